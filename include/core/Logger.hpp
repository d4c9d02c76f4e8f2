#pragma once
/** @file  Logger.hpp
 *  @brief Named spdlog loggers sharing one sink set (console + optional rotating file).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <string>

#include <spdlog/common.h>
#include <spdlog/logger.h>

namespace marich {
  namespace core {
    namespace logging {

      /// Returns the logger for \p name, creating it on first use with the shared sinks.
      std::shared_ptr<spdlog::logger> get(const std::string& name);

      /** Sets the global level and, if \p filePath is non-empty, adds a rotating file
       *  sink (1 MB x 3). Loggers created before the call pick up the new sinks too. */
      void configure(spdlog::level::level_enum level, const std::string& filePath = {});

      /// Attach an extra sink to every existing and future logger (used by tests).
      void addSink(spdlog::sink_ptr sink);

      /// Detach a sink previously added with addSink().
      void removeSink(const spdlog::sink_ptr& sink);

    } // namespace logging
  } // namespace core
} // namespace marich
