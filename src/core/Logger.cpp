/* @file Logger.cpp
 * @brief spdlog registry glue: every subsystem logger shares the same sink list.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <mutex>
#include <unordered_map>
#include <vector>

// spdlog headers
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

// Marich headers
#include "core/Logger.hpp"

namespace marich {
  namespace core {
    namespace logging {

      namespace {

        constexpr const char* kPattern = "%H:%M:%S.%e %^%-5l%$ %-12n %v";
        constexpr std::size_t kFileBytes = 1024 * 1024;
        constexpr std::size_t kFileCount = 3;

        struct Registry {
          std::mutex mtx;
          std::vector<spdlog::sink_ptr> sinks;
          std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers;
          spdlog::level::level_enum level{ spdlog::level::info };

          Registry() {
            auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console->set_pattern(kPattern);
            sinks.push_back(std::move(console));
          }

          // caller holds mtx
          void rebindAll() {
            for (auto& [name, logger] : loggers) {
              logger->sinks() = sinks;
              logger->set_level(level);
            }
          }
        };

        Registry& registry() {
          static Registry reg;
          return reg;
        }

      } // namespace

      std::shared_ptr<spdlog::logger> get(const std::string& name) {
        auto& reg = registry();
        std::lock_guard<std::mutex> lock(reg.mtx);

        if (auto it = reg.loggers.find(name); it != reg.loggers.end())
          return it->second;

        auto logger = std::make_shared<spdlog::logger>(name, reg.sinks.begin(), reg.sinks.end());
        logger->set_level(reg.level);
        logger->flush_on(spdlog::level::warn);
        reg.loggers.emplace(name, logger);
        return logger;
      }

      void configure(spdlog::level::level_enum level, const std::string& filePath) {
        auto& reg = registry();
        std::lock_guard<std::mutex> lock(reg.mtx);

        reg.level = level;
        if (!filePath.empty()) {
          auto file =
              std::make_shared<spdlog::sinks::rotating_file_sink_mt>(filePath, kFileBytes, kFileCount);
          file->set_pattern(kPattern);
          reg.sinks.push_back(std::move(file));
        }
        reg.rebindAll();
      }

      void addSink(spdlog::sink_ptr sink) {
        auto& reg = registry();
        std::lock_guard<std::mutex> lock(reg.mtx);
        reg.sinks.push_back(std::move(sink));
        reg.rebindAll();
      }

      void removeSink(const spdlog::sink_ptr& sink) {
        auto& reg = registry();
        std::lock_guard<std::mutex> lock(reg.mtx);
        reg.sinks.erase(std::remove(reg.sinks.begin(), reg.sinks.end(), sink), reg.sinks.end());
        reg.rebindAll();
      }

    } // namespace logging
  } // namespace core
} // namespace marich
