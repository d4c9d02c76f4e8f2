#pragma once
/** @file  Service.hpp
 *  @brief Abstract base class for every long-running background service.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

namespace marich::core { // forward decls only
  class CancelSignal;
} // namespace marich::core

namespace marich::services {

  /**
 * @class Service
 * @brief Common polymorphic interface that every worker body (chatbot, RPS game,
 *        presentation script) implements.
 *
 *  * Runs synchronously on the Worker's thread.
 *  * Owns no hardware; holds references handed over by the ServiceFactory.
 *  * Must poll the cancel signal at every blocking point with a bounded interval.
 */
  class Service {
  public:
    virtual ~Service() = default;

    /**
     * @brief Execute the service loop until finished or cancelled.
     *
     * @param cancel  Cooperative stop request from the owning Worker.
     */
    virtual void run(const core::CancelSignal& cancel) = 0;
  };

} // namespace marich::services
