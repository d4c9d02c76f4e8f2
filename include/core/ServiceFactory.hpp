#pragma once
/** @file  ServiceFactory.hpp
 *  @brief Capability handle through which the coordinator (and only it) creates workers.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>

namespace marich {
  namespace camera {
    class GestureSource;
  } // namespace camera
  namespace services {
    class Service;
  } // namespace services

  namespace core {

    class CancelSignal;

    /**
 * @class ServiceFactory
 * @brief Builds the body of each background worker.
 *
 *  * Implementations hold the face, hardware and voice handles the services need;
 *    the coordinator only decides *when* a service may exist.
 *  * `make*()` may throw; the coordinator turns that into a refused transition.
 */
    class ServiceFactory {
    public:
      virtual ~ServiceFactory() = default;

      /** Best-effort warm-up of the conversational backend; may throw.
       *  Called on the chatbot worker thread before the chatbot loop starts. */
      virtual void preloadConversation(const CancelSignal& cancel) = 0;

      virtual std::unique_ptr<services::Service> makeChatbot(bool suppressGreeting) = 0;

      /// \p gestures is the read-only camera view the game is allowed to use.
      virtual std::unique_ptr<services::Service> makeRpsGame(const camera::GestureSource& gestures) = 0;

      virtual std::unique_ptr<services::Service> makePresentation() = 0;
    };

  } // namespace core
} // namespace marich
