#pragma once

#include <memory>

#include "internal/observability/logging.hpp"

namespace rfshared::broker {
class MemoryBroker;
}

namespace rfshared::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<rfshared::broker::MemoryBroker> broker;
  observability::LoggerPtr                        logger;
};

} // namespace rfshared::service
