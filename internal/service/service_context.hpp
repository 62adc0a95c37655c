#pragma once

#include <memory>

namespace satp::core {
class Dispatcher;
}

namespace satp::service {

/*
  Dependency container shared by the gateway services.
*/
struct ServiceContext {
  std::shared_ptr<satp::core::Dispatcher> dispatcher;
};

} // namespace satp::service
