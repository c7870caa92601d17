#pragma once

#include "warden/config/schema.hpp"
#include "warden/observability/observer.hpp"

#include <memory>

namespace warden::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace warden::observability
