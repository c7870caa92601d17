#include "warden/observability/factory.hpp"

#include "warden/common/fs.hpp"
#include "warden/observability/log_observer.hpp"
#include "warden/observability/multi_observer.hpp"
#include "warden/observability/noop_observer.hpp"

namespace warden::observability {

namespace {

std::unique_ptr<IObserver> single_backend(const std::string &backend) {
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.find(',') == std::string::npos) {
    return single_backend(backend);
  }

  auto multi = std::make_unique<MultiObserver>();
  for (const auto &part : common::split(backend, ',')) {
    const std::string name = common::trim(part);
    if (name == "log" || name == "noop" || name == "none") {
      multi->add(single_backend(name));
    }
  }
  return multi;
}

} // namespace warden::observability
