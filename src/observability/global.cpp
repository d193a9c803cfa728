#include "lxcforge/observability/global.hpp"

#include <mutex>

namespace lxcforge::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_step_start(const std::string &container, const std::string &description) {
  record_event(StepStartEvent{.container = container, .description = description});
}

void record_step_end(const std::string &container, const std::string &description,
                     const std::chrono::milliseconds duration, const int exit_status) {
  record_event(StepEndEvent{.container = container,
                            .description = description,
                            .duration = duration,
                            .exit_status = exit_status});
}

void record_sandbox(const std::string &container, const SandboxAction action, const bool success,
                    const std::string &detail) {
  record_event(SandboxEvent{
      .container = container, .action = action, .success = success, .detail = detail});
}

void record_rollback(const std::string &container, const bool stopped, const bool destroyed) {
  record_event(RollbackEvent{.container = container, .stopped = stopped, .destroyed = destroyed});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace lxcforge::observability
