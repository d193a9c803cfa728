#include "lxcforge/observability/log_observer.hpp"

#include <type_traits>

namespace lxcforge::observability {

namespace {

void log_line(std::ostream &out, const std::string &level, const std::string &message) {
  out << "[" << level << "] " << message << "\n";
}

std::string bool_text(const bool value) { return value ? "true" : "false"; }

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, StepStartEvent>) {
          log_line(out_, "DEBUG", "step.start container=" + evt.container + " step=\"" +
                                      evt.description + "\"");
        } else if constexpr (std::is_same_v<T, StepEndEvent>) {
          log_line(out_, evt.exit_status == 0 ? "INFO" : "WARN",
                   "step.end container=" + evt.container + " step=\"" + evt.description +
                       "\" exit=" + std::to_string(evt.exit_status) +
                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, SandboxEvent>) {
          std::string line = "sandbox." + std::string(sandbox_action_to_string(evt.action)) +
                             " container=" + evt.container + " success=" + bool_text(evt.success);
          if (!evt.detail.empty()) {
            line += " detail=" + evt.detail;
          }
          log_line(out_, evt.success ? "INFO" : "WARN", line);
        } else if constexpr (std::is_same_v<T, RollbackEvent>) {
          log_line(out_, "WARN", "rollback container=" + evt.container +
                                     " stopped=" + bool_text(evt.stopped) +
                                     " destroyed=" + bool_text(evt.destroyed));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(out_, "ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

} // namespace lxcforge::observability
