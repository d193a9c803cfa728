#include "lxcforge/observability/progress_observer.hpp"

namespace lxcforge::observability {

void ProgressObserver::record_event(const ObserverEvent &event) {
  if (const auto *step = std::get_if<StepStartEvent>(&event); step != nullptr) {
    out_ << step->description << "...\n";
    out_.flush();
  }
}

} // namespace lxcforge::observability
