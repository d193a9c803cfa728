#pragma once

#include "lxcforge/observability/observer.hpp"

#include <memory>

namespace lxcforge::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);

void record_step_start(const std::string &container, const std::string &description);
void record_step_end(const std::string &container, const std::string &description,
                     std::chrono::milliseconds duration, int exit_status);
void record_sandbox(const std::string &container, SandboxAction action, bool success,
                    const std::string &detail = "");
void record_rollback(const std::string &container, bool stopped, bool destroyed);
void record_error(const std::string &component, const std::string &message);

} // namespace lxcforge::observability
