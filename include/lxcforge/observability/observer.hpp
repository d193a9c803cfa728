#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <variant>

namespace lxcforge::observability {

struct StepStartEvent {
  std::string container;
  std::string description;
};

struct StepEndEvent {
  std::string container;
  std::string description;
  std::chrono::milliseconds duration{0};
  int exit_status = 0;
};

// Destruction is reported through RollbackEvent.
enum class SandboxAction { Create, Configure, Start, Address, Stop };

struct SandboxEvent {
  std::string container;
  SandboxAction action = SandboxAction::Create;
  bool success = false;
  std::string detail;
};

struct RollbackEvent {
  std::string container;
  bool stopped = false;
  bool destroyed = false;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<StepStartEvent, StepEndEvent, SandboxEvent, RollbackEvent, ErrorEvent>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

[[nodiscard]] std::string_view sandbox_action_to_string(SandboxAction action);

} // namespace lxcforge::observability
