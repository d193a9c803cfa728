#pragma once

#include "lxcforge/sandbox/provider.hpp"

#include <string>

namespace lxcforge::provision {

/// Stops and destroys a sandbox when it goes out of scope, unless disarmed first.
class SandboxRollback {
public:
  SandboxRollback(sandbox::SandboxProvider &provider, std::string container);
  ~SandboxRollback();

  SandboxRollback(const SandboxRollback &) = delete;
  SandboxRollback &operator=(const SandboxRollback &) = delete;

  void disarm() noexcept { armed_ = false; }
  [[nodiscard]] bool armed() const noexcept { return armed_; }

private:
  sandbox::SandboxProvider &provider_;
  std::string container_;
  bool armed_ = true;
};

} // namespace lxcforge::provision
