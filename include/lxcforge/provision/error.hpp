#pragma once

#include <stdexcept>
#include <string>

namespace lxcforge::provision {

/// A fatal provisioning condition. The message is the user-facing description of what
/// was being attempted.
class ProvisionError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Aborts the current provisioning run.
[[noreturn]] void fail(const std::string &description);

} // namespace lxcforge::provision
