#pragma once

#include "lxcforge/common/result.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace lxcforge::security {

inline constexpr std::string_view PASSWORD_ALPHABET =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

/// Uniformly random alphanumeric string from the OpenSSL CSPRNG.
[[nodiscard]] common::Result<std::string> generate_password(std::size_t length = 8);

} // namespace lxcforge::security
