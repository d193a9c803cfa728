#include "lxcforge/security/password.hpp"

#include <array>
#include <openssl/rand.h>

namespace lxcforge::security {

namespace {

// Largest multiple of the alphabet size that fits in a byte; bytes at or above it are
// rejected so every character is equally likely.
constexpr unsigned int REJECTION_LIMIT = 256 - (256 % PASSWORD_ALPHABET.size());

} // namespace

common::Result<std::string> generate_password(const std::size_t length) {
  if (length == 0) {
    return common::Result<std::string>::failure("password length must be greater than zero");
  }

  std::string password;
  password.reserve(length);
  std::array<unsigned char, 64> buffer{};

  while (password.size() < length) {
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
      return common::Result<std::string>::failure("random number generator failure");
    }
    for (const unsigned char byte : buffer) {
      if (byte >= REJECTION_LIMIT) {
        continue;
      }
      password.push_back(PASSWORD_ALPHABET[byte % PASSWORD_ALPHABET.size()]);
      if (password.size() == length) {
        break;
      }
    }
  }

  return common::Result<std::string>::success(std::move(password));
}

} // namespace lxcforge::security
