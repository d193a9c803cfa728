#pragma once

#include "lxcforge/provision/step.hpp"

#include <string>
#include <utility>
#include <vector>

namespace lxcforge::recipes {

[[nodiscard]] std::string user_name(const std::string &prefix);
/// GECOS field: "Acme User" for prefix "acme".
[[nodiscard]] std::string user_info(const std::string &prefix);
[[nodiscard]] std::string user_home(const std::string &prefix);

/// Address with its last octet removed, e.g. "10.0.3." for "10.0.3.17".
[[nodiscard]] std::string subnet_prefix(const std::string &address);

/// Replaces every `{name}` placeholder with its value.
[[nodiscard]] std::string
fill_template(std::string text, const std::vector<std::pair<std::string, std::string>> &values);

/// Clears the sandbox's id mappings and installs the shared host-uid layout:
/// container uid/gid 1000 maps to host 1000, everything else to the 100000 range.
[[nodiscard]] std::vector<provision::ConfigMutation> idmap_mutations();

[[nodiscard]] provision::Step apt_update_step();
[[nodiscard]] provision::Step apt_install_step(const std::string &description,
                                               const std::vector<std::string> &packages,
                                               bool no_recommends = false);
[[nodiscard]] provision::Step pip_install_step(const std::vector<std::string> &packages);
[[nodiscard]] provision::Step add_user_step(const std::string &prefix);
[[nodiscard]] provision::Step set_password_step(const std::string &user,
                                                const std::string &password);

/// Streams `content` from the host into `path` inside the sandbox, written as `owner`
/// (root when empty).
[[nodiscard]] provision::Step write_file_step(const std::string &description,
                                              const std::string &owner,
                                              const std::string &content,
                                              const std::string &path);

/// Runs `command` through a login shell of `user`.
[[nodiscard]] provision::Step as_user_step(const std::string &description, const std::string &user,
                                           const std::string &command);

} // namespace lxcforge::recipes
