#include "lxcforge/recipes/shared.hpp"

#include "lxcforge/common/fs.hpp"

#include <cctype>

namespace lxcforge::recipes {

std::string user_name(const std::string &prefix) { return prefix + "_user"; }

std::string user_info(const std::string &prefix) {
  std::string out = common::to_lower(prefix);
  if (!out.empty()) {
    out.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(out.front())));
  }
  return out + " User";
}

std::string user_home(const std::string &prefix) { return "/home/" + user_name(prefix); }

std::string subnet_prefix(const std::string &address) {
  const auto last = address.find_last_not_of("0123456789");
  if (last == std::string::npos) {
    return "";
  }
  return address.substr(0, last + 1);
}

std::string fill_template(std::string text,
                          const std::vector<std::pair<std::string, std::string>> &values) {
  for (const auto &[name, value] : values) {
    const std::string placeholder = "{" + name + "}";
    std::size_t pos = 0;
    while ((pos = text.find(placeholder, pos)) != std::string::npos) {
      text.replace(pos, placeholder.size(), value);
      pos += value.size();
    }
  }
  return text;
}

std::vector<provision::ConfigMutation> idmap_mutations() {
  using provision::ConfigEdit;
  using provision::ConfigOp;

  provision::ConfigMutation clear{
      .description = "Clearing UID and GID mappings",
      .edits = {ConfigEdit{.op = ConfigOp::Clear, .key = "lxc.idmap", .value = ""}},
  };

  provision::ConfigMutation append{.description = "Appending new UID and GID mappings",
                                   .edits = {}};
  for (const char *mapping : {"u 0 100000 1000", "g 0 100000 1000", "u 1000 1000 1",
                              "g 1000 1000 1", "u 1001 101001 64535", "g 1001 101001 64535"}) {
    append.edits.push_back(ConfigEdit{.op = ConfigOp::Append, .key = "lxc.idmap", .value = mapping});
  }
  return {clear, append};
}

provision::Step apt_update_step() {
  return provision::Step::direct("Updating apt", {"apt-get", "update"});
}

provision::Step apt_install_step(const std::string &description,
                                 const std::vector<std::string> &packages,
                                 const bool no_recommends) {
  std::vector<std::string> command = {"apt-get", "install"};
  if (no_recommends) {
    command.emplace_back("--no-install-recommends");
  }
  command.emplace_back("-y");
  command.insert(command.end(), packages.begin(), packages.end());
  return provision::Step::direct(description, std::move(command));
}

provision::Step pip_install_step(const std::vector<std::string> &packages) {
  std::vector<std::string> command = {"pip3", "install"};
  command.insert(command.end(), packages.begin(), packages.end());
  return provision::Step::direct("Installing python packages", std::move(command));
}

provision::Step add_user_step(const std::string &prefix) {
  return provision::Step::direct("Adding user", {"adduser", "--disabled-password", "--gecos",
                                                 user_info(prefix), user_name(prefix)});
}

provision::Step set_password_step(const std::string &user, const std::string &password) {
  return provision::Step::piped("Setting user password", {"echo", user + ":" + password},
                                {"chpasswd"});
}

provision::Step write_file_step(const std::string &description, const std::string &owner,
                                const std::string &content, const std::string &path) {
  const std::string redirect = "cat > '" + path + "'";
  std::vector<std::string> command;
  if (owner.empty()) {
    command = {"sh", "-c", redirect};
  } else {
    command = {"su", "-", owner, "-c", redirect};
  }
  return provision::Step::piped(description, {"printf", "%s", content}, std::move(command));
}

provision::Step as_user_step(const std::string &description, const std::string &user,
                             const std::string &command) {
  return provision::Step::direct(description, {"su", "-", user, "-c", command});
}

} // namespace lxcforge::recipes
