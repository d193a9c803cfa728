#include "lxcforge/sandbox/lxc.hpp"

#include "lxcforge/common/fs.hpp"
#include "lxcforge/common/interrupt.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <thread>

namespace lxcforge::sandbox {

namespace {

constexpr std::chrono::milliseconds STATE_QUERY_TIMEOUT{10'000};
constexpr std::chrono::milliseconds MIN_QUERY_TIMEOUT{50};

bool is_ipv4(const std::string &text) {
  in_addr address{};
  return inet_pton(AF_INET, text.c_str(), &address) == 1;
}

// Matches `key = value` and `key=value`, but not keys that merely share a prefix.
bool line_has_key(const std::string &line, const std::string &key) {
  const std::string trimmed = common::trim(line);
  if (!common::starts_with(trimmed, key)) {
    return false;
  }
  const std::string rest = common::trim(trimmed.substr(key.size()));
  return !rest.empty() && rest.front() == '=';
}

} // namespace

std::vector<std::string> build_lxc_create_args(const std::string &name, const DistroParams &params,
                                               const std::string &lxc_path) {
  std::vector<std::string> args = {"lxc-create", "-n", name};
  if (!lxc_path.empty()) {
    args.push_back("-P");
    args.push_back(lxc_path);
  }
  args.push_back("-t");
  args.push_back(params.template_name);
  args.push_back("-q");
  args.push_back("--");
  args.push_back("-d");
  args.push_back(params.dist);
  args.push_back("-r");
  args.push_back(params.release);
  args.push_back("-a");
  args.push_back(params.arch);
  return args;
}

std::vector<std::string> build_lxc_attach_args(const std::string &name,
                                               const std::vector<std::string> &argv,
                                               const AttachIo &io, const std::string &lxc_path) {
  std::vector<std::string> args = {"lxc-attach", "-n", name};
  if (!lxc_path.empty()) {
    args.push_back("-P");
    args.push_back(lxc_path);
  }
  args.push_back(io.env_policy == EnvPolicy::Clear ? "--clear-env" : "--keep-env");
  for (const auto &[key, value] : io.extra_env) {
    if (common::trim(key).empty()) {
      continue;
    }
    args.push_back("--set-var");
    args.push_back(key + "=" + value);
  }
  args.push_back("--");
  args.insert(args.end(), argv.begin(), argv.end());
  return args;
}

std::optional<std::string> parse_first_ipv4(const std::string &lxc_info_output) {
  for (const auto &line : common::split_lines(lxc_info_output)) {
    const std::string candidate = common::trim(line);
    if (is_ipv4(candidate)) {
      return candidate;
    }
  }
  return std::nullopt;
}

LxcProvider::LxcProvider(LxcProviderOptions options, std::shared_ptr<ICommandRunner> runner)
    : options_(std::move(options)), runner_(std::move(runner)) {}

std::vector<std::string> LxcProvider::tool(const std::string &program,
                                           const std::string &name) const {
  std::vector<std::string> args = {program, "-n", name};
  if (!options_.lxc_path.empty()) {
    args.push_back("-P");
    args.push_back(options_.lxc_path);
  }
  return args;
}

common::Status LxcProvider::run_tool(const std::vector<std::string> &args,
                                     const std::chrono::milliseconds timeout) {
  if (!runner_) {
    return common::Status::error("command runner unavailable");
  }
  auto result = runner_->run(args, CommandOptions{.allow_failure = false, .timeout = timeout});
  if (!result.ok()) {
    return common::Status::error(common::trim(result.error()));
  }
  return common::Status::success();
}

LxcProvider::ContainerState LxcProvider::inspect(const std::string &name) {
  if (!runner_) {
    return {};
  }
  auto args = tool("lxc-info", name);
  args.push_back("-s");
  args.push_back("-H");
  auto info =
      runner_->run(args, CommandOptions{.allow_failure = true, .timeout = STATE_QUERY_TIMEOUT});
  if (!info.ok() || info.value().exit_code != 0) {
    return {};
  }
  const std::string state = common::trim(info.value().stdout_text);
  return ContainerState{.exists = true, .running = state == "RUNNING"};
}

bool LxcProvider::exists(const std::string &name) { return inspect(name).exists; }

bool LxcProvider::is_running(const std::string &name) { return inspect(name).running; }

common::Status LxcProvider::create(const std::string &name, const DistroParams &params) {
  return run_tool(build_lxc_create_args(name, params, options_.lxc_path),
                  options_.command_timeout);
}

common::Status LxcProvider::start(const std::string &name) {
  auto args = tool("lxc-start", name);
  args.push_back("-d");
  return run_tool(args, options_.command_timeout);
}

common::Status LxcProvider::stop(const std::string &name) {
  return run_tool(tool("lxc-stop", name), options_.command_timeout);
}

common::Status LxcProvider::destroy(const std::string &name) {
  config_files_.erase(name);
  return run_tool(tool("lxc-destroy", name), options_.command_timeout);
}

std::optional<std::string> LxcProvider::get_address(const std::string &name,
                                                    const std::chrono::seconds timeout) {
  if (!runner_) {
    return std::nullopt;
  }

  auto args = tool("lxc-info", name);
  args.push_back("-i");
  args.push_back("-H");

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    auto info = runner_->run(
        args, CommandOptions{.allow_failure = true,
                             .timeout = std::max(remaining, MIN_QUERY_TIMEOUT)});
    if (info.ok() && info.value().exit_code == 0) {
      if (auto address = parse_first_ipv4(info.value().stdout_text); address.has_value()) {
        return address;
      }
    }

    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline || common::interrupted()) {
      return std::nullopt;
    }
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(options_.poll_interval, left));
  }
}

common::Result<int> LxcProvider::attach_run(const std::string &name,
                                            const std::vector<std::string> &argv,
                                            const AttachIo &io) {
  if (argv.empty()) {
    return common::Result<int>::failure("attach command is empty");
  }

  auto child = ChildProcess::spawn(
      build_lxc_attach_args(name, argv, io, options_.lxc_path),
      StdioRedirect{.stdin_fd = io.stdin_fd, .stdout_fd = io.stdout_fd, .stderr_fd = io.stderr_fd});
  if (!child.ok()) {
    return common::Result<int>::failure(child.error());
  }
  return child.value().wait();
}

common::Result<std::filesystem::path> LxcProvider::lxc_path() {
  if (!options_.lxc_path.empty()) {
    return common::Result<std::filesystem::path>::success(options_.lxc_path);
  }
  if (resolved_lxc_path_.has_value()) {
    return common::Result<std::filesystem::path>::success(*resolved_lxc_path_);
  }
  if (!runner_) {
    return common::Result<std::filesystem::path>::failure("command runner unavailable");
  }

  auto queried = runner_->run({"lxc-config", "lxc.lxcpath"},
                              CommandOptions{.allow_failure = false, .timeout = STATE_QUERY_TIMEOUT});
  if (!queried.ok()) {
    return common::Result<std::filesystem::path>::failure(queried.error());
  }
  const std::string path = common::trim(queried.value().stdout_text);
  if (path.empty()) {
    return common::Result<std::filesystem::path>::failure("lxc-config reported no lxc.lxcpath");
  }
  resolved_lxc_path_ = std::filesystem::path(path);
  return common::Result<std::filesystem::path>::success(*resolved_lxc_path_);
}

common::Result<std::filesystem::path> LxcProvider::container_dir(const std::string &name) {
  auto base = lxc_path();
  if (!base.ok()) {
    return base;
  }
  return common::Result<std::filesystem::path>::success(base.value() / name);
}

common::Result<LxcProvider::ConfigFile *> LxcProvider::config_file(const std::string &name) {
  if (auto it = config_files_.find(name); it != config_files_.end()) {
    return common::Result<ConfigFile *>::success(&it->second);
  }

  auto dir = container_dir(name);
  if (!dir.ok()) {
    return common::Result<ConfigFile *>::failure(dir.error());
  }
  const auto path = dir.value() / "config";
  auto content = common::read_text_file(path);
  if (!content.ok()) {
    return common::Result<ConfigFile *>::failure(content.error());
  }

  auto [it, inserted] = config_files_.emplace(
      name, ConfigFile{.path = path, .lines = common::split_lines(content.value())});
  return common::Result<ConfigFile *>::success(&it->second);
}

common::Status LxcProvider::set_config_item(const std::string &name, const std::string &key,
                                            const std::string &value) {
  if (auto cleared = clear_config_item(name, key); !cleared.ok()) {
    return cleared;
  }
  return append_config_item(name, key, value);
}

common::Status LxcProvider::clear_config_item(const std::string &name, const std::string &key) {
  auto file = config_file(name);
  if (!file.ok()) {
    return common::Status::error(file.error());
  }
  auto &lines = file.value()->lines;
  std::erase_if(lines, [&key](const std::string &line) { return line_has_key(line, key); });
  return common::Status::success();
}

common::Status LxcProvider::append_config_item(const std::string &name, const std::string &key,
                                               const std::string &value) {
  if (common::trim(key).empty()) {
    return common::Status::error("config key is empty");
  }
  auto file = config_file(name);
  if (!file.ok()) {
    return common::Status::error(file.error());
  }
  file.value()->lines.push_back(key + " = " + value);
  return common::Status::success();
}

common::Status LxcProvider::save_config(const std::string &name) {
  auto file = config_file(name);
  if (!file.ok()) {
    return common::Status::error(file.error());
  }
  std::string content = common::join(file.value()->lines, "\n");
  content.push_back('\n');
  return common::write_text_file(file.value()->path, content);
}

} // namespace lxcforge::sandbox
