#pragma once

#include "lxcforge/common/result.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace lxcforge::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split_lines(const std::string &text);
[[nodiscard]] std::vector<std::string> split_whitespace(const std::string &text);
[[nodiscard]] std::string join(const std::vector<std::string> &parts, const std::string &separator);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] std::string expand_path(std::string value);

[[nodiscard]] Result<std::string> read_text_file(const std::filesystem::path &path);
[[nodiscard]] Status write_text_file(const std::filesystem::path &path, const std::string &content);

} // namespace lxcforge::common
