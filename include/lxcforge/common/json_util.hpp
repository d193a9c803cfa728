#pragma once

#include <cstddef>
#include <map>
#include <string>

namespace lxcforge::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Render a flat string→string object with keys in sorted order, one member per line,
/// indented by `indent` spaces. An empty map renders as `{}`.
[[nodiscard]] std::string json_render_flat_object(const std::map<std::string, std::string> &fields,
                                                  std::size_t indent = 4);

} // namespace lxcforge::common
