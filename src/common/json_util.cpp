#include "lxcforge/common/json_util.hpp"

#include <cstdio>
#include <sstream>

namespace lxcforge::common {

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_render_flat_object(const std::map<std::string, std::string> &fields,
                                    const std::size_t indent) {
  if (fields.empty()) {
    return "{}";
  }

  const std::string pad(indent, ' ');
  std::ostringstream out;
  out << "{\n";
  std::size_t index = 0;
  for (const auto &[key, value] : fields) {
    out << pad << '"' << json_escape(key) << "\": \"" << json_escape(value) << '"';
    if (++index < fields.size()) {
      out << ',';
    }
    out << '\n';
  }
  out << '}';
  return out.str();
}

} // namespace lxcforge::common
