#include "tunnelshare/common/json_util.hpp"

#include <cctype>
#include <charconv>
#include <cstdio>

namespace tunnelshare::common {

namespace {

std::size_t skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t string_end(const std::string &json, const std::size_t quote_pos) {
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    if (json[i] == '\\') {
      ++i;
    } else if (json[i] == '"') {
      return i;
    }
  }
  return std::string::npos;
}

// Position of the value that follows "field": or npos.
std::size_t value_start(const std::string &json, const std::string &field) {
  const std::string quoted = "\"" + field + "\"";
  std::size_t from = 0;
  while (true) {
    const auto key = json.find(quoted, from);
    if (key == std::string::npos) {
      return std::string::npos;
    }
    const auto colon = skip_ws(json, key + quoted.size());
    if (colon < json.size() && json[colon] == ':') {
      return skip_ws(json, colon + 1);
    }
    // A string value that happens to equal the key name.
    from = key + quoted.size();
  }
}

void append_utf8(std::string &out, const unsigned code) {
  if (code < 0x80) {
    out.push_back(static_cast<char>(code));
  } else if (code < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code >> 6)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xE0 | (code >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  }
}

std::string unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    if (raw[i] != '\\' || i + 1 >= raw.size()) {
      out.push_back(raw[i]);
      continue;
    }
    const char ch = raw[++i];
    switch (ch) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u':
      if (i + 4 < raw.size()) {
        unsigned code = 0;
        const char *first = raw.data() + i + 1;
        const auto parsed = std::from_chars(first, first + 4, code, 16);
        if (parsed.ec == std::errc() && parsed.ptr == first + 4) {
          append_utf8(out, code);
          i += 4;
          break;
        }
      }
      out.push_back(ch);
      break;
    default:
      out.push_back(ch);
      break;
    }
  }
  return out;
}

} // namespace

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

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

std::string json_get_string(const std::string &json, const std::string &field) {
  const auto pos = value_start(json, field);
  if (pos >= json.size() || json[pos] != '"') {
    return "";
  }
  const auto end = string_end(json, pos);
  if (end == std::string::npos) {
    return "";
  }
  return unescape(json.substr(pos + 1, end - pos - 1));
}

std::optional<std::string> json_get_scalar(const std::string &json, const std::string &field) {
  const auto pos = value_start(json, field);
  if (pos >= json.size()) {
    return std::nullopt;
  }
  if (json[pos] == '"') {
    if (string_end(json, pos) == std::string::npos) {
      return std::nullopt;
    }
    return json_get_string(json, field);
  }
  if (json[pos] == '{' || json[pos] == '[') {
    return std::nullopt;
  }
  std::size_t end = pos;
  while (end < json.size() && json[end] != ',' && json[end] != '}' && json[end] != ']' &&
         std::isspace(static_cast<unsigned char>(json[end])) == 0) {
    ++end;
  }
  if (end == pos) {
    return std::nullopt;
  }
  return json.substr(pos, end - pos);
}

bool json_looks_like_object(const std::string &text) {
  const auto first = skip_ws(text, 0);
  auto last = text.size();
  while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1])) != 0) {
    --last;
  }
  return last - first >= 2 && text[first] == '{' && text[last - 1] == '}';
}

} // namespace tunnelshare::common
