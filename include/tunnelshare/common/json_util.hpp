#pragma once

#include <optional>
#include <string>

namespace tunnelshare::common {

/// Escapes a value for a JSON string literal. Control characters become \u00XX.
[[nodiscard]] std::string json_escape(const std::string &value);
[[nodiscard]] std::string json_quote(const std::string &value);

/// Value of the first string field named field, unescaped. Empty when the
/// field is absent or not a string.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

[[nodiscard]] std::optional<std::string> json_get_scalar(const std::string &json,
                                                         const std::string &field);

[[nodiscard]] bool json_looks_like_object(const std::string &text);

} // namespace tunnelshare::common
