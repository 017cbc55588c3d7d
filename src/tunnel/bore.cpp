#include "tunnelshare/tunnel/bore.hpp"

namespace tunnelshare::tunnel {

namespace {

std::string escape_regex(const std::string &value) {
  static const std::string special = R"(\^$.|?*+()[]{})";
  std::string out;
  out.reserve(value.size() * 2);
  for (const char ch : value) {
    if (special.find(ch) != std::string::npos) {
      out.push_back('\\');
    }
    out.push_back(ch);
  }
  return out;
}

} // namespace

BoreAgent::BoreAgent(std::string command_path, std::string server)
    : command_path_(std::move(command_path)), server_(std::move(server)),
      listening_pattern_(R"(listening at ([a-zA-Z0-9.-]+:\d+))"),
      server_pattern_(escape_regex(server_) + R"(:\d+)") {}

std::vector<std::string> BoreAgent::build_args(const std::uint16_t local_port) const {
  return {"local", std::to_string(local_port), "--to", server_};
}

std::optional<std::string> BoreAgent::extract_url(const std::string &line) const {
  std::smatch match;
  if (std::regex_search(line, match, listening_pattern_)) {
    return "http://" + match[1].str();
  }
  if (std::regex_search(line, match, server_pattern_)) {
    return "http://" + match[0].str();
  }
  return std::nullopt;
}

} // namespace tunnelshare::tunnel
