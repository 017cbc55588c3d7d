#include "tests/helpers/test_helpers.hpp"

#include <zlib.h>

#include <fstream>
#include <random>
#include <stdexcept>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace tunnelshare::testing {

namespace {

void put_u16(std::string &out, const std::uint16_t value) {
  out.push_back(static_cast<char>(value & 0xFF));
  out.push_back(static_cast<char>((value >> 8) & 0xFF));
}

void put_u32(std::string &out, const std::uint32_t value) {
  for (int shift = 0; shift < 32; shift += 8) {
    out.push_back(static_cast<char>((value >> shift) & 0xFF));
  }
}

std::string raw_deflate(const std::string &input) {
  z_stream stream{};
  if (deflateInit2(&stream, Z_BEST_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                   Z_DEFAULT_STRATEGY) != Z_OK) {
    throw std::runtime_error("deflateInit2 failed");
  }
  std::string out(deflateBound(&stream, static_cast<uLong>(input.size())), '\0');
  stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(input.data()));
  stream.avail_in = static_cast<uInt>(input.size());
  stream.next_out = reinterpret_cast<Bytef *>(out.data());
  stream.avail_out = static_cast<uInt>(out.size());
  const int rc = deflate(&stream, Z_FINISH);
  deflateEnd(&stream);
  if (rc != Z_STREAM_END) {
    throw std::runtime_error("deflate failed");
  }
  out.resize(stream.total_out);
  return out;
}

} // namespace

config::Config mock_config() {
  config::Config config;
  config.sharing.default_provider = "bore";
  config.sharing.max_connections = 4;
  config.sharing.request_timeout_secs = 5;
  config.sharing.url_wait_secs = 5;
  config.observability.backend = "none";
  return config;
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() /
          ("tunnelshare-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
  out << content;
}

config::Config temp_config(const TempWorkspace &workspace) {
  auto config = mock_config();
  config.sharing.agents_dir = (workspace.path() / "agents").string();
  config.sharing.database = (workspace.path() / "shares.db").string();

  std::error_code ec;
  std::filesystem::create_directories(workspace.path() / "agents", ec);
  return config;
}

std::filesystem::path write_fake_agent(const TempWorkspace &workspace, const std::string &name,
                                       const std::string &script_body) {
  const auto path = workspace.path() / "agents" / name;
  workspace.create_file("agents/" + name, "#!/bin/sh\n" + script_body + "\n");
  std::filesystem::permissions(path,
                               std::filesystem::perms::owner_all |
                                   std::filesystem::perms::group_read |
                                   std::filesystem::perms::group_exec,
                               std::filesystem::perm_options::replace);
  return path;
}

void write_zip(const std::filesystem::path &path, const std::vector<ZipEntry> &entries) {
  std::string archive;
  std::string central;
  for (const auto &entry : entries) {
    const std::uint32_t crc = static_cast<std::uint32_t>(
        crc32(0L, reinterpret_cast<const Bytef *>(entry.content.data()),
              static_cast<uInt>(entry.content.size())));
    const std::string data = entry.deflate ? raw_deflate(entry.content) : entry.content;
    const std::uint16_t method = entry.deflate ? 8 : 0;
    const auto offset = static_cast<std::uint32_t>(archive.size());

    put_u32(archive, 0x04034b50);
    put_u16(archive, 20);
    put_u16(archive, 0);
    put_u16(archive, method);
    put_u16(archive, 0);
    put_u16(archive, 0);
    put_u32(archive, crc);
    put_u32(archive, static_cast<std::uint32_t>(data.size()));
    put_u32(archive, static_cast<std::uint32_t>(entry.content.size()));
    put_u16(archive, static_cast<std::uint16_t>(entry.name.size()));
    put_u16(archive, 0);
    archive += entry.name;
    archive += data;

    put_u32(central, 0x02014b50);
    put_u16(central, 20);
    put_u16(central, 20);
    put_u16(central, 0);
    put_u16(central, method);
    put_u16(central, 0);
    put_u16(central, 0);
    put_u32(central, crc);
    put_u32(central, static_cast<std::uint32_t>(data.size()));
    put_u32(central, static_cast<std::uint32_t>(entry.content.size()));
    put_u16(central, static_cast<std::uint16_t>(entry.name.size()));
    put_u16(central, 0);
    put_u16(central, 0);
    put_u16(central, 0);
    put_u16(central, 0);
    put_u32(central, 0);
    put_u32(central, offset);
    central += entry.name;
  }

  const auto central_offset = static_cast<std::uint32_t>(archive.size());
  archive += central;
  put_u32(archive, 0x06054b50);
  put_u16(archive, 0);
  put_u16(archive, 0);
  put_u16(archive, static_cast<std::uint16_t>(entries.size()));
  put_u16(archive, static_cast<std::uint16_t>(entries.size()));
  put_u32(archive, static_cast<std::uint32_t>(central.size()));
  put_u32(archive, central_offset);
  put_u16(archive, 0);

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(archive.data(), static_cast<std::streamsize>(archive.size()));
}

std::filesystem::path write_package(const TempWorkspace &workspace, const std::string &name,
                                    const std::string &payload) {
  const auto path = workspace.path() / name;
  write_zip(path, {ZipEntry{.name = "kaizen-manifest.json",
                            .content = R"({"version":"1.0","name":"demo instance","files":1})"},
                   ZipEntry{.name = "data/payload.bin", .content = payload, .deflate = false}});
  return path;
}

std::string http_exchange(const std::uint16_t port, const std::string &raw_request) {
  const int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    throw std::runtime_error("socket failed");
  }
  timeval timeout{};
  timeout.tv_sec = 5;
  setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
  if (connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    close(fd);
    throw std::runtime_error("connect failed on port " + std::to_string(port));
  }

  std::size_t sent = 0;
  while (sent < raw_request.size()) {
    const ssize_t n = send(fd, raw_request.data() + sent, raw_request.size() - sent, 0);
    if (n <= 0) {
      break;
    }
    sent += static_cast<std::size_t>(n);
  }

  std::string response;
  char buffer[8192];
  while (true) {
    const ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
    if (n <= 0) {
      break;
    }
    response.append(buffer, static_cast<std::size_t>(n));
  }
  close(fd);
  return response;
}

std::string response_body(const std::string &response) {
  const auto pos = response.find("\r\n\r\n");
  return pos == std::string::npos ? "" : response.substr(pos + 4);
}

int response_status(const std::string &response) {
  // "HTTP/1.1 200 OK"
  if (response.size() < 12) {
    return 0;
  }
  return std::stoi(response.substr(9, 3));
}

bool wait_until(const std::function<bool()> &predicate, const std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  return predicate();
}

void RecordingEventSink::on_status(const sharing::ShareStatusEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  statuses_.push_back(event);
}

void RecordingEventSink::on_download(const sharing::ShareDownloadEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  downloads_.push_back(event);
}

std::vector<sharing::ShareStatusEvent> RecordingEventSink::statuses() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return statuses_;
}

std::vector<sharing::ShareDownloadEvent> RecordingEventSink::downloads() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return downloads_;
}

bool RecordingEventSink::saw_completed_download() const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &event : downloads_) {
    if (event.completed) {
      return true;
    }
  }
  return false;
}

} // namespace tunnelshare::testing
