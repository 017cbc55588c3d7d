#include "tunnelshare/package/manifest.hpp"

#include "tunnelshare/common/json_util.hpp"

#include <zlib.h>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <optional>

namespace tunnelshare::package {

namespace {

constexpr std::uint32_t kEndOfCentralDirSignature = 0x06054b50;
constexpr std::uint32_t kCentralDirSignature = 0x02014b50;
constexpr std::uint32_t kLocalHeaderSignature = 0x04034b50;
constexpr std::size_t kEndOfCentralDirSize = 22;
constexpr std::size_t kCentralDirHeaderSize = 46;
constexpr std::size_t kLocalHeaderSize = 30;
constexpr std::size_t kMaxCommentSize = 0xFFFF;

struct CentralEntry {
  std::uint16_t method = 0;
  std::uint32_t crc = 0;
  std::uint32_t compressed_size = 0;
  std::uint32_t uncompressed_size = 0;
  std::uint32_t local_header_offset = 0;
};

std::uint16_t read_u16(const std::string &buf, const std::size_t pos) {
  return static_cast<std::uint16_t>(static_cast<unsigned char>(buf[pos]) |
                                    (static_cast<unsigned char>(buf[pos + 1]) << 8));
}

std::uint32_t read_u32(const std::string &buf, const std::size_t pos) {
  return static_cast<std::uint32_t>(read_u16(buf, pos)) |
         (static_cast<std::uint32_t>(read_u16(buf, pos + 2)) << 16);
}

common::Result<std::string> invalid(std::string message) {
  return common::Result<std::string>::failure(common::ErrorKind::InvalidPackage,
                                              std::move(message));
}

std::optional<std::string> read_at(std::ifstream &file, const std::uint64_t offset,
                                   const std::size_t size) {
  std::string buf(size, '\0');
  file.clear();
  file.seekg(static_cast<std::streamoff>(offset));
  if (!file.read(buf.data(), static_cast<std::streamsize>(size))) {
    return std::nullopt;
  }
  return buf;
}

common::Result<CentralEntry> find_central_entry(std::ifstream &file, const std::uint64_t file_size,
                                                const std::string &entry_name) {
  using EntryResult = common::Result<CentralEntry>;
  if (file_size < kEndOfCentralDirSize) {
    return EntryResult::failure(common::ErrorKind::InvalidPackage, "not a zip archive");
  }

  const std::size_t tail_size = static_cast<std::size_t>(
      std::min<std::uint64_t>(file_size, kEndOfCentralDirSize + kMaxCommentSize));
  const auto tail = read_at(file, file_size - tail_size, tail_size);
  if (!tail.has_value()) {
    return EntryResult::failure(common::ErrorKind::Io, "failed to read archive tail");
  }

  std::optional<std::size_t> eocd;
  for (std::size_t pos = tail_size - kEndOfCentralDirSize + 1; pos-- > 0;) {
    if (read_u32(*tail, pos) == kEndOfCentralDirSignature) {
      eocd = pos;
      break;
    }
  }
  if (!eocd.has_value()) {
    return EntryResult::failure(common::ErrorKind::InvalidPackage,
                                "end of central directory not found");
  }

  const std::uint16_t entry_count = read_u16(*tail, *eocd + 10);
  const std::uint32_t dir_size = read_u32(*tail, *eocd + 12);
  const std::uint32_t dir_offset = read_u32(*tail, *eocd + 16);
  if (entry_count == 0xFFFF || dir_offset == 0xFFFFFFFF) {
    return EntryResult::failure(common::ErrorKind::InvalidPackage,
                                "ZIP64 archives are not supported");
  }
  if (static_cast<std::uint64_t>(dir_offset) + dir_size > file_size) {
    return EntryResult::failure(common::ErrorKind::InvalidPackage,
                                "central directory out of bounds");
  }

  const auto dir = read_at(file, dir_offset, dir_size);
  if (!dir.has_value()) {
    return EntryResult::failure(common::ErrorKind::Io, "failed to read central directory");
  }

  std::size_t pos = 0;
  for (std::uint16_t i = 0; i < entry_count; ++i) {
    if (pos + kCentralDirHeaderSize > dir->size() ||
        read_u32(*dir, pos) != kCentralDirSignature) {
      return EntryResult::failure(common::ErrorKind::InvalidPackage,
                                  "corrupt central directory");
    }
    const std::uint16_t name_len = read_u16(*dir, pos + 28);
    const std::uint16_t extra_len = read_u16(*dir, pos + 30);
    const std::uint16_t comment_len = read_u16(*dir, pos + 32);
    if (pos + kCentralDirHeaderSize + name_len > dir->size()) {
      return EntryResult::failure(common::ErrorKind::InvalidPackage,
                                  "corrupt central directory");
    }

    if (dir->compare(pos + kCentralDirHeaderSize, name_len, entry_name) == 0 &&
        name_len == entry_name.size()) {
      CentralEntry entry;
      entry.method = read_u16(*dir, pos + 10);
      entry.crc = read_u32(*dir, pos + 16);
      entry.compressed_size = read_u32(*dir, pos + 20);
      entry.uncompressed_size = read_u32(*dir, pos + 24);
      entry.local_header_offset = read_u32(*dir, pos + 42);
      return EntryResult::success(entry);
    }
    pos += kCentralDirHeaderSize + name_len + extra_len + comment_len;
  }

  return EntryResult::failure(common::ErrorKind::NotFound,
                              "Missing " + entry_name + " in package");
}

common::Result<std::string> inflate_raw(std::string &compressed, const std::size_t expected) {
  std::string out(expected, '\0');
  z_stream stream{};
  if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
    return invalid("inflateInit2 failed");
  }
  stream.next_in = reinterpret_cast<Bytef *>(compressed.data());
  stream.avail_in = static_cast<uInt>(compressed.size());
  stream.next_out = reinterpret_cast<Bytef *>(out.data());
  stream.avail_out = static_cast<uInt>(out.size());

  const int rc = inflate(&stream, Z_FINISH);
  const auto produced = stream.total_out;
  inflateEnd(&stream);
  if (rc != Z_STREAM_END || produced != expected) {
    return invalid("failed to inflate entry");
  }
  return common::Result<std::string>::success(std::move(out));
}

} // namespace

common::Result<std::string> read_zip_entry(const std::filesystem::path &archive,
                                           const std::string &entry_name) {
  std::error_code ec;
  const auto file_size = std::filesystem::file_size(archive, ec);
  if (ec) {
    return common::Result<std::string>::failure(
        common::ErrorKind::Io, "Failed to stat " + archive.string() + ": " + ec.message());
  }

  std::ifstream file(archive, std::ios::binary);
  if (!file) {
    return common::Result<std::string>::failure(common::ErrorKind::Io,
                                                "Failed to open " + archive.string());
  }

  auto found = find_central_entry(file, file_size, entry_name);
  if (!found.ok()) {
    return common::Result<std::string>::failure(found.status());
  }
  const CentralEntry entry = found.value();
  if (entry.uncompressed_size > kMaxEntryBytes || entry.compressed_size > kMaxEntryBytes) {
    return invalid(entry_name + " exceeds the maximum entry size");
  }

  const auto local = read_at(file, entry.local_header_offset, kLocalHeaderSize);
  if (!local.has_value() || read_u32(*local, 0) != kLocalHeaderSignature) {
    return invalid("corrupt local header for " + entry_name);
  }
  const std::uint64_t data_offset = static_cast<std::uint64_t>(entry.local_header_offset) +
                                    kLocalHeaderSize + read_u16(*local, 26) +
                                    read_u16(*local, 28);
  auto data = read_at(file, data_offset, entry.compressed_size);
  if (!data.has_value()) {
    return invalid("truncated data for " + entry_name);
  }

  std::string content;
  if (entry.method == 0) {
    if (entry.compressed_size != entry.uncompressed_size) {
      return invalid("stored entry size mismatch for " + entry_name);
    }
    content = std::move(*data);
  } else if (entry.method == 8) {
    auto inflated = inflate_raw(*data, entry.uncompressed_size);
    if (!inflated.ok()) {
      return inflated;
    }
    content = std::move(inflated.value());
  } else {
    return invalid("unsupported compression method " + std::to_string(entry.method));
  }

  const uLong crc = crc32(crc32(0L, Z_NULL, 0), reinterpret_cast<const Bytef *>(content.data()),
                          static_cast<uInt>(content.size()));
  if (static_cast<std::uint32_t>(crc) != entry.crc) {
    return invalid("CRC mismatch for " + entry_name);
  }
  return common::Result<std::string>::success(std::move(content));
}

common::Result<std::string> read_manifest(const std::filesystem::path &archive,
                                          const std::string &entry_name) {
  auto json = read_zip_entry(archive, entry_name);
  if (!json.ok()) {
    return json;
  }

  if (!common::json_looks_like_object(json.value())) {
    return invalid(entry_name + " is not a JSON object");
  }
  const std::string version = common::json_get_string(json.value(), "version");
  if (version != kManifestVersion) {
    const auto raw = common::json_get_scalar(json.value(), "version");
    return invalid("Unsupported manifest version: " + raw.value_or("<missing>") +
                   ". Expected: " + kManifestVersion);
  }
  return json;
}

} // namespace tunnelshare::package
