#pragma once

#include "tunnelshare/common/result.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

namespace tunnelshare::package {

constexpr const char *kManifestVersion = "1.0";
constexpr std::size_t kMaxEntryBytes = 16 * 1024 * 1024;

/// Reads one file out of a ZIP archive. Supports stored and deflated entries
/// up to kMaxEntryBytes and verifies the CRC-32. ZIP64 is not supported.
[[nodiscard]] common::Result<std::string> read_zip_entry(const std::filesystem::path &archive,
                                                         const std::string &entry_name);

/// Returns the manifest JSON embedded in a package after checking its
/// "version" field against kManifestVersion.
[[nodiscard]] common::Result<std::string> read_manifest(const std::filesystem::path &archive,
                                                        const std::string &entry_name);

} // namespace tunnelshare::package
