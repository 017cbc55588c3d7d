#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"
#include "tunnelshare/package/manifest.hpp"

#include <fstream>

void register_package_tests(std::vector<tunnelshare::tests::TestCase> &tests) {
  using tunnelshare::tests::require;
  using tunnelshare::tests::require_ok;
  namespace pkg = tunnelshare::package;
  namespace ts = tunnelshare::testing;
  using tunnelshare::common::ErrorKind;

  tests.push_back({"read_zip_entry_stored_and_deflated", [] {
                     ts::TempWorkspace workspace;
                     const auto path = workspace.path() / "mixed.zip";
                     const std::string big(100000, 'z');
                     ts::write_zip(path, {ts::ZipEntry{.name = "a.txt", .content = "alpha",
                                                       .deflate = false},
                                          ts::ZipEntry{.name = "dir/b.txt", .content = big}});

                     auto stored = pkg::read_zip_entry(path, "a.txt");
                     require_ok(stored);
                     require(stored.value() == "alpha", "stored entry content");

                     auto deflated = pkg::read_zip_entry(path, "dir/b.txt");
                     require_ok(deflated);
                     require(deflated.value() == big, "deflated entry content");
                   }});

  tests.push_back({"read_zip_entry_missing_entry_is_not_found", [] {
                     ts::TempWorkspace workspace;
                     const auto path = workspace.path() / "one.zip";
                     ts::write_zip(path, {ts::ZipEntry{.name = "a.txt", .content = "alpha"}});
                     auto missing = pkg::read_zip_entry(path, "a.tx");
                     require(!missing.ok(), "prefix name must not match");
                     require(missing.kind() == ErrorKind::NotFound, "missing entry is NotFound");
                     require(missing.error() == "Missing a.tx in package", missing.error());
                   }});

  tests.push_back({"read_zip_entry_rejects_non_zip_and_missing_file", [] {
                     ts::TempWorkspace workspace;
                     workspace.create_file("plain.kaizen", "this is not an archive at all, sorry");
                     auto not_zip = pkg::read_zip_entry(workspace.path() / "plain.kaizen", "x");
                     require(!not_zip.ok(), "plain file is not a zip");
                     require(not_zip.kind() == ErrorKind::InvalidPackage, "InvalidPackage kind");

                     auto absent = pkg::read_zip_entry(workspace.path() / "absent.zip", "x");
                     require(!absent.ok(), "missing archive");
                     require(absent.kind() == ErrorKind::Io, "missing archive is Io");
                   }});

  tests.push_back({"read_zip_entry_detects_crc_mismatch", [] {
                     ts::TempWorkspace workspace;
                     const auto path = workspace.path() / "corrupt.zip";
                     ts::write_zip(path, {ts::ZipEntry{.name = "a.txt", .content = "alpha",
                                                       .deflate = false}});
                     // Flip one payload byte; the local header is 30 bytes plus the name.
                     std::fstream file(path, std::ios::binary | std::ios::in | std::ios::out);
                     file.seekp(30 + 5);
                     file.put('A');
                     file.close();

                     auto corrupt = pkg::read_zip_entry(path, "a.txt");
                     require(!corrupt.ok(), "crc mismatch should fail");
                     require(corrupt.error().find("CRC") != std::string::npos, corrupt.error());
                   }});

  tests.push_back({"read_manifest_checks_version", [] {
                     ts::TempWorkspace workspace;
                     const auto good = ts::write_package(workspace, "good.kaizen");
                     auto manifest = pkg::read_manifest(good, "kaizen-manifest.json");
                     require_ok(manifest);
                     require(manifest.value().find("demo instance") != std::string::npos,
                             "manifest json returned as-is");

                     const auto old = workspace.path() / "old.kaizen";
                     ts::write_zip(old, {ts::ZipEntry{.name = "kaizen-manifest.json",
                                                      .content = R"({"version":"0.9"})"}});
                     auto rejected = pkg::read_manifest(old, "kaizen-manifest.json");
                     require(!rejected.ok(), "old version rejected");
                     require(rejected.kind() == ErrorKind::InvalidPackage, "InvalidPackage kind");
                     require(rejected.error() ==
                                 "Unsupported manifest version: 0.9. Expected: 1.0",
                             rejected.error());

                     const auto numeric = workspace.path() / "numeric.kaizen";
                     ts::write_zip(numeric, {ts::ZipEntry{.name = "kaizen-manifest.json",
                                                          .content = R"({"version": 1.0})"}});
                     auto numeric_result = pkg::read_manifest(numeric, "kaizen-manifest.json");
                     require(numeric_result.error() ==
                                 "Unsupported manifest version: 1.0. Expected: 1.0",
                             numeric_result.error());

                     const auto garbage = workspace.path() / "garbage.kaizen";
                     ts::write_zip(garbage, {ts::ZipEntry{.name = "kaizen-manifest.json",
                                                          .content = "version 1.0"}});
                     auto garbage_result = pkg::read_manifest(garbage, "kaizen-manifest.json");
                     require(garbage_result.kind() == ErrorKind::InvalidPackage,
                             "non-object manifest rejected");
                   }});
}
