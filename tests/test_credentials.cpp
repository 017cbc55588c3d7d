#include "test_framework.hpp"

#include "tunnelshare/security/credentials.hpp"

#include <set>

void register_credentials_tests(std::vector<tunnelshare::tests::TestCase> &tests) {
  using tunnelshare::tests::require;
  using tunnelshare::tests::require_ok;
  namespace sec = tunnelshare::security;

  tests.push_back({"token_is_64_lowercase_hex_chars", [] {
                     auto token = sec::generate_token();
                     require_ok(token);
                     require(token.value().size() == sec::kTokenBytes * 2, "token length mismatch");
                     require(token.value().find_first_not_of("0123456789abcdef") ==
                                 std::string::npos,
                             "token must be lowercase hex");
                   }});

  tests.push_back({"tokens_are_unique", [] {
                     std::set<std::string> seen;
                     for (int i = 0; i < 64; ++i) {
                       auto token = sec::generate_token();
                       require_ok(token);
                       require(seen.insert(token.value()).second, "duplicate token generated");
                     }
                   }});

  tests.push_back({"share_id_is_uuid_v4", [] {
                     auto id = sec::generate_share_id();
                     require_ok(id);
                     const std::string &value = id.value();
                     require(value.size() == 36, "uuid should be 36 chars");
                     require(value[8] == '-' && value[13] == '-' && value[18] == '-' &&
                                 value[23] == '-',
                             "uuid dashes misplaced");
                     require(value[14] == '4', "uuid version nibble should be 4");
                     require(std::string("89ab").find(value[19]) != std::string::npos,
                             "uuid variant nibble should be 8-b");
                   }});

  tests.push_back({"hash_password_is_sha256_of_password_then_salt", [] {
                     // SHA-256("abc")
                     require(sec::hash_password("ab", "c") ==
                                 "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                             "hash should match the SHA-256 test vector");
                     require(sec::hash_password("pw", "share-1") !=
                                 sec::hash_password("pw", "share-2"),
                             "salt must change the hash");
                   }});

  tests.push_back({"validate_password_accepts_only_matching_password", [] {
                     const std::string salt = "0b7d1c7e-2f1e-4a55-9c1e-5e0c2d1a9f00";
                     const std::string stored = sec::hash_password("secret", salt);
                     require(sec::validate_password("secret", salt, stored), "right password");
                     require(!sec::validate_password("Secret", salt, stored), "wrong case");
                     require(!sec::validate_password("", salt, stored), "empty password");
                     require(!sec::validate_password("secret", "other-salt", stored), "wrong salt");
                   }});

  tests.push_back({"constant_time_eq_compares_length_and_content", [] {
                     require(sec::constant_time_eq("abc", "abc"), "equal strings");
                     require(!sec::constant_time_eq("abc", "abd"), "last byte differs");
                     require(!sec::constant_time_eq("abc", "abcd"), "length differs");
                     require(sec::constant_time_eq("", ""), "empty strings are equal");
                   }});
}
