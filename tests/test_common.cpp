#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "fsgate/common/digest.hpp"
#include "fsgate/common/fs.hpp"
#include "fsgate/common/toml.hpp"

void register_common_tests(std::vector<fsgate::tests::TestCase> &tests) {
  using fsgate::tests::require;
  namespace common = fsgate::common;

  tests.push_back({"common_trim_and_lower", [] {
                     require(common::trim("  a b \n") == "a b", "trim both sides");
                     require(common::trim("   ").empty(), "all-space trims to empty");
                     require(common::to_lower("XLSX") == "xlsx", "lowercase");
                   }});

  tests.push_back({"common_is_subpath_is_segment_wise", [] {
                     require(common::is_subpath("/home/u/Downloads/a.json", "/home/u/Downloads"),
                             "child should match");
                     require(common::is_subpath("/home/u/Downloads", "/home/u/Downloads"),
                             "root itself should match");
                     require(!common::is_subpath("/home/u/Downloads2/a.json", "/home/u/Downloads"),
                             "sibling with shared string prefix must not match");
                     require(!common::is_subpath("/home/u", "/home/u/Downloads"),
                             "parent must not match");
                     require(!common::is_subpath("/etc/passwd", ""), "empty root never matches");
                   }});

  tests.push_back({"common_lowercase_extension", [] {
                     require(common::lowercase_extension("/a/B.JSON") == std::optional<std::string>("json"),
                             "extension is lowercased");
                     require(common::lowercase_extension("/a/report.tar.xml") ==
                                 std::optional<std::string>("xml"),
                             "last extension wins");
                     require(!common::lowercase_extension("/a/README").has_value(),
                             "no extension");
                     require(!common::lowercase_extension("/a/.json").has_value(),
                             "dot file has no extension");
                     require(!common::lowercase_extension("/a/file.").has_value(),
                             "trailing dot has no extension");
                   }});

  tests.push_back({"common_expand_home_only_tilde", [] {
                     const fsgate::testing::EnvGuard home("HOME", "/home/tester");
                     const fsgate::testing::EnvGuard var("FSGATE_TEST_VAR", "injected");
                     require(common::expand_home("~/Downloads/a.json") ==
                                 "/home/tester/Downloads/a.json",
                             "tilde expands");
                     require(common::expand_home("/tmp/$FSGATE_TEST_VAR.json") ==
                                 "/tmp/$FSGATE_TEST_VAR.json",
                             "variables are not expanded in caller paths");
                     require(common::expand_home("~other/a.json") == "~other/a.json",
                             "~user is left alone");
                     require(common::expand_path("$FSGATE_TEST_VAR/x") == "injected/x",
                             "config paths expand variables");
                   }});

  tests.push_back({"common_sha256_hex", [] {
                     require(common::sha256_hex("abc") ==
                                 "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                             "known SHA-256 vector");
                     require(common::sha256_hex("").size() == 64, "hex digest length");
                   }});

  tests.push_back({"common_toml_sections_and_types", [] {
                     const auto parsed = common::parse_toml(R"(
# comment
[audit]
enabled = true   # trailing comment
path = "/var/tmp/a#b.db"

[limits]
size = 10_485_760
names = ["json", 'xml']
)");
                     require(parsed.ok(), parsed.error());
                     const auto &doc = parsed.value();
                     require(doc.get_bool("audit.enabled", false), "bool value");
                     require(doc.get_string("audit.path") == "/var/tmp/a#b.db",
                             "hash inside quotes is kept");
                     require(doc.get_u64("limits.size", 0) == 10485760, "underscored integer");
                     const auto names = doc.get_string_array("limits.names");
                     require(names.size() == 2 && names[0] == "json" && names[1] == "xml",
                             "string array");
                     require(doc.get_string("missing.key", "fallback") == "fallback", "fallback");
                   }});

  tests.push_back({"common_toml_rejects_malformed_line", [] {
                     const auto parsed = common::parse_toml("[ok]\njust some words\n");
                     require(!parsed.ok(), "line without '=' must fail");
                     require(parsed.code() == common::ErrorCode::Config, "config error code");
                     require(parsed.error().find("line 2") != std::string::npos,
                             "error names the line");
                   }});

  tests.push_back({"common_error_code_names", [] {
                     require(common::error_code_name(common::ErrorCode::RateLimitExceeded) ==
                                 "rate_limit_exceeded",
                             "rate limit name");
                     require(common::error_code_name(common::ErrorCode::PathNotAllowed) ==
                                 "path_not_allowed",
                             "path name");
                     require(common::is_retryable(common::ErrorCode::RateLimitExceeded),
                             "rate limit is retryable");
                     require(!common::is_retryable(common::ErrorCode::PayloadTooLarge),
                             "size is not retryable");
                   }});

  tests.push_back({"common_result_value_on_failure_throws", [] {
                     const auto failed =
                         common::Result<int>::failure(common::ErrorCode::IoFailure, "boom");
                     require(!failed.ok(), "failure is not ok");
                     require(failed.status().code() == common::ErrorCode::IoFailure,
                             "status keeps code");
                     bool threw = false;
                     try {
                       (void)failed.value();
                     } catch (const std::logic_error &) {
                       threw = true;
                     }
                     require(threw, "value() on failure throws");
                   }});
}
