#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "fsgate/gateway/file_gateway.hpp"
#include "fsgate/observability/global.hpp"

namespace {

std::vector<std::uint8_t> bytes_of(const std::string &text) {
  return std::vector<std::uint8_t>(text.begin(), text.end());
}

} // namespace

void register_gateway_tests(std::vector<fsgate::tests::TestCase> &tests) {
  using fsgate::tests::require;
  using fsgate::common::ErrorCode;
  using fsgate::gateway::MAX_FILE_SIZE;
  using fsgate::testing::GatewayFixture;
  using fsgate::testing::TempDir;
  using fsgate::testing::download_root;
  using fsgate::testing::read_file;

  tests.push_back({"gateway_write_text_success", [] {
                     const TempDir dir;
                     const auto downloads = dir.make_dir("Downloads");
                     GatewayFixture fx(download_root(downloads));

                     const std::string path = (downloads / "out.json").string();
                     const auto written = fx.gateway->write_text(path, "{\"a\":1}");
                     require(written.ok(), written.error());
                     require(written.value() == path, "returns the path as given");
                     require(read_file(downloads / "out.json") == "{\"a\":1}", "content on disk");

                     const auto again = fx.gateway->write_text(path, "<x/>");
                     require(again.ok(), again.error());
                     require(read_file(downloads / "out.json") == "<x/>", "overwrites");
                   }});

  tests.push_back({"gateway_write_text_extensions", [] {
                     const TempDir dir;
                     const auto downloads = dir.make_dir("Downloads");
                     GatewayFixture fx(download_root(downloads));

                     require(fx.gateway->write_text((downloads / "A.XML").string(), "<a/>").ok(),
                             "extension match ignores case");

                     const auto xlsx = fx.gateway->write_text((downloads / "a.xlsx").string(), "x");
                     require(!xlsx.ok() && xlsx.code() == ErrorCode::DisallowedExtension,
                             "xlsx is not a text format");
                     require(xlsx.error() ==
                                 "Only .json and .xml files may be written by this operation",
                             "disallowed message");

                     const auto none = fx.gateway->write_text((downloads / "README").string(), "x");
                     require(!none.ok() && none.code() == ErrorCode::MissingExtension,
                             "extension is required");
                     require(none.error() == "File must have an extension", "missing message");
                     require(fx.filesystem->writes == 1, "rejected calls never write");
                   }});

  tests.push_back({"gateway_write_binary", [] {
                     const TempDir dir;
                     const auto downloads = dir.make_dir("Downloads");
                     GatewayFixture fx(download_root(downloads));

                     const std::string payload("PK\x03\x04\x00\xff", 6);
                     const auto ok = fx.gateway->write_binary((downloads / "r.XLSX").string(),
                                                              bytes_of(payload));
                     require(ok.ok(), ok.error());
                     require(read_file(downloads / "r.XLSX") == payload, "bytes preserved");

                     const auto json =
                         fx.gateway->write_binary((downloads / "r.json").string(), bytes_of("{}"));
                     require(!json.ok() && json.code() == ErrorCode::DisallowedExtension,
                             "binary write is xlsx only");
                     const auto none =
                         fx.gateway->write_binary((downloads / "r").string(), bytes_of("x"));
                     require(!none.ok() && none.code() == ErrorCode::MissingExtension,
                             "extension is required");
                   }});

  tests.push_back({"gateway_size_limit_is_inclusive", [] {
                     const TempDir dir;
                     const auto downloads = dir.make_dir("Downloads");
                     GatewayFixture fx(download_root(downloads));

                     const std::string at_limit(MAX_FILE_SIZE, 'a');
                     require(fx.gateway->write_text((downloads / "max.json").string(), at_limit).ok(),
                             "exactly the maximum is accepted");

                     const std::string over(MAX_FILE_SIZE + 1, 'a');
                     const auto rejected =
                         fx.gateway->write_text((downloads / "over.json").string(), over);
                     require(!rejected.ok() && rejected.code() == ErrorCode::PayloadTooLarge,
                             "one byte over is rejected");
                     require(rejected.error() == "File size exceeds the maximum (10 MB)",
                             "size message");
                     require(!std::filesystem::exists(downloads / "over.json"), "nothing written");
                   }});

  tests.push_back({"gateway_size_checked_before_extension", [] {
                     const TempDir dir;
                     GatewayFixture fx(download_root(dir.make_dir("Downloads")));
                     const std::string over(MAX_FILE_SIZE + 1, 'a');
                     const auto rejected = fx.gateway->write_text("/etc/README", over);
                     require(rejected.code() == ErrorCode::PayloadTooLarge,
                             "size stage runs first");
                   }});

  tests.push_back({"gateway_rejects_paths_outside_roots", [] {
                     const TempDir dir;
                     const auto downloads = dir.make_dir("Downloads");
                     const auto other = dir.make_dir("Other");
                     GatewayFixture fx(download_root(downloads));

                     const auto outside = fx.gateway->write_text((other / "a.json").string(), "{}");
                     require(!outside.ok() && outside.code() == ErrorCode::PathNotAllowed,
                             "outside the roots");
                     require(outside.error() ==
                                 "Saving is only allowed to the Downloads, Documents or Desktop folders",
                             "containment message");

                     const auto climb = fx.gateway->write_text(
                         (downloads / ".." / "Other" / "b.json").string(), "{}");
                     require(!climb.ok() && climb.code() == ErrorCode::PathNotAllowed,
                             ".. cannot leave the root");
                     require(fx.filesystem->writes == 0, "no write attempted");
                     require(!std::filesystem::exists(other / "b.json"), "nothing created");
                   }});

  tests.push_back({"gateway_write_through_dangling_symlink_is_rejected", [] {
                     const TempDir dir;
                     const auto downloads = dir.make_dir("Downloads");
                     const auto outside = dir.make_dir("outside");
                     std::filesystem::create_symlink(outside / "escaped.json",
                                                     downloads / "link.json");
                     GatewayFixture fx(download_root(downloads));

                     const auto written =
                         fx.gateway->write_text((downloads / "link.json").string(), "{}");
                     require(!written.ok() && written.code() == ErrorCode::PathNotAllowed,
                             "write through a dangling link is not allowed");
                     require(fx.filesystem->writes == 0, "no write attempted");
                     require(!std::filesystem::exists(outside / "escaped.json"),
                             "nothing created outside the root");

                     const auto read = fx.gateway->read_text((downloads / "link.json").string());
                     require(!read.ok() && read.code() == ErrorCode::PathNotAllowed,
                             "read through a dangling link is not allowed");
                   }});

  tests.push_back({"gateway_invalid_path_input", [] {
                     const TempDir dir;
                     GatewayFixture fx(download_root(dir.make_dir("Downloads")));
                     const std::string with_nul("/tmp/a\0b.json", 13);
                     const auto rejected = fx.gateway->write_text(with_nul, "{}");
                     require(!rejected.ok() && rejected.code() == ErrorCode::InvalidArgument,
                             "NUL in path is an invalid argument");
                   }});

  tests.push_back({"gateway_write_io_failure_keeps_detail", [] {
                     const TempDir dir;
                     const auto downloads = dir.make_dir("Downloads");
                     GatewayFixture fx(download_root(downloads));
                     fx.filesystem->write_error = "No space left on device";

                     const auto failed = fx.gateway->write_text((downloads / "a.json").string(), "{}");
                     require(!failed.ok() && failed.code() == ErrorCode::IoFailure, "io failure");
                     require(failed.error() == "Write error: No space left on device",
                             "underlying detail is kept");
                   }});

  tests.push_back({"gateway_read_text", [] {
                     const TempDir dir;
                     const auto downloads = dir.make_dir("Downloads");
                     const auto file = dir.create_file("Downloads/in.json", "{\"k\":\"значение\"}");
                     GatewayFixture fx(download_root(downloads));

                     const auto read = fx.gateway->read_text(file.string());
                     require(read.ok(), read.error());
                     require(read.value() == "{\"k\":\"значение\"}", "utf-8 content");

                     const auto missing = fx.gateway->read_text((downloads / "none.json").string());
                     require(!missing.ok() && missing.code() == ErrorCode::IoFailure,
                             "missing file is an io failure");
                     require(missing.error().rfind("Failed to get file information: ", 0) == 0,
                             "metadata message");
                   }});

  tests.push_back({"gateway_read_rejects_invalid_utf8", [] {
                     const TempDir dir;
                     const auto downloads = dir.make_dir("Downloads");
                     const auto file = dir.create_file("Downloads/bin.json", std::string("\xff\xfe{", 3));
                     GatewayFixture fx(download_root(downloads));

                     const auto read = fx.gateway->read_text(file.string());
                     require(!read.ok() && read.code() == ErrorCode::IoFailure, "io failure");
                     require(read.error() == "Read error: stream did not contain valid UTF-8",
                             "utf-8 message");
                   }});

  tests.push_back({"gateway_read_size_from_metadata", [] {
                     const TempDir dir;
                     const auto downloads = dir.make_dir("Downloads");
                     const auto file = dir.create_file("Downloads/big.json", "{}");
                     GatewayFixture fx(download_root(downloads));
                     fx.filesystem->reported_size = MAX_FILE_SIZE + 1;

                     const auto read = fx.gateway->read_text(file.string());
                     require(!read.ok() && read.code() == ErrorCode::PayloadTooLarge,
                             "reported size is enforced");
                     require(fx.filesystem->reads == 0, "content is never read");

                     fx.filesystem->reported_size = MAX_FILE_SIZE;
                     require(fx.gateway->read_text(file.string()).ok(), "maximum is readable");
                   }});

  tests.push_back({"gateway_read_containment_before_stat", [] {
                     const TempDir dir;
                     GatewayFixture fx(download_root(dir.make_dir("Downloads")));

                     const auto traversal = fx.gateway->read_text("/tmp/evil/../../etc/passwd");
                     require(!traversal.ok() && traversal.code() == ErrorCode::PathNotAllowed,
                             "outside the roots regardless of extension");
                     require(traversal.error() ==
                                 "Reading is only allowed from the Downloads, Documents or Desktop folders",
                             "read containment message");
                     require(fx.filesystem->size_queries == 0 && fx.filesystem->reads == 0,
                             "nothing outside the roots is touched");
                   }});

  tests.push_back({"gateway_read_extension_rules", [] {
                     const TempDir dir;
                     const auto downloads = dir.make_dir("Downloads");
                     dir.create_file("Downloads/a.xlsx", "x");
                     dir.create_file("Downloads/notes", "x");
                     GatewayFixture fx(download_root(downloads));

                     const auto xlsx = fx.gateway->read_text((downloads / "a.xlsx").string());
                     require(!xlsx.ok() && xlsx.code() == ErrorCode::DisallowedExtension,
                             "xlsx is not readable as text");
                     const auto none = fx.gateway->read_text((downloads / "notes").string());
                     require(!none.ok() && none.code() == ErrorCode::MissingExtension,
                             "extension is required");
                     require(fx.filesystem->size_queries == 0, "no metadata lookups");
                   }});

  tests.push_back({"gateway_rate_limit_per_operation", [] {
                     const TempDir dir;
                     const auto downloads = dir.make_dir("Downloads");
                     GatewayFixture fx(download_root(downloads),
                                       fsgate::security::RateLimitOptions{.max_calls = 2});

                     const std::string path = (downloads / "r.json").string();
                     require(fx.gateway->write_text(path, "{}").ok(), "first");
                     require(!fx.gateway->write_text((downloads / "bad").string(), "{}").ok(),
                             "rejected call still counts against the budget");
                     const auto limited = fx.gateway->write_text(path, "{}");
                     require(!limited.ok() && limited.code() == ErrorCode::RateLimitExceeded,
                             "third call is rate limited");
                     require(limited.error() == "Too many requests. Please try again later.",
                             "rate message");

                     require(fx.gateway->read_text(path).ok(), "reads have their own budget");
                     require(fx.gateway->write_binary((downloads / "b.xlsx").string(), bytes_of("x"))
                                 .ok(),
                             "binary writes have their own budget");
                   }});

  tests.push_back({"gateway_russian_messages", [] {
                     const TempDir dir;
                     const auto downloads = dir.make_dir("Downloads");
                     auto fs = std::make_shared<fsgate::testing::FakeFileSystem>();
                     auto guard = std::make_shared<fsgate::security::PathGuard>(
                         std::make_shared<fsgate::platform::FixedDirectoryProvider>(
                             download_root(downloads)),
                         fs);
                     fsgate::security::RateLimiter limiter;
                     fsgate::gateway::FileGateway gateway(
                         guard, fs, limiter,
                         fsgate::gateway::GatewayOptions{.locale = fsgate::gateway::Locale::Ru});

                     const auto none = gateway.write_text((downloads / "x").string(), "{}");
                     require(none.error() == "Файл должен иметь расширение", "ru missing extension");
                     const auto outside = gateway.write_text("/etc/x.json", "{}");
                     require(outside.error() ==
                                 "Сохранение разрешено только в папки: Загрузки, Документы или Рабочий стол",
                             "ru containment");
                     const auto xlsx = gateway.write_text((downloads / "x.xlsx").string(), "{}");
                     require(xlsx.error() == "Разрешена запись только .json и .xml файлов",
                             "ru text extensions");
                     const auto json = gateway.write_binary((downloads / "x.json").string(),
                                                            bytes_of("{}"));
                     require(json.error() ==
                                 "Разрешена запись только .xlsx файлов через эту команду",
                             "ru binary extensions");
                     dir.create_file("Downloads/x.xlsx", "x");
                     const auto read = gateway.read_text((downloads / "x.xlsx").string());
                     require(read.error() == "Разрешено чтение только .json и .xml файлов",
                             "ru read extensions");
                   }});

  tests.push_back({"gateway_list_allowed_roots", [] {
                     const TempDir dir;
                     const auto downloads = dir.make_dir("Downloads");
                     GatewayFixture fx({
                         {fsgate::platform::DirectoryCategory::Download, downloads},
                         {fsgate::platform::DirectoryCategory::Desktop, dir.path() / "Desktop"},
                     });
                     const auto roots = fx.gateway->list_allowed_roots();
                     require(roots.size() == 1 && roots[0] == downloads.string(),
                             "only existing roots are listed");
                     require(fx.limiter->tracked_operations() == 0, "listing is not rate limited");
                   }});

  tests.push_back({"gateway_reports_decisions", [] {
                     const TempDir dir;
                     const auto downloads = dir.make_dir("Downloads");
                     GatewayFixture fx(download_root(downloads));
                     auto recorder = std::make_unique<fsgate::testing::RecordingObserver>();
                     auto *observer = recorder.get();
                     fsgate::observability::set_global_observer(std::move(recorder));

                     require(fx.gateway->write_text((downloads / "a.json").string(), "{}").ok(),
                             "write");
                     require(!fx.gateway->write_text((downloads / "a").string(), "{}").ok(),
                             "rejected");

                     const auto decisions = observer->decisions();
                     require(decisions.size() == 2, "one decision per call");
                     require(decisions[0].operation == "save_file_secure" &&
                                 decisions[0].stage == "done" && decisions[0].outcome == "ok",
                             "successful write");
                     require(decisions[1].stage == "extension" &&
                                 decisions[1].outcome == "missing_extension",
                             "rejection names its stage");
                     require(observer->metric_count() == 1, "bytes metric for the success only");
                   }});
}
