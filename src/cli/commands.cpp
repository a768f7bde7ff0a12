#include "fsgate/cli/commands.hpp"

#include "fsgate/audit/audit_log.hpp"
#include "fsgate/common/fs.hpp"
#include "fsgate/config/config.hpp"
#include "fsgate/gateway/factory.hpp"
#include "fsgate/io/filesystem.hpp"
#include "fsgate/observability/factory.hpp"
#include "fsgate/observability/global.hpp"
#include "fsgate/platform/user_dirs.hpp"
#include "fsgate/security/path_guard.hpp"

#include <charconv>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fsgate::cli {

namespace {

std::string version_string() {
#ifdef FSGATE_VERSION
  return std::string("fsgate ") + FSGATE_VERSION;
#else
  return "fsgate 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

void print_help() {
  std::cout << "Usage: fsgate [--config PATH] <command> [args]\n\n"
            << "Commands:\n"
            << "  write-text <path> (--content TEXT | --from FILE)   write a .json/.xml file\n"
            << "  write-binary <path> --from FILE                    write a .xlsx file\n"
            << "  read-text <path>                                   print a .json/.xml file\n"
            << "  roots                                              list allowed directories\n"
            << "  check-path <path>                                  show how a path resolves\n"
            << "  audit [--limit N]                                  show recent decisions\n"
            << "  config-path                                        print the config file path\n"
            << "  version                                            print the version\n";
}

common::Result<std::string> read_local_file(const std::string &path) {
  std::ifstream in(common::expand_home(path), std::ios::binary);
  if (!in) {
    return common::Result<std::string>::failure(common::ErrorCode::IoFailure,
                                                "Unable to open " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return common::Result<std::string>::success(buffer.str());
}

common::Result<config::Config> load_validated_config() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return loaded;
  }
  const auto validated = config::validate_config(loaded.value());
  if (!validated.ok()) {
    return common::Result<config::Config>::failure(validated.status());
  }
  for (const auto &warning : validated.value()) {
    std::cerr << "[WARN] config: " << warning << "\n";
  }
  return loaded;
}

int report_failure(const std::string &message) {
  std::cerr << message << "\n";
  return 1;
}

int run_write(gateway::FileGateway &gw, std::vector<std::string> args, const bool binary) {
  std::string content;
  std::string from;
  const bool has_content = take_option(args, "--content", "-c", content);
  const bool has_from = take_option(args, "--from", "-f", from);
  if (args.size() != 1 || has_content == has_from || (binary && has_content)) {
    return report_failure(binary ? "usage: fsgate write-binary <path> --from FILE"
                                 : "usage: fsgate write-text <path> (--content TEXT | --from FILE)");
  }

  if (has_from) {
    auto loaded = read_local_file(from);
    if (!loaded.ok()) {
      return report_failure(loaded.error());
    }
    content = std::move(loaded.value());
  }

  common::Result<std::string> result = common::Result<std::string>::failure("not run");
  if (binary) {
    const std::vector<std::uint8_t> bytes(content.begin(), content.end());
    result = gw.write_binary(args[0], bytes);
  } else {
    result = gw.write_text(args[0], content);
  }
  if (!result.ok()) {
    return report_failure(result.error());
  }
  std::cout << result.value() << "\n";
  return 0;
}

int run_read(gateway::FileGateway &gw, const std::vector<std::string> &args) {
  if (args.size() != 1) {
    return report_failure("usage: fsgate read-text <path>");
  }
  const auto result = gw.read_text(args[0]);
  if (!result.ok()) {
    return report_failure(result.error());
  }
  std::cout << result.value();
  if (!result.value().empty() && result.value().back() != '\n') {
    std::cout << "\n";
  }
  return 0;
}

int run_check_path(const config::Config &config, const std::vector<std::string> &args) {
  if (args.size() != 1) {
    return report_failure("usage: fsgate check-path <path>");
  }
  const security::PathGuard guard(platform::create_directory_provider(config.roots),
                                  std::make_shared<io::LocalFileSystem>());
  const auto resolved = guard.resolve(args[0]);
  if (!resolved.ok()) {
    std::cout << "denied: " << resolved.error() << "\n";
    return 1;
  }
  const auto &value = resolved.value();
  std::cout << "allowed: " << value.target.string() << "\n"
            << "  root: " << value.root.string() << "\n"
            << "  branch: "
            << (value.branch == security::ResolutionBranch::NewTarget ? "new-target"
                                                                      : "existing-target")
            << "\n";
  return 0;
}

int run_audit(const config::Config &config, std::vector<std::string> args) {
  std::string limit_text = "20";
  take_option(args, "--limit", "-n", limit_text);
  std::size_t limit = 0;
  const auto *first = limit_text.data();
  const auto *last = first + limit_text.size();
  if (auto [ptr, ec] = std::from_chars(first, last, limit); ec != std::errc() || ptr != last) {
    return report_failure("--limit must be a non-negative integer");
  }

  if (!config.audit.enabled) {
    return report_failure("audit log is disabled (set audit.enabled = true)");
  }
  audit::AuditLog log(config.audit.path);
  if (!log.is_open()) {
    return report_failure("Unable to open audit log: " + config.audit.path);
  }
  const auto entries = log.recent(limit);
  if (!entries.ok()) {
    return report_failure(entries.error());
  }
  for (const auto &entry : entries.value()) {
    std::cout << entry.timestamp_ms << "\t" << entry.operation << "\t"
              << common::error_code_name(entry.outcome) << "\t" << entry.bytes << "\t"
              << entry.path;
    if (entry.sha256.has_value()) {
      std::cout << "\t" << *entry.sha256;
    }
    std::cout << "\n";
  }
  return 0;
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);

  std::string config_override;
  if (take_option(args, "--config", "", config_override)) {
    config::set_config_path_override(std::filesystem::path(config_override));
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    const auto path = config::config_path();
    if (!path.ok()) {
      return report_failure(path.error());
    }
    std::cout << path.value().string() << "\n";
    return 0;
  }

  const auto cfg = load_validated_config();
  if (!cfg.ok()) {
    return report_failure(cfg.error());
  }
  observability::set_global_observer(observability::create_observer(cfg.value()));

  if (subcommand == "check-path") {
    return run_check_path(cfg.value(), args);
  }
  if (subcommand == "audit") {
    return run_audit(cfg.value(), std::move(args));
  }

  auto gw = gateway::create_gateway(cfg.value());
  if (!gw.ok()) {
    return report_failure(gw.error());
  }

  if (subcommand == "write-text") {
    return run_write(*gw.value(), std::move(args), false);
  }
  if (subcommand == "write-binary") {
    return run_write(*gw.value(), std::move(args), true);
  }
  if (subcommand == "read-text") {
    return run_read(*gw.value(), args);
  }
  if (subcommand == "roots") {
    for (const auto &root : gw.value()->list_allowed_roots()) {
      std::cout << root << "\n";
    }
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace fsgate::cli
