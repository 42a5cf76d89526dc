#include "skillreg/cli/commands.hpp"

#include "skillreg/common/fs.hpp"
#include "skillreg/config/config.hpp"
#include "skillreg/observability/factory.hpp"
#include "skillreg/observability/global.hpp"
#include "skillreg/registry/builder.hpp"
#include "skillreg/registry/emitter.hpp"
#include "skillreg/registry/reader.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace skillreg::cli {

namespace {

struct CliOptions {
  std::optional<std::string> skills_dir;
  std::optional<std::string> output;
  bool quiet = false;
};

std::string version_string() {
#ifdef SKILLREG_VERSION
  std::string version = SKILLREG_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef SKILLREG_GIT_COMMIT
  const std::string commit = SKILLREG_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "skillreg " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

/// Removes `--name VALUE` or `--name=VALUE`. Returns false when the value is missing.
bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 std::optional<std::string> &out_value, std::string &error) {
  const std::string inline_prefix = long_name + "=";
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name) {
      if (i + 1 >= args.size()) {
        error = "missing value for " + long_name;
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
    if (common::starts_with(args[i], inline_prefix)) {
      const auto value = args[i].substr(inline_prefix.size());
      if (value.empty()) {
        error = "missing value for " + long_name;
        return false;
      }
      out_value = value;
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return true;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, CliOptions &options,
                          std::string &error) {
  std::optional<std::string> config_path;
  if (!take_option(args, "--config", config_path, error)) {
    return false;
  }
  if (config_path.has_value()) {
    config::set_config_path_override(std::filesystem::path(*config_path));
  } else {
    config::clear_config_path_override();
  }

  if (!take_option(args, "--skills-dir", options.skills_dir, error) ||
      !take_option(args, "--output", options.output, error)) {
    return false;
  }
  const bool quiet_long = take_flag(args, "--quiet");
  const bool quiet_short = take_flag(args, "-q");
  options.quiet = quiet_long || quiet_short;
  return true;
}

void print_help(std::ostream &out) {
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *RESET = "\033[0m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *GREEN = "\033[32m";

  out << BOLD << "  USAGE" << RESET << "\n";
  out << DIM << "  $ " << RESET
      << "skillreg [--config PATH] [--skills-dir DIR] [--output FILE] [--quiet] [command]\n\n";

  out << BOLD << "  COMMANDS" << RESET << "\n";
  out << "  " << GREEN << "build" << RESET << DIM
      << "     Validate every package and write the registry (default)" << RESET << "\n";
  out << "  " << GREEN << "check" << RESET << DIM << "     Validate every package, write nothing"
      << RESET << "\n";
  out << "  " << GREEN << "verify" << RESET << DIM
      << "    Compare the written registry with the packages on disk" << RESET << "\n";
  out << "  " << GREEN << "version" << RESET << DIM << "   Show version" << RESET << "\n\n";
}

void print_validation_errors(const std::vector<skills::ValidationError> &errors) {
  for (const auto &error : errors) {
    std::cerr << "  ERROR: " << error.message << " in " << error.package << "\n";
  }
}

/// Shared front half of build/check/verify. Returns nullopt after printing the failure.
std::optional<registry::BuildOutcome> run_pipeline(const config::Config &config,
                                                   const CliOptions &options) {
  registry::RegistryBuilder builder(
      config.skills_dir, {.declaration_file = config.declaration_file,
                          .allow_duplicate_ids = config.registry.allow_duplicate_ids});
  if (!options.quiet) {
    builder.set_progress_callback([](const skills::PackageDirectory &package) {
      std::cout << "Processing: " << package.name << "\n";
    });
  }

  auto built = builder.build();
  if (!built.ok()) {
    std::cerr << built.error() << "\n";
    return std::nullopt;
  }

  const auto &outcome = built.value();
  if (!outcome.ok()) {
    print_validation_errors(outcome.errors);
    std::cerr << "\n" << outcome.errors.size() << " skill(s) failed validation\n";
    return std::nullopt;
  }
  return std::move(built.value());
}

int run_build(const config::Config &config, const CliOptions &options) {
  auto outcome = run_pipeline(config, options);
  if (!outcome.has_value()) {
    return 1;
  }

  const auto written = registry::write_registry(config.output, outcome->records);
  if (!written.ok()) {
    observability::record_error("emitter", written.error());
    std::cerr << "Failed to write registry: " << written.error() << "\n";
    return 1;
  }

  std::error_code ec;
  const auto output = std::filesystem::absolute(config.output, ec);
  std::cout << "\nGenerated " << (ec ? config.output : output.string()) << " with "
            << outcome->records.size() << " skill(s)\n";
  return 0;
}

int run_check(const config::Config &config, const CliOptions &options) {
  auto outcome = run_pipeline(config, options);
  if (!outcome.has_value()) {
    return 1;
  }
  std::cout << "\nAll " << outcome->records.size() << " skill(s) valid\n";
  return 0;
}

int run_verify(const config::Config &config, const CliOptions &options) {
  auto recorded = registry::read_registry(config.output);
  if (!recorded.ok()) {
    std::cerr << "Cannot read registry: " << recorded.error() << "\n";
    return 1;
  }

  auto outcome = run_pipeline(config, options);
  if (!outcome.has_value()) {
    return 1;
  }

  const auto drift = registry::diff_registries(recorded.value(), outcome->records);
  for (const auto &entry : drift) {
    std::cerr << "  DRIFT: " << entry.id << " " << registry::drift_kind_to_string(entry.kind);
    for (std::size_t i = 0; i < entry.fields.size(); ++i) {
      std::cerr << (i == 0 ? " (" : ", ") << entry.fields[i];
    }
    if (!entry.fields.empty()) {
      std::cerr << ")";
    }
    std::cerr << "\n";
  }

  if (!drift.empty()) {
    std::cerr << "\n" << drift.size() << " registry entry(ies) out of date; run `skillreg build`\n";
    return 1;
  }
  std::cout << "\nRegistry " << config.output << " is up to date (" << outcome->records.size()
            << " skill(s))\n";
  return 0;
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argc > 0 ? argv + 1 : argv);

  CliOptions options;
  std::string global_error;
  if (!apply_global_options(args, options, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  std::string subcommand = "build";
  if (!args.empty()) {
    subcommand = args[0];
    args.erase(args.begin());
  }

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help(std::cout);
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand != "build" && subcommand != "check" && subcommand != "verify") {
    std::cerr << "Unknown command: " << subcommand << "\n";
    print_help(std::cerr);
    return 1;
  }
  if (!args.empty()) {
    std::cerr << "Unexpected argument: " << args[0] << "\n";
    print_help(std::cerr);
    return 1;
  }

  auto loaded = config::load_config();
  if (!loaded.ok()) {
    std::cerr << "Failed to load config: " << loaded.error() << "\n";
    return 1;
  }
  auto cfg = std::move(loaded.value());
  if (options.skills_dir.has_value()) {
    cfg.skills_dir = config::expand_config_path(*options.skills_dir);
  }
  if (options.output.has_value()) {
    cfg.output = config::expand_config_path(*options.output);
  }
  if (options.quiet) {
    cfg.observability.level = "error";
  }

  auto validated = config::validate_config(cfg);
  if (!validated.ok()) {
    std::cerr << "Invalid config: " << validated.error() << "\n";
    return 1;
  }

  observability::set_global_observer(observability::create_observer(cfg));
  for (const auto &warning : validated.value()) {
    std::cerr << "warning: " << warning << "\n";
  }

  int status = 1;
  if (subcommand == "build") {
    status = run_build(cfg, options);
  } else if (subcommand == "check") {
    status = run_check(cfg, options);
  } else {
    status = run_verify(cfg, options);
  }
  observability::flush();
  return status;
}

} // namespace skillreg::cli
