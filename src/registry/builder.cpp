#include "skillreg/registry/builder.hpp"

#include "skillreg/common/fs.hpp"
#include "skillreg/observability/global.hpp"
#include "skillreg/skills/content_hash.hpp"
#include "skillreg/skills/scanner.hpp"

#include <chrono>
#include <unordered_map>

namespace skillreg::registry {

RegistryBuilder::RegistryBuilder(std::filesystem::path skills_root, BuildOptions options)
    : skills_root_(std::move(skills_root)), options_(std::move(options)) {}

void RegistryBuilder::set_progress_callback(ProgressCallback callback) {
  progress_ = std::move(callback);
}

PackageResult RegistryBuilder::process_package(const skills::PackageDirectory &package) const {
  auto metadata = skills::MetadataParser::parse_package(
      package, {.declaration_file = options_.declaration_file});
  if (!metadata.ok()) {
    return PackageResult::failure(metadata.error());
  }

  auto fingerprint = skills::compute_content_hash(package.path);
  if (!fingerprint.ok()) {
    return PackageResult::failure(skills::ValidationError{.package = package.name,
                                                          .kind = skills::ErrorKind::ContentReadError,
                                                          .field = "",
                                                          .message = fingerprint.error()});
  }
  observability::record_bytes_hashed(package.name, fingerprint.value().files,
                                     fingerprint.value().bytes);

  auto &meta = metadata.value();
  skills::SkillRecord record;
  record.id = std::move(meta.name);
  record.description = common::trim(meta.description);
  record.version = std::move(meta.version);
  record.author = std::move(meta.author);
  record.content_hash = std::move(fingerprint.value().value);
  record.requires_env = std::move(meta.requires_env);
  record.has_execution_manifest = meta.has_execution;
  return PackageResult::success(std::move(record));
}

common::Result<BuildOutcome> RegistryBuilder::build() const {
  const auto started = std::chrono::steady_clock::now();
  observability::record_scan_start(skills_root_.string());

  auto packages = skills::DirectoryScanner::scan(skills_root_);
  if (!packages.ok()) {
    observability::record_error("scanner", packages.error());
    return common::Result<BuildOutcome>::failure(packages.error());
  }

  BuildOutcome outcome;
  std::unordered_map<std::string, std::string> seen_ids;
  for (const auto &package : packages.value()) {
    ++outcome.packages_scanned;
    if (progress_) {
      progress_(package);
    }
    observability::record_package_start(package.name);

    auto processed = process_package(package);
    if (processed.ok() && !options_.allow_duplicate_ids) {
      const auto &id = processed.value().id;
      if (const auto it = seen_ids.find(id); it != seen_ids.end()) {
        processed = PackageResult::failure(skills::ValidationError{
            .package = package.name,
            .kind = skills::ErrorKind::DuplicateId,
            .field = "name",
            .message = "Duplicate skill id '" + id + "' (already declared by " + it->second + ")"});
      } else {
        seen_ids.emplace(id, package.name);
      }
    }

    if (!processed.ok()) {
      const auto &error = processed.error();
      observability::record_package_rejected(
          package.name, std::string(skills::error_kind_to_string(error.kind)), error.message);
      outcome.errors.push_back(error);
      continue;
    }

    observability::record_package_accepted(package.name, processed.value().id,
                                           processed.value().content_hash);
    outcome.records.push_back(std::move(processed.value()));
  }

  observability::record_run_complete(outcome.records.size(), outcome.errors.size());
  observability::record_build_duration(std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started));
  return common::Result<BuildOutcome>::success(std::move(outcome));
}

} // namespace skillreg::registry
