#include "test_framework.hpp"

#include "skillreg/common/sha256.hpp"
#include "skillreg/skills/content_hash.hpp"
#include "skillreg/skills/metadata.hpp"
#include "skillreg/skills/scanner.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>

namespace {

namespace skills = skillreg::skills;

skills::MetadataResult parse(const std::string &content) {
  return skills::MetadataParser::parse_declaration("pkg", content);
}

void require_kind(const skills::MetadataResult &result, const skills::ErrorKind kind) {
  skillreg::tests::require(!result.ok(), "expected a validation error");
  skillreg::tests::require(result.error().kind == kind,
                           "unexpected kind: " +
                               std::string(skills::error_kind_to_string(result.error().kind)) +
                               " (" + result.error().message + ")");
}

/// Tree whose files sort differently per directory than by full relative path.
void write_ordering_tree(const skillreg::testing::TempWorkspace &ws) {
  ws.create_file("pkg/SKILL.md", "---\nname: demo\n---\n");
  ws.create_file("pkg/scripts/run.py", "print(1)\n");
  ws.create_file("pkg/a-b/x.txt", "x");
  ws.create_file("pkg/a/y.txt", "y");
  ws.create_file("pkg/a.txt", "z");
  ws.create_file("pkg/a/c/w.txt", "w");
}

} // namespace

void register_skills_tests(std::vector<skillreg::tests::TestCase> &tests) {
  using skillreg::tests::require;

  // DirectoryScanner

  tests.push_back({"scanner_lists_subdirectories_sorted", [] {
                     skillreg::testing::TempWorkspace ws;
                     ws.create_dir("skills/foo");
                     ws.create_dir("skills/bar");
                     ws.create_dir("skills/Zeta");
                     ws.create_file("skills/README.md", "not a package");

                     auto scanned = skills::DirectoryScanner::scan(ws.skills_dir());
                     require(scanned.ok(), scanned.error());
                     const auto &dirs = scanned.value();
                     require(dirs.size() == 3, "plain files must be skipped");
                     require(dirs[0].name == "Zeta" && dirs[1].name == "bar" &&
                                 dirs[2].name == "foo",
                             "byte-wise name order expected");
                     require(dirs[1].path == ws.skills_dir() / "bar", "package path");
                   }});

  tests.push_back({"scanner_empty_root_yields_nothing", [] {
                     skillreg::testing::TempWorkspace ws;
                     ws.create_dir("skills");
                     auto scanned = skills::DirectoryScanner::scan(ws.skills_dir());
                     require(scanned.ok(), scanned.error());
                     require(scanned.value().empty(), "no packages expected");
                   }});

  tests.push_back({"scanner_missing_root_fails", [] {
                     skillreg::testing::TempWorkspace ws;
                     auto scanned = skills::DirectoryScanner::scan(ws.path() / "absent");
                     require(!scanned.ok(), "missing root should fail");
                     require(scanned.error().find("Skills directory not found") != std::string::npos,
                             scanned.error());
                   }});

  tests.push_back({"scanner_root_that_is_a_file_fails", [] {
                     skillreg::testing::TempWorkspace ws;
                     ws.create_file("skills", "file");
                     require(!skills::DirectoryScanner::scan(ws.skills_dir()).ok(),
                             "file root should fail");
                   }});

  tests.push_back({"scanner_follows_directory_links", [] {
                     skillreg::testing::TempWorkspace ws;
                     ws.create_dir("skills");
                     ws.create_dir("elsewhere/linked");
                     std::filesystem::create_directory_symlink(ws.path() / "elsewhere" / "linked",
                                                               ws.skills_dir() / "linked");
                     std::filesystem::create_symlink(ws.path() / "missing",
                                                     ws.skills_dir() / "dangling");

                     auto scanned = skills::DirectoryScanner::scan(ws.skills_dir());
                     require(scanned.ok(), scanned.error());
                     require(scanned.value().size() == 1 && scanned.value()[0].name == "linked",
                             "only the link to a directory is a package");
                   }});

  // MetadataParser

  tests.push_back({"metadata_parses_required_and_optional_fields", [] {
                     auto parsed = parse("---\n"
                                         "name: weather\n"
                                         "description: Looks up the forecast\n"
                                         "version: 1.2.0\n"
                                         "author: ops\n"
                                         "requires_env:\n"
                                         "  - WEATHER_API_KEY\n"
                                         "  - WEATHER_REGION\n"
                                         "execution:\n"
                                         "  command: python run.py\n"
                                         "---\n"
                                         "# Weather\n");
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error().message);
                     const auto &meta = parsed.value();
                     require(meta.name == "weather", "name");
                     require(meta.description == "Looks up the forecast", "description");
                     require(meta.version == "1.2.0", "version");
                     require(meta.author == "ops", "author");
                     require(meta.requires_env ==
                                 std::vector<std::string>{"WEATHER_API_KEY", "WEATHER_REGION"},
                             "requires_env order kept");
                     require(meta.has_execution, "execution present");
                   }});

  tests.push_back({"metadata_optional_fields_default", [] {
                     auto parsed = parse(skillreg::testing::skill_md("plain"));
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error().message);
                     require(parsed.value().requires_env.empty(), "no requirements");
                     require(!parsed.value().has_execution, "no execution block");
                   }});

  tests.push_back({"metadata_numeric_scalars_keep_their_text", [] {
                     auto parsed = parse(skillreg::testing::skill_md("num", "", "1.0"));
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error().message);
                     require(parsed.value().version == "1.0", "version text must be preserved");
                   }});

  tests.push_back({"metadata_null_execution_still_counts", [] {
                     auto parsed = parse(skillreg::testing::skill_md("x", "execution:\n"));
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error().message);
                     require(parsed.value().has_execution, "key presence is enough");
                   }});

  tests.push_back({"metadata_missing_frontmatter", [] {
                     auto parsed = parse("# Just markdown\nname: x\n");
                     require_kind(parsed, skills::ErrorKind::MissingFrontmatter);
                     require(parsed.error().message == "SKILL.md missing frontmatter",
                             parsed.error().message);
                     require(parsed.error().package == "pkg", "package label");
                   }});

  tests.push_back({"metadata_unterminated_frontmatter", [] {
                     require_kind(parse("---\nname: x\nversion: 1\n"),
                                  skills::ErrorKind::MalformedFrontmatterFormat);
                   }});

  tests.push_back({"metadata_yaml_syntax_error", [] {
                     auto parsed = parse("---\nname: [unclosed\n---\n");
                     require_kind(parsed, skills::ErrorKind::ParseError);
                     require(parsed.error().message.rfind("YAML parse error: ", 0) == 0,
                             parsed.error().message);
                   }});

  tests.push_back({"metadata_not_a_mapping", [] {
                     require_kind(parse("---\n- a\n- b\n---\n"), skills::ErrorKind::NotAMapping);
                     require_kind(parse("---\n---\nbody\n"), skills::ErrorKind::NotAMapping);
                     require_kind(parse("---\njust text\n---\n"), skills::ErrorKind::NotAMapping);
                   }});

  tests.push_back({"metadata_missing_required_field_names_it", [] {
                     auto parsed = parse("---\nname: x\ndescription: d\nauthor: a\n---\n");
                     require_kind(parsed, skills::ErrorKind::MissingRequiredField);
                     require(parsed.error().field == "version", "field should be version");
                     require(parsed.error().message == "Missing required field 'version'",
                             parsed.error().message);
                   }});

  tests.push_back({"metadata_first_missing_field_in_declared_order", [] {
                     auto parsed = parse("---\nversion: 1\n---\n");
                     require_kind(parsed, skills::ErrorKind::MissingRequiredField);
                     require(parsed.error().field == "name", "name is checked first");
                   }});

  tests.push_back({"metadata_non_scalar_required_field", [] {
                     auto listed = parse("---\nname: [a, b]\ndescription: d\nversion: 1\n"
                                         "author: a\n---\n");
                     require_kind(listed, skills::ErrorKind::InvalidFieldType);
                     require(listed.error().field == "name", "field");

                     auto null_author = parse("---\nname: x\ndescription: d\nversion: 1\n"
                                              "author:\n---\n");
                     require_kind(null_author, skills::ErrorKind::InvalidFieldType);
                     require(null_author.error().field == "author", "field");
                   }});

  tests.push_back({"metadata_bad_requires_env", [] {
                     require_kind(parse(skillreg::testing::skill_md("x", "requires_env: KEY\n")),
                                  skills::ErrorKind::InvalidFieldType);
                     require_kind(parse(skillreg::testing::skill_md(
                                      "x", "requires_env:\n  - {a: b}\n")),
                                  skills::ErrorKind::InvalidFieldType);
                   }});

  tests.push_back({"metadata_body_ends_at_first_fence", [] {
                     auto parsed = parse(skillreg::testing::skill_md("x") +
                                         "---\nnot: frontmatter\n---\n");
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error().message);
                     require(parsed.value().name == "x", "body after the close is ignored");
                   }});

  tests.push_back({"metadata_invalid_utf8_is_parse_error", [] {
                     const std::string content = "---\nname: u\ndescription: \"bad \xff byte\"\n"
                                                 "version: 1\nauthor: a\n---\n";
                     auto parsed = parse(content);
                     require_kind(parsed, skills::ErrorKind::ParseError);
                     skillreg::tests::require_contains(parsed.error().message, "not valid UTF-8");
                     skillreg::tests::require_contains(
                         parsed.error().message,
                         "byte offset " + std::to_string(content.find('\xff')));
                   }});

  tests.push_back({"metadata_multibyte_utf8_is_kept", [] {
                     auto parsed = parse(skillreg::testing::skill_md("caf\xc3\xa9-\xf0\x9f\x98\x80"));
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error().message);
                     require(parsed.value().name == "caf\xc3\xa9-\xf0\x9f\x98\x80", "name bytes");
                   }});

  tests.push_back({"metadata_custom_tag_is_parse_error", [] {
                     auto parsed = parse("---\nname: !custom t\ndescription: d\nversion: 1\n"
                                         "author: a\n---\n");
                     require_kind(parsed, skills::ErrorKind::ParseError);
                     skillreg::tests::require_contains(parsed.error().message, "'!custom'");
                     skillreg::tests::require_contains(parsed.error().message, "line 2");

                     auto python = parse(skillreg::testing::skill_md(
                         "x", "execution: !!python/object:os.system {}\n"));
                     require_kind(python, skills::ErrorKind::ParseError);
                   }});

  tests.push_back({"metadata_core_tags_are_accepted", [] {
                     auto parsed = parse("---\nname: !!str 42\ndescription: d\nversion: !!str 1.0\n"
                                         "author: a\nrequires_env: !!seq [K]\n---\n");
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error().message);
                     require(parsed.value().name == "42" && parsed.value().version == "1.0",
                             "tagged scalars keep their text");
                     require(parsed.value().requires_env == std::vector<std::string>{"K"}, "seq");
                   }});

  tests.push_back({"metadata_non_scalar_key_is_parse_error", [] {
                     auto parsed = parse(skillreg::testing::skill_md("x", "? [x, y]\n: pair\n"));
                     require_kind(parsed, skills::ErrorKind::ParseError);
                     skillreg::tests::require_contains(parsed.error().message,
                                                       "mapping key must be a scalar");
                   }});

  tests.push_back({"metadata_duplicate_key_is_parse_error", [] {
                     auto parsed = parse("---\nname: b\nname: b2\ndescription: d\nversion: 1\n"
                                         "author: a\n---\n");
                     require_kind(parsed, skills::ErrorKind::ParseError);
                     skillreg::tests::require_contains(parsed.error().message, "duplicate key 'name'");

                     auto nested = parse(skillreg::testing::skill_md("x", "execution:\n  a: 1\n  a: 2\n"));
                     require_kind(nested, skills::ErrorKind::ParseError);
                   }});

  tests.push_back({"metadata_merge_keys_are_expanded", [] {
                     auto parsed = parse("---\n"
                                         "defaults: &defaults\n"
                                         "  author: z\n"
                                         "  version: '2.0'\n"
                                         "name: c\n"
                                         "description: d\n"
                                         "<<: *defaults\n"
                                         "version: 1.0.0\n"
                                         "---\n");
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error().message);
                     require(parsed.value().author == "z", "merged author");
                     require(parsed.value().version == "1.0.0", "explicit key wins over merge");
                   }});

  tests.push_back({"metadata_merge_list_prefers_earlier_sources", [] {
                     auto parsed = parse("---\n"
                                         "a: &a {author: first, version: '1'}\n"
                                         "b: &b {author: second, description: from-b}\n"
                                         "name: m\n"
                                         "<<: [*a, *b]\n"
                                         "---\n");
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error().message);
                     require(parsed.value().author == "first", "earlier source wins");
                     require(parsed.value().description == "from-b", "later source fills gaps");

                     require_kind(parse(skillreg::testing::skill_md("x", "<<: scalar\n")),
                                  skills::ErrorKind::ParseError);
                   }});

  tests.push_back({"metadata_parse_package_missing_declaration", [] {
                     skillreg::testing::TempWorkspace ws;
                     ws.create_file("skills/empty/notes.txt", "n");
                     const skills::PackageDirectory pkg{.name = "empty",
                                                        .path = ws.skills_dir() / "empty"};
                     auto parsed = skills::MetadataParser::parse_package(pkg);
                     require_kind(parsed, skills::ErrorKind::MissingDeclarationFile);
                     require(parsed.error().message == "No SKILL.md found", parsed.error().message);
                     require(parsed.error().package == "empty", "package label");
                   }});

  tests.push_back({"metadata_parse_package_custom_declaration_file", [] {
                     skillreg::testing::TempWorkspace ws;
                     ws.create_file("skills/custom/skill.yaml.md", skillreg::testing::skill_md("c"));
                     const skills::PackageDirectory pkg{.name = "custom",
                                                        .path = ws.skills_dir() / "custom"};
                     auto parsed = skills::MetadataParser::parse_package(
                         pkg, {.declaration_file = "skill.yaml.md"});
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error().message);
                     require(parsed.value().name == "c", "name");
                   }});

  // content hashing

  tests.push_back({"hash_single_file_known_digest", [] {
                     skillreg::testing::TempWorkspace ws;
                     ws.create_file("pkg/a.txt", "hi");
                     auto digest = skills::compute_content_hash(ws.path() / "pkg");
                     require(digest.ok(), digest.error());
                     require(digest.value().value ==
                                 "sha256:5fc5b37c1492b8499e08ea1f6f91e40601d66c97bb8ee23838d4e4354b7f6c6a",
                             digest.value().value);
                     require(digest.value().files == 1 && digest.value().bytes == 2, "counters");
                   }});

  tests.push_back({"hash_empty_tree_is_digest_of_nothing", [] {
                     skillreg::testing::TempWorkspace ws;
                     ws.create_dir("pkg/sub");
                     auto digest = skills::compute_content_hash(ws.path() / "pkg");
                     require(digest.ok(), digest.error());
                     require(digest.value().value ==
                                 "sha256:e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
                             digest.value().value);
                   }});

  tests.push_back({"hash_empty_files_still_contribute_paths", [] {
                     skillreg::testing::TempWorkspace ws;
                     ws.create_file("pkg/a.txt", "");
                     ws.create_file("pkg/b.txt", "");
                     auto digest = skills::compute_content_hash(ws.path() / "pkg");
                     require(digest.ok(), digest.error());
                     require(digest.value().value ==
                                 "sha256:" + skillreg::common::sha256_hex("a.txtb.txt"),
                             digest.value().value);
                   }});

  tests.push_back({"hash_walk_order_groups_by_directory", [] {
                     skillreg::testing::TempWorkspace ws;
                     write_ordering_tree(ws);
                     auto files = skills::list_hashed_files(ws.path() / "pkg");
                     require(files.ok(), files.error());
                     const std::vector<std::string> expected = {
                         "SKILL.md", "a.txt", "a/y.txt", "a-b/x.txt", "a/c/w.txt", "scripts/run.py"};
                     require(files.value().size() == expected.size(), "file count");
                     for (std::size_t i = 0; i < expected.size(); ++i) {
                       require(files.value()[i].relative_path == expected[i],
                               "position " + std::to_string(i) + ": " +
                                   files.value()[i].relative_path);
                     }

                     auto digest = skills::compute_content_hash(ws.path() / "pkg");
                     require(digest.ok(), digest.error());
                     require(digest.value().value ==
                                 "sha256:a5bab0df8c7eeba3dd505e0328232ef470c404e76b12a36eb7bd6b1822457bb5",
                             digest.value().value);
                   }});

  tests.push_back({"hash_independent_of_creation_order", [] {
                     skillreg::testing::TempWorkspace first;
                     first.create_file("pkg/b/2.txt", "two");
                     first.create_file("pkg/a/1.txt", "one");
                     first.create_file("pkg/SKILL.md", "decl");

                     skillreg::testing::TempWorkspace second;
                     second.create_file("pkg/SKILL.md", "decl");
                     second.create_file("pkg/a/1.txt", "one");
                     second.create_file("pkg/b/2.txt", "two");

                     auto lhs = skills::compute_content_hash(first.path() / "pkg");
                     auto rhs = skills::compute_content_hash(second.path() / "pkg");
                     require(lhs.ok() && rhs.ok(), "hashing should succeed");
                     require(lhs.value().value == rhs.value().value, "digests must match");
                   }});

  tests.push_back({"hash_changes_with_content_and_names", [] {
                     skillreg::testing::TempWorkspace ws;
                     ws.create_file("pkg/a.txt", "hi");
                     const auto base = skills::compute_content_hash(ws.path() / "pkg");

                     ws.create_file("pkg/a.txt", "hI");
                     const auto edited = skills::compute_content_hash(ws.path() / "pkg");

                     std::filesystem::rename(ws.path() / "pkg" / "a.txt", ws.path() / "pkg" / "b.txt");
                     const auto renamed = skills::compute_content_hash(ws.path() / "pkg");

                     require(base.ok() && edited.ok() && renamed.ok(), "hashing should succeed");
                     require(base.value().value != edited.value().value, "content change");
                     require(edited.value().value != renamed.value().value, "rename");
                   }});

  tests.push_back({"hash_binary_content_is_byte_exact", [] {
                     skillreg::testing::TempWorkspace ws;
                     const std::string binary("\x00\xff\x00\n", 4);
                     ws.create_file("pkg/blob.bin", binary);
                     auto digest = skills::compute_content_hash(ws.path() / "pkg");
                     require(digest.ok(), digest.error());
                     require(digest.value().bytes == 4, "all bytes read");
                     require(digest.value().value ==
                                 "sha256:" + skillreg::common::sha256_hex("blob.bin" + binary),
                             digest.value().value);
                   }});

  tests.push_back({"hash_skips_directory_links_and_reads_file_links", [] {
                     skillreg::testing::TempWorkspace ws;
                     ws.create_file("pkg/a.txt", "hi");
                     ws.create_file("outside/data/x.txt", "x");
                     ws.create_file("outside/target.txt", "hi");

                     const auto plain = skills::compute_content_hash(ws.path() / "pkg");
                     std::filesystem::create_directory_symlink(ws.path() / "outside" / "data",
                                                               ws.path() / "pkg" / "data");
                     const auto with_dir_link = skills::compute_content_hash(ws.path() / "pkg");
                     require(plain.ok() && with_dir_link.ok(), "hashing should succeed");
                     require(plain.value().value == with_dir_link.value().value,
                             "linked directories are not descended into");

                     std::filesystem::create_symlink(ws.path() / "outside" / "target.txt",
                                                     ws.path() / "pkg" / "z.txt");
                     auto with_file_link = skills::compute_content_hash(ws.path() / "pkg");
                     require(with_file_link.ok(), with_file_link.error());
                     require(with_file_link.value().value ==
                                 "sha256:" + skillreg::common::sha256_hex("a.txthiz.txthi"),
                             "file links are hashed by target content");
                   }});

  tests.push_back({"hash_dangling_link_fails", [] {
                     skillreg::testing::TempWorkspace ws;
                     ws.create_file("pkg/a.txt", "hi");
                     std::filesystem::create_symlink(ws.path() / "nowhere", ws.path() / "pkg" / "b");
                     auto digest = skills::compute_content_hash(ws.path() / "pkg");
                     require(!digest.ok(), "unreadable entries should fail the hash");
                   }});
}
