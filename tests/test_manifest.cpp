#include "fake_backends.hpp"
#include "manifest.hpp"
#include "path_resolver.hpp"
#include <catch2/catch_test_macros.hpp>
#include <fstream>

using namespace ghv;
using namespace ghv::testing;

TEST_CASE("manifest persists and reloads") {
  auto dir = scratch_dir("manifest-io");
  SnapshotManifest m;
  m.id = SnapshotId{{"acme", "widgets"}, "20240101-000000"};
  m.started_at = new_year_2024();
  m.completed_at = new_year_2024() + std::chrono::seconds(90);
  m.content_state = ContentState::Complete;
  m.clone_url = "https://github.com/acme/widgets.git";
  m.source_default_branch = "main";
  m.ref_count = 4;
  m.metadata[EntityClass::Issues] = {MetadataState::Complete, 12, 12, false,
                                     0, ""};
  m.metadata[EntityClass::Releases] = {MetadataState::Failed, 0, std::nullopt,
                                       false, 0, "HTTP 403"};
  write_manifest(dir, m);

  REQUIRE(std::filesystem::exists(dir / "manifest.json"));
  REQUIRE_FALSE(std::filesystem::exists(dir / "manifest.json.tmp"));

  std::ifstream in(dir / "manifest.json");
  auto j = nlohmann::json::parse(in);
  REQUIRE(j["snapshot_id"] == "acme/widgets@20240101-000000");
  REQUIRE(j["started_at"] == "2024-01-01T00:00:00Z");
  REQUIRE(j["completed_at"] == "2024-01-01T00:01:30Z");
  REQUIRE(j["content"]["state"] == "complete");
  REQUIRE(j["metadata"]["releases"]["error"] == "HTTP 403");
  REQUIRE(j["entity_counts"]["issues"] == 12);

  auto loaded = read_manifest(dir);
  REQUIRE(loaded);
  REQUIRE(loaded->id == m.id);
  REQUIRE(loaded->completed_at == m.completed_at);
  REQUIRE(loaded->ref_count == 4);
  REQUIRE(loaded->metadata.at(EntityClass::Issues).total_count == 12U);
  REQUIRE_FALSE(loaded->metadata.at(EntityClass::Releases).total_count);
  REQUIRE(loaded->terminal());
  REQUIRE_FALSE(loaded->fully_successful());
  std::filesystem::remove_all(dir);
}

TEST_CASE("manifest completeness rules") {
  SnapshotManifest m;
  REQUIRE_FALSE(m.terminal());
  m.content_state = ContentState::Skipped;
  m.metadata[EntityClass::Issues].state = MetadataState::Complete;
  m.metadata[EntityClass::Releases].state = MetadataState::Skipped;
  REQUIRE(m.terminal());
  REQUIRE(m.fully_successful());

  m.metadata[EntityClass::Issues].truncated = true;
  REQUIRE(m.terminal());
  REQUIRE_FALSE(m.fully_successful());

  m.metadata[EntityClass::Issues].truncated = false;
  m.metadata[EntityClass::Issues].skipped_entities = 1;
  REQUIRE_FALSE(m.fully_successful());

  m.metadata[EntityClass::Issues].skipped_entities = 0;
  m.metadata[EntityClass::PullRequests].state = MetadataState::Pending;
  REQUIRE_FALSE(m.terminal());
}

TEST_CASE("manifest rejects unknown versions and states") {
  auto dir = scratch_dir("manifest-invalid");
  std::ofstream(dir / "manifest.json")
      << R"({"format_version": 99, "repository": "acme/widgets",
             "timestamp": "20240101-000000", "content": {"state": "complete"},
             "metadata": {}})";
  REQUIRE_FALSE(read_manifest(dir));

  std::ofstream(dir / "manifest.json")
      << R"({"format_version": 1, "repository": "acme/widgets",
             "timestamp": "20240101-000000", "content": {"state": "done"},
             "metadata": {}})";
  REQUIRE_FALSE(read_manifest(dir));

  std::filesystem::remove(dir / "manifest.json");
  REQUIRE_FALSE(read_manifest(dir));
  std::filesystem::remove_all(dir);
}

TEST_CASE("entity class names") {
  REQUIRE(to_string(EntityClass::PullRequests) == "pull_requests");
  REQUIRE(artifact_file_name(EntityClass::Issues) == "issues.json");
  REQUIRE(entity_class_from_string("releases") == EntityClass::Releases);
  REQUIRE(entity_class_from_string("prs") == EntityClass::PullRequests);
  REQUIRE_FALSE(entity_class_from_string("wiki"));
  REQUIRE(all_entity_classes().size() == 4);
}

TEST_CASE("iso8601 timestamps") {
  auto tp = parse_iso8601("2024-01-01T00:00:00Z");
  REQUIRE(tp);
  REQUIRE(*tp == new_year_2024());
  REQUIRE(format_iso8601(new_year_2024()) == "2024-01-01T00:00:00Z");
  REQUIRE_FALSE(parse_iso8601("yesterday"));
}

TEST_CASE("committed files replace their previous content") {
  auto dir = scratch_dir("commit-file");
  auto target = dir / "artifact.json";
  commit_file(target, "first\n", "artifact");
  commit_file(target, "second\n", "artifact");
  std::ifstream in(target);
  std::string content((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
  REQUIRE(content == "second\n");
  REQUIRE_FALSE(std::filesystem::exists(dir / "artifact.json.tmp"));

  REQUIRE(error_kind_of([&] {
            commit_file(dir / "missing" / "artifact.json", "x", "artifact");
          }) == ErrorKind::Storage);
  REQUIRE_FALSE(std::filesystem::exists(dir / "missing"));
  std::filesystem::remove_all(dir);
}
