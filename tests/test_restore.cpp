#include "backup_catalog.hpp"
#include "fake_backends.hpp"
#include "restore_engine.hpp"
#include "snapshot_coordinator.hpp"
#include <catch2/catch_test_macros.hpp>
#include <fstream>

using namespace ghv;
using namespace ghv::testing;

namespace {

/// Backs up acme/widgets once and returns its id.
SnapshotId make_snapshot(const std::filesystem::path &root,
                         FakeProvider &provider, FakeWorkspace &workspace) {
  RepositoryRef ref{"acme", "widgets"};
  provider.add_repository(ref);
  provider.set_issues(ref, {issue(2, "Second"), issue(1, "First", "closed")});
  provider.set_releases(ref, {release(11, "v1.1"), release(10, "v1.0")});
  SnapshotCoordinator coordinator(PathResolver(root), provider, workspace);
  coordinator.set_clock(new_year_2024);
  auto result = coordinator.backup(ref);
  REQUIRE(result.committed());
  return *result.snapshot;
}

} // namespace

TEST_CASE("restore materializes the mirrored content") {
  auto root = scratch_dir("restore-content");
  auto target = scratch_dir("restore-content-target") / "widgets";
  FakeProvider provider;
  FakeWorkspace workspace;
  auto id = make_snapshot(root, provider, workspace);

  BackupCatalog catalog{PathResolver(root)};
  RestoreEngine engine(catalog, workspace);
  auto report = engine.restore(id, target);

  REQUIRE(report.content == StepStatus::Done);
  REQUIRE(report.refs_match);
  REQUIRE(report.restored_refs.size() == 3);
  REQUIRE(report.active_branch == "main");
  REQUIRE(report.clean);
  REQUIRE(report.metadata == StepStatus::Skipped);
  REQUIRE_FALSE(report.partial());
  REQUIRE(std::filesystem::exists(target / "README.md"));
  REQUIRE(report.to_json()["content"]["status"] == "done");
  REQUIRE(report.to_text().find("match mirror") != std::string::npos);
  std::filesystem::remove_all(root);
  std::filesystem::remove_all(target.parent_path());
}

TEST_CASE("restore refuses a non-empty target") {
  auto root = scratch_dir("restore-not-empty");
  auto target = scratch_dir("restore-not-empty-target");
  std::ofstream(target / "keep.txt") << "precious";
  FakeProvider provider;
  FakeWorkspace workspace;
  auto id = make_snapshot(root, provider, workspace);

  BackupCatalog catalog{PathResolver(root)};
  RestoreEngine engine(catalog, workspace, &provider);
  RestoreOptions options;
  options.replay_metadata = true;
  REQUIRE(error_kind_of([&] { engine.restore(id, target, options); }) ==
          ErrorKind::TargetNotEmpty);
  REQUIRE(std::filesystem::exists(target / "keep.txt"));
  REQUIRE_FALSE(std::filesystem::exists(target / "README.md"));
  REQUIRE(provider.created_issues.empty());

  options.overwrite = true;
  auto report = engine.restore(id, target, options);
  REQUIRE(report.content == StepStatus::Done);
  REQUIRE_FALSE(std::filesystem::exists(target / "keep.txt"));
  std::filesystem::remove_all(root);
  std::filesystem::remove_all(target);
}

TEST_CASE("restore never targets the backup tree") {
  auto base = scratch_dir("restore-overlap");
  auto root = base / "backups";
  FakeProvider provider;
  FakeWorkspace workspace;
  auto id = make_snapshot(root, provider, workspace);

  BackupCatalog catalog{PathResolver(root)};
  RestoreEngine engine(catalog, workspace);
  RestoreOptions options;
  options.overwrite = true;
  for (const auto &target :
       {root, root / "", base, root / "acme" / "widgets",
        catalog.paths().snapshot_dir(id), root / "elsewhere" / ".." / "acme"}) {
    REQUIRE(error_kind_of([&] { engine.restore(id, target, options); }) ==
            ErrorKind::InvalidPath);
  }
  REQUIRE(catalog.list(id.repository).size() == 1);
  REQUIRE(std::filesystem::exists(content_path(catalog.paths().snapshot_dir(id)) /
                                  "refs.json"));

  auto report = engine.restore(id, base / "checkout", options);
  REQUIRE(report.content == StepStatus::Done);
  std::filesystem::remove_all(base);
}

TEST_CASE("metadata-only restore ignores the target directory") {
  auto root = scratch_dir("restore-replay-only");
  auto target = scratch_dir("restore-replay-only-target");
  std::ofstream(target / "keep.txt") << "precious";
  FakeProvider provider;
  FakeWorkspace workspace;
  auto id = make_snapshot(root, provider, workspace);

  BackupCatalog catalog{PathResolver(root)};
  RestoreEngine engine(catalog, workspace, &provider);
  RestoreOptions options;
  options.restore_content = false;
  options.replay_metadata = true;
  options.dry_run = true;
  auto report = engine.restore(id, target, options);
  REQUIRE(report.content_detail == "not requested");
  REQUIRE(report.metadata == StepStatus::Planned);
  REQUIRE(std::filesystem::exists(target / "keep.txt"));
  REQUIRE_FALSE(std::filesystem::exists(target / "README.md"));

  // the backup root itself is fine when nothing is written locally
  report = engine.restore(id, root, options);
  REQUIRE(report.metadata == StepStatus::Planned);
  REQUIRE(catalog.list(id.repository).size() == 1);
  std::filesystem::remove_all(root);
  std::filesystem::remove_all(target);
}

TEST_CASE("restore of an unknown snapshot is not found") {
  auto root = scratch_dir("restore-missing");
  auto target = scratch_dir("restore-missing-target");
  FakeWorkspace workspace;
  BackupCatalog catalog{PathResolver(root)};
  RestoreEngine engine(catalog, workspace);
  REQUIRE(error_kind_of([&] {
            engine.restore(SnapshotId{{"acme", "widgets"}, "20240101-000000"},
                           target);
          }) == ErrorKind::NotFound);
  REQUIRE(std::filesystem::is_empty(target));
  std::filesystem::remove_all(root);
  std::filesystem::remove_all(target);
}

TEST_CASE("restore skips content that was never captured") {
  auto root = scratch_dir("restore-no-content");
  auto target = scratch_dir("restore-no-content-target") / "out";
  FakeProvider provider;
  FakeWorkspace workspace;
  RepositoryRef ref{"acme", "widgets"};
  provider.add_repository(ref);
  SnapshotCoordinator coordinator(PathResolver(root), provider, workspace);
  BackupOptions backup;
  backup.include_content = false;
  auto id = *coordinator.backup(ref, backup).snapshot;

  BackupCatalog catalog{PathResolver(root)};
  RestoreEngine engine(catalog, workspace);
  auto report = engine.restore(id, target);
  REQUIRE(report.content == StepStatus::Skipped);
  REQUIRE(report.content_detail == "snapshot content is skipped");
  REQUIRE_FALSE(std::filesystem::exists(target));
  std::filesystem::remove_all(root);
  std::filesystem::remove_all(target.parent_path());
}

TEST_CASE("dry run plans the metadata replay") {
  auto root = scratch_dir("restore-dry-run");
  auto target = scratch_dir("restore-dry-run-target") / "widgets";
  FakeProvider provider;
  FakeWorkspace workspace;
  auto id = make_snapshot(root, provider, workspace);

  BackupCatalog catalog{PathResolver(root)};
  RestoreEngine engine(catalog, workspace, &provider);
  RestoreOptions options;
  options.replay_metadata = true;
  options.dry_run = true;
  options.restore_content = false;
  auto report = engine.restore(id, target, options);

  REQUIRE(report.dry_run);
  REQUIRE(report.metadata == StepStatus::Planned);
  // label bug, two issues, two releases
  REQUIRE(report.count(StepStatus::Planned) == 5);
  REQUIRE(report.count(StepStatus::Skipped) == 2);
  REQUIRE(provider.created_issues.empty());
  REQUIRE(provider.created_labels.empty());
  REQUIRE(provider.created_releases.empty());
  REQUIRE(report.to_text().find("(dry run)") != std::string::npos);
  std::filesystem::remove_all(root);
  std::filesystem::remove_all(target.parent_path());
}

TEST_CASE("metadata replay recreates issues and releases") {
  auto root = scratch_dir("restore-replay");
  auto target = scratch_dir("restore-replay-target") / "widgets";
  FakeProvider provider;
  FakeWorkspace workspace;
  auto id = make_snapshot(root, provider, workspace);

  RepositoryRef fork{"acme", "widgets-restored"};
  provider.add_repository(fork);
  provider.set_releases(fork, {release(99, "v1.0")});
  provider.add_existing_label("bug");

  BackupCatalog catalog{PathResolver(root)};
  RestoreEngine engine(catalog, workspace, &provider);
  RestoreOptions options;
  options.replay_metadata = true;
  options.restore_content = false;
  options.target_repository = fork;
  options.classes = {EntityClass::Issues, EntityClass::Releases};
  auto report = engine.restore(id, target, options);

  REQUIRE(report.metadata == StepStatus::Done);
  REQUIRE(provider.created_labels.empty());
  REQUIRE(provider.created_issues.size() == 2);
  REQUIRE(provider.created_issues[0]["title"] == "First");
  REQUIRE(provider.created_issues[1]["title"] == "Second");
  REQUIRE(provider.closed_issues == std::vector<int>{1});
  REQUIRE(provider.created_releases.size() == 1);
  REQUIRE(provider.created_releases[0]["tag_name"] == "v1.1");
  REQUIRE(report.count(StepStatus::Done) == 3);
  // existing label and release v1.0
  REQUIRE(report.count(StepStatus::Skipped) == 2);
  REQUIRE_FALSE(report.partial());
  std::filesystem::remove_all(root);
  std::filesystem::remove_all(target.parent_path());
}

TEST_CASE("metadata replay reports per-entity failures") {
  auto root = scratch_dir("restore-replay-failure");
  auto target = scratch_dir("restore-replay-failure-target") / "widgets";
  FakeProvider provider;
  FakeWorkspace workspace;
  auto id = make_snapshot(root, provider, workspace);
  provider.fail("create_release", id.repository, ErrorKind::AuthError);
  provider.set_issues(id.repository, {});
  provider.set_releases(id.repository, {});

  BackupCatalog catalog{PathResolver(root)};
  RestoreEngine engine(catalog, workspace, &provider);
  RestoreOptions options;
  options.replay_metadata = true;
  options.restore_content = false;
  auto report = engine.restore(id, target, options);

  REQUIRE(report.metadata == StepStatus::Failed);
  REQUIRE(report.count(StepStatus::Failed) == 2);
  REQUIRE(provider.created_issues.size() == 2);
  REQUIRE(report.partial());
  REQUIRE(report.to_json()["partial"] == true);
  std::filesystem::remove_all(root);
  std::filesystem::remove_all(target.parent_path());
}
