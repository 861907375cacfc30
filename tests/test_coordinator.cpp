#include "backup_catalog.hpp"
#include "fake_backends.hpp"
#include "snapshot_coordinator.hpp"
#include <atomic>
#include <catch2/catch_test_macros.hpp>

using namespace ghv;
using namespace ghv::testing;

namespace {

CoordinatorSettings fast_settings(int concurrency = 2) {
  CoordinatorSettings settings;
  settings.concurrency = concurrency;
  settings.retry.max_attempts = 2;
  settings.retry.initial_backoff = std::chrono::milliseconds(1);
  settings.retry.max_backoff = std::chrono::milliseconds(1);
  return settings;
}

void seed(FakeProvider &provider, const RepositoryRef &ref) {
  provider.add_repository(ref);
  provider.set_issues(ref, {issue(2, "Second"), issue(1, "First", "closed")});
  provider.set_pull_requests(ref, {{{"number", 3}, {"title", "Feature"}}});
  provider.set_releases(ref, {release(10, "v1.0")});
}

} // namespace

TEST_CASE("coordinator commits partial snapshot when one class fails") {
  auto root = scratch_dir("coord-partial");
  FakeProvider provider;
  FakeWorkspace workspace;
  RepositoryRef ref{"acme", "widgets"};
  seed(provider, ref);
  provider.fail("releases", ref, ErrorKind::SourceUnavailable);

  SnapshotCoordinator coordinator(PathResolver(root), provider, workspace,
                                  fast_settings());
  coordinator.set_clock(new_year_2024);
  auto result = coordinator.backup(ref);

  REQUIRE(result.outcome == BackupOutcome::PartiallyCommitted);
  REQUIRE(result.final_phase == SnapshotPhase::Committed);
  REQUIRE(result.snapshot);
  REQUIRE(result.snapshot->timestamp == "20240101-000000");
  REQUIRE(result.manifest);
  const auto &manifest = *result.manifest;
  REQUIRE(manifest.content_state == ContentState::Complete);
  REQUIRE(manifest.ref_count == 3);
  REQUIRE(manifest.metadata.at(EntityClass::Issues).state ==
          MetadataState::Complete);
  REQUIRE(manifest.metadata.at(EntityClass::Issues).fetched_count == 2);
  REQUIRE(manifest.metadata.at(EntityClass::Releases).state ==
          MetadataState::Failed);
  REQUIRE_FALSE(manifest.metadata.at(EntityClass::Releases).error.empty());

  auto dir = root / "acme" / "widgets" / "20240101-000000";
  REQUIRE(std::filesystem::exists(dir / "manifest.json"));
  REQUIRE(std::filesystem::exists(dir / "metadata" / "issues.json"));
  REQUIRE_FALSE(std::filesystem::exists(dir / "metadata" / "releases.json"));

  BackupCatalog catalog{PathResolver(root)};
  auto listed = catalog.list(ref);
  REQUIRE(listed.size() == 1);
  REQUIRE(listed[0].id.timestamp == "20240101-000000");
  std::filesystem::remove_all(root);
}

TEST_CASE("coordinator records an unreadable class as failed") {
  auto root = scratch_dir("coord-garbled");
  FakeProvider provider;
  FakeWorkspace workspace;
  RepositoryRef ref{"acme", "widgets"};
  seed(provider, ref);
  provider.set_issues(ref, {issue(1, "broken \xfe\xff")});

  SnapshotCoordinator coordinator(PathResolver(root), provider, workspace,
                                  fast_settings());
  coordinator.set_clock(new_year_2024);
  auto result = coordinator.backup(ref);

  REQUIRE(result.outcome == BackupOutcome::PartiallyCommitted);
  REQUIRE(result.manifest);
  const auto &issues = result.manifest->metadata.at(EntityClass::Issues);
  REQUIRE(issues.state == MetadataState::Failed);
  REQUIRE_FALSE(issues.error.empty());
  REQUIRE(result.manifest->metadata.at(EntityClass::Releases).state ==
          MetadataState::Complete);
  auto dir = root / "acme" / "widgets" / "20240101-000000";
  REQUIRE(std::filesystem::exists(dir / "manifest.json"));
  REQUIRE_FALSE(std::filesystem::exists(dir / "metadata" / "issues.json"));
  std::filesystem::remove_all(root);
}

TEST_CASE("coordinator commits complete snapshot") {
  auto root = scratch_dir("coord-complete");
  FakeProvider provider;
  FakeWorkspace workspace;
  RepositoryRef ref{"acme", "widgets"};
  seed(provider, ref);

  SnapshotCoordinator coordinator(PathResolver(root), provider, workspace,
                                  fast_settings());
  std::vector<SnapshotPhase> phases;
  coordinator.set_phase_observer(
      [&phases](const SnapshotId &, SnapshotPhase phase) {
        phases.push_back(phase);
      });
  auto result = coordinator.backup(ref);

  REQUIRE(result.outcome == BackupOutcome::Committed);
  REQUIRE(result.manifest->fully_successful());
  REQUIRE(phases == std::vector<SnapshotPhase>{
                        SnapshotPhase::Created, SnapshotPhase::ContentInFlight,
                        SnapshotPhase::MetadataInFlight,
                        SnapshotPhase::Finalizing, SnapshotPhase::Committed});
  std::filesystem::remove_all(root);
}

TEST_CASE("coordinator disambiguates snapshots within one second") {
  auto root = scratch_dir("coord-same-second");
  FakeProvider provider;
  FakeWorkspace workspace;
  RepositoryRef ref{"acme", "widgets"};
  seed(provider, ref);

  SnapshotCoordinator coordinator(PathResolver(root), provider, workspace,
                                  fast_settings());
  coordinator.set_clock(new_year_2024);
  auto first = coordinator.backup(ref);
  auto second = coordinator.backup(ref);

  REQUIRE(first.snapshot->timestamp == "20240101-000000");
  REQUIRE(second.snapshot->timestamp == "20240101-000000-1");

  BackupCatalog catalog{PathResolver(root)};
  auto listed = catalog.list(ref);
  REQUIRE(listed.size() == 2);
  REQUIRE(listed[0].id.timestamp == "20240101-000000-1");
  REQUIRE(listed[1].id.timestamp == "20240101-000000");
  std::filesystem::remove_all(root);
}

TEST_CASE("coordinator records content failure without aborting") {
  auto root = scratch_dir("coord-content-failure");
  FakeProvider provider;
  FakeWorkspace workspace;
  RepositoryRef ref{"acme", "widgets"};
  seed(provider, ref);
  workspace.fail_url("https://example.test/acme/widgets.git",
                     ErrorKind::RepositoryGone);

  SnapshotCoordinator coordinator(PathResolver(root), provider, workspace,
                                  fast_settings());
  auto result = coordinator.backup(ref);

  REQUIRE(result.outcome == BackupOutcome::PartiallyCommitted);
  REQUIRE(result.manifest->content_state == ContentState::Failed);
  REQUIRE(result.manifest->metadata.at(EntityClass::Issues).state ==
          MetadataState::Complete);
  REQUIRE_FALSE(std::filesystem::exists(result.path / "content"));
  std::filesystem::remove_all(root);
}

TEST_CASE("coordinator retries transient clone failures") {
  auto root = scratch_dir("coord-retry");
  FakeProvider provider;
  FakeWorkspace workspace;
  RepositoryRef ref{"acme", "widgets"};
  seed(provider, ref);
  workspace.fail_url("https://example.test/acme/widgets.git",
                     ErrorKind::NetworkError);

  SnapshotCoordinator coordinator(PathResolver(root), provider, workspace,
                                  fast_settings());
  auto result = coordinator.backup(ref);

  REQUIRE(workspace.mirror_calls() == 2);
  REQUIRE(result.manifest->content_state == ContentState::Failed);
  REQUIRE(result.outcome == BackupOutcome::PartiallyCommitted);
  std::filesystem::remove_all(root);
}

TEST_CASE("coordinator aborts on storage failure and removes the directory") {
  auto root = scratch_dir("coord-storage");
  FakeProvider provider;
  FakeWorkspace workspace;
  RepositoryRef ref{"acme", "widgets"};
  seed(provider, ref);
  workspace.fail_url("https://example.test/acme/widgets.git",
                     ErrorKind::Storage);

  SnapshotCoordinator coordinator(PathResolver(root), provider, workspace,
                                  fast_settings());
  auto result = coordinator.backup(ref);

  REQUIRE(result.outcome == BackupOutcome::Aborted);
  REQUIRE(result.final_phase == SnapshotPhase::Aborted);
  REQUIRE_FALSE(result.committed());
  REQUIRE_FALSE(std::filesystem::exists(result.path));
  BackupCatalog catalog{PathResolver(root)};
  REQUIRE(catalog.list(ref).empty());
  std::filesystem::remove_all(root);
}

TEST_CASE("coordinator aborts when cancelled mid pipeline") {
  auto root = scratch_dir("coord-cancel");
  FakeProvider provider;
  FakeWorkspace workspace;
  RepositoryRef ref{"acme", "widgets"};
  seed(provider, ref);

  SnapshotCoordinator coordinator(PathResolver(root), provider, workspace,
                                  fast_settings());
  CancellationToken cancel;
  coordinator.set_phase_observer(
      [&cancel](const SnapshotId &, SnapshotPhase phase) {
        if (phase == SnapshotPhase::MetadataInFlight) {
          cancel.cancel();
        }
      });
  auto result = coordinator.backup(ref, {}, &cancel);

  REQUIRE(result.outcome == BackupOutcome::Aborted);
  REQUIRE(result.error == "cancelled");
  REQUIRE_FALSE(std::filesystem::exists(result.path));
  REQUIRE(provider.issue_pages_fetched == 0);

  auto again = coordinator.backup(ref, {}, &cancel);
  REQUIRE(again.outcome == BackupOutcome::NotStarted);
  REQUIRE_FALSE(again.snapshot);
  std::filesystem::remove_all(root);
}

TEST_CASE("coordinator rejects hostile repository names") {
  auto root = scratch_dir("coord-invalid");
  FakeProvider provider;
  FakeWorkspace workspace;
  SnapshotCoordinator coordinator(PathResolver(root), provider, workspace,
                                  fast_settings());

  REQUIRE(error_kind_of([&] {
            coordinator.backup(RepositoryRef{"..", "widgets"});
          }) == ErrorKind::InvalidIdentifier);
  REQUIRE(error_kind_of([&] {
            coordinator.backup(RepositoryRef{"acme", "a/b"});
          }) == ErrorKind::InvalidIdentifier);
  REQUIRE(std::filesystem::is_empty(root));
  REQUIRE(workspace.mirror_calls() == 0);
  std::filesystem::remove_all(root);
}

TEST_CASE("coordinator rejects zero concurrency") {
  FakeProvider provider;
  FakeWorkspace workspace;
  CoordinatorSettings settings;
  settings.concurrency = 0;
  REQUIRE(error_kind_of([&] {
            SnapshotCoordinator(PathResolver("backups"), provider, workspace,
                                settings);
          }) == ErrorKind::Configuration);
}

TEST_CASE("coordinator honours metadata selection") {
  auto root = scratch_dir("coord-selection");
  FakeProvider provider;
  FakeWorkspace workspace;
  RepositoryRef ref{"acme", "widgets"};
  seed(provider, ref);

  SnapshotCoordinator coordinator(PathResolver(root), provider, workspace,
                                  fast_settings());
  BackupOptions options;
  options.include_content = false;
  options.classes = {EntityClass::Issues};
  auto result = coordinator.backup(ref, options);

  REQUIRE(result.outcome == BackupOutcome::Committed);
  REQUIRE(result.manifest->content_state == ContentState::Skipped);
  REQUIRE(result.manifest->metadata.at(EntityClass::Issues).state ==
          MetadataState::Complete);
  REQUIRE(result.manifest->metadata.at(EntityClass::Releases).state ==
          MetadataState::Skipped);
  REQUIRE(workspace.mirror_calls() == 0);
  std::filesystem::remove_all(root);
}

TEST_CASE("coordinator captures metadata classes in parallel") {
  auto root = scratch_dir("coord-parallel");
  FakeProvider provider;
  FakeWorkspace workspace;
  RepositoryRef ref{"acme", "widgets"};
  seed(provider, ref);

  SnapshotCoordinator coordinator(PathResolver(root), provider, workspace,
                                  fast_settings());
  BackupOptions options;
  options.parallel_metadata = true;
  auto result = coordinator.backup(ref, options);

  REQUIRE(result.outcome == BackupOutcome::Committed);
  for (EntityClass cls : all_entity_classes()) {
    REQUIRE(result.manifest->metadata.at(cls).state ==
            MetadataState::Complete);
  }
  std::filesystem::remove_all(root);
}

TEST_CASE("coordinator resumes an interrupted snapshot") {
  auto root = scratch_dir("coord-resume");
  FakeProvider provider;
  FakeWorkspace workspace;
  RepositoryRef ref{"acme", "widgets"};
  seed(provider, ref);

  SnapshotId id{ref, "20240101-000000"};
  auto dir = root / "acme" / "widgets" / "20240101-000000";
  std::filesystem::create_directories(dir / "content");
  std::filesystem::create_directories(dir / "metadata");
  std::ofstream(dir / "content" / "leftover.pack") << "stale";
  std::ofstream(dir / "metadata" / "issues.json") << "{ truncated";

  BackupCatalog catalog{PathResolver(root)};
  REQUIRE(catalog.list(ref).empty());
  REQUIRE(catalog.incomplete(ref).size() == 1);

  SnapshotCoordinator coordinator(PathResolver(root), provider, workspace,
                                  fast_settings());
  auto result = coordinator.resume(id);
  REQUIRE(result.outcome == BackupOutcome::Committed);
  REQUIRE(result.snapshot == id);
  REQUIRE_FALSE(std::filesystem::exists(dir / "content" / "leftover.pack"));
  REQUIRE(catalog.list(ref).size() == 1);

  REQUIRE(error_kind_of([&] { coordinator.resume(id); }) ==
          ErrorKind::Conflict);
  REQUIRE(error_kind_of([&] {
            coordinator.resume(SnapshotId{ref, "20240102-000000"});
          }) == ErrorKind::NotFound);
  std::filesystem::remove_all(root);
}

TEST_CASE("coordinator isolates failures within a batch") {
  auto root = scratch_dir("coord-batch");
  FakeProvider provider;
  FakeWorkspace workspace;
  RepositoryRef good1{"acme", "widgets"};
  RepositoryRef good2{"acme", "gadgets"};
  RepositoryRef bad{"acme", "broken"};
  seed(provider, good1);
  seed(provider, good2);
  seed(provider, bad);
  workspace.fail_url("https://example.test/acme/broken.git",
                     ErrorKind::Storage);

  SnapshotCoordinator coordinator(PathResolver(root), provider, workspace,
                                  fast_settings(2));
  auto batch =
      coordinator.backup_many({good1, bad, good2, good1, {"..", "evil"}});

  REQUIRE(batch.results.size() == 4);
  REQUIRE(batch.results.at("acme/widgets").outcome == BackupOutcome::Committed);
  REQUIRE(batch.results.at("acme/gadgets").outcome == BackupOutcome::Committed);
  REQUIRE(batch.results.at("acme/broken").outcome == BackupOutcome::Aborted);
  REQUIRE(batch.results.at("../evil").outcome == BackupOutcome::Rejected);
  REQUIRE(batch.count(BackupOutcome::Committed) == 2);
  REQUIRE_FALSE(batch.all_committed());
  REQUIRE(batch.peak_concurrency >= 1);
  REQUIRE(batch.peak_concurrency <= 2);

  BackupCatalog catalog{PathResolver(root)};
  REQUIRE(catalog.list(good1).size() == 1);
  REQUIRE(catalog.list(good2).size() == 1);
  REQUIRE(catalog.list(bad).empty());
  std::filesystem::remove_all(root);
}

TEST_CASE("coordinator backs up every selected repository of an owner") {
  auto root = scratch_dir("coord-all");
  FakeProvider provider;
  FakeWorkspace workspace;
  seed(provider, {"acme", "widgets"});
  seed(provider, {"acme", "gadgets"});
  seed(provider, {"acme", "legacy-tool"});
  seed(provider, {"other", "thing"});
  provider.remaining_budget = 10;

  SnapshotCoordinator coordinator(PathResolver(root), provider, workspace,
                                  fast_settings(3));
  BatchOptions options;
  options.owner = "acme";
  options.exclude = {"legacy-*"};
  auto batch = coordinator.backup_all(options);

  REQUIRE(batch.results.size() == 2);
  REQUIRE(batch.all_committed());
  REQUIRE(batch.results.count("acme/legacy-tool") == 0);
  REQUIRE(batch.results.count("other/thing") == 0);
  std::filesystem::remove_all(root);
}

TEST_CASE("coordinator stops scheduling after cancellation") {
  auto root = scratch_dir("coord-batch-cancel");
  FakeProvider provider;
  FakeWorkspace workspace;
  std::vector<RepositoryRef> refs;
  for (int i = 0; i < 6; ++i) {
    RepositoryRef ref{"acme", "repo" + std::to_string(i)};
    seed(provider, ref);
    refs.push_back(ref);
  }
  SnapshotCoordinator coordinator(PathResolver(root), provider, workspace,
                                  fast_settings(1));
  CancellationToken cancel;
  std::atomic<int> committed{0};
  coordinator.set_phase_observer(
      [&](const SnapshotId &, SnapshotPhase phase) {
        if (phase == SnapshotPhase::Committed && ++committed == 1) {
          cancel.cancel();
        }
      });
  auto batch = coordinator.backup_many(refs, {}, &cancel);

  REQUIRE(batch.results.size() == 6);
  REQUIRE(batch.count(BackupOutcome::Committed) == 1);
  REQUIRE(batch.count(BackupOutcome::NotStarted) == 5);
  std::filesystem::remove_all(root);
}

TEST_CASE("selection patterns") {
  REQUIRE(SnapshotCoordinator::selected("widgets", {}, {}));
  REQUIRE(SnapshotCoordinator::selected("widgets", {"wid*"}, {}));
  REQUIRE_FALSE(SnapshotCoordinator::selected("gadgets", {"wid*"}, {}));
  REQUIRE_FALSE(SnapshotCoordinator::selected("widgets", {}, {"widgets"}));
  REQUIRE_FALSE(SnapshotCoordinator::selected("widgets", {"w*"}, {"*ets"}));
  REQUIRE(SnapshotCoordinator::selected("a.b", {"a.b"}, {}));
  REQUIRE_FALSE(SnapshotCoordinator::selected("axb", {"a.b"}, {}));
}
