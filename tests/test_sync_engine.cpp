#include "test_framework.hpp"

#include "docsync/error.hpp"
#include "docsync/sha256.h"
#include "engine/report.hpp"
#include "engine/sync_engine.hpp"

#include <atomic>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace {

using namespace docsync::engine;

struct Workspace {
  TempDir dir{"docsync-sync-"};
  VersionStore store;

  Workspace() { store.open(dir.path() / "docs.db"); }

  std::filesystem::path commands() const { return dir.path() / "cmds"; }
  std::filesystem::path plans() const { return dir.path() / "plans"; }

  std::vector<DocumentSource> sources() const {
    return {{DocumentKind::Command, {commands()}, CategoryResolver(CategorySet::from_list("go,tools"))},
            {DocumentKind::Plan, {plans()}, CategoryResolver(CategorySet::plan_lifecycle())}};
  }

  FlattenTargets targets(const std::filesystem::path &out) const {
    FlattenTargets t;
    t.command_roots = {out / "cmds"};
    t.plan_root = out / "plans";
    return t;
  }

  SyncEngine engine(SyncOptions options = {}) {
    LoaderOptions loader;
    loader.quiet = true;
    options.quiet = true;
    return SyncEngine(store, DocumentLoader(loader), options);
  }
};

} // namespace

void register_sync_engine_tests(std::vector<docsync::tests::TestCase> &tests) {
  using docsync::tests::require;

  tests.push_back({"sync_creates_missing_category_directories", [] {
                     Workspace ws;
                     auto summary = ws.engine().sync(ws.sources());
                     require(summary.ok(), "empty sync is clean");
                     require(std::filesystem::is_directory(ws.commands() / "tools"), "command category created");
                     require(std::filesystem::is_directory(ws.plans() / "completed"), "plan lifecycle dir created");
                   }});

  tests.push_back({"sync_is_idempotent", [] {
                     Workspace ws;
                     write_file(ws.commands() / "go" / "build.md", "build\n");
                     write_file(ws.plans() / "drafts" / "roadmap.md", "# Roadmap\n");

                     auto first = ws.engine().sync(ws.sources());
                     require(first.created.size() == 2, "two created");

                     auto second = ws.engine().sync(ws.sources());
                     require(second.created.empty() && second.updated.empty(), "nothing changes on resync");
                     require(second.unchanged.size() == 2, "both unchanged");
                     require(ws.store.current_count() == 2, "still two rows");
                     require(ws.store.history_count(ws.store.get_current("build")->id) == 0, "no history rows");
                   }});

  tests.push_back({"sync_batch_accounting_covers_every_input", [] {
                     Workspace ws;
                     write_file(ws.commands() / "go" / "a.md", "a\n");
                     write_file(ws.commands() / "go" / "b.md", "b\n");
                     ws.engine().sync(ws.sources());

                     write_file(ws.commands() / "go" / "a.md", "a2\n");
                     write_file(ws.commands() / "tools" / "c.md", "c\n");
                     write_file(ws.commands() / "tools" / "bad.md", std::string("\xFF\xFE"));

                     auto summary = ws.engine().sync(ws.sources());
                     require(summary.created == std::vector<std::string>{"c"}, "c created");
                     require(summary.updated == std::vector<std::string>{"a"}, "a updated");
                     require(summary.unchanged == std::vector<std::string>{"b"}, "b unchanged");
                     require(summary.errors.size() == 1, "bad file reported");
                     require(summary.errors[0].stage == SyncError::Stage::Load, "reported at load stage");
                     require(summary.created.size() + summary.updated.size() + summary.unchanged.size() +
                                     summary.errors.size() == 4,
                             "every input accounted exactly once");
                     require(!summary.ok(), "errors make the summary not ok");
                   }});

  tests.push_back({"sync_plan_lifecycle_move_without_edit_is_unchanged", [] {
                     Workspace ws;
                     write_file(ws.plans() / "drafts" / "launch.md", "# Launch\n");
                     ws.engine().sync(ws.sources());
                     const auto id = ws.store.get_current("launch")->id;

                     std::filesystem::rename(ws.plans() / "drafts" / "launch.md", ws.plans() / "approved" / "launch.md");
                     auto moved = ws.engine().sync(ws.sources());
                     require(moved.unchanged == std::vector<std::string>{"launch"}, "move alone is unchanged");
                     require(moved.updated.empty(), "no update counted");
                     require(ws.store.history_count(id) == 0, "no history row for a move");

                     write_file(ws.plans() / "approved" / "launch.md", "# Launch\n\n- approved\n");
                     auto edited = ws.engine().sync(ws.sources());
                     require(edited.updated == std::vector<std::string>{"launch"}, "edit is an update");
                     auto current = ws.store.get_current("launch");
                     require(current->category == "approved", "category follows the file on a content change");
                     require(plan_status(current->category) == PlanStatus::Approved, "status derived from location");
                   }});

  tests.push_back({"sync_registers_configured_project_before_plans", [] {
                     Workspace ws;
                     write_file(ws.plans() / "drafts" / "roadmap.md", "# Roadmap\n");

                     SyncOptions options;
                     options.project_ref = "https://github.com/example/repo";
                     auto summary = ws.engine(options).sync(ws.sources());
                     require(summary.ok(), "sync on a fresh store is clean");
                     require(summary.created == std::vector<std::string>{"roadmap"}, "plan created");

                     auto projects = ws.store.list_projects();
                     require(projects.size() == 1 && projects[0].ref == "https://github.com/example/repo",
                             "project registered");
                     require(ws.store.get_current("roadmap")->project_ref ==
                                 std::optional<std::string>("https://github.com/example/repo"),
                             "plan associated with the registered project");

                     auto again = ws.engine(options).sync(ws.sources());
                     require(again.ok() && again.unchanged.size() == 1, "second run finds the project in place");
                     require(ws.store.list_projects().size() == 1, "project registered once");
                   }});

  tests.push_back({"sync_store_error_is_collected_and_run_continues", [] {
                     Workspace ws;
                     write_file(ws.commands() / "tools" / "shared.md", "command\n");
                     ws.engine().sync(ws.sources());

                     // The same name now only exists as a plan: kind change is refused per document.
                     std::filesystem::remove(ws.commands() / "tools" / "shared.md");
                     write_file(ws.plans() / "drafts" / "shared.md", "# Shared\n");
                     write_file(ws.plans() / "drafts" / "other.md", "# Other\n");

                     auto summary = ws.engine().sync(ws.sources());
                     require(summary.errors.size() == 1, "one store error");
                     require(summary.errors[0].stage == SyncError::Stage::Store, "store stage");
                     require(summary.errors[0].subject == "shared", "subject is the document name");
                     require(summary.created == std::vector<std::string>{"other"}, "other still created");
                   }});

  tests.push_back({"sync_project_ref_applies_to_plans_only", [] {
                     Workspace ws;
                     ws.store.add_project("https://example.com/repo", "example");
                     write_file(ws.commands() / "go" / "build.md", "build\n");
                     write_file(ws.plans() / "drafts" / "roadmap.md", "# Roadmap\n");

                     SyncOptions options;
                     options.project_ref = "https://example.com/repo";
                     auto summary = ws.engine(options).sync(ws.sources());
                     require(summary.ok(), "sync is clean");
                     require(ws.store.get_current("roadmap")->project_ref ==
                                 std::optional<std::string>("https://example.com/repo"),
                             "plan associated with project");
                     require(!ws.store.get_current("build")->project_ref.has_value(), "command left global");
                   }});

  tests.push_back({"sync_corrupt_store_aborts_with_consistency_error", [] {
                     Workspace ws;
                     write_file(ws.commands() / "go" / "build.md", "build\n");
                     ws.engine().sync(ws.sources());

                     sqlite3 *db = nullptr;
                     sqlite3_open((ws.dir.path() / "docs.db").c_str(), &db);
                     sqlite3_exec(db, "UPDATE documents SET content_hash = 'deadbeef';", nullptr, nullptr, nullptr);
                     sqlite3_close(db);

                     write_file(ws.commands() / "go" / "new.md", "new\n");
                     bool threw = false;
                     try {
                       ws.engine().sync(ws.sources());
                     } catch (const docsync::ConsistencyError &) {
                       threw = true;
                     }
                     require(threw, "corruption must abort the run");
                     require(!ws.store.get_current("new").has_value(), "nothing written after abort");
                   }});

  tests.push_back({"sync_cancel_flag_interrupts_between_documents", [] {
                     Workspace ws;
                     write_file(ws.commands() / "go" / "a.md", "a\n");
                     write_file(ws.commands() / "go" / "b.md", "b\n");

                     std::atomic<bool> cancel{true};
                     auto summary = ws.engine().sync(ws.sources(), &cancel);
                     require(summary.interrupted, "summary marked interrupted");
                     require(!summary.ok(), "interrupted run is not ok");
                     require(ws.store.current_count() == 0, "no document processed after cancel");
                   }});

  tests.push_back({"sync_scenarios_update_rollback_flatten", [] {
                     Workspace ws;
                     write_file(ws.commands() / "a.md", "v1");
                     write_file(ws.commands() / "b.md", "x");

                     // Scenario A
                     auto first = ws.engine().sync(ws.sources());
                     require(first.created == std::vector<std::string>({"a", "b"}), "a and b created");
                     require(ws.store.get_current("a")->version == 1, "a at version 1");

                     write_file(ws.commands() / "a.md", "v2");
                     auto second = ws.engine().sync(ws.sources());
                     require(second.updated == std::vector<std::string>{"a"}, "a updated");
                     require(second.unchanged == std::vector<std::string>{"b"}, "b unchanged");
                     auto a = *ws.store.get_current("a");
                     require(a.version == 2, "a at version 2");
                     auto history = ws.store.history(a.id);
                     require(history.size() == 1 && history[0].document.version == 1 &&
                                 history[0].document.content() == "v1",
                             "one history row holding v1");

                     // Scenario B
                     auto rolled = ws.store.rollback(a.id, 1, "revert");
                     require(rolled.version == 3, "rollback lands on version 3");
                     require(ws.store.get_current("a")->content() == "v1", "content reverted");
                     auto v2 = ws.store.get_version(a.id, 2);
                     require(v2.has_value() && v2->content() == "v2", "version 2 archived with v2");
                     auto after_rollback = ws.store.history(a.id);
                     require(after_rollback.size() == 2, "two archived versions");
                     require(after_rollback[0].document.version == 1 && after_rollback[1].document.version == 2,
                             "history versions contiguous");
                     require(after_rollback[1].change_summary == std::optional<std::string>("revert"),
                             "rollback note kept on the row it superseded");

                     // Scenario C
                     TempDir out("docsync-sync-out-");
                     FlattenOptions flatten_options;
                     flatten_options.quiet = true;
                     auto flat = ws.engine().flatten(ws.targets(out.path()), flatten_options);
                     require(flat.ok(), "flatten is clean");
                     const auto written = read_file(out.path() / "cmds" / "a.md");
                     require(written == "v1", "flattened a holds v1");
                     require(docsync::crypto::content_hash(written) == ws.store.get_current("a")->content_hash,
                             "flattened bytes hash to the stored hash");
                     ws.store.verify_integrity();
                   }});

  tests.push_back({"sync_summary_renders_as_json_and_text", [] {
                     SyncSummary summary;
                     summary.created = {"a"};
                     summary.unchanged = {"b", "c"};
                     summary.errors.push_back({"/x/bad.md", "file is not valid UTF-8", SyncError::Stage::Load});

                     auto j = to_json(summary);
                     require(j["created"].size() == 1 && j["unchanged"].size() == 2, "buckets serialized");
                     require(j["errors"][0]["stage"] == "load", "error stage serialized");
                     require(j["interrupted"] == false, "interrupted flag serialized");

                     const std::string text = render_text(summary);
                     require(text.find("Created (1)") != std::string::npos, "created section");
                     require(text.find("[load] /x/bad.md") != std::string::npos, "error line");
                   }});
}
