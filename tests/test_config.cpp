#include "test_framework.hpp"

#include "docsync/error.hpp"
#include "engine/config.hpp"

#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

namespace {

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = existing;
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }
};

} // namespace

void register_config_tests(std::vector<docsync::tests::TestCase> &tests) {
  using docsync::tests::require;
  using docsync::engine::Config;

  tests.push_back({"config_missing_file_gives_defaults", [] {
                     TempDir dir("docsync-config-");
                     const EnvGuard db("DOCSYNC_DB_PATH", std::nullopt);
                     const EnvGuard cats("DOCSYNC_CATEGORIES", std::nullopt);

                     auto cfg = Config::load(dir.path() / "absent.json");
                     require(cfg.command_roots.size() == 2, "two default command roots expected");
                     require(cfg.plan_root == "_docs/plans", "default plan root");
                     require(cfg.command_categories().labels().size() == 6, "six default categories");
                     require(cfg.extension == ".md", "default extension");
                     require(cfg.verify_before_sync, "verification on by default");
                   }});

  tests.push_back({"config_reads_json_keys", [] {
                     TempDir dir("docsync-config-");
                     const EnvGuard db("DOCSYNC_DB_PATH", std::nullopt);
                     const EnvGuard cats("DOCSYNC_CATEGORIES", std::nullopt);
                     write_file(dir.path() / "config.json", R"({
  "db_path": "/var/lib/docs.db",
  "command_roots": ["cmds"],
  "plan_root": "plans",
  "categories": ["go", "rust"],
  "workers": 2,
  "verify_before_sync": false,
  "project_ref": "https://example.com/repo",
  "quiet": true
})");
                     auto cfg = Config::load(dir.path() / "config.json");
                     require(cfg.db_path == "/var/lib/docs.db", "db_path");
                     require(cfg.command_roots.size() == 1 && cfg.command_roots[0] == "cmds", "command_roots");
                     require(cfg.categories == "go,rust", "array categories are joined");
                     require(cfg.workers == 2, "workers");
                     require(!cfg.verify_before_sync, "verify_before_sync");
                     require(cfg.project_ref == std::optional<std::string>("https://example.com/repo"), "project_ref");
                     require(cfg.quiet, "quiet");
                   }});

  tests.push_back({"config_environment_overrides_file", [] {
                     TempDir dir("docsync-config-");
                     write_file(dir.path() / "config.json", R"({"db_path": "a.db", "categories": "go"})");
                     const EnvGuard db("DOCSYNC_DB_PATH", std::string("/tmp/b.db"));
                     const EnvGuard cats("DOCSYNC_CATEGORIES", std::string("python,js"));

                     auto cfg = Config::load(dir.path() / "config.json");
                     require(cfg.db_path == "/tmp/b.db", "env db path wins");
                     require(cfg.command_categories().contains("js"), "env categories win");
                   }});

  tests.push_back({"config_invalid_input_is_config_error", [] {
                     TempDir dir("docsync-config-");
                     const EnvGuard cats("DOCSYNC_CATEGORIES", std::nullopt);
                     const std::vector<std::string> bad = {
                         "{ not json", R"({"workers": "many"})", R"({"categories": "go,go"})",
                         R"({"extension": "md"})", R"({"command_roots": []})"};
                     for (const auto &text : bad) {
                       write_file(dir.path() / "config.json", text);
                       bool threw = false;
                       try {
                         Config::load(dir.path() / "config.json");
                       } catch (const docsync::ConfigError &) {
                         threw = true;
                       }
                       require(threw, "expected ConfigError for " + text);
                     }
                   }});

  tests.push_back({"config_save_then_load", [] {
                     TempDir dir("docsync-config-");
                     const EnvGuard db("DOCSYNC_DB_PATH", std::nullopt);
                     const EnvGuard cats("DOCSYNC_CATEGORIES", std::nullopt);
                     Config cfg;
                     cfg.plan_root = "docs/plans";
                     cfg.categories = "tools";
                     cfg.save(dir.path() / "config.json");

                     auto loaded = Config::load(dir.path() / "config.json");
                     require(loaded.plan_root == "docs/plans", "plan root should persist");
                     require(loaded.categories == "tools", "categories should persist");
                   }});

  tests.push_back({"config_records_whether_db_path_was_given", [] {
                     TempDir dir("docsync-config-");
                     const EnvGuard db("DOCSYNC_DB_PATH", std::nullopt);
                     const EnvGuard cats("DOCSYNC_CATEGORIES", std::nullopt);

                     require(!Config::load(dir.path() / "absent.json").db_path_set, "default is not an explicit path");

                     write_file(dir.path() / "config.json", R"({"db_path": "docsync.db"})");
                     auto cfg = Config::load(dir.path() / "config.json");
                     require(cfg.db_path_set, "explicit path equal to the default is still explicit");
                     require(cfg.db_path == "docsync.db", "path kept as given");

                     const EnvGuard env_db("DOCSYNC_DB_PATH", std::string("/tmp/env.db"));
                     require(Config::load(dir.path() / "absent.json").db_path_set, "env path is explicit");
                   }});
}
