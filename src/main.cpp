#include <iostream>
#include <csignal>
#include <atomic>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "platform.hpp"
#include "docsync/error.hpp"
#include "engine/config.hpp"
#include "engine/category.hpp"
#include "engine/loader.hpp"
#include "engine/payload.hpp"
#include "engine/report.hpp"
#include "engine/sync_engine.hpp"
#include "engine/version_store.hpp"
#include <nlohmann/json.hpp>

using namespace docsync;
using namespace docsync::engine;

// Checked between documents by the sync loop
std::atomic<bool> g_cancel{false};

void signal_handler(int signum) {
    g_cancel = true;
    (void)signum;
}

namespace {

    enum ExitCode { kClean = 0, kReportedErrors = 1, kFatal = 2 };

    void print_usage() {
        std::cerr << "Usage: docsync [--config <path>] [--json] [--quiet] <command> [args...]\n";
        std::cerr << "Commands:\n";
        std::cerr << "  sync                              - Load command and plan files into the store\n";
        std::cerr << "  flatten                           - Write current documents back to disk\n";
        std::cerr << "  list                              - List current documents\n";
        std::cerr << "  show <name> [version]             - Print a document\n";
        std::cerr << "  history <name>                    - List archived versions\n";
        std::cerr << "  rollback <name> <version> [note]  - Restore an earlier version as a new one\n";
        std::cerr << "  verify                            - Re-hash every stored row\n";
        std::cerr << "  project add <ref> <description>\n";
        std::cerr << "  project remove <ref>\n";
        std::cerr << "  project list\n";
        std::cerr << "  metric add <name> <metric> <step> <value>\n";
        std::cerr << "  metric list <name>\n";
    }

    std::vector<DocumentSource> make_sources(const Config& config) {
        std::vector<DocumentSource> sources;
        sources.push_back({DocumentKind::Command, config.command_roots, CategoryResolver(config.command_categories())});
        sources.push_back({DocumentKind::Plan, {config.plan_root}, CategoryResolver(CategorySet::plan_lifecycle())});
        return sources;
    }

    FlattenTargets make_targets(const Config& config) {
        FlattenTargets targets;
        targets.command_roots = config.command_roots;
        targets.plan_root = config.plan_root;
        targets.extension = config.extension;
        return targets;
    }

    Document require_document(VersionStore& store, const std::string& name_or_id) {
        auto doc = store.get_current(name_or_id);
        if (!doc) doc = store.get_by_id(name_or_id);
        if (!doc) throw StoreError("no such document: " + name_or_id);
        return *doc;
    }

    int64_t parse_int(const std::string& text, const char* what) {
        try {
            size_t used = 0;
            int64_t v = std::stoll(text, &used);
            if (used == text.size()) return v;
        } catch (const std::logic_error&) {
        }
        throw ConfigError(std::string("invalid ") + what + ": " + text);
    }

    double parse_double(const std::string& text, const char* what) {
        try {
            size_t used = 0;
            double v = std::stod(text, &used);
            if (used == text.size()) return v;
        } catch (const std::logic_error&) {
        }
        throw ConfigError(std::string("invalid ") + what + ": " + text);
    }

    void print_document(const Document& doc) {
        std::cout << doc.name << "  v" << doc.version << "  " << to_string(doc.kind()) << "/" << doc.category << "  "
                  << doc.content_hash.substr(0, 12) << "  " << doc.updated_at;
        if (doc.project_ref) std::cout << "  [" << *doc.project_ref << "]";
        std::cout << "\n";
    }

    int run(const std::string& command, const std::vector<std::string>& args, const Config& config, bool json) {
        VersionStore store;
        if (!config.db_path.parent_path().empty()) {
            std::filesystem::create_directories(config.db_path.parent_path());
        }
        store.open(config.db_path);

        auto need = [&](size_t n) {
            if (args.size() < n) throw ConfigError("missing arguments for '" + command + "'");
        };

        if (command == "sync") {
            LoaderOptions loader_options;
            loader_options.extension = config.extension;
            loader_options.workers = config.workers;
            loader_options.quiet = config.quiet;

            SyncOptions options;
            options.verify_before_sync = config.verify_before_sync;
            options.project_ref = config.project_ref;
            options.quiet = config.quiet;

            SyncEngine engine(store, DocumentLoader(loader_options), options);
            SyncSummary summary = engine.sync(make_sources(config), &g_cancel);
            std::cout << (json ? to_json(summary).dump(2) + "\n" : render_text(summary));
            return summary.ok() ? kClean : kReportedErrors;
        }

        if (command == "flatten") {
            FlattenOptions options;
            options.workers = config.workers;
            options.quiet = config.quiet;
            Flattener flattener(store, options);
            FlattenSummary summary = flattener.flatten(make_targets(config));
            std::cout << (json ? to_json(summary).dump(2) + "\n" : render_text(summary));
            return summary.ok() ? kClean : kReportedErrors;
        }

        if (command == "list") {
            auto docs = store.list_current();
            if (json) {
                nlohmann::json out = nlohmann::json::array();
                for (const auto& d : docs) out.push_back(to_json(d));
                std::cout << out.dump(2) << "\n";
            } else {
                for (const auto& d : docs) print_document(d);
            }
            return kClean;
        }

        if (command == "show") {
            need(1);
            Document doc = require_document(store, args[0]);
            if (args.size() > 1) {
                int64_t version = parse_int(args[1], "version");
                auto v = store.get_version(doc.id, version);
                if (!v) throw StoreError("no version " + args[1] + " of " + doc.name);
                doc = *v;
            }
            if (json) {
                std::cout << to_json(doc, true).dump(2) << "\n";
            } else {
                print_document(doc);
                std::cout << "\n" << doc.content();
                if (!doc.content().empty() && doc.content().back() != '\n') std::cout << "\n";
            }
            return kClean;
        }

        if (command == "history") {
            need(1);
            Document doc = require_document(store, args[0]);
            auto records = store.history(doc.id);
            if (json) {
                nlohmann::json out = nlohmann::json::array();
                for (const auto& r : records) out.push_back(to_json(r));
                std::cout << out.dump(2) << "\n";
            } else {
                for (const auto& r : records) {
                    std::cout << "v" << r.document.version << "  " << r.document.content_hash.substr(0, 12) << "  "
                              << r.archived_at << "  " << r.change_summary.value_or("") << "\n";
                }
                std::cout << "v" << doc.version << "  " << doc.content_hash.substr(0, 12) << "  (current)\n";
            }
            return kClean;
        }

        if (command == "rollback") {
            need(2);
            Document doc = require_document(store, args[0]);
            int64_t version = parse_int(args[1], "version");
            std::string note = args.size() > 2 ? args[2] : "rollback to version " + args[1];
            UpsertResult result = store.rollback(doc.id, version, note);
            std::cout << "[docsync] " << doc.name << ": " << to_string(result.outcome) << ", now v" << result.version << "\n";
            return kClean;
        }

        if (command == "verify") {
            store.verify_integrity();
            std::cout << "[docsync] Store is consistent (" << store.current_count() << " documents)\n";
            return kClean;
        }

        if (command == "project") {
            need(1);
            if (args[0] == "add") {
                need(3);
                store.add_project(args[1], args[2]);
                return kClean;
            }
            if (args[0] == "remove") {
                need(2);
                if (!store.remove_project(args[1])) {
                    std::cerr << "[docsync] No such project: " << args[1] << "\n";
                    return kReportedErrors;
                }
                return kClean;
            }
            if (args[0] == "list") {
                for (const auto& p : store.list_projects()) {
                    std::cout << p.ref << "  " << p.description << "\n";
                }
                return kClean;
            }
        }

        if (command == "metric") {
            need(2);
            Document doc = require_document(store, args[1]);
            if (args[0] == "add") {
                need(5);
                Metric m;
                m.document_id = doc.id;
                m.version = doc.version;
                m.name = args[2];
                m.step = parse_int(args[3], "step");
                m.value = parse_double(args[4], "value");
                store.record_metric(m);
                return kClean;
            }
            if (args[0] == "list") {
                for (const auto& m : store.metrics(doc.id)) {
                    std::cout << "v" << m.version << "  " << m.name << "[" << m.step << "] = " << m.value << "  " << m.timestamp << "\n";
                }
                return kClean;
            }
        }

        print_usage();
        return kFatal;
    }

}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::filesystem::path config_path;
    bool json = false;
    bool quiet = false;
    std::string command;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (command.empty() && arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (command.empty() && arg == "--json") {
            json = true;
        } else if (command.empty() && arg == "--quiet") {
            quiet = true;
        } else if (command.empty()) {
            command = arg;
        } else {
            args.push_back(arg);
        }
    }

    if (command.empty()) {
        print_usage();
        return kFatal;
    }

    if (config_path.empty()) {
        auto config_dir = platform::system::get_config_dir();
        if (!config_dir.empty()) config_path = config_dir / "config.json";
    }

    try {
        Config config = Config::load(config_path);
        if (quiet || json) config.quiet = true;
        // Default database lives in the data directory
        if (!config.db_path_set) {
            auto data_dir = platform::system::get_data_dir();
            if (!data_dir.empty()) config.db_path = data_dir / "docsync.db";
        }
        if (!config.quiet) {
            std::cout << "[docsync] Database path: " << config.db_path << "\n";
        }
        return run(command, args, config, json);
    } catch (const ConfigError& e) {
        std::cerr << "[docsync] Configuration error: " << e.what() << "\n";
        return kFatal;
    } catch (const ConsistencyError& e) {
        std::cerr << "[docsync] Store is inconsistent: " << e.what() << "\n";
        return kFatal;
    } catch (const StoreError& e) {
        std::cerr << "[docsync] " << e.what() << "\n";
        return kReportedErrors;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "[docsync] " << e.what() << "\n";
        return kFatal;
    }
}
