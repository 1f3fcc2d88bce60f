#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include "docsync/error.hpp"
#include "category.hpp"

namespace docsync::engine {

    struct Config {
        std::filesystem::path db_path = "docsync.db";
        std::vector<std::filesystem::path> command_roots = {".claude/commands", ".gemini/commands"};
        std::filesystem::path plan_root = "_docs/plans";
        std::string categories = "archive,go,js,mcp,python,tools"; // command categories, comma separated
        std::string extension = ".md";
        size_t workers = 4;
        bool verify_before_sync = true;
        std::optional<std::string> project_ref; // attached to plans on sync
        bool quiet = false;
        // true when db_path came from the file or DOCSYNC_DB_PATH rather than the default
        bool db_path_set = false;

        /**
         * @brief Reads a JSON config file; a missing file yields the defaults.
         * Environment overrides (DOCSYNC_DB_PATH, DOCSYNC_CATEGORIES) are applied last.
         * @throws ConfigError on unreadable JSON or wrongly typed keys.
         */
        static Config load(const std::filesystem::path& path) {
            Config cfg;
            if (!path.empty() && std::filesystem::exists(path)) {
                std::ifstream f(path);
                if (!f) throw ConfigError("cannot read config: " + path.string());

                try {
                    nlohmann::json j = nlohmann::json::parse(f);

                    if (j.contains("db_path")) {
                        cfg.db_path = j["db_path"].get<std::string>();
                        cfg.db_path_set = true;
                    }
                    if (j.contains("command_roots")) {
                        cfg.command_roots.clear();
                        for (const auto& r : j["command_roots"]) cfg.command_roots.emplace_back(r.get<std::string>());
                    }
                    if (j.contains("plan_root")) cfg.plan_root = j["plan_root"].get<std::string>();
                    if (j.contains("categories")) {
                        if (j["categories"].is_array()) {
                            std::string joined;
                            for (const auto& c : j["categories"]) {
                                if (!joined.empty()) joined += ",";
                                joined += c.get<std::string>();
                            }
                            cfg.categories = joined;
                        } else {
                            cfg.categories = j["categories"].get<std::string>();
                        }
                    }
                    if (j.contains("extension")) cfg.extension = j["extension"].get<std::string>();
                    if (j.contains("workers")) cfg.workers = j["workers"].get<size_t>();
                    if (j.contains("verify_before_sync")) cfg.verify_before_sync = j["verify_before_sync"].get<bool>();
                    if (j.contains("project_ref") && !j["project_ref"].is_null()) cfg.project_ref = j["project_ref"].get<std::string>();
                    if (j.contains("quiet")) cfg.quiet = j["quiet"].get<bool>();
                } catch (const nlohmann::json::exception& e) {
                    throw ConfigError("invalid config " + path.string() + ": " + e.what());
                }
            }

            if (const char* db = std::getenv("DOCSYNC_DB_PATH"); db && *db) {
                cfg.db_path = db;
                cfg.db_path_set = true;
            }
            if (const char* cats = std::getenv("DOCSYNC_CATEGORIES"); cats && *cats) cfg.categories = cats;

            cfg.validate();
            return cfg;
        }

        void validate() const {
            if (command_roots.empty()) throw ConfigError("at least one command root is required");
            if (plan_root.empty()) throw ConfigError("plan_root must not be empty");
            if (extension.empty() || extension.front() != '.') throw ConfigError("extension must start with '.': " + extension);
            if (workers == 0) throw ConfigError("workers must be at least 1");
            CategorySet::from_list(categories);
        }

        CategorySet command_categories() const { return CategorySet::from_list(categories); }

        void save(const std::filesystem::path& path) const {
            nlohmann::json j;
            j["db_path"] = db_path.string();
            j["command_roots"] = nlohmann::json::array();
            for (const auto& r : command_roots) j["command_roots"].push_back(r.string());
            j["plan_root"] = plan_root.string();
            j["categories"] = categories;
            j["extension"] = extension;
            j["workers"] = workers;
            j["verify_before_sync"] = verify_before_sync;
            if (project_ref) j["project_ref"] = *project_ref;
            j["quiet"] = quiet;

            std::ofstream f(path);
            if (!f) throw ConfigError("cannot write config: " + path.string());
            f << j.dump(4);
        }
    };

}
