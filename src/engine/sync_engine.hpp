#pragma once

#include <atomic>
#include <optional>
#include <string>
#include <vector>
#include "docsync/types.hpp"
#include "loader.hpp"
#include "flattener.hpp"
#include "version_store.hpp"

namespace docsync::engine {

    struct SyncOptions {
        bool verify_before_sync = true;
        bool quiet = false;
        // Registered if missing, then associated with every plan that does not already carry a project.
        std::optional<std::string> project_ref;
    };

    /**
     * @brief Drives one sync pass: load from disk, upsert into the store.
     *
     * The same engine handles commands and plans; each DocumentSource says
     * which kind its roots hold.
     */
    class SyncEngine {
    public:
        SyncEngine(VersionStore& store, DocumentLoader loader, SyncOptions options = {});

        /**
         * @brief Creates missing category directories, registers the configured
         * project, loads every source and upserts each document in name order.
         *
         * Load and store failures are collected in the summary. A set cancel
         * flag stops the pass between documents and marks it interrupted.
         *
         * @throws ConfigError if a category directory cannot be created.
         * @throws ConsistencyError if the store is corrupt; the pass stops.
         */
        SyncSummary sync(const std::vector<DocumentSource>& sources, const std::atomic<bool>* cancel = nullptr);

        /**
         * @brief Projects the store back onto disk.
         */
        FlattenSummary flatten(const FlattenTargets& targets, const FlattenOptions& options = {});

    private:
        VersionStore& m_store;
        DocumentLoader m_loader;
        SyncOptions m_options;
    };

}
