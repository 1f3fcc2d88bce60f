#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <sqlite3.h>
#include "docsync/types.hpp"

namespace docsync::engine {

    /**
     * @brief SQLite backed current + history tables.
     *
     * Every mutating operation is a single BEGIN IMMEDIATE transaction. A
     * VersionStore handle is not thread-safe; open one per thread or process.
     * Rows are re-hashed when read and a mismatch raises ConsistencyError.
     */
    class VersionStore {
    public:
        VersionStore();
        ~VersionStore();

        VersionStore(const VersionStore&) = delete;
        VersionStore& operator=(const VersionStore&) = delete;

        /**
         * @brief Opens (creating if needed) the store and its schema.
         * @throws StoreError if the database cannot be opened.
         * @throws ConsistencyError if the store was written with another hash scheme.
         */
        void open(const std::filesystem::path& path);
        void close();
        bool is_open() const { return m_db != nullptr; }

        std::optional<Document> get_current(const std::string& name);
        std::optional<Document> get_by_id(const std::string& id);

        /**
         * @brief Inserts, archives-then-updates, or leaves the current row alone.
         *
         * The hash is recomputed from the document content. A row whose hash
         * matches is unchanged and nothing is written, even if category or
         * project_ref differ. Otherwise the existing row is copied into history
         * at its version and the current row moves to version + 1 with the new
         * category (and project_ref, when given), all in one transaction. Busy
         * transactions are retried against the fresh current row.
         *
         * @param change_summary Stored on the archived history row. Derived
         * from what changed when not given.
         * @throws StoreError on constraint violations or exhausted retries.
         */
        UpsertResult upsert(const Document& document, const std::optional<std::string>& change_summary = std::nullopt);

        /**
         * @brief A specific version: the current row or an archived one.
         */
        std::optional<Document> get_version(const std::string& id, int64_t version);

        /**
         * @brief Archived versions of a document, oldest first.
         */
        std::vector<HistoryRecord> history(const std::string& id);

        /**
         * @brief Makes the content of an earlier version current again as a new version.
         *
         * A history row's change_summary describes the transition that archived
         * it, so `summary` lands on the history row of the version that was
         * current before the rollback (version N when the rollback creates N+1).
         * Rolling back to the current content is unchanged and stores nothing.
         * @throws StoreError if the id or version does not exist.
         */
        UpsertResult rollback(const std::string& id, int64_t version, const std::string& summary);

        /**
         * @brief One consistent snapshot of all current rows, ordered by name.
         */
        std::vector<Document> list_current();

        /**
         * @brief Re-hashes every current and history row and checks that history
         * versions are exactly 1..version-1.
         * @throws ConsistencyError naming the first bad row.
         */
        void verify_integrity();

        void add_project(const std::string& ref, const std::string& description);

        /**
         * @brief Registers a project unless it already exists.
         * @return true if it was created.
         */
        bool ensure_project(const std::string& ref, const std::string& description);

        /**
         * @brief Removes a project; documents referencing it keep existing with a null project_ref.
         * @return false if no such project.
         */
        bool remove_project(const std::string& ref);
        std::vector<Project> list_projects();

        void record_metric(const Metric& metric);
        std::vector<Metric> metrics(const std::string& document_id);

        size_t current_count();
        size_t history_count(const std::string& id);

    private:
        sqlite3* m_db = nullptr;

        void initialize_schema();
        void check_hash_scheme();
        void require_open() const;
        UpsertResult upsert_once(const Document& document, const std::string& hash, const std::string& data,
                                 const std::optional<std::string>& change_summary);
    };

}
