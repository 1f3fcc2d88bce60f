#include "version_store.hpp"
#include "payload.hpp"
#include "util.hpp"
#include "docsync/error.hpp"
#include "docsync/sha256.h"
#include <chrono>
#include <iostream>
#include <thread>

namespace docsync::engine {

    namespace {

        constexpr int kBusyTimeoutMs = 5000;
        constexpr int kMaxAttempts = 5;

        class BusyError : public StoreError {
        public:
            using StoreError::StoreError;
        };

        [[noreturn]] void throw_sqlite(sqlite3* db, int rc, const std::string& what) {
            std::string msg = what + ": " + sqlite3_errmsg(db);
            if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) throw BusyError(msg);
            throw StoreError(msg);
        }

        class Statement {
        public:
            Statement(sqlite3* db, const char* sql) : m_db(db) {
                int rc = sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr);
                if (rc != SQLITE_OK) throw_sqlite(db, rc, "prepare failed");
            }
            ~Statement() { sqlite3_finalize(m_stmt); }

            Statement(const Statement&) = delete;
            Statement& operator=(const Statement&) = delete;

            void bind_text(int index, const std::string& value) {
                sqlite3_bind_text(m_stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
            }
            void bind_optional(int index, const std::optional<std::string>& value) {
                if (value) bind_text(index, *value);
                else sqlite3_bind_null(m_stmt, index);
            }
            void bind_int64(int index, int64_t value) { sqlite3_bind_int64(m_stmt, index, value); }
            void bind_double(int index, double value) { sqlite3_bind_double(m_stmt, index, value); }

            /**
             * @brief true while rows are available, false when done.
             */
            bool step() {
                int rc = sqlite3_step(m_stmt);
                if (rc == SQLITE_ROW) return true;
                if (rc == SQLITE_DONE) return false;
                throw_sqlite(m_db, rc, "statement failed");
            }

            std::string text(int col) const {
                const auto* p = sqlite3_column_text(m_stmt, col);
                if (!p) return "";
                return std::string(reinterpret_cast<const char*>(p), sqlite3_column_bytes(m_stmt, col));
            }
            std::optional<std::string> optional_text(int col) const {
                if (sqlite3_column_type(m_stmt, col) == SQLITE_NULL) return std::nullopt;
                return text(col);
            }
            int64_t int64(int col) const { return sqlite3_column_int64(m_stmt, col); }
            double real(int col) const { return sqlite3_column_double(m_stmt, col); }

        private:
            sqlite3* m_db;
            sqlite3_stmt* m_stmt = nullptr;
        };

        class Transaction {
        public:
            enum class Mode { Read, Write };

            Transaction(sqlite3* db, Mode mode) : m_db(db) {
                const char* sql = mode == Mode::Write ? "BEGIN IMMEDIATE;" : "BEGIN;";
                int rc = sqlite3_exec(db, sql, nullptr, nullptr, nullptr);
                if (rc != SQLITE_OK) throw_sqlite(db, rc, "begin failed");
                m_active = true;
            }

            ~Transaction() {
                if (m_active && sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
                    std::cerr << "[VersionStore] Rollback failed: " << sqlite3_errmsg(m_db) << "\n";
                }
            }

            Transaction(const Transaction&) = delete;
            Transaction& operator=(const Transaction&) = delete;

            void commit() {
                int rc = sqlite3_exec(m_db, "COMMIT;", nullptr, nullptr, nullptr);
                if (rc != SQLITE_OK) throw_sqlite(m_db, rc, "commit failed");
                m_active = false;
            }

        private:
            sqlite3* m_db;
            bool m_active = false;
        };

        // Column order shared by every documents / document_history select:
        // id, name, category, kind, data, version, content_hash, project_ref, created_at, updated_at
        constexpr const char* kDocumentColumns =
            "id, name, category, kind, data, version, content_hash, project_ref, created_at, updated_at";

        std::string describe(const Document& doc) {
            return "'" + doc.name + "' (" + doc.id + ") version " + std::to_string(doc.version);
        }

        Document read_document(const Statement& st, const char* table) {
            Document doc;
            doc.id = st.text(0);
            doc.name = st.text(1);
            doc.category = st.text(2);
            doc.version = st.int64(5);
            doc.content_hash = st.text(6);
            doc.project_ref = st.optional_text(7);
            doc.created_at = st.text(8);
            doc.updated_at = st.text(9);

            auto kind = parse_kind(st.text(3));
            if (!kind) {
                throw ConsistencyError(std::string(table) + " row " + describe(doc) + " has unknown kind '" + st.text(3) + "'");
            }
            try {
                doc.data = decode_data(st.text(4), *kind);
            } catch (const ConsistencyError& e) {
                throw ConsistencyError(std::string(table) + " row " + describe(doc) + ": " + e.what());
            }

            if (crypto::content_hash(doc.content()) != doc.content_hash) {
                throw ConsistencyError(std::string(table) + " row " + describe(doc) +
                                       ": stored content_hash does not match its data");
            }
            return doc;
        }

        std::string change_description(const Document& current, const Document& next, bool moved,
                                       bool project_changed) {
            std::string out = "content changed";
            auto add = [&out](const std::string& part) {
                out += "; ";
                out += part;
            };
            if (moved) add("moved from " + current.category + " to " + next.category);
            if (project_changed) add("project set to " + next.project_ref.value_or(""));
            return out;
        }

        const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS meta (
  key TEXT PRIMARY KEY,
  value TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS projects (
  project_ref TEXT PRIMARY KEY,
  description TEXT NOT NULL,
  created_at TEXT NOT NULL,
  updated_at TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS documents (
  id TEXT PRIMARY KEY,
  name TEXT NOT NULL UNIQUE,
  category TEXT NOT NULL,
  kind TEXT NOT NULL CHECK (kind IN ('cmd', 'plan')),
  data TEXT NOT NULL,
  version INTEGER NOT NULL DEFAULT 1 CHECK (version >= 1),
  content_hash TEXT NOT NULL,
  project_ref TEXT REFERENCES projects(project_ref) ON DELETE SET NULL,
  created_at TEXT NOT NULL,
  updated_at TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS document_history (
  id TEXT NOT NULL,
  version INTEGER NOT NULL,
  name TEXT NOT NULL,
  category TEXT NOT NULL,
  kind TEXT NOT NULL,
  data TEXT NOT NULL,
  content_hash TEXT NOT NULL,
  project_ref TEXT,
  created_at TEXT NOT NULL,
  updated_at TEXT NOT NULL,
  archived_at TEXT NOT NULL,
  change_summary TEXT,
  PRIMARY KEY (id, version)
);
CREATE TABLE IF NOT EXISTS document_metrics (
  document_id TEXT NOT NULL,
  version INTEGER NOT NULL,
  metric_name TEXT NOT NULL,
  step INTEGER NOT NULL,
  value REAL,
  timestamp TEXT NOT NULL,
  PRIMARY KEY (document_id, version, metric_name, step)
);
CREATE INDEX IF NOT EXISTS idx_documents_hash ON documents(content_hash);
CREATE INDEX IF NOT EXISTS idx_documents_updated ON documents(updated_at);
CREATE INDEX IF NOT EXISTS idx_documents_project ON documents(project_ref);
CREATE INDEX IF NOT EXISTS idx_history_created ON document_history(created_at);
CREATE INDEX IF NOT EXISTS idx_metrics_time ON document_metrics(timestamp);
CREATE TRIGGER IF NOT EXISTS document_history_immutable
  BEFORE UPDATE ON document_history
  BEGIN SELECT RAISE(ABORT, 'history rows are immutable'); END;
CREATE TRIGGER IF NOT EXISTS document_history_append_only
  BEFORE DELETE ON document_history
  BEGIN SELECT RAISE(ABORT, 'history rows are append-only'); END;
CREATE TRIGGER IF NOT EXISTS documents_never_deleted
  BEFORE DELETE ON documents
  BEGIN SELECT RAISE(ABORT, 'documents are never deleted'); END;
)SQL";

    }

    VersionStore::VersionStore() = default;
    VersionStore::~VersionStore() { close(); }

    void VersionStore::open(const std::filesystem::path& path) {
        close();
        if (sqlite3_open(path.c_str(), &m_db) != SQLITE_OK) {
            std::string msg = m_db ? sqlite3_errmsg(m_db) : "out of memory";
            close();
            throw StoreError("cannot open store " + path.string() + ": " + msg);
        }
        sqlite3_busy_timeout(m_db, kBusyTimeoutMs);

        try {
            initialize_schema();
            check_hash_scheme();
        } catch (...) {
            close();
            throw;
        }
    }

    void VersionStore::close() {
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
    }

    void VersionStore::require_open() const {
        if (!m_db) throw StoreError("store is not open");
    }

    void VersionStore::initialize_schema() {
        const char* pragmas =
            "PRAGMA foreign_keys = ON;"
            "PRAGMA journal_mode = WAL;"
            "PRAGMA synchronous = NORMAL;";

        for (const char* sql : {pragmas, kSchema}) {
            char* err_msg = nullptr;
            if (sqlite3_exec(m_db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
                std::string msg = err_msg ? err_msg : "unknown error";
                sqlite3_free(err_msg);
                throw StoreError("schema error: " + msg);
            }
        }

        Statement st(m_db, "INSERT OR IGNORE INTO meta (key, value) VALUES ('schema_version', '1'), ('hash_scheme', ?);");
        st.bind_text(1, crypto::kHashScheme);
        st.step();
    }

    void VersionStore::check_hash_scheme() {
        Statement st(m_db, "SELECT value FROM meta WHERE key = 'hash_scheme';");
        if (!st.step()) {
            throw ConsistencyError("store has no recorded hash scheme");
        }
        std::string scheme = st.text(0);
        if (scheme != crypto::kHashScheme) {
            throw ConsistencyError("store was written with hash scheme '" + scheme + "', expected '" +
                                   crypto::kHashScheme + "'");
        }
    }

    std::optional<Document> VersionStore::get_current(const std::string& name) {
        require_open();
        std::string sql = std::string("SELECT ") + kDocumentColumns + " FROM documents WHERE name = ?;";
        Statement st(m_db, sql.c_str());
        st.bind_text(1, name);
        if (!st.step()) return std::nullopt;
        return read_document(st, "documents");
    }

    std::optional<Document> VersionStore::get_by_id(const std::string& id) {
        require_open();
        std::string sql = std::string("SELECT ") + kDocumentColumns + " FROM documents WHERE id = ?;";
        Statement st(m_db, sql.c_str());
        st.bind_text(1, id);
        if (!st.step()) return std::nullopt;
        return read_document(st, "documents");
    }

    UpsertResult VersionStore::upsert(const Document& document, const std::optional<std::string>& change_summary) {
        require_open();
        if (document.name.empty()) {
            throw StoreError("document name is empty");
        }

        // The payload is rebuilt from the content so derived fields always follow the hash.
        const std::string hash = crypto::content_hash(document.content());
        const std::string data = encode_data(make_data(document.kind(), document.content()));

        for (int attempt = 1;; ++attempt) {
            try {
                return upsert_once(document, hash, data, change_summary);
            } catch (const BusyError& e) {
                if (attempt >= kMaxAttempts) {
                    throw StoreError("store busy, gave up on '" + document.name + "' after " +
                                     std::to_string(attempt) + " attempts: " + e.what());
                }
                std::cerr << "[VersionStore] Busy, retrying '" << document.name << "' (attempt " << attempt << ")\n";
                std::this_thread::sleep_for(std::chrono::milliseconds(50 * attempt));
            }
        }
    }

    UpsertResult VersionStore::upsert_once(const Document& document, const std::string& hash, const std::string& data,
                                           const std::optional<std::string>& change_summary) {
        Transaction tx(m_db, Transaction::Mode::Write);
        auto current = get_current(document.name);
        const std::string now = now_timestamp();

        if (!current) {
            std::string id = generate_id();
            Statement st(m_db,
                "INSERT INTO documents (id, name, category, kind, data, version, content_hash, project_ref, created_at, updated_at) "
                "VALUES (?, ?, ?, ?, ?, 1, ?, ?, ?, ?);");
            st.bind_text(1, id);
            st.bind_text(2, document.name);
            st.bind_text(3, document.category);
            st.bind_text(4, to_string(document.kind()));
            st.bind_text(5, data);
            st.bind_text(6, hash);
            st.bind_optional(7, document.project_ref);
            st.bind_text(8, now);
            st.bind_text(9, now);
            st.step();
            tx.commit();
            return {UpsertOutcome::Created, id, 1};
        }

        if (current->kind() != document.kind()) {
            throw StoreError("'" + document.name + "' is stored as a " + to_string(current->kind()) +
                             " and cannot become a " + to_string(document.kind()));
        }

        // Only content decides the outcome; placement and project ride along with a content change.
        if (current->content_hash == hash) {
            return {UpsertOutcome::Unchanged, current->id, current->version};
        }

        bool moved = current->category != document.category;
        bool project_changed = document.project_ref.has_value() && document.project_ref != current->project_ref;

        std::optional<std::string> summary = change_summary;
        if (!summary) summary = change_description(*current, document, moved, project_changed);

        {
            Statement st(m_db,
                "INSERT INTO document_history (id, version, name, category, kind, data, content_hash, project_ref, "
                "created_at, updated_at, archived_at, change_summary) "
                "SELECT id, version, name, category, kind, data, content_hash, project_ref, created_at, updated_at, ?, ? "
                "FROM documents WHERE id = ? AND version = ?;");
            st.bind_text(1, now);
            st.bind_optional(2, summary);
            st.bind_text(3, current->id);
            st.bind_int64(4, current->version);
            st.step();
            if (sqlite3_changes(m_db) != 1) {
                throw StoreError("failed to archive " + describe(*current));
            }
        }

        {
            Statement st(m_db,
                "UPDATE documents SET category = ?, data = ?, content_hash = ?, project_ref = ?, "
                "version = version + 1, updated_at = ? WHERE id = ? AND version = ?;");
            st.bind_text(1, document.category);
            st.bind_text(2, data);
            st.bind_text(3, hash);
            st.bind_optional(4, document.project_ref ? document.project_ref : current->project_ref);
            st.bind_text(5, now);
            st.bind_text(6, current->id);
            st.bind_int64(7, current->version);
            st.step();
            if (sqlite3_changes(m_db) != 1) {
                throw StoreError("failed to update " + describe(*current));
            }
        }

        tx.commit();
        return {UpsertOutcome::Updated, current->id, current->version + 1};
    }

    std::optional<Document> VersionStore::get_version(const std::string& id, int64_t version) {
        require_open();
        Transaction tx(m_db, Transaction::Mode::Read);

        auto current = get_by_id(id);
        if (!current) return std::nullopt;
        if (current->version == version) return current;

        std::string sql = std::string("SELECT ") + kDocumentColumns + " FROM document_history WHERE id = ? AND version = ?;";
        Statement st(m_db, sql.c_str());
        st.bind_text(1, id);
        st.bind_int64(2, version);
        if (!st.step()) return std::nullopt;
        return read_document(st, "document_history");
    }

    std::vector<HistoryRecord> VersionStore::history(const std::string& id) {
        require_open();
        std::vector<HistoryRecord> records;

        std::string sql = std::string("SELECT ") + kDocumentColumns +
                          ", archived_at, change_summary FROM document_history WHERE id = ? ORDER BY version;";
        Statement st(m_db, sql.c_str());
        st.bind_text(1, id);
        while (st.step()) {
            HistoryRecord record;
            record.document = read_document(st, "document_history");
            record.archived_at = st.text(10);
            record.change_summary = st.optional_text(11);
            records.push_back(std::move(record));
        }
        return records;
    }

    UpsertResult VersionStore::rollback(const std::string& id, int64_t version, const std::string& summary) {
        auto target = get_version(id, version);
        if (!target) {
            throw StoreError("document " + id + " has no version " + std::to_string(version));
        }
        auto current = get_by_id(id);
        if (!current) {
            throw StoreError("document " + id + " does not exist");
        }

        Document next = *current;
        next.data = make_data(current->kind(), target->content());
        next.project_ref.reset();
        return upsert(next, summary);
    }

    std::vector<Document> VersionStore::list_current() {
        require_open();
        std::vector<Document> docs;

        // A single SELECT reads one snapshot, even while another connection commits.
        std::string sql = std::string("SELECT ") + kDocumentColumns + " FROM documents ORDER BY name;";
        Statement st(m_db, sql.c_str());
        while (st.step()) {
            docs.push_back(read_document(st, "documents"));
        }
        return docs;
    }

    void VersionStore::verify_integrity() {
        require_open();
        Transaction tx(m_db, Transaction::Mode::Read);

        {
            std::string sql = std::string("SELECT ") + kDocumentColumns + " FROM documents;";
            Statement st(m_db, sql.c_str());
            while (st.step()) read_document(st, "documents");
        }
        {
            std::string sql = std::string("SELECT ") + kDocumentColumns + " FROM document_history;";
            Statement st(m_db, sql.c_str());
            while (st.step()) read_document(st, "document_history");
        }
        {
            Statement st(m_db,
                "SELECT d.id, d.name, d.version, COUNT(h.version), MIN(h.version), MAX(h.version) "
                "FROM documents d LEFT JOIN document_history h ON h.id = d.id GROUP BY d.id;");
            while (st.step()) {
                int64_t version = st.int64(2);
                int64_t count = st.int64(3);
                bool contiguous = count == version - 1 && (count == 0 || (st.int64(4) == 1 && st.int64(5) == version - 1));
                if (!contiguous) {
                    throw ConsistencyError("history of '" + st.text(1) + "' (" + st.text(0) + ") does not hold versions 1.." +
                                           std::to_string(version - 1));
                }
            }
        }
        {
            Statement st(m_db,
                "SELECT h.id FROM document_history h LEFT JOIN documents d ON d.id = h.id "
                "WHERE d.id IS NULL LIMIT 1;");
            if (st.step()) {
                throw ConsistencyError("history rows exist for unknown document " + st.text(0));
            }
        }
    }

    void VersionStore::add_project(const std::string& ref, const std::string& description) {
        require_open();
        if (ref.empty()) throw StoreError("project reference is empty");

        const std::string now = now_timestamp();
        Statement st(m_db, "INSERT INTO projects (project_ref, description, created_at, updated_at) VALUES (?, ?, ?, ?);");
        st.bind_text(1, ref);
        st.bind_text(2, description);
        st.bind_text(3, now);
        st.bind_text(4, now);
        st.step();
    }

    bool VersionStore::ensure_project(const std::string& ref, const std::string& description) {
        require_open();
        if (ref.empty()) throw StoreError("project reference is empty");

        const std::string now = now_timestamp();
        Statement st(m_db,
            "INSERT OR IGNORE INTO projects (project_ref, description, created_at, updated_at) VALUES (?, ?, ?, ?);");
        st.bind_text(1, ref);
        st.bind_text(2, description);
        st.bind_text(3, now);
        st.bind_text(4, now);
        st.step();
        return sqlite3_changes(m_db) > 0;
    }

    bool VersionStore::remove_project(const std::string& ref) {
        require_open();
        Transaction tx(m_db, Transaction::Mode::Write);
        Statement st(m_db, "DELETE FROM projects WHERE project_ref = ?;");
        st.bind_text(1, ref);
        st.step();
        bool removed = sqlite3_changes(m_db) > 0;
        tx.commit();
        return removed;
    }

    std::vector<Project> VersionStore::list_projects() {
        require_open();
        std::vector<Project> projects;
        Statement st(m_db, "SELECT project_ref, description, created_at, updated_at FROM projects ORDER BY project_ref;");
        while (st.step()) {
            projects.push_back({st.text(0), st.text(1), st.text(2), st.text(3)});
        }
        return projects;
    }

    void VersionStore::record_metric(const Metric& metric) {
        require_open();
        Statement st(m_db,
            "INSERT INTO document_metrics (document_id, version, metric_name, step, value, timestamp) "
            "VALUES (?, ?, ?, ?, ?, ?);");
        st.bind_text(1, metric.document_id);
        st.bind_int64(2, metric.version);
        st.bind_text(3, metric.name);
        st.bind_int64(4, metric.step);
        st.bind_double(5, metric.value);
        st.bind_text(6, metric.timestamp.empty() ? now_timestamp() : metric.timestamp);
        st.step();
    }

    std::vector<Metric> VersionStore::metrics(const std::string& document_id) {
        require_open();
        std::vector<Metric> out;
        Statement st(m_db,
            "SELECT document_id, version, metric_name, step, value, timestamp FROM document_metrics "
            "WHERE document_id = ? ORDER BY version, metric_name, step;");
        st.bind_text(1, document_id);
        while (st.step()) {
            Metric m;
            m.document_id = st.text(0);
            m.version = st.int64(1);
            m.name = st.text(2);
            m.step = st.int64(3);
            m.value = st.real(4);
            m.timestamp = st.text(5);
            out.push_back(std::move(m));
        }
        return out;
    }

    size_t VersionStore::current_count() {
        require_open();
        Statement st(m_db, "SELECT COUNT(*) FROM documents;");
        st.step();
        return static_cast<size_t>(st.int64(0));
    }

    size_t VersionStore::history_count(const std::string& id) {
        require_open();
        Statement st(m_db, "SELECT COUNT(*) FROM document_history WHERE id = ?;");
        st.bind_text(1, id);
        st.step();
        return static_cast<size_t>(st.int64(0));
    }

}
