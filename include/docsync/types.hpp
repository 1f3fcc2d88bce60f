#pragma once
#include <string>
#include <vector>
#include <optional>
#include <variant>
#include <filesystem>
#include <cstdint>

namespace docsync::engine {

    inline constexpr const char* kUncategorized = "uncategorized";

    enum class DocumentKind {
        Command,
        Plan
    };

    enum class PlanStatus {
        Draft,
        Approved,
        Completed
    };

    struct CommandData {
        std::string content;
        std::optional<std::string> description; // from front matter
    };

    struct PlanData {
        std::string content;
        std::optional<std::string> title; // first "# " heading
    };

    using DocumentData = std::variant<CommandData, PlanData>;

    struct Document {
        std::string id;
        std::string name;
        std::string category = kUncategorized;
        DocumentData data;
        std::string content_hash;
        int64_t version = 0;
        std::optional<std::string> project_ref;
        std::string created_at;
        std::string updated_at;

        // Set by the loader only, never persisted.
        std::filesystem::path source_path;

        DocumentKind kind() const {
            return std::holds_alternative<PlanData>(data) ? DocumentKind::Plan : DocumentKind::Command;
        }

        const std::string& content() const {
            return std::visit([](const auto& d) -> const std::string& { return d.content; }, data);
        }
    };

    struct HistoryRecord {
        Document document;
        std::string archived_at;
        std::optional<std::string> change_summary;
    };

    struct LoadError {
        std::filesystem::path path;
        std::string reason;
    };

    struct LoadResult {
        std::vector<Document> documents;
        std::vector<LoadError> errors;
    };

    enum class UpsertOutcome {
        Created,
        Updated,
        Unchanged
    };

    struct UpsertResult {
        UpsertOutcome outcome;
        std::string id;
        int64_t version = 0;
    };

    struct SyncError {
        enum class Stage {
            Load,
            Store
        };

        std::string subject; // document name, or file path for load failures
        std::string reason;
        Stage stage;
    };

    struct SyncSummary {
        std::vector<std::string> created;
        std::vector<std::string> updated;
        std::vector<std::string> unchanged;
        std::vector<SyncError> errors;
        bool interrupted = false;

        bool ok() const { return errors.empty() && !interrupted; }
    };

    struct FlattenError {
        std::string name;
        std::filesystem::path path;
        std::string reason;
    };

    struct FlattenSummary {
        std::vector<std::string> written;
        std::vector<std::filesystem::path> paths;
        std::vector<FlattenError> errors;

        bool ok() const { return errors.empty(); }
    };

    struct Project {
        std::string ref;
        std::string description;
        std::string created_at;
        std::string updated_at;
    };

    struct Metric {
        std::string document_id;
        int64_t version = 0;
        std::string name;
        int64_t step = 0;
        double value = 0.0;
        std::string timestamp;
    };

}
