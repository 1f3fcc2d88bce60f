#include "report.hpp"
#include "payload.hpp"
#include "category.hpp"
#include <sstream>

namespace docsync::engine {

    namespace {
        void list_section(std::ostringstream& out, const char* title, const std::vector<std::string>& names) {
            out << title << " (" << names.size() << ")\n";
            for (const auto& n : names) out << "  " << n << "\n";
        }
    }

    const char* to_string(SyncError::Stage stage) {
        return stage == SyncError::Stage::Load ? "load" : "store";
    }

    nlohmann::json to_json(const SyncSummary& summary) {
        nlohmann::json errors = nlohmann::json::array();
        for (const auto& e : summary.errors) {
            errors.push_back({{"subject", e.subject}, {"reason", e.reason}, {"stage", to_string(e.stage)}});
        }
        return {
            {"created", summary.created},
            {"updated", summary.updated},
            {"unchanged", summary.unchanged},
            {"errors", errors},
            {"interrupted", summary.interrupted}
        };
    }

    nlohmann::json to_json(const FlattenSummary& summary) {
        nlohmann::json paths = nlohmann::json::array();
        for (const auto& p : summary.paths) paths.push_back(p.string());
        nlohmann::json errors = nlohmann::json::array();
        for (const auto& e : summary.errors) {
            errors.push_back({{"name", e.name}, {"path", e.path.string()}, {"reason", e.reason}});
        }
        return {{"written", summary.written}, {"paths", paths}, {"errors", errors}};
    }

    nlohmann::json to_json(const Document& doc, bool include_content) {
        nlohmann::json j = {
            {"id", doc.id},
            {"name", doc.name},
            {"kind", to_string(doc.kind())},
            {"category", doc.category},
            {"version", doc.version},
            {"content_hash", doc.content_hash},
            {"project_ref", doc.project_ref ? nlohmann::json(*doc.project_ref) : nlohmann::json(nullptr)},
            {"created_at", doc.created_at},
            {"updated_at", doc.updated_at}
        };
        if (const auto* plan = std::get_if<PlanData>(&doc.data)) {
            auto status = plan_status(doc.category);
            j["status"] = status ? nlohmann::json(to_string(*status)) : nlohmann::json(nullptr);
            if (plan->title) j["title"] = *plan->title;
        } else if (const auto* cmd = std::get_if<CommandData>(&doc.data)) {
            if (cmd->description) j["description"] = *cmd->description;
        }
        if (include_content) j["content"] = doc.content();
        return j;
    }

    nlohmann::json to_json(const HistoryRecord& record) {
        nlohmann::json j = to_json(record.document);
        j["archived_at"] = record.archived_at;
        j["change_summary"] = record.change_summary ? nlohmann::json(*record.change_summary) : nlohmann::json(nullptr);
        return j;
    }

    std::string render_text(const SyncSummary& summary) {
        std::ostringstream out;
        list_section(out, "Created", summary.created);
        list_section(out, "Updated", summary.updated);
        out << "Unchanged (" << summary.unchanged.size() << ")\n";
        out << "Errors (" << summary.errors.size() << ")\n";
        for (const auto& e : summary.errors) {
            out << "  [" << to_string(e.stage) << "] " << e.subject << ": " << e.reason << "\n";
        }
        if (summary.interrupted) out << "Interrupted before completion\n";
        return out.str();
    }

    std::string render_text(const FlattenSummary& summary) {
        std::ostringstream out;
        out << "Written (" << summary.written.size() << " documents, " << summary.paths.size() << " files)\n";
        for (const auto& p : summary.paths) out << "  " << p.string() << "\n";
        out << "Errors (" << summary.errors.size() << ")\n";
        for (const auto& e : summary.errors) {
            out << "  " << e.name;
            if (!e.path.empty()) out << " -> " << e.path.string();
            out << ": " << e.reason << "\n";
        }
        return out.str();
    }

}
