#include "payload.hpp"
#include "docsync/error.hpp"
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace docsync::engine {

    namespace {

        std::string trim(const std::string& s) {
            const auto first = s.find_first_not_of(" \t\r");
            if (first == std::string::npos) return "";
            const auto last = s.find_last_not_of(" \t\r");
            return s.substr(first, last - first + 1);
        }

        // Reads `description:` out of a leading "---" front matter block.
        std::optional<std::string> front_matter_description(const std::string& content) {
            std::istringstream stream(content);
            std::string line;
            if (!std::getline(stream, line) || trim(line) != "---") return std::nullopt;

            while (std::getline(stream, line)) {
                std::string t = trim(line);
                if (t == "---") break;
                const std::string key = "description:";
                if (t.compare(0, key.size(), key) == 0) {
                    std::string value = trim(t.substr(key.size()));
                    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
                        value = value.substr(1, value.size() - 2);
                    }
                    if (!value.empty()) return value;
                }
            }
            return std::nullopt;
        }

        std::optional<std::string> first_heading(const std::string& content) {
            std::istringstream stream(content);
            std::string line;
            while (std::getline(stream, line)) {
                if (line.compare(0, 2, "# ") == 0) {
                    std::string title = trim(line.substr(2));
                    if (!title.empty()) return title;
                }
            }
            return std::nullopt;
        }

        std::optional<std::string> optional_string(const json& j, const char* key) {
            auto it = j.find(key);
            if (it == j.end() || it->is_null()) return std::nullopt;
            return it->get<std::string>();
        }

    }

    const char* to_string(DocumentKind kind) {
        return kind == DocumentKind::Plan ? "plan" : "cmd";
    }

    std::optional<DocumentKind> parse_kind(const std::string& text) {
        if (text == "cmd") return DocumentKind::Command;
        if (text == "plan") return DocumentKind::Plan;
        return std::nullopt;
    }

    const char* to_string(UpsertOutcome outcome) {
        switch (outcome) {
            case UpsertOutcome::Created: return "created";
            case UpsertOutcome::Updated: return "updated";
            case UpsertOutcome::Unchanged: return "unchanged";
        }
        return "unknown";
    }

    DocumentData make_data(DocumentKind kind, std::string content) {
        if (kind == DocumentKind::Plan) {
            PlanData plan;
            plan.title = first_heading(content);
            plan.content = std::move(content);
            return plan;
        }
        CommandData cmd;
        cmd.description = front_matter_description(content);
        cmd.content = std::move(content);
        return cmd;
    }

    std::string encode_data(const DocumentData& data) {
        json j;
        j["schema"] = kPayloadSchema;
        if (const auto* plan = std::get_if<PlanData>(&data)) {
            j["type"] = to_string(DocumentKind::Plan);
            j["content"] = plan->content;
            if (plan->title) j["title"] = *plan->title;
        } else {
            const auto& cmd = std::get<CommandData>(data);
            j["type"] = to_string(DocumentKind::Command);
            j["content"] = cmd.content;
            if (cmd.description) j["description"] = *cmd.description;
        }
        try {
            return j.dump();
        } catch (const json::type_error& e) {
            throw StoreError(std::string("content is not valid UTF-8: ") + e.what());
        }
    }

    DocumentData decode_data(const std::string& json_text, DocumentKind kind) {
        try {
            json j = json::parse(json_text);

            int schema = j.at("schema").get<int>();
            if (schema != kPayloadSchema) {
                throw ConsistencyError("unsupported payload schema " + std::to_string(schema));
            }

            auto type = parse_kind(j.at("type").get<std::string>());
            if (!type) {
                throw ConsistencyError("unknown payload type " + j.at("type").dump());
            }
            if (*type != kind) {
                throw ConsistencyError(std::string("payload type ") + to_string(*type) +
                                       " does not match kind " + to_string(kind));
            }

            if (kind == DocumentKind::Plan) {
                PlanData plan;
                plan.content = j.at("content").get<std::string>();
                plan.title = optional_string(j, "title");
                return plan;
            }
            CommandData cmd;
            cmd.content = j.at("content").get<std::string>();
            cmd.description = optional_string(j, "description");
            return cmd;
        } catch (const json::exception& e) {
            throw ConsistencyError(std::string("malformed payload: ") + e.what());
        }
    }

}
