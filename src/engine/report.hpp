#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "docsync/types.hpp"

namespace docsync::engine {

    nlohmann::json to_json(const SyncSummary& summary);
    nlohmann::json to_json(const FlattenSummary& summary);
    nlohmann::json to_json(const Document& doc, bool include_content = false);
    nlohmann::json to_json(const HistoryRecord& record);

    /**
     * @brief Human readable multi-line report.
     */
    std::string render_text(const SyncSummary& summary);
    std::string render_text(const FlattenSummary& summary);

    const char* to_string(SyncError::Stage stage);

}
