#pragma once

#include <string>
#include <optional>
#include "docsync/types.hpp"

namespace docsync::engine {

    /**
     * @brief Version of the JSON layout written to the data column.
     */
    inline constexpr int kPayloadSchema = 1;

    const char* to_string(DocumentKind kind);
    std::optional<DocumentKind> parse_kind(const std::string& text);

    const char* to_string(UpsertOutcome outcome);

    /**
     * @brief Builds the kind-specific payload for raw content. Derived fields
     * (command description, plan title) are a pure function of the content.
     */
    DocumentData make_data(DocumentKind kind, std::string content);

    /**
     * @brief Serializes a payload to the data column JSON.
     */
    std::string encode_data(const DocumentData& data);

    /**
     * @brief Parses the data column. Throws ConsistencyError on an unknown
     * schema, a malformed document, or a type that disagrees with `kind`.
     */
    DocumentData decode_data(const std::string& json_text, DocumentKind kind);

}
