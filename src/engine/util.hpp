#pragma once

#include <string>

namespace docsync::engine {

    /**
     * @brief Current UTC time as "YYYY-MM-DDTHH:MM:SS.mmmZ".
     */
    std::string now_timestamp();

    /**
     * @brief Fresh random (v4) UUID in canonical lower-case form.
     */
    std::string generate_id();

    /**
     * @brief Strict UTF-8 validation (no overlongs, surrogates or code points above U+10FFFF).
     */
    bool is_valid_utf8(const std::string& bytes);

}
