#pragma once

#include <filesystem>

namespace docsync::platform {

    /**
     * @brief System-level helper functions.
     */
    namespace system {
        std::filesystem::path get_config_dir();
        std::filesystem::path get_data_dir();
    }

}
