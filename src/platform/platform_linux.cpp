#include "../platform.hpp"
#include <cstdlib>

namespace docsync::platform {

    namespace system {
        namespace {
            std::filesystem::path xdg_dir(const char* var, const char* home_suffix) {
                const char* xdg = std::getenv(var);
                if (xdg && *xdg) return std::filesystem::path(xdg) / "docsync";
                const char* home = std::getenv("HOME");
                return home ? std::filesystem::path(home) / home_suffix / "docsync" : "";
            }
        }

        std::filesystem::path get_config_dir() {
            return xdg_dir("XDG_CONFIG_HOME", ".config");
        }
        std::filesystem::path get_data_dir() {
            return xdg_dir("XDG_DATA_HOME", ".local/share");
        }
    }

}
