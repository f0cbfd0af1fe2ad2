#include "../platform.hpp"
#include <cstdlib>

namespace lectern::platform {

    namespace system {
        namespace {
            std::filesystem::path xdg_dir(const char* variable, const char* fallback) {
                const char* xdg = std::getenv(variable);
                if (xdg && *xdg) return std::filesystem::path(xdg) / "lectern";
                const char* home = std::getenv("HOME");
                return home ? std::filesystem::path(home) / fallback / "lectern" : std::filesystem::path();
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
