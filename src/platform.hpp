#pragma once

#include <filesystem>

namespace lectern::platform {

    /**
     * @brief System-level helper functions.
     */
    namespace system {
        /**
         * @brief Per-user configuration directory (holds config.json). Empty if it cannot be determined.
         */
        std::filesystem::path get_config_dir();

        /**
         * @brief Per-user data directory (holds lectern.db and the vector index).
         */
        std::filesystem::path get_data_dir();
    }

}
