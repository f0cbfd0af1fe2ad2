#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <regex>

namespace lectern::engine {

    /**
     * @brief Glob patterns matched against file and directory names during a scan.
     */
    class Ignore {
    public:
        /**
         * @brief Loads patterns from a .lectern_ignore file. A missing file is not an error.
         * @param ignore_file Path to the ignore file.
         */
        void load(const std::filesystem::path& ignore_file);

        /**
         * @brief Adds a single glob (`*`, `?`), e.g. "*.log".
         */
        void add(const std::string& glob);

        /**
         * @brief Checks if a path should be ignored.
         * @param path The path to check.
         * @return true if its name matches an ignore pattern.
         */
        bool check(const std::filesystem::path& path) const;

        /**
         * @brief Adds a default set of ignores (VCS directories, build output, the lectern database).
         */
        void add_defaults();

        size_t size() const { return m_patterns.size(); }

    private:
        struct Pattern {
            std::regex regex;
            std::string original;
        };
        std::vector<Pattern> m_patterns;

        static std::string glob_to_regex(const std::string& glob);
    };

}
