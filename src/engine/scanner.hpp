#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <functional>
#include "ignore.hpp"

namespace lectern::engine {

    class Scanner {
    public:
        using FileCallback = std::function<void(const std::filesystem::path&)>;

        Scanner();

        /**
         * @brief Walks a directory and reports every supported, non-ignored file.
         * A .lectern_ignore file in the root adds patterns for this walk.
         * @param root The root directory to scan.
         * @param recursive Descend into subdirectories.
         * @param callback Called for every valid file found.
         * @throws Error if root is not a directory.
         */
        void scan(const std::filesystem::path& root, bool recursive, const FileCallback& callback) const;

        /**
         * @brief Same walk, collected and sorted by path.
         */
        std::vector<std::filesystem::path> collect(const std::filesystem::path& root, bool recursive) const;

        Ignore& ignore() { return m_ignore; }

    private:
        Ignore m_ignore;
    };

}
