#include "ignore.hpp"
#include "log.hpp"
#include <fstream>

namespace lectern::engine {

    void Ignore::load(const std::filesystem::path& ignore_file) {
        std::error_code ec;
        if (!std::filesystem::exists(ignore_file, ec)) return;

        std::ifstream file(ignore_file);
        if (!file) {
            log::warn("Ignore", "Cannot read ", ignore_file.string());
            return;
        }
        std::string line;
        size_t loaded = 0;
        while (std::getline(file, line)) {
            line.erase(0, line.find_first_not_of(" \t\r"));
            line.erase(line.find_last_not_of(" \t\r") + 1);

            if (line.empty() || line[0] == '#') continue;

            add(line);
            ++loaded;
        }
        log::debug("Ignore", "Loaded ", loaded, " patterns from ", ignore_file.string());
    }

    void Ignore::add(const std::string& glob) {
        // Trailing slash marks a directory in gitignore style; names are matched without it.
        std::string name = glob;
        while (name.size() > 1 && name.back() == '/') name.pop_back();
        m_patterns.push_back({std::regex(glob_to_regex(name)), glob});
    }

    void Ignore::add_defaults() {
        static const std::vector<std::string> defaults = {
            ".git", ".svn", ".hg",
            "build", "dist", "node_modules", "__pycache__", ".venv",
            "*.o", "*.obj", "*.exe", "*.dll", "*.so", "*.dylib",
            ".DS_Store", "Thumbs.db",
            "lectern.db", "lectern.db-journal", "lectern.db-wal", "lectern.db-shm",
            "lectern.hnsw", "lectern.hnsw.json", ".lectern_ignore"
        };
        for (const auto& p : defaults) add(p);
    }

    bool Ignore::check(const std::filesystem::path& path) const {
        std::string filename = path.filename().string();
        for (const auto& p : m_patterns) {
            if (std::regex_match(filename, p.regex)) return true;
        }
        return false;
    }

    std::string Ignore::glob_to_regex(const std::string& glob) {
        std::string regex_str = "^";
        for (char c : glob) {
            switch (c) {
                case '*': regex_str += ".*"; break;
                case '?': regex_str += "."; break;
                case '/': regex_str += "[/\\\\]"; break;
                case '.': case '+': case '(': case ')': case '[': case ']':
                case '{': case '}': case '^': case '$': case '|': case '\\':
                    regex_str += '\\';
                    regex_str += c;
                    break;
                default:
                    regex_str += c;
            }
        }
        regex_str += "$";
        return regex_str;
    }

}
