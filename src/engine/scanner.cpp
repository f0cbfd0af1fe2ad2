#include "scanner.hpp"
#include "extractor.hpp"
#include "log.hpp"
#include "lectern/errors.hpp"
#include <algorithm>

namespace lectern::engine {

    Scanner::Scanner() {
        m_ignore.add_defaults();
    }

    void Scanner::scan(const std::filesystem::path& root, bool recursive, const FileCallback& callback) const {
        std::error_code ec;
        if (!std::filesystem::is_directory(root, ec)) {
            throw Error("[Scanner] Not a directory: " + root.string());
        }

        Ignore ignore = m_ignore;
        ignore.load(root / ".lectern_ignore");

        auto visit = [&](const std::filesystem::directory_entry& entry) {
            std::error_code entry_ec;
            if (!entry.is_regular_file(entry_ec)) return;
            if (!Extractor::is_supported(entry.path())) {
                log::debug("Scanner", "Unsupported file: ", entry.path().string());
                return;
            }
            if (callback) callback(entry.path());
        };

        const auto options = std::filesystem::directory_options::skip_permission_denied;
        if (recursive) {
            for (auto it = std::filesystem::recursive_directory_iterator(root, options, ec);
                 !ec && it != std::filesystem::recursive_directory_iterator();
                 it.increment(ec)) {
                if (ignore.check(it->path())) {
                    std::error_code dir_ec;
                    if (it->is_directory(dir_ec)) {
                        it.disable_recursion_pending();
                    }
                    continue;
                }
                visit(*it);
            }
        } else {
            for (auto it = std::filesystem::directory_iterator(root, options, ec);
                 !ec && it != std::filesystem::directory_iterator();
                 it.increment(ec)) {
                if (ignore.check(it->path())) continue;
                visit(*it);
            }
        }
        if (ec) {
            log::warn("Scanner", "Walk of ", root.string(), " stopped early: ", ec.message());
        }
    }

    std::vector<std::filesystem::path> Scanner::collect(const std::filesystem::path& root, bool recursive) const {
        std::vector<std::filesystem::path> files;
        scan(root, recursive, [&](const std::filesystem::path& p) { files.push_back(p); });
        std::sort(files.begin(), files.end());
        log::info("Scanner", "Found ", files.size(), " supported files in ", root.string());
        return files;
    }

}
