#include "extractor.hpp"
#include "document_text.hpp"
#include "log.hpp"
#include "lectern/errors.hpp"
#include "lectern/sha256.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <sstream>
#include <sys/stat.h>

namespace lectern::engine {

    namespace {

        struct TypeInfo {
            const char* content_type;
            const char* mime;
        };

        const std::map<std::string, TypeInfo>& type_table() {
            static const std::map<std::string, TypeInfo> table = {
                {".txt", {"text", "text/plain"}},
                {".md", {"markdown", "text/markdown"}},
                {".markdown", {"markdown", "text/markdown"}},
                {".rst", {"text", "text/x-rst"}},
                {".py", {"code", "text/x-python"}},
                {".js", {"code", "text/javascript"}},
                {".ts", {"code", "application/typescript"}},
                {".java", {"code", "text/x-java"}},
                {".cpp", {"code", "text/x-c++src"}},
                {".c", {"code", "text/x-csrc"}},
                {".h", {"code", "text/x-chdr"}},
                {".hpp", {"code", "text/x-c++hdr"}},
                {".css", {"text", "text/css"}},
                {".html", {"markup", "text/html"}},
                {".xml", {"markup", "application/xml"}},
                {".json", {"structured_data", "application/json"}},
                {".yaml", {"structured_data", "application/x-yaml"}},
                {".yml", {"structured_data", "application/x-yaml"}},
                {".ini", {"text", "text/plain"}},
                {".cfg", {"text", "text/plain"}},
                {".conf", {"text", "text/plain"}},
                {".log", {"text", "text/plain"}},
                {".csv", {"csv", "text/csv"}},
                {".pdf", {"pdf", "application/pdf"}},
                {".docx", {"document", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"}},
                {".doc", {"document", "application/msword"}},
                {".rtf", {"document", "application/rtf"}},
                {".odt", {"document", "application/vnd.oasis.opendocument.text"}}
            };
            return table;
        }

        std::string lower_extension(const std::filesystem::path& path) {
            std::string ext = path.extension().string();
            std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return ext;
        }

        void append_utf8(std::string& out, uint32_t cp) {
            if (cp < 0x80) {
                out.push_back(static_cast<char>(cp));
            } else if (cp < 0x800) {
                out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp < 0x10000) {
                out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        bool valid_utf8(const std::string& s) {
            size_t i = 0;
            const size_t n = s.size();
            while (i < n) {
                unsigned char c = static_cast<unsigned char>(s[i]);
                size_t len;
                uint32_t cp;
                if (c < 0x80) { ++i; continue; }
                else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
                else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
                else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
                else return false;
                if (i + len > n) return false;
                for (size_t k = 1; k < len; ++k) {
                    unsigned char cc = static_cast<unsigned char>(s[i + k]);
                    if ((cc & 0xC0) != 0x80) return false;
                    cp = (cp << 6) | (cc & 0x3F);
                }
                // Overlong forms, surrogates and out-of-range code points
                if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
                if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
                i += len;
            }
            return true;
        }

        bool decode_utf16(const std::string& bytes, bool little_endian, std::string& out) {
            if (bytes.size() % 2 != 0) return false;
            auto unit = [&](size_t i) -> uint32_t {
                uint32_t a = static_cast<unsigned char>(bytes[i]);
                uint32_t b = static_cast<unsigned char>(bytes[i + 1]);
                return little_endian ? (a | (b << 8)) : ((a << 8) | b);
            };
            out.clear();
            out.reserve(bytes.size());
            for (size_t i = 2; i < bytes.size(); i += 2) {
                uint32_t u = unit(i);
                if (u >= 0xD800 && u <= 0xDBFF) {
                    if (i + 3 >= bytes.size()) return false;
                    uint32_t low = unit(i + 2);
                    if (low < 0xDC00 || low > 0xDFFF) return false;
                    append_utf8(out, 0x10000 + ((u - 0xD800) << 10) + (low - 0xDC00));
                    i += 2;
                } else if (u >= 0xDC00 && u <= 0xDFFF) {
                    return false;
                } else {
                    append_utf8(out, u);
                }
            }
            return true;
        }

        // 0x80-0x9F in Windows-1252; 0 marks undefined bytes.
        constexpr uint16_t kCp1252High[32] = {
            0x20AC, 0, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
            0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0, 0x017D, 0,
            0, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
            0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0, 0x017E, 0x0178
        };

        bool decode_cp1252(const std::string& bytes, std::string& out) {
            out.clear();
            out.reserve(bytes.size() + bytes.size() / 4);
            for (char ch : bytes) {
                unsigned char c = static_cast<unsigned char>(ch);
                if (c >= 0x80 && c <= 0x9F) {
                    uint16_t cp = kCp1252High[c - 0x80];
                    if (cp == 0) return false;
                    append_utf8(out, cp);
                } else {
                    append_utf8(out, c);
                }
            }
            return true;
        }

        std::string decode_latin1(const std::string& bytes) {
            std::string out;
            out.reserve(bytes.size() + bytes.size() / 4);
            for (char ch : bytes) append_utf8(out, static_cast<unsigned char>(ch));
            return out;
        }

    }

    bool Extractor::is_supported(const std::filesystem::path& path) {
        return type_table().count(lower_extension(path)) > 0;
    }

    std::string Extractor::content_type(const std::filesystem::path& path) {
        auto it = type_table().find(lower_extension(path));
        return it == type_table().end() ? "text" : it->second.content_type;
    }

    std::string Extractor::mime_type(const std::filesystem::path& path) {
        auto it = type_table().find(lower_extension(path));
        return it == type_table().end() ? "" : it->second.mime;
    }

    std::vector<std::pair<std::string, std::string>> Extractor::supported_types() {
        std::vector<std::pair<std::string, std::string>> out;
        for (const auto& [ext, info] : type_table()) out.emplace_back(ext, info.content_type);
        return out;
    }

    DocumentInfo Extractor::describe(const std::filesystem::path& path) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            throw ExtractionError("Not a regular file: " + path.string());
        }

        struct stat st {};
        if (::stat(path.c_str(), &st) != 0) {
            throw ExtractionError("Cannot stat " + path.string());
        }

        DocumentInfo info;
        info.path = std::filesystem::absolute(path, ec);
        if (ec) info.path = path;
        info.filename = path.filename().string();
        info.size = static_cast<std::uintmax_t>(st.st_size);
        info.extension = lower_extension(path);
        info.content_type = content_type(path);
        info.mime_type = mime_type(path);
        info.last_modified = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000 + st.st_mtim.tv_nsec / 1000000;
        info.hash = crypto::SHA256::hash_file(path.string());
        if (info.hash.empty()) {
            throw ExtractionError("Cannot read " + path.string());
        }
        return info;
    }

    std::string Extractor::extract(const std::filesystem::path& path) {
        std::string type = content_type(path);
        if (type == "pdf") return document_text::pdf(path);
        if (type == "document") {
            std::string ext = lower_extension(path);
            if (ext == ".docx") return document_text::docx(path);
            throw ExtractionError("No text extractor available for " + ext + " file " + path.filename().string());
        }
        return read_text(path);
    }

    std::string Extractor::read_text(const std::filesystem::path& path, std::string* encoding) {
        std::ifstream file(path, std::ios::binary);
        if (!file) throw ExtractionError("Cannot open " + path.string());
        std::ostringstream ss;
        ss << file.rdbuf();
        if (file.bad()) throw ExtractionError("Read failed for " + path.string());

        std::string used;
        std::string text = decode(ss.str(), &used);
        log::debug("Extractor", "Read ", path.string(), " with ", used, " encoding");
        if (encoding) *encoding = used;
        return text;
    }

    std::string Extractor::decode(const std::string& bytes, std::string* encoding) {
        auto set = [&](const char* name) { if (encoding) *encoding = name; };

        if (bytes.size() >= 2) {
            unsigned char b0 = static_cast<unsigned char>(bytes[0]);
            unsigned char b1 = static_cast<unsigned char>(bytes[1]);
            if ((b0 == 0xFF && b1 == 0xFE) || (b0 == 0xFE && b1 == 0xFF)) {
                std::string out;
                if (decode_utf16(bytes, b0 == 0xFF, out)) {
                    set("utf-16");
                    return out;
                }
            }
        }

        if (bytes.find('\0') != std::string::npos) {
            throw ExtractionError("Binary content (NUL bytes) cannot be decoded as text");
        }

        if (valid_utf8(bytes)) {
            set("utf-8");
            if (bytes.size() >= 3 && bytes.compare(0, 3, "\xEF\xBB\xBF") == 0) return bytes.substr(3);
            return bytes;
        }

        std::string out;
        if (decode_cp1252(bytes, out)) {
            set("cp1252");
            return out;
        }

        set("latin-1");
        return decode_latin1(bytes);
    }

}
