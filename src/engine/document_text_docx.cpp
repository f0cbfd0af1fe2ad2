#include "document_text.hpp"
#include "log.hpp"
#include "lectern/errors.hpp"
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#ifdef LECTERN_WITH_DOCX
#include <archive.h>
#include <archive_entry.h>
#endif

namespace lectern::engine::document_text {

    namespace {

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
            } else if (cp < 0x110000) {
                out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        /**
         * @brief Appends character data, resolving the predefined and numeric XML entities.
         */
        void append_text(std::string& out, const std::string& xml, size_t begin, size_t end) {
            for (size_t i = begin; i < end; ++i) {
                if (xml[i] != '&') {
                    out.push_back(xml[i]);
                    continue;
                }
                size_t semi = xml.find(';', i);
                if (semi == std::string::npos || semi >= end) {
                    out.push_back('&');
                    continue;
                }
                std::string name = xml.substr(i + 1, semi - i - 1);
                if (name == "amp") out.push_back('&');
                else if (name == "lt") out.push_back('<');
                else if (name == "gt") out.push_back('>');
                else if (name == "quot") out.push_back('"');
                else if (name == "apos") out.push_back('\'');
                else if (name.size() > 1 && name[0] == '#') {
                    bool hex = name[1] == 'x' || name[1] == 'X';
                    append_utf8(out, static_cast<uint32_t>(std::strtoul(name.c_str() + (hex ? 2 : 1), nullptr, hex ? 16 : 10)));
                } else {
                    out.append(xml, i, semi - i + 1);
                }
                i = semi;
            }
        }

        bool is_blank(const std::string& s) {
            for (char c : s) {
                if (!std::isspace(static_cast<unsigned char>(c))) return false;
            }
            return true;
        }

    }

    std::string docx_paragraphs(const std::string& xml) {
        std::vector<std::string> paragraphs;
        std::string current;
        bool in_text = false;

        size_t i = 0;
        while (i < xml.size()) {
            if (xml[i] != '<') {
                size_t next = xml.find('<', i);
                if (next == std::string::npos) next = xml.size();
                if (in_text) append_text(current, xml, i, next);
                i = next;
                continue;
            }

            if (xml.compare(i, 4, "<!--") == 0) {
                size_t close = xml.find("-->", i + 4);
                i = close == std::string::npos ? xml.size() : close + 3;
                continue;
            }

            size_t close = xml.find('>', i);
            if (close == std::string::npos) break;
            std::string tag = xml.substr(i + 1, close - i - 1);
            i = close + 1;

            bool closing = !tag.empty() && tag[0] == '/';
            bool self_closing = !tag.empty() && tag.back() == '/';
            size_t name_begin = closing ? 1 : 0;
            size_t name_end = tag.find_first_of(" \t\r\n/", name_begin);
            std::string name = tag.substr(name_begin, name_end == std::string::npos ? std::string::npos : name_end - name_begin);

            if (name == "w:t") {
                in_text = !closing && !self_closing;
            } else if (name == "w:tab" && !closing) {
                current.push_back('\t');
            } else if ((name == "w:br" || name == "w:cr") && !closing) {
                current.push_back('\n');
            } else if (name == "w:p" && (closing || self_closing)) {
                if (!is_blank(current)) paragraphs.push_back(current);
                current.clear();
                in_text = false;
            }
        }
        if (!is_blank(current)) paragraphs.push_back(current);

        std::string out;
        for (const auto& p : paragraphs) {
            if (!out.empty()) out += "\n\n";
            out += p;
        }
        return out;
    }

#ifdef LECTERN_WITH_DOCX
    namespace {

        struct ArchiveReadDeleter {
            void operator()(struct archive* a) const { archive_read_free(a); }
        };

        std::string archive_message(struct archive* a) {
            const char* msg = archive_error_string(a);
            return msg ? msg : "unknown archive error";
        }

    }

    std::string docx(const std::filesystem::path& path) {
        std::unique_ptr<struct archive, ArchiveReadDeleter> zip(archive_read_new());
        if (!zip) throw ExtractionError("Cannot allocate archive reader");
        archive_read_support_format_zip(zip.get());

        if (archive_read_open_filename(zip.get(), path.string().c_str(), 10240) != ARCHIVE_OK) {
            throw ExtractionError("Cannot open " + path.filename().string() + " as a DOCX archive: " + archive_message(zip.get()));
        }

        struct archive_entry* entry = nullptr;
        int status = ARCHIVE_OK;
        while ((status = archive_read_next_header(zip.get(), &entry)) == ARCHIVE_OK) {
            const char* name = archive_entry_pathname(entry);
            if (!name || std::string(name) != "word/document.xml") {
                archive_read_data_skip(zip.get());
                continue;
            }

            std::string xml;
            char buffer[16384];
            la_ssize_t n = 0;
            while ((n = archive_read_data(zip.get(), buffer, sizeof(buffer))) > 0) {
                xml.append(buffer, static_cast<size_t>(n));
            }
            if (n < 0) {
                throw ExtractionError("Cannot inflate word/document.xml in " + path.filename().string() + ": " +
                                      archive_message(zip.get()));
            }
            log::debug("Extractor", "Read ", xml.size(), " bytes of document XML from ", path.string());
            return docx_paragraphs(xml);
        }

        if (status != ARCHIVE_EOF) {
            throw ExtractionError("Corrupt DOCX archive " + path.filename().string() + ": " + archive_message(zip.get()));
        }
        throw ExtractionError(path.filename().string() + " has no word/document.xml");
    }
#else
    std::string docx(const std::filesystem::path& path) {
        throw ExtractionError("Cannot read " + path.filename().string() + ": this build has no DOCX support (LECTERN_WITH_DOCX)");
    }
#endif

}
