#include "document_text.hpp"
#include "log.hpp"
#include "lectern/errors.hpp"
#include <sstream>
#include <string>
#include <vector>

#ifdef LECTERN_WITH_PDF
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#endif

namespace lectern::engine::document_text {

#ifdef LECTERN_WITH_PDF
    namespace {

        /**
         * @brief Collects the strings shown by text operators of one content stream.
         * Line moves (Td/TD with a vertical offset, T*, Tm, ', ", ET) start a new line.
         */
        class PageText : public QPDFObjectHandle::ParserCallbacks {
        public:
            void handleObject(QPDFObjectHandle obj) override {
                if (!obj.isOperator()) {
                    m_operands.push_back(obj);
                    return;
                }
                apply(obj.getOperatorValue());
                m_operands.clear();
            }

            void handleEOF() override {}

            std::string text() const {
                std::istringstream in(m_text);
                std::string line;
                std::string out;
                bool gap = false;
                while (std::getline(in, line)) {
                    while (!line.empty() && (line.back() == ' ' || line.back() == '\r')) line.pop_back();
                    if (line.empty()) {
                        gap = !out.empty();
                        continue;
                    }
                    if (!out.empty()) out += gap ? "\n\n" : "\n";
                    out += line;
                    gap = false;
                }
                return out;
            }

        private:
            std::vector<QPDFObjectHandle> m_operands;
            std::string m_text;

            void new_line() {
                if (!m_text.empty() && m_text.back() != '\n') m_text.push_back('\n');
            }

            void show(QPDFObjectHandle item) {
                if (item.isString()) {
                    m_text += item.getUTF8Value();
                } else if (item.isNumber() && item.getNumericValue() < -200.0) {
                    // Large negative kerning inside TJ separates words.
                    if (!m_text.empty() && m_text.back() != ' ' && m_text.back() != '\n') m_text.push_back(' ');
                }
            }

            void apply(const std::string& op) {
                if (op == "Tj") {
                    if (!m_operands.empty()) show(m_operands.back());
                } else if (op == "TJ") {
                    if (!m_operands.empty() && m_operands.back().isArray()) {
                        for (auto& item : m_operands.back().getArrayAsVector()) show(item);
                    }
                } else if (op == "'" || op == "\"") {
                    new_line();
                    if (!m_operands.empty()) show(m_operands.back());
                } else if (op == "Td" || op == "TD") {
                    if (m_operands.size() == 2 && m_operands[1].isNumber() && m_operands[1].getNumericValue() != 0.0) {
                        new_line();
                    } else if (!m_text.empty() && m_text.back() != ' ' && m_text.back() != '\n') {
                        m_text.push_back(' ');
                    }
                } else if (op == "T*" || op == "Tm" || op == "ET") {
                    new_line();
                }
            }
        };

    }

    std::string pdf(const std::filesystem::path& path) {
        QPDF document;
        document.setSuppressWarnings(true);
        try {
            document.processFile(path.string().c_str());
        } catch (const std::exception& e) {
            throw ExtractionError("Cannot open PDF " + path.filename().string() + ": " + e.what());
        }

        std::vector<QPDFPageObjectHelper> pages;
        try {
            pages = QPDFPageDocumentHelper(document).getAllPages();
        } catch (const std::exception& e) {
            throw ExtractionError("Cannot read page tree of " + path.filename().string() + ": " + e.what());
        }

        std::string out;
        for (size_t i = 0; i < pages.size(); ++i) {
            PageText collector;
            try {
                pages[i].parsePageContents(&collector);
            } catch (const std::exception& e) {
                log::warn("Extractor", "Error extracting page ", i + 1, " from ", path.string(), ": ", e.what());
                continue;
            }
            std::string text = collector.text();
            if (text.empty()) continue;
            if (!out.empty()) out += "\n\n";
            out += "[Page " + std::to_string(i + 1) + "]\n" + text;
        }
        log::debug("Extractor", "Read ", pages.size(), " PDF pages from ", path.string());
        return out;
    }
#else
    std::string pdf(const std::filesystem::path& path) {
        throw ExtractionError("Cannot read " + path.filename().string() + ": this build has no PDF support (LECTERN_WITH_PDF)");
    }
#endif

}
