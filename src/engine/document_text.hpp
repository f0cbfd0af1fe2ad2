#pragma once

#include <filesystem>
#include <string>

namespace lectern::engine::document_text {

    /**
     * @brief Text of a PDF, one block per page prefixed with "[Page N]", blocks separated by a blank line.
     * Pages without text are left out; a page that fails to parse is logged and skipped.
     * @throws ExtractionError if the file cannot be opened as a PDF, or the build has no PDF support.
     */
    std::string pdf(const std::filesystem::path& path);

    /**
     * @brief Non-empty paragraphs of a .docx body, separated by a blank line.
     * @throws ExtractionError if the archive or word/document.xml cannot be read, or the build has no DOCX support.
     */
    std::string docx(const std::filesystem::path& path);

    /**
     * @brief Paragraph text of a WordprocessingML document part (w:p / w:t, with w:tab and w:br).
     */
    std::string docx_paragraphs(const std::string& document_xml);

}
