#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "lectern/types.hpp"

namespace lectern::engine {

    /**
     * @brief File classification, metadata and text extraction.
     */
    class Extractor {
    public:
        static bool is_supported(const std::filesystem::path& path);

        /**
         * @brief Content type from the extension: markdown, code, markup, structured_data, pdf, document, csv or text.
         */
        static std::string content_type(const std::filesystem::path& path);

        static std::string mime_type(const std::filesystem::path& path);

        /**
         * @brief Every supported extension, sorted, with its content type.
         */
        static std::vector<std::pair<std::string, std::string>> supported_types();

        /**
         * @brief Stats and hashes a file.
         * @throws ExtractionError if the file cannot be read.
         */
        static DocumentInfo describe(const std::filesystem::path& path);

        /**
         * @brief Extracts the text of a whole document.
         * PDF pages come back as "[Page N]" blocks and DOCX files as their paragraphs.
         * @throws ExtractionError for unreadable, binary or undecodable files, and for
         * .doc, .rtf and .odt, which have no extractor.
         */
        static std::string extract(const std::filesystem::path& path);

        /**
         * @brief Reads a file as text through the encoding fallback chain.
         */
        static std::string read_text(const std::filesystem::path& path, std::string* encoding = nullptr);

        /**
         * @brief Decodes raw bytes to UTF-8: utf-8, utf-16 (BOM required), cp1252, latin-1.
         * @throws ExtractionError if the bytes look binary (contain NUL outside UTF-16).
         */
        static std::string decode(const std::string& bytes, std::string* encoding = nullptr);
    };

}
