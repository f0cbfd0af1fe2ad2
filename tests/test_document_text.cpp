#include <gtest/gtest.h>
#include <cstdio>
#include <utility>
#include "engine/document_text.hpp"
#include "engine/extractor.hpp"
#include "lectern/errors.hpp"
#include "test_support.hpp"

#ifdef LECTERN_WITH_DOCX
#include <archive.h>
#include <archive_entry.h>
#endif

using namespace lectern::engine;
using lectern::test::TempDir;

namespace {

#ifdef LECTERN_WITH_PDF
    /**
     * @brief Minimal uncompressed PDF with one Helvetica content stream per page and a valid xref table.
     */
    std::string build_pdf(const std::vector<std::string>& page_streams) {
        std::vector<std::string> objects;
        objects.push_back("<< /Type /Catalog /Pages 2 0 R >>");

        const size_t font_id = 3 + 2 * page_streams.size();
        std::string kids;
        for (size_t i = 0; i < page_streams.size(); ++i) {
            kids += std::to_string(3 + 2 * i) + " 0 R ";
        }
        objects.push_back("<< /Type /Pages /Kids [" + kids + "] /Count " + std::to_string(page_streams.size()) + " >>");

        for (size_t i = 0; i < page_streams.size(); ++i) {
            objects.push_back("<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] /Resources << /Font << /F1 " +
                              std::to_string(font_id) + " 0 R >> >> /Contents " + std::to_string(4 + 2 * i) + " 0 R >>");
            objects.push_back("<< /Length " + std::to_string(page_streams[i].size()) + " >>\nstream\n" +
                              page_streams[i] + "\nendstream");
        }
        objects.push_back("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>");

        std::string pdf = "%PDF-1.4\n";
        std::vector<size_t> offsets;
        for (size_t i = 0; i < objects.size(); ++i) {
            offsets.push_back(pdf.size());
            pdf += std::to_string(i + 1) + " 0 obj\n" + objects[i] + "\nendobj\n";
        }

        const size_t xref = pdf.size();
        pdf += "xref\n0 " + std::to_string(objects.size() + 1) + "\n0000000000 65535 f \n";
        for (size_t offset : offsets) {
            char entry[21];
            std::snprintf(entry, sizeof(entry), "%010zu 00000 n \n", offset);
            pdf += entry;
        }
        pdf += "trailer\n<< /Size " + std::to_string(objects.size() + 1) + " /Root 1 0 R >>\nstartxref\n" +
               std::to_string(xref) + "\n%%EOF\n";
        return pdf;
    }
#endif

#ifdef LECTERN_WITH_DOCX
    void write_zip(const std::filesystem::path& path, const std::vector<std::pair<std::string, std::string>>& entries) {
        struct archive* zip = archive_write_new();
        ASSERT_NE(zip, nullptr);
        ASSERT_EQ(archive_write_set_format_zip(zip), ARCHIVE_OK);
        ASSERT_EQ(archive_write_open_filename(zip, path.string().c_str()), ARCHIVE_OK);
        for (const auto& [name, body] : entries) {
            struct archive_entry* entry = archive_entry_new();
            archive_entry_set_pathname(entry, name.c_str());
            archive_entry_set_size(entry, static_cast<la_int64_t>(body.size()));
            archive_entry_set_filetype(entry, AE_IFREG);
            archive_entry_set_perm(entry, 0644);
            EXPECT_EQ(archive_write_header(zip, entry), ARCHIVE_OK);
            EXPECT_EQ(archive_write_data(zip, body.data(), body.size()), static_cast<la_ssize_t>(body.size()));
            archive_entry_free(entry);
        }
        archive_write_close(zip);
        archive_write_free(zip);
    }
#endif

    const char* const kDocumentXml =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
        "<w:document xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\"><w:body>"
        "<w:p><w:pPr><w:pStyle w:val=\"Title\"/></w:pPr><w:r><w:t>Release notes</w:t></w:r></w:p>"
        "<w:p/>"
        "<w:p><w:r><w:t xml:space=\"preserve\">Fixes &amp; </w:t></w:r><w:r><w:t>improvements</w:t></w:r></w:p>"
        "<w:p><w:r><w:t>   </w:t></w:r></w:p>"
        "<!-- <w:p><w:r><w:t>hidden</w:t></w:r></w:p> -->"
        "<w:p><w:r><w:t>Name</w:t><w:tab/><w:t>Caf&#233;</w:t><w:br/><w:t>&lt;end&gt;</w:t></w:r></w:p>"
        "</w:body></w:document>";

}

TEST(DocumentText, DocxParagraphsKeepNonEmptyParagraphs) {
    EXPECT_EQ(document_text::docx_paragraphs(kDocumentXml),
              "Release notes\n\nFixes & improvements\n\nName\tCaf\xC3\xA9\n<end>");
}

TEST(DocumentText, DocxParagraphsOfEmptyBodyIsEmpty) {
    EXPECT_EQ(document_text::docx_paragraphs("<w:document><w:body><w:p/></w:body></w:document>"), "");
}

TEST(DocumentText, PdfPagesAreMarked) {
#ifndef LECTERN_WITH_PDF
    GTEST_SKIP() << "built without PDF support";
#else
    TempDir dir;
    auto path = dir.write("report.pdf", build_pdf({
        "BT /F1 12 Tf 72 712 Td (Hello PDF) Tj ET",
        "BT /F1 12 Tf 72 712 Td",
        "BT /F1 12 Tf 72 712 Td [(Wor) -20 (ld)] TJ 0 -14 Td (Second line) Tj ET",
    }));

    EXPECT_EQ(Extractor::extract(path), "[Page 1]\nHello PDF\n\n[Page 3]\nWorld\nSecond line");
#endif
}

TEST(DocumentText, DocxFileIsReadThroughItsArchive) {
#ifndef LECTERN_WITH_DOCX
    GTEST_SKIP() << "built without DOCX support";
#else
    TempDir dir;
    auto path = dir.path() / "notes.docx";
    write_zip(path, {{"[Content_Types].xml", "<Types/>"}, {"word/document.xml", kDocumentXml}});

    EXPECT_EQ(Extractor::extract(path), document_text::docx_paragraphs(kDocumentXml));

    auto empty = dir.path() / "empty.docx";
    write_zip(empty, {{"[Content_Types].xml", "<Types/>"}});
    EXPECT_THROW(Extractor::extract(empty), ExtractionError);
#endif
}

TEST(DocumentText, UnreadableDocumentsAreExtractionErrors) {
    TempDir dir;
    EXPECT_THROW(Extractor::extract(dir.write("paper.pdf", "%PDF-1.4")), ExtractionError);
    EXPECT_THROW(Extractor::extract(dir.write("letter.docx", "PK")), ExtractionError);
    EXPECT_THROW(Extractor::extract(dir.write("legacy.doc", "binary")), ExtractionError);
}
