#include <gtest/gtest.h>
#include "docprint/engine.h"
#include "docprint/pdf_writer.h"
#include <sstream>
#include <string>

using namespace docprint;

namespace {

size_t countOccurrences(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

std::string pdfFor(const DocumentTree& tree, const PageConfig& config,
                   const std::string& title = "") {
    auto result = render(tree, config);
    EXPECT_TRUE(result.ok());
    std::ostringstream out;
    writePdf(*result.artifact, out, title);
    return out.str();
}

} // anonymous namespace

TEST(PdfWriterTest, HeaderAndTrailer) {
    DocumentTree tree;
    tree.blocks.push_back(Block::paragraph("Hello world"));
    std::string pdf = pdfFor(tree, PageConfig{});

    EXPECT_EQ(pdf.compare(0, 8, "%PDF-1.4"), 0);
    EXPECT_NE(pdf.find("xref"), std::string::npos);
    EXPECT_NE(pdf.find("/Root 1 0 R"), std::string::npos);
    ASSERT_GE(pdf.size(), 6u);
    EXPECT_EQ(pdf.substr(pdf.size() - 6), "%%EOF\n");
}

TEST(PdfWriterTest, TextAndPageSize) {
    DocumentTree tree;
    tree.blocks.push_back(Block::paragraph("Hello world"));
    std::string pdf = pdfFor(tree, PageConfig{});

    EXPECT_NE(pdf.find("(Hello world) Tj"), std::string::npos);
    EXPECT_NE(pdf.find("/MediaBox [0 0 595.28 841.89]"), std::string::npos);
    EXPECT_NE(pdf.find("/BaseFont /Helvetica "), std::string::npos);
}

TEST(PdfWriterTest, OnePageObjectPerPage) {
    DocumentTree tree;
    for (int i = 0; i < 120; ++i) {
        tree.blocks.push_back(Block::paragraph("paragraph " + std::to_string(i)));
    }
    auto result = render(tree, PageConfig{});
    ASSERT_TRUE(result.ok());
    size_t pages = result.artifact->pages.size();
    ASSERT_GT(pages, 1u);

    std::ostringstream out;
    writePdf(*result.artifact, out);
    std::string pdf = out.str();
    EXPECT_EQ(countOccurrences(pdf, "/Type /Page /Parent"), pages);
    EXPECT_NE(pdf.find("/Count " + std::to_string(pages)), std::string::npos);
}

TEST(PdfWriterTest, TitleInInfoDictionary) {
    DocumentTree tree;
    std::string pdf = pdfFor(tree, PageConfig{}, "Notes (draft)");
    EXPECT_NE(pdf.find("/Title (Notes \\(draft\\))"), std::string::npos);
}

TEST(PdfWriterTest, LiteralStringEscapes) {
    EXPECT_EQ(PdfWriter::literalString("a(b)c\\d"), "(a\\(b\\)c\\\\d)");
    EXPECT_EQ(PdfWriter::literalString(""), "()");
}

TEST(PdfWriterTest, WinAnsiConversion) {
    EXPECT_EQ(PdfWriter::toWinAnsi("plain"), "plain");
    EXPECT_EQ(PdfWriter::toWinAnsi("caf\xc3\xa9"), "caf\xe9");
    EXPECT_EQ(PdfWriter::toWinAnsi("\xe2\x80\xa2 item"), "\x95 item");
    EXPECT_EQ(PdfWriter::toWinAnsi("\xe4\xb8\xad"), "?");
    EXPECT_EQ(PdfWriter::toWinAnsi("a\nb"), "ab");
}

TEST(PdfWriterTest, SinkDrawsDirectly) {
    std::ostringstream out;
    PdfWriter writer(out);
    writer.beginPage(1, 100.0f, 100.0f);
    writer.fillRect(10.0f, 10.0f, 20.0f, 5.0f, Rgb{242, 242, 242});
    writer.drawLine(10.0f, 50.0f, 90.0f, 50.0f, 0.3f, Rgb{128, 128, 128});
    writer.finish();

    std::string pdf = out.str();
    EXPECT_NE(pdf.find(" re f"), std::string::npos);
    EXPECT_NE(pdf.find(" l S"), std::string::npos);
    EXPECT_NE(pdf.find("0.95 0.95 0.95 rg"), std::string::npos);
    EXPECT_EQ(countOccurrences(pdf, "/Type /Page /Parent"), 1u);

    // A second finish() writes nothing more
    size_t size = pdf.size();
    writer.finish();
    EXPECT_EQ(out.str().size(), size);
}

TEST(ExportPdfTest, WritesNothingOnError) {
    DocumentTree tree;
    tree.blocks.push_back(Block::paragraph("Hello"));
    PageConfig config;
    config.pageWidthMm = 0;

    std::ostringstream out;
    auto result = exportPdf(tree, config, RenderOptions{}, out);
    EXPECT_FALSE(result.ok());
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, RenderErrorKind::Configuration);
    EXPECT_TRUE(out.str().empty());
}

TEST(ExportPdfTest, WritesDocument) {
    DocumentTree tree;
    tree.blocks.push_back(Block::heading(1, {InlineRun::plain("Heading")}));
    tree.blocks.push_back(Block::paragraph("Body"));
    RenderOptions options;
    options.title = "Export";

    std::ostringstream out;
    auto result = exportPdf(tree, pageConfigFor(PageProfile::A5), options, out);
    ASSERT_TRUE(result.ok());
    std::string pdf = out.str();
    EXPECT_EQ(pdf.compare(0, 8, "%PDF-1.4"), 0);
    EXPECT_NE(pdf.find("(Export) Tj"), std::string::npos);
    EXPECT_NE(pdf.find("(Heading) Tj"), std::string::npos);
    EXPECT_NE(pdf.find("/Helvetica-Bold"), std::string::npos);
}
