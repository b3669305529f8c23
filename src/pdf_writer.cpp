#include "docprint/pdf_writer.h"
#include "docprint/log.h"
#include "docprint/metrics.h"
#include <cstdio>
#include <utility>

namespace docprint {

namespace {

// Object numbers of the fixed objects; fonts follow, then pages
constexpr int kCatalogObj = 1;
constexpr int kPagesObj = 2;
constexpr int kInfoObj = 3;
constexpr int kFirstFontObj = 4;
constexpr int kFontCount = 12;

const char* const kBaseFonts[kFontCount] = {
    "Helvetica", "Helvetica-Bold", "Helvetica-Oblique", "Helvetica-BoldOblique",
    "Times-Roman", "Times-Bold", "Times-Italic", "Times-BoldItalic",
    "Courier", "Courier-Bold", "Courier-Oblique", "Courier-BoldOblique",
};

/// Index into kBaseFonts
int fontIndex(const FontSpec& font) {
    int family = 0;
    switch (font.family) {
        case FontFamily::Helvetica: family = 0; break;
        case FontFamily::Times:     family = 1; break;
        case FontFamily::Courier:   family = 2; break;
    }
    return family * 4 + (font.bold ? 1 : 0) + (font.italic ? 2 : 0);
}

std::string pdfNumber(float v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", v);
    return buf;
}

float mmToPt(float mm) {
    return mm / kPtToMm;
}

std::string colorOperator(const Rgb& color, bool fill) {
    return pdfNumber(color.r / 255.0f) + " " + pdfNumber(color.g / 255.0f) + " " +
           pdfNumber(color.b / 255.0f) + (fill ? " rg\n" : " RG\n");
}

/// Windows-1252 bytes for the punctuation outside Latin-1
struct AnsiMapping {
    char32_t codepoint;
    unsigned char byte;
};

const AnsiMapping kAnsiPunctuation[] = {
    {0x2022, 0x95},  // bullet
    {0x2013, 0x96},  // en dash
    {0x2014, 0x97},  // em dash
    {0x2018, 0x91}, {0x2019, 0x92},
    {0x201C, 0x93}, {0x201D, 0x94},
    {0x2026, 0x85},  // ellipsis
    {0x20AC, 0x80},  // euro
};

} // anonymous namespace

PdfWriter::PdfWriter(std::ostream& out, std::string title)
    : out_(out), title_(std::move(title)) {}

void PdfWriter::beginPage(int pageIndex, float widthMm, float heightMm) {
    PageContent page;
    page.widthPt = mmToPt(widthMm);
    page.heightPt = mmToPt(heightMm);
    pages_.push_back(std::move(page));
    DP_LOGD("pdf: beginPage %d (%.1fx%.1fpt)", pageIndex, pages_.back().widthPt,
            pages_.back().heightPt);
}

PdfWriter::PageContent& PdfWriter::currentPage() {
    if (pages_.empty()) {
        pages_.push_back(PageContent{mmToPt(210.0f), mmToPt(297.0f), {}});
    }
    return pages_.back();
}

float PdfWriter::pdfY(float yMm) const {
    return pages_.back().heightPt - mmToPt(yMm);
}

void PdfWriter::drawText(const std::string& text, float x, float y,
                         const FontSpec& font, const Rgb& color, float /*advance*/) {
    auto& page = currentPage();
    page.stream += "BT\n";
    page.stream += colorOperator(color, true);
    page.stream += "/F" + std::to_string(fontIndex(font) + 1) + " " + pdfNumber(font.sizePt) + " Tf\n";
    page.stream += pdfNumber(mmToPt(x)) + " " + pdfNumber(pdfY(y)) + " Td\n";
    page.stream += literalString(toWinAnsi(text)) + " Tj\nET\n";
}

void PdfWriter::fillRect(float x, float y, float width, float height, const Rgb& color) {
    auto& page = currentPage();
    page.stream += colorOperator(color, true);
    // PDF rectangles grow upward from their lower-left corner
    page.stream += pdfNumber(mmToPt(x)) + " " + pdfNumber(pdfY(y + height)) + " " +
                   pdfNumber(mmToPt(width)) + " " + pdfNumber(mmToPt(height)) + " re f\n";
}

void PdfWriter::drawLine(float x1, float y1, float x2, float y2,
                         float lineWidth, const Rgb& color) {
    auto& page = currentPage();
    page.stream += colorOperator(color, false);
    page.stream += pdfNumber(mmToPt(lineWidth)) + " w\n";
    page.stream += pdfNumber(mmToPt(x1)) + " " + pdfNumber(pdfY(y1)) + " m " +
                   pdfNumber(mmToPt(x2)) + " " + pdfNumber(pdfY(y2)) + " l S\n";
}

void PdfWriter::finish() {
    if (finished_) return;
    finished_ = true;

    int objectCount = kFirstFontObj + kFontCount - 1 + 2 * static_cast<int>(pages_.size());
    std::vector<size_t> offsets(objectCount + 1, 0);
    std::string pdf = "%PDF-1.4\n%\xe2\xe3\xcf\xd3\n";

    auto beginObj = [&](int id) {
        offsets[id] = pdf.size();
        pdf += std::to_string(id) + " 0 obj\n";
    };
    auto endObj = [&]() {
        pdf += "\nendobj\n";
    };

    for (int i = 0; i < kFontCount; ++i) {
        beginObj(kFirstFontObj + i);
        pdf += "<< /Type /Font /Subtype /Type1 /BaseFont /";
        pdf += kBaseFonts[i];
        pdf += " /Encoding /WinAnsiEncoding >>";
        endObj();
    }

    std::string resources = "<< /Font <<";
    for (int i = 0; i < kFontCount; ++i) {
        resources += " /F" + std::to_string(i + 1) + " " +
                     std::to_string(kFirstFontObj + i) + " 0 R";
    }
    resources += " >> >>";

    std::string kids;
    int nextObj = kFirstFontObj + kFontCount;
    for (const auto& page : pages_) {
        int contentObj = nextObj++;
        int pageObj = nextObj++;

        beginObj(contentObj);
        pdf += "<< /Length " + std::to_string(page.stream.size()) + " >>\nstream\n";
        pdf += page.stream;
        pdf += "endstream";
        endObj();

        beginObj(pageObj);
        pdf += "<< /Type /Page /Parent " + std::to_string(kPagesObj) + " 0 R";
        pdf += " /MediaBox [0 0 " + pdfNumber(page.widthPt) + " " + pdfNumber(page.heightPt) + "]";
        pdf += " /Contents " + std::to_string(contentObj) + " 0 R";
        pdf += " /Resources " + resources + " >>";
        endObj();

        kids += std::to_string(pageObj) + " 0 R ";
    }

    beginObj(kPagesObj);
    pdf += "<< /Type /Pages /Kids [" + kids + "] /Count " + std::to_string(pages_.size()) + " >>";
    endObj();

    beginObj(kInfoObj);
    pdf += "<< /Producer (docprint)";
    if (!title_.empty()) pdf += " /Title " + literalString(toWinAnsi(title_));
    pdf += " >>";
    endObj();

    beginObj(kCatalogObj);
    pdf += "<< /Type /Catalog /Pages " + std::to_string(kPagesObj) + " 0 R >>";
    endObj();

    size_t xrefOffset = pdf.size();
    pdf += "xref\n0 " + std::to_string(objectCount + 1) + "\n";
    pdf += "0000000000 65535 f \n";
    for (int id = 1; id <= objectCount; ++id) {
        char entry[24];
        std::snprintf(entry, sizeof(entry), "%010zu 00000 n \n", offsets[id]);
        pdf += entry;
    }
    pdf += "trailer\n<< /Size " + std::to_string(objectCount + 1) +
           " /Root " + std::to_string(kCatalogObj) + " 0 R /Info " +
           std::to_string(kInfoObj) + " 0 R >>\n";
    pdf += "startxref\n" + std::to_string(xrefOffset) + "\n%%EOF\n";

    out_.write(pdf.data(), static_cast<std::streamsize>(pdf.size()));
    DP_LOGI("pdf: wrote pages=%zu bytes=%zu", pages_.size(), pdf.size());
}

std::string PdfWriter::toWinAnsi(const std::string& utf8Text) {
    std::string result;
    result.reserve(utf8Text.size());
    for (size_t pos = 0; pos < utf8Text.size();) {
        char32_t cp = utf8::decode(utf8Text, pos);
        if (cp == '\n' || cp == '\r') continue;
        if (cp == '\t') cp = ' ';
        if (cp < 0x80 || (cp >= 0xA0 && cp <= 0xFF)) {
            result += static_cast<char>(cp);
            continue;
        }
        char mapped = '?';
        for (const auto& m : kAnsiPunctuation) {
            if (m.codepoint == cp) {
                mapped = static_cast<char>(m.byte);
                break;
            }
        }
        result += mapped;
    }
    return result;
}

std::string PdfWriter::literalString(const std::string& bytes) {
    std::string result = "(";
    for (char c : bytes) {
        if (c == '(' || c == ')' || c == '\\') result += '\\';
        result += c;
    }
    result += ")";
    return result;
}

} // namespace docprint
