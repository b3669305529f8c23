#pragma once

#include "docprint/emitter.h"
#include <ostream>
#include <string>
#include <vector>

namespace docprint {

/// Serializes draw instructions into a PDF 1.4 file using the standard
/// Type 1 fonts (no embedding). Text is converted to WinAnsiEncoding;
/// characters outside it are written as '?'.
/// Output is buffered and written to the stream by finish().
class PdfWriter : public DrawSink {
public:
    explicit PdfWriter(std::ostream& out, std::string title = "");

    void beginPage(int pageIndex, float widthMm, float heightMm) override;
    void drawText(const std::string& text, float x, float y,
                  const FontSpec& font, const Rgb& color, float advance) override;
    void fillRect(float x, float y, float width, float height, const Rgb& color) override;
    void drawLine(float x1, float y1, float x2, float y2,
                  float lineWidth, const Rgb& color) override;
    void finish() override;

    /// UTF-8 to WinAnsiEncoding bytes
    static std::string toWinAnsi(const std::string& utf8Text);

    /// PDF literal string with (, ) and \ escaped
    static std::string literalString(const std::string& bytes);

private:
    struct PageContent {
        float widthPt = 0;
        float heightPt = 0;
        std::string stream;
    };

    std::ostream& out_;
    std::string title_;
    std::vector<PageContent> pages_;
    bool finished_ = false;

    PageContent& currentPage();
    float pdfY(float yMm) const;
};

} // namespace docprint
