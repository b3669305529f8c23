#pragma once

#include "docprint/style.h"
#include <string>

namespace docprint {

/// Millimeters per typographic point (1/72 inch)
constexpr float kPtToMm = 25.4f / 72.0f;

/// Line height factor: mm of line box per point of font size at spacing 1.0
constexpr float kLineHeightMmPerPt = 0.38f;

/// Supplies text measurements for a font. All results are in millimeters.
/// Implementations must be stateless so one provider can serve
/// concurrent renders.
class MetricProvider {
public:
    virtual ~MetricProvider() = default;

    /// Advance width of a UTF-8 string in the given font
    virtual float measure(const std::string& text, const FontSpec& font) const = 0;

    /// Distance from the top of the line box to the baseline
    virtual float ascent(const FontSpec& font) const {
        return font.sizePt * kPtToMm * 0.8f;
    }

    /// Height of one line of text at this size and spacing multiplier
    float lineHeight(float sizePt, float lineSpacing) const {
        return sizePt * kLineHeightMmPerPt * lineSpacing;
    }
};

/// Every code point advances by the same fraction of the em.
/// Predictable geometry for tests and plain-text output.
class FixedWidthMetrics : public MetricProvider {
public:
    explicit FixedWidthMetrics(float emFraction = 0.5f) : emFraction_(emFraction) {}

    float measure(const std::string& text, const FontSpec& font) const override;

private:
    float emFraction_;
};

/// Advance widths of the PDF standard fonts (AFM tables, 1/1000 em).
/// Helvetica has separate regular and bold tables, Courier is fixed at 600.
/// Times is measured with the Helvetica tables.
class StandardFontMetrics : public MetricProvider {
public:
    float measure(const std::string& text, const FontSpec& font) const override;

    /// Advance of a single code point in 1/1000 em
    static int advance(char32_t codepoint, const FontSpec& font);
};

namespace utf8 {

/// Byte length of the UTF-8 sequence starting with lead byte c.
/// Invalid lead bytes count as one byte.
size_t charLen(unsigned char c);

/// Number of code points in s
size_t length(const std::string& s);

/// Decode the code point at pos and advance pos past it
char32_t decode(const std::string& s, size_t& pos);

} // namespace utf8

} // namespace docprint
