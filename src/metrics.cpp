#include "docprint/metrics.h"

namespace docprint {

namespace {

// Helvetica advance widths for ASCII 32..126, 1/1000 em
const int kHelveticaWidths[95] = {
    278, 278, 355, 556, 556, 889, 667, 191, 333, 333, 389, 584, 278, 333, 278, 278,  // ' '../
    556, 556, 556, 556, 556, 556, 556, 556, 556, 556,                                // 0..9
    278, 278, 584, 584, 584, 556, 1015,                                              // :..@
    667, 667, 722, 722, 667, 611, 778, 722, 278, 500, 667, 556, 833,                 // A..M
    722, 778, 667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611,                 // N..Z
    278, 278, 278, 469, 556, 333,                                                    // [..`
    556, 556, 500, 556, 556, 278, 556, 556, 222, 222, 500, 222, 833,                 // a..m
    556, 556, 556, 556, 333, 500, 278, 556, 500, 722, 500, 500, 500,                 // n..z
    334, 260, 334, 584,                                                              // {..~
};

const int kHelveticaBoldWidths[95] = {
    278, 333, 474, 556, 556, 889, 722, 238, 333, 333, 389, 584, 278, 333, 278, 278,
    556, 556, 556, 556, 556, 556, 556, 556, 556, 556,
    333, 333, 584, 584, 584, 611, 975,
    722, 722, 722, 722, 667, 611, 778, 722, 278, 556, 722, 611, 833,
    722, 778, 667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611,
    333, 278, 333, 584, 556, 333,
    556, 611, 556, 611, 556, 333, 611, 611, 278, 278, 556, 278, 889,
    611, 611, 611, 611, 389, 556, 333, 611, 556, 778, 556, 556, 500,
    389, 280, 389, 584,
};

constexpr int kCourierWidth = 600;
constexpr int kDefaultWidth = 556;   // Code points outside the tables
constexpr int kBulletWidth = 350;    // U+2022

} // anonymous namespace

const char* familyName(FontFamily family) {
    switch (family) {
        case FontFamily::Helvetica: return "helvetica";
        case FontFamily::Times:     return "times";
        case FontFamily::Courier:   return "courier";
    }
    return "helvetica";
}

namespace utf8 {

size_t charLen(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1;
}

size_t length(const std::string& s) {
    size_t count = 0;
    size_t pos = 0;
    while (pos < s.size()) {
        pos += charLen(static_cast<unsigned char>(s[pos]));
        ++count;
    }
    return count;
}

char32_t decode(const std::string& s, size_t& pos) {
    unsigned char lead = static_cast<unsigned char>(s[pos]);
    size_t len = charLen(lead);
    if (pos + len > s.size()) {
        // Truncated sequence: consume the rest as one replacement character
        pos = s.size();
        return 0xFFFD;
    }
    char32_t cp;
    switch (len) {
        case 1: cp = lead; break;
        case 2: cp = lead & 0x1F; break;
        case 3: cp = lead & 0x0F; break;
        default: cp = lead & 0x07; break;
    }
    for (size_t i = 1; i < len; ++i) {
        cp = (cp << 6) | (static_cast<unsigned char>(s[pos + i]) & 0x3F);
    }
    pos += len;
    return cp;
}

} // namespace utf8

float FixedWidthMetrics::measure(const std::string& text, const FontSpec& font) const {
    size_t count = 0;
    for (size_t pos = 0; pos < text.size();) {
        char32_t cp = utf8::decode(text, pos);
        if (cp != '\n') ++count;
    }
    return static_cast<float>(count) * emFraction_ * font.sizePt * kPtToMm;
}

int StandardFontMetrics::advance(char32_t codepoint, const FontSpec& font) {
    if (codepoint == '\n') return 0;
    if (font.family == FontFamily::Courier) return kCourierWidth;
    if (codepoint == 0x2022) return kBulletWidth;
    if (codepoint == '\t') codepoint = ' ';
    if (codepoint < 32 || codepoint > 126) return kDefaultWidth;
    const int* table = font.bold ? kHelveticaBoldWidths : kHelveticaWidths;
    return table[codepoint - 32];
}

float StandardFontMetrics::measure(const std::string& text, const FontSpec& font) const {
    long units = 0;
    for (size_t pos = 0; pos < text.size();) {
        units += advance(utf8::decode(text, pos), font);
    }
    return static_cast<float>(units) / 1000.0f * font.sizePt * kPtToMm;
}

} // namespace docprint
