#pragma once

#include <cstdint>
#include <string>

namespace docprint {

/// Output font families. These map onto the PDF standard fonts.
enum class FontFamily {
    Helvetica,
    Times,
    Courier,
};

/// Vertical position of a run relative to the baseline
enum class Script {
    Normal,
    Super,
    Sub,
};

struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Rgb& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const Rgb& o) const { return !(*this == o); }
};

/// Font request for measurement and drawing
struct FontSpec {
    FontFamily family = FontFamily::Helvetica;
    float sizePt = 12.0f;
    bool bold = false;
    bool italic = false;

    bool operator==(const FontSpec& o) const {
        return family == o.family && sizePt == o.sizePt &&
               bold == o.bold && italic == o.italic;
    }
};

/// Fully resolved style of a run. Every field is concrete.
struct RunStyle {
    FontFamily family = FontFamily::Helvetica;
    float sizePt = 12.0f;
    bool bold = false;
    bool italic = false;
    bool underline = false;
    bool strike = false;
    Script script = Script::Normal;
    Rgb color;                    // Default black
    bool highlighted = false;
    Rgb highlight{255, 255, 0};   // Only meaningful when highlighted

    /// Font used to draw and measure the run. Super/subscript shrink to 70%.
    FontSpec font() const {
        FontSpec f;
        f.family = family;
        f.sizePt = script == Script::Normal ? sizePt : sizePt * 0.7f;
        f.bold = bold;
        f.italic = italic;
        return f;
    }

    bool operator==(const RunStyle& o) const {
        return family == o.family && sizePt == o.sizePt && bold == o.bold &&
               italic == o.italic && underline == o.underline && strike == o.strike &&
               script == o.script && color == o.color &&
               highlighted == o.highlighted && (!highlighted || highlight == o.highlight);
    }
    bool operator!=(const RunStyle& o) const { return !(*this == o); }
};

/// Lower-case family name as used by the PDF and JSON writers
const char* familyName(FontFamily family);

} // namespace docprint
