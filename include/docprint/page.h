#pragma once

#include "docprint/style.h"
#include <string>
#include <vector>

namespace docprint {

/// Primitive draw operations understood by every output sink
enum class DrawKind {
    Text,   // text at (x, y) with font and color; y is the baseline
    Rect,   // filled rectangle (x, y) - (x + width, y + height)
    Line,   // segment (x, y) - (x2, y2) with lineWidth
};

/// One positioned draw instruction. Coordinates are millimeters from the
/// top-left corner of the page.
struct DrawInstruction {
    DrawKind kind = DrawKind::Text;
    float x = 0;
    float y = 0;
    float width = 0;       // Rect; measured advance for Text
    float height = 0;      // Rect
    float x2 = 0;          // Line end
    float y2 = 0;
    float lineWidth = 0;   // Line stroke
    std::string text;      // Text
    FontSpec font;         // Text
    Rgb color;             // Fill, stroke or text color

    bool operator==(const DrawInstruction& o) const {
        return kind == o.kind && x == o.x && y == o.y && width == o.width &&
               height == o.height && x2 == o.x2 && y2 == o.y2 &&
               lineWidth == o.lineWidth && text == o.text && font == o.font &&
               color == o.color;
    }
};

/// A single laid-out page
struct Page {
    int pageIndex = 1;     // 1-based
    std::vector<DrawInstruction> instructions;
};

/// The paginated output of one render call
struct OutputArtifact {
    float pageWidthMm = 0;
    float pageHeightMm = 0;
    std::vector<Page> pages;

    /// All text instructions in page order
    std::vector<const DrawInstruction*> textInstructions() const {
        std::vector<const DrawInstruction*> result;
        for (const auto& page : pages) {
            for (const auto& ins : page.instructions) {
                if (ins.kind == DrawKind::Text) result.push_back(&ins);
            }
        }
        return result;
    }
};

} // namespace docprint
