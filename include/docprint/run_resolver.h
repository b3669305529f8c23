#pragma once

#include "docprint/document.h"
#include "docprint/style.h"
#include <optional>
#include <string>
#include <vector>

namespace docprint {

/// An inline run after all style inheritance is applied. Text is never empty.
struct ResolvedRun {
    std::string text;
    RunStyle style;
};

/// Block-level defaults and forced flags handed to the resolver
struct BlockDefaults {
    FontFamily family = FontFamily::Helvetica;
    float sizePt = 12.0f;
    bool forceBold = false;       // Headings
    bool forceItalic = false;     // Blockquotes
    bool forceMonospace = false;  // Code blocks
};

// Per-field resolution: explicit mark value if it parses, otherwise the
// inherited value. Unparseable values are logged and ignored.

/// Map a CSS font-family list to the nearest output family
std::optional<FontFamily> lookupFontFamily(const std::string& cssFamily);

/// Parse "14pt", "16px" (x0.75) or "12" into points
std::optional<float> parseFontSize(const std::string& size);

/// Parse "#rgb", "#rrggbb", "rgb(r, g, b)" or a basic color name
std::optional<Rgb> parseColor(const std::string& color);

FontFamily resolveFamily(FontFamily inherited, const std::optional<std::string>& override);
float resolveSize(float inherited, const std::optional<std::string>& override);
Rgb resolveColor(const Rgb& inherited, const std::optional<std::string>& override);

/// Merge one inline run's marks over an inherited style
RunStyle merge(const RunStyle& inherited, const InlineRun& run);

/// Walks a block's inline content and produces resolved runs.
/// Resolution order: document default -> block default -> mark override.
class RunResolver {
public:
    explicit RunResolver(const BlockDefaults& defaults);

    std::vector<ResolvedRun> resolve(const std::vector<InlineRun>& inlines) const;

    /// Style every run of this block starts from
    const RunStyle& baseStyle() const { return base_; }

private:
    BlockDefaults defaults_;
    RunStyle base_;
};

} // namespace docprint
