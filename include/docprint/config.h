#pragma once

#include "docprint/metrics.h"
#include "docprint/style.h"
#include <memory>
#include <optional>
#include <string>

namespace docprint {

/// Named page sizes offered by the export dialog
enum class PageProfile {
    A4,       // 210 x 297
    A5,       // 148 x 210
    Letter,   // 215.9 x 279.4
    Legal,    // 215.9 x 355.6
    Custom,
};

/// Page geometry in millimeters
struct PageConfig {
    float pageWidthMm = 210.0f;
    float pageHeightMm = 297.0f;
    float marginMm = 25.4f;               // Uniform on all four sides
    float lineSpacingMultiplier = 1.15f;

    /// Width available to text
    float contentWidth() const { return pageWidthMm - 2.0f * marginMm; }

    /// Lowest y any drawing may reach
    float bottomLimit() const { return pageHeightMm - marginMm; }
};

/// Geometry of a named profile with default margin and spacing.
/// Custom returns the A4 defaults; callers then set the size.
PageConfig pageConfigFor(PageProfile profile);

/// "a4", "a5", "letter", "legal" (case-insensitive)
std::optional<PageProfile> parsePageProfile(const std::string& name);

/// Throws ConfigurationError for non-positive sizes, negative margins,
/// margins that leave no content area, or a non-positive line spacing.
void validatePageConfig(const PageConfig& config);

/// Render-wide typographic defaults
struct RenderOptions {
    std::string title;                    // Drawn above the content when not empty
    float baseFontSizePt = 12.0f;
    std::string fontFamily = "helvetica"; // CSS family name, mapped like inline marks
    /// Measurement source; StandardFontMetrics when null
    std::shared_ptr<const MetricProvider> metrics;
};

} // namespace docprint
