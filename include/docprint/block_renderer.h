#pragma once

#include "docprint/config.h"
#include "docprint/document.h"
#include "docprint/emitter.h"
#include "docprint/line_breaker.h"
#include "docprint/metrics.h"
#include "docprint/paginator.h"
#include "docprint/run_resolver.h"
#include <string>
#include <vector>

namespace docprint {

/// Layout constants. Sizes in points, distances in millimeters.
struct BlockMetrics {
    static constexpr float kHeading1Pt = 24.0f;
    static constexpr float kHeading2Pt = 18.0f;
    static constexpr float kHeading3Pt = 14.0f;
    static constexpr float kTitlePt = 18.0f;

    static constexpr float kListIndentMm = 6.0f;
    static constexpr float kQuoteIndentMm = 6.0f;
    static constexpr float kQuoteRuleOffsetMm = 2.0f;
    static constexpr float kQuoteRuleWidthMm = 0.5f;
    static constexpr float kCodePaddingMm = 2.0f;   // Shrinks on very narrow columns
    static constexpr float kCodeSizeFactor = 0.9f;
    static constexpr float kRuleGapMm = 4.0f;
    static constexpr float kRuleWidthMm = 0.3f;
    static constexpr float kMinTextWidthMm = 20.0f;  // Nesting never narrows text further

    // Fractions of the block's own line height
    static constexpr float kParagraphGap = 0.5f;
    static constexpr float kHeadingGapAbove = 0.6f;
    static constexpr float kHeadingGapBelow = 0.3f;
};

/// State inherited from enclosing containers
struct BlockContext {
    float indentMm = 0;       // Added to the left margin; additive across nesting
    bool italic = false;      // Set inside blockquotes
};

/// Renders blocks onto the paginator's pages through a DrawSink.
/// One instance per render call.
class BlockRenderer {
public:
    BlockRenderer(const MetricProvider& metrics,
                  const PageConfig& config,
                  const RenderOptions& options,
                  DrawSink& sink);

    /// Render a sequence of sibling blocks
    void renderBlocks(const std::vector<Block>& blocks, const BlockContext& ctx,
                      Paginator& paginator);

    /// Render one block and its children
    void render(const Block& block, const BlockContext& ctx, Paginator& paginator,
                const Block* next = nullptr);

    /// Document title line above the content
    void renderTitle(const std::string& title, Paginator& paginator);

    /// Height of the first visual line `block` would produce, including the
    /// space placed above it. Used to keep headings with what follows.
    float firstLineHeight(const Block& block, const BlockContext& ctx) const;

    /// Visual lines for a text block, without drawing
    std::vector<VisualLine> layoutText(const Block& block, const BlockContext& ctx,
                                       const std::string& prefix = "") const;

    BlockDefaults defaultsFor(const Block& block, const BlockContext& ctx) const;

private:
    const MetricProvider& metrics_;
    const PageConfig& config_;
    DrawSink& sink_;
    FontFamily baseFamily_;
    float baseSizePt_;

    void renderHeading(const Block& block, const BlockContext& ctx, Paginator& paginator,
                       const Block* next);
    void renderParagraph(const Block& block, const BlockContext& ctx, Paginator& paginator,
                         const std::string& prefix = "");
    void renderList(const Block& block, const BlockContext& ctx, Paginator& paginator);
    void renderListItem(const Block& item, const BlockContext& ctx, Paginator& paginator,
                        const std::string& marker);
    void renderBlockquote(const Block& block, const BlockContext& ctx, Paginator& paginator);
    void renderCodeBlock(const Block& block, const BlockContext& ctx, Paginator& paginator);
    void renderHorizontalRule(const BlockContext& ctx, Paginator& paginator);

    /// Place lines one at a time, breaking pages between lines
    void placeLines(const std::vector<VisualLine>& lines, const BlockContext& ctx,
                    const RunStyle& baseStyle, Paginator& paginator);

    /// Draw a line whose box starts at `top`
    void drawLine(const VisualLine& line, float originX, float availableWidth,
                  float top, const RunStyle& baseStyle);
    void drawDecorations(const RunStyle& style, float x, float width,
                         float baseline, float lineBottom);

    float effectiveIndent(const BlockContext& ctx) const;
    float originX(const BlockContext& ctx) const;
    float availableWidth(const BlockContext& ctx) const;
    float codePadding(const BlockContext& ctx) const;
    float baseLineHeight() const;
};

} // namespace docprint
