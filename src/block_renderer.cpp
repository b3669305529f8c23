#include "docprint/block_renderer.h"
#include "docprint/log.h"
#include <algorithm>

namespace docprint {

namespace {

const Rgb kCodeBackground{242, 242, 242};
const Rgb kQuoteRuleColor{170, 170, 170};
const Rgb kRuleColor{128, 128, 128};

const char* const kBulletMarker = "\xe2\x80\xa2 ";  // "• "

float headingSize(int level) {
    switch (std::clamp(level, 1, 3)) {
        case 1:  return BlockMetrics::kHeading1Pt;
        case 2:  return BlockMetrics::kHeading2Pt;
        default: return BlockMetrics::kHeading3Pt;
    }
}

float totalHeight(const std::vector<VisualLine>& lines) {
    float height = 0;
    for (const auto& line : lines) {
        height += line.heightMm;
    }
    return height;
}

bool takesListMarker(const Block& block) {
    return block.kind == BlockKind::Paragraph || block.kind == BlockKind::Heading;
}

} // anonymous namespace

BlockRenderer::BlockRenderer(const MetricProvider& metrics,
                             const PageConfig& config,
                             const RenderOptions& options,
                             DrawSink& sink)
    : metrics_(metrics)
    , config_(config)
    , sink_(sink)
    , baseFamily_(lookupFontFamily(options.fontFamily).value_or(FontFamily::Helvetica))
    , baseSizePt_(options.baseFontSizePt > 0 ? options.baseFontSizePt : 12.0f) {}

// ---------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------

void BlockRenderer::renderBlocks(const std::vector<Block>& blocks, const BlockContext& ctx,
                                 Paginator& paginator) {
    for (size_t i = 0; i < blocks.size(); ++i) {
        const Block* next = (i + 1 < blocks.size()) ? &blocks[i + 1] : nullptr;
        render(blocks[i], ctx, paginator, next);
    }
}

void BlockRenderer::render(const Block& block, const BlockContext& ctx, Paginator& paginator,
                           const Block* next) {
    DP_LOGD("render: kind=%d page=%d offset=%.2f indent=%.1f",
            static_cast<int>(block.kind), paginator.cursor().pageIndex,
            paginator.cursor().offsetMm, ctx.indentMm);

    switch (block.kind) {
        case BlockKind::Heading:
            renderHeading(block, ctx, paginator, next);
            break;
        case BlockKind::Paragraph:
            renderParagraph(block, ctx, paginator);
            break;
        case BlockKind::BulletList:
        case BlockKind::OrderedList:
            renderList(block, ctx, paginator);
            break;
        case BlockKind::ListItem:
            // Outside a list there is no marker to draw
            renderListItem(block, ctx, paginator, "");
            break;
        case BlockKind::Blockquote:
            renderBlockquote(block, ctx, paginator);
            break;
        case BlockKind::CodeBlock:
            renderCodeBlock(block, ctx, paginator);
            break;
        case BlockKind::HorizontalRule:
            renderHorizontalRule(ctx, paginator);
            break;
        case BlockKind::Unknown:
            if (!block.children.empty()) {
                renderBlocks(block.children, ctx, paginator);
            } else {
                DP_LOGD("render: skipping unknown leaf node '%s'", block.typeName.c_str());
            }
            break;
    }
}

// ---------------------------------------------------------------
// Layout helpers
// ---------------------------------------------------------------

BlockDefaults BlockRenderer::defaultsFor(const Block& block, const BlockContext& ctx) const {
    BlockDefaults defaults;
    defaults.family = baseFamily_;
    defaults.sizePt = baseSizePt_;
    defaults.forceItalic = ctx.italic;

    switch (block.kind) {
        case BlockKind::Heading:
            defaults.sizePt = headingSize(block.level);
            defaults.forceBold = true;
            break;
        case BlockKind::CodeBlock:
            defaults.sizePt = baseSizePt_ * BlockMetrics::kCodeSizeFactor;
            defaults.forceMonospace = true;
            break;
        case BlockKind::Paragraph:
        case BlockKind::BulletList:
        case BlockKind::OrderedList:
        case BlockKind::ListItem:
        case BlockKind::Blockquote:
        case BlockKind::HorizontalRule:
        case BlockKind::Unknown:
            break;
    }
    return defaults;
}

std::vector<VisualLine> BlockRenderer::layoutText(const Block& block, const BlockContext& ctx,
                                                  const std::string& prefix) const {
    RunResolver resolver(defaultsFor(block, ctx));
    auto runs = resolver.resolve(block.inlines);

    float width = availableWidth(ctx);
    TextAlign align = block.align;
    if (block.kind == BlockKind::CodeBlock) {
        width -= 2.0f * codePadding(ctx);
        align = TextAlign::Left;
    }

    LineBreaker breaker(metrics_, config_.lineSpacingMultiplier);
    return breaker.breakLines(runs, width, prefix, align);
}

float BlockRenderer::effectiveIndent(const BlockContext& ctx) const {
    // Deep nesting stops indenting once the text width would drop below the minimum
    float maxIndent = std::max(0.0f, config_.contentWidth() - BlockMetrics::kMinTextWidthMm);
    return std::min(ctx.indentMm, maxIndent);
}

float BlockRenderer::originX(const BlockContext& ctx) const {
    return config_.marginMm + effectiveIndent(ctx);
}

float BlockRenderer::availableWidth(const BlockContext& ctx) const {
    return config_.contentWidth() - effectiveIndent(ctx);
}

float BlockRenderer::codePadding(const BlockContext& ctx) const {
    return std::min(BlockMetrics::kCodePaddingMm, availableWidth(ctx) / 4.0f);
}

float BlockRenderer::baseLineHeight() const {
    return metrics_.lineHeight(baseSizePt_, config_.lineSpacingMultiplier);
}

float BlockRenderer::firstLineHeight(const Block& block, const BlockContext& ctx) const {
    switch (block.kind) {
        case BlockKind::Heading:
        case BlockKind::Paragraph: {
            float lineHeight = metrics_.lineHeight(defaultsFor(block, ctx).sizePt,
                                                   config_.lineSpacingMultiplier);
            auto lines = layoutText(block, ctx);
            float first = lines.empty() ? lineHeight : lines.front().heightMm;
            if (block.kind == BlockKind::Heading) {
                first += BlockMetrics::kHeadingGapAbove * lineHeight;
            }
            return first;
        }
        case BlockKind::CodeBlock: {
            auto lines = layoutText(block, ctx);
            float first = lines.empty()
                ? metrics_.lineHeight(defaultsFor(block, ctx).sizePt, config_.lineSpacingMultiplier)
                : lines.front().heightMm;
            return first + 2.0f * codePadding(ctx);
        }
        case BlockKind::HorizontalRule:
            return 2.0f * BlockMetrics::kRuleGapMm + BlockMetrics::kRuleWidthMm;
        case BlockKind::BulletList:
        case BlockKind::OrderedList:
        case BlockKind::ListItem: {
            if (block.children.empty()) return 0;
            BlockContext childCtx = ctx;
            if (block.kind == BlockKind::ListItem) childCtx.indentMm += BlockMetrics::kListIndentMm;
            return firstLineHeight(block.children.front(), childCtx);
        }
        case BlockKind::Blockquote: {
            if (block.children.empty()) return 0;
            BlockContext childCtx = ctx;
            childCtx.indentMm += BlockMetrics::kQuoteIndentMm;
            childCtx.italic = true;
            return firstLineHeight(block.children.front(), childCtx);
        }
        case BlockKind::Unknown:
            if (block.children.empty()) return 0;
            return firstLineHeight(block.children.front(), ctx);
    }
    return 0;
}

// ---------------------------------------------------------------
// Text blocks
// ---------------------------------------------------------------

void BlockRenderer::renderTitle(const std::string& title, Paginator& paginator) {
    BlockDefaults defaults;
    defaults.family = baseFamily_;
    defaults.sizePt = BlockMetrics::kTitlePt;
    defaults.forceBold = true;

    RunResolver resolver(defaults);
    auto runs = resolver.resolve({InlineRun::plain(title)});
    LineBreaker breaker(metrics_, config_.lineSpacingMultiplier);
    auto lines = breaker.breakLines(runs, availableWidth(BlockContext{}));

    placeLines(lines, BlockContext{}, resolver.baseStyle(), paginator);
    paginator.advance(BlockMetrics::kHeadingGapBelow *
                      metrics_.lineHeight(defaults.sizePt, config_.lineSpacingMultiplier));
}

void BlockRenderer::renderHeading(const Block& block, const BlockContext& ctx,
                                  Paginator& paginator, const Block* next) {
    if (block.level < 1 || block.level > 3) {
        DP_LOGW("renderHeading: level %d outside 1..3, clamped", block.level);
    }

    RunResolver resolver(defaultsFor(block, ctx));
    auto lines = layoutText(block, ctx);
    float lineHeight = metrics_.lineHeight(resolver.baseStyle().sizePt,
                                           config_.lineSpacingMultiplier);
    float gapAbove = BlockMetrics::kHeadingGapAbove * lineHeight;
    float gapBelow = BlockMetrics::kHeadingGapBelow * lineHeight;

    // The heading and the first line after it go on the same page
    float keep = (lines.empty() ? lineHeight : totalHeight(lines)) + gapBelow;
    if (next) keep += firstLineHeight(*next, ctx);

    if (!paginator.atPageTop()) {
        paginator.requestSpace(gapAbove + keep);
    }
    if (!paginator.atPageTop()) {
        paginator.advance(gapAbove);
    } else {
        paginator.requestSpace(keep);
    }

    if (lines.empty()) {
        paginator.advance(lineHeight);
    } else {
        placeLines(lines, ctx, resolver.baseStyle(), paginator);
    }
    paginator.advance(gapBelow);
}

void BlockRenderer::renderParagraph(const Block& block, const BlockContext& ctx,
                                    Paginator& paginator, const std::string& prefix) {
    RunResolver resolver(defaultsFor(block, ctx));
    auto lines = layoutText(block, ctx, prefix);

    if (lines.empty()) {
        // An empty paragraph still takes one line
        float lineHeight = metrics_.lineHeight(resolver.baseStyle().sizePt,
                                               config_.lineSpacingMultiplier);
        paginator.requestSpace(lineHeight);
        if (!prefix.empty()) {
            VisualLine markerOnly;
            markerOnly.prefix = prefix;
            markerOnly.heightMm = lineHeight;
            markerOnly.maxSizePt = resolver.baseStyle().sizePt;
            drawLine(markerOnly, originX(ctx), availableWidth(ctx),
                     paginator.cursor().offsetMm, resolver.baseStyle());
        }
        paginator.advance(lineHeight);
    } else {
        placeLines(lines, ctx, resolver.baseStyle(), paginator);
    }

    paginator.advance(BlockMetrics::kParagraphGap * baseLineHeight());
}

// ---------------------------------------------------------------
// Containers
// ---------------------------------------------------------------

void BlockRenderer::renderList(const Block& block, const BlockContext& ctx, Paginator& paginator) {
    bool ordered = block.kind == BlockKind::OrderedList;
    int counter = ordered ? block.start : 0;

    // validateDocument guarantees every child is a list item
    for (const auto& item : block.children) {
        std::string marker = ordered ? std::to_string(counter++) + ". " : kBulletMarker;
        renderListItem(item, ctx, paginator, marker);
    }
}

void BlockRenderer::renderListItem(const Block& item, const BlockContext& ctx,
                                   Paginator& paginator, const std::string& marker) {
    BlockContext childCtx = ctx;
    childCtx.indentMm += BlockMetrics::kListIndentMm;

    std::string pendingMarker = marker;
    if (!pendingMarker.empty() &&
        (item.children.empty() || !takesListMarker(item.children.front()))) {
        // Nothing to attach the marker to: give it a line of its own
        renderParagraph(Block::paragraph(std::vector<InlineRun>{}), childCtx, paginator,
                        pendingMarker);
        pendingMarker.clear();
    }

    for (size_t i = 0; i < item.children.size(); ++i) {
        const auto& child = item.children[i];
        if (!pendingMarker.empty()) {
            // A heading here keeps its own size and weight but is placed
            // like a paragraph so the marker can lead it
            renderParagraph(child, childCtx, paginator, pendingMarker);
            pendingMarker.clear();
            continue;
        }
        const Block* next = (i + 1 < item.children.size()) ? &item.children[i + 1] : nullptr;
        render(child, childCtx, paginator, next);
    }
}

void BlockRenderer::renderBlockquote(const Block& block, const BlockContext& ctx,
                                     Paginator& paginator) {
    BlockContext childCtx = ctx;
    childCtx.indentMm += BlockMetrics::kQuoteIndentMm;
    childCtx.italic = true;

    float ruleX = originX(ctx) + BlockMetrics::kQuoteRuleOffsetMm;
    DrawSink& sink = sink_;
    paginator.openSpan([&sink, ruleX](float top, float bottom) {
        sink.drawLine(ruleX, top, ruleX, bottom, BlockMetrics::kQuoteRuleWidthMm, kQuoteRuleColor);
    });
    renderBlocks(block.children, childCtx, paginator);
    paginator.closeSpan();
}

// ---------------------------------------------------------------
// Code and rules
// ---------------------------------------------------------------

void BlockRenderer::renderCodeBlock(const Block& block, const BlockContext& ctx,
                                    Paginator& paginator) {
    RunResolver resolver(defaultsFor(block, ctx));
    auto lines = layoutText(block, ctx);
    const float padding = codePadding(ctx);
    const float x = originX(ctx);
    const float width = availableWidth(ctx);

    if (lines.empty()) {
        float lineHeight = metrics_.lineHeight(resolver.baseStyle().sizePt,
                                               config_.lineSpacingMultiplier);
        paginator.requestSpace(lineHeight + 2.0f * padding);
        float top = paginator.cursor().offsetMm;
        sink_.fillRect(x, top, width,
                       std::min(lineHeight + 2.0f * padding, config_.bottomLimit() - top),
                       kCodeBackground);
        paginator.advance(lineHeight + 2.0f * padding);
    }

    // The background is never split: each page gets its own rectangle
    // sized to the lines placed on it.
    size_t i = 0;
    while (i < lines.size()) {
        paginator.requestSpace(lines[i].heightMm + 2.0f * padding);

        float room = paginator.remainingHeight() - 2.0f * padding;
        float chunkHeight = 0;
        size_t end = i;
        while (end < lines.size() && chunkHeight + lines[end].heightMm <= room + 0.001f) {
            chunkHeight += lines[end].heightMm;
            ++end;
        }
        if (end == i) {
            chunkHeight = lines[i].heightMm;
            end = i + 1;
        }

        float top = paginator.cursor().offsetMm;
        sink_.fillRect(x, top, width,
                       std::min(chunkHeight + 2.0f * padding, config_.bottomLimit() - top),
                       kCodeBackground);

        float lineTop = top + padding;
        for (size_t j = i; j < end; ++j) {
            drawLine(lines[j], x + padding, width - 2.0f * padding, lineTop, resolver.baseStyle());
            lineTop += lines[j].heightMm;
        }
        paginator.advance(chunkHeight + 2.0f * padding);
        i = end;
    }

    paginator.advance(BlockMetrics::kParagraphGap * baseLineHeight());
}

void BlockRenderer::renderHorizontalRule(const BlockContext& ctx, Paginator& paginator) {
    float height = 2.0f * BlockMetrics::kRuleGapMm + BlockMetrics::kRuleWidthMm;
    paginator.requestSpace(height);

    float y = std::min(paginator.cursor().offsetMm + BlockMetrics::kRuleGapMm +
                           BlockMetrics::kRuleWidthMm / 2.0f,
                       config_.bottomLimit());
    float x = originX(ctx);
    sink_.drawLine(x, y, x + availableWidth(ctx), y, BlockMetrics::kRuleWidthMm, kRuleColor);
    paginator.advance(height);
}

// ---------------------------------------------------------------
// Line drawing
// ---------------------------------------------------------------

void BlockRenderer::placeLines(const std::vector<VisualLine>& lines, const BlockContext& ctx,
                               const RunStyle& baseStyle, Paginator& paginator) {
    for (const auto& line : lines) {
        paginator.requestSpace(line.heightMm);
        drawLine(line, originX(ctx), availableWidth(ctx), paginator.cursor().offsetMm, baseStyle);
        paginator.advance(line.heightMm);
    }
}

void BlockRenderer::drawLine(const VisualLine& line, float lineX, float width,
                             float top, const RunStyle& baseStyle) {
    FontSpec lineFont;
    lineFont.sizePt = line.maxSizePt;
    // A line taller than the page is cut off at the bottom limit
    float lineBottom = std::min(top + line.heightMm, config_.bottomLimit());
    float baseline = std::min(top + metrics_.ascent(lineFont), lineBottom);

    // Trailing spaces and line breaks are kept in the slices but not drawn
    std::string lineText = line.text();
    size_t visible = line.slices.empty() ? 0
        : line.slices.front().begin + linebreak::trimTrailingSpace(lineText, 0, lineText.size());

    if (line.align == TextAlign::Left) {
        float x = lineX;
        if (!line.prefix.empty()) {
            FontSpec markerFont = baseStyle.font();
            float markerWidth = metrics_.measure(line.prefix, markerFont);
            sink_.drawText(line.prefix, x, baseline, markerFont, baseStyle.color, markerWidth);
            x += markerWidth;
        }

        for (const auto& slice : line.slices) {
            size_t cut = std::min(slice.end, visible);
            if (cut <= slice.begin) continue;
            std::string text = slice.run.text.substr(0, cut - slice.begin);
            const RunStyle& style = slice.run.style;
            FontSpec font = style.font();
            float advance = metrics_.measure(text, font);

            if (style.highlighted) {
                sink_.fillRect(x, top, advance, lineBottom - top, style.highlight);
            }

            float y = baseline;
            if (style.script == Script::Super) {
                y -= style.sizePt * kPtToMm * 0.33f;
            } else if (style.script == Script::Sub) {
                y = std::min(y + style.sizePt * kPtToMm * 0.2f, lineBottom);
            }
            sink_.drawText(text, x, y, font, style.color, advance);
            drawDecorations(style, x, advance, baseline, lineBottom);
            x += advance;
        }
        return;
    }

    // Center, right and justify draw the line as one unit in its dominant style
    const RunStyle& style = line.slices.empty() ? baseStyle : line.dominantStyle();
    std::string text = line.prefix;
    if (!line.slices.empty()) {
        text += lineText.substr(0, visible - line.slices.front().begin);
    }
    if (text.empty()) return;

    FontSpec font = style.font();
    float advance = metrics_.measure(text, font);
    float extra = std::max(0.0f, width - advance);
    float x = lineX;
    switch (line.align) {
        case TextAlign::Center:
            x += extra / 2.0f;
            break;
        case TextAlign::Right:
            x += extra;
            break;
        case TextAlign::Left:
        case TextAlign::Justify:
            break;
    }

    if (style.highlighted) {
        sink_.fillRect(x, top, advance, lineBottom - top, style.highlight);
    }
    sink_.drawText(text, x, baseline, font, style.color, advance);
    drawDecorations(style, x, advance, baseline, lineBottom);
}

void BlockRenderer::drawDecorations(const RunStyle& style, float x, float width,
                                    float baseline, float lineBottom) {
    float sizeMm = style.font().sizePt * kPtToMm;
    float stroke = std::max(0.1f, sizeMm * 0.05f);
    if (style.underline) {
        float y = std::min(baseline + sizeMm * 0.12f, lineBottom);
        sink_.drawLine(x, y, x + width, y, stroke, style.color);
    }
    if (style.strike) {
        float y = baseline - sizeMm * 0.28f;
        sink_.drawLine(x, y, x + width, y, stroke, style.color);
    }
}

} // namespace docprint
