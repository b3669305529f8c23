#pragma once

#include "docprint/config.h"
#include "docprint/emitter.h"
#include <functional>
#include <vector>

namespace docprint {

/// Current write position. Offsets are measured from the top edge of the page.
struct PageCursor {
    int pageIndex = 1;     // 1-based
    float offsetMm = 0;
};

/// Owns the vertical cursor of one render and decides page breaks.
/// Passed by reference through every renderer call; never shared
/// between renders.
class Paginator {
public:
    /// Decoration drawn along a vertical span of the current page,
    /// e.g. a blockquote rule. Called with the span's top and bottom.
    using SpanPainter = std::function<void(float topMm, float bottomMm)>;

    Paginator(const PageConfig& config, DrawSink& sink);

    /// Open page 1 on the sink. Must be called once before anything else.
    void start();

    /// Ensure the next `height` mm fit on the current page, breaking to a
    /// new page if they do not. Returns true when the height fits now;
    /// false only if it exceeds an entire fresh page (the caller proceeds
    /// on the fresh page).
    bool requestSpace(float height);

    /// Move the cursor down. The offset never passes the bottom limit.
    void advance(float height);

    /// Unconditional page break
    void breakPage();

    const PageCursor& cursor() const { return cursor_; }
    float top() const;
    float bottom() const;
    float remainingHeight() const { return bottom() - cursor_.offsetMm; }
    bool atPageTop() const;
    int pageCount() const { return cursor_.pageIndex; }

    /// Start a decoration that follows content down the page and across
    /// page breaks. On each break the painter draws the part on the
    /// finished page; closeSpan() draws the last part.
    void openSpan(SpanPainter painter);
    void closeSpan();

private:
    struct OpenSpan {
        SpanPainter painter;
        float startMm = 0;
    };

    const PageConfig& config_;
    DrawSink& sink_;
    PageCursor cursor_;
    std::vector<OpenSpan> spans_;
};

} // namespace docprint
