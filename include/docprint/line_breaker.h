#pragma once

#include "docprint/document.h"
#include "docprint/metrics.h"
#include "docprint/run_resolver.h"
#include <string>
#include <vector>

namespace docprint {

/// A piece of a resolved run placed on one visual line
struct LineSlice {
    ResolvedRun run;     // Style of the source run, text cut to this line
    size_t begin = 0;    // Byte range in the block's logical string
    size_t end = 0;
};

/// One line of laid-out text
struct VisualLine {
    std::vector<LineSlice> slices;
    std::string prefix;          // List marker, first line of an item only
    float widthMm = 0;           // Measured width, trailing whitespace excluded
    float heightMm = 0;          // max(size) * 0.38 * lineSpacing
    float maxSizePt = 0;
    TextAlign align = TextAlign::Left;

    /// Concatenated slice text
    std::string text() const {
        std::string result;
        for (const auto& slice : slices) {
            result += slice.run.text;
        }
        return result;
    }

    /// Style of the largest run on the line (first wins ties)
    const RunStyle& dominantStyle() const;
};

namespace linebreak {

/// Byte positions just after each break opportunity in text.
/// Breaks follow ASCII space, tab and CR, and U+2000..U+200A; NBSP does not break.
std::vector<size_t> findBreakPoints(const std::string& text, size_t begin, size_t end);

/// End of [begin, end) with trailing whitespace and line breaks removed
size_t trimTrailingSpace(const std::string& text, size_t begin, size_t end);

/// Index of the run with the largest font size (first wins ties)
size_t dominantRun(const std::vector<ResolvedRun>& runs);

} // namespace linebreak

/// Greedy word wrap over a sequence of styled runs.
/// The concatenated text of the returned lines equals the concatenated run
/// text: runs crossing a break are split, nothing is dropped.
class LineBreaker {
public:
    LineBreaker(const MetricProvider& metrics, float lineSpacing);

    /// Break runs into lines no wider than contentWidth (mm), measured with
    /// the dominant font. A word wider than the line is emitted alone.
    /// '\n' forces a break. Throws ConfigurationError if contentWidth <= 0.
    std::vector<VisualLine> breakLines(const std::vector<ResolvedRun>& runs,
                                       float contentWidth,
                                       const std::string& prefix = "",
                                       TextAlign align = TextAlign::Left) const;

private:
    const MetricProvider& metrics_;
    float lineSpacing_;

    VisualLine buildLine(const std::vector<ResolvedRun>& runs,
                         const std::vector<size_t>& runOffsets,
                         const std::string& logical,
                         size_t begin, size_t end) const;
};

} // namespace docprint
