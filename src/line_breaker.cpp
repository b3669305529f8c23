#include "docprint/line_breaker.h"
#include "docprint/errors.h"
#include "docprint/log.h"
#include <algorithm>

namespace docprint {

namespace {

/// Unicode spaces U+2000..U+200A (E2 80 80..8A), which allow a break
bool isUnicodeSpace(const std::string& text, size_t pos) {
    if (pos + 2 >= text.size()) return false;
    unsigned char b0 = static_cast<unsigned char>(text[pos]);
    unsigned char b1 = static_cast<unsigned char>(text[pos + 1]);
    unsigned char b2 = static_cast<unsigned char>(text[pos + 2]);
    return b0 == 0xE2 && b1 == 0x80 && b2 >= 0x80 && b2 <= 0x8A;
}

bool isAsciiSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

} // anonymous namespace

const RunStyle& VisualLine::dominantStyle() const {
    static const RunStyle kDefault;
    if (slices.empty()) return kDefault;
    size_t best = 0;
    for (size_t i = 1; i < slices.size(); ++i) {
        if (slices[i].run.style.sizePt > slices[best].run.style.sizePt) best = i;
    }
    return slices[best].run.style;
}

namespace linebreak {

std::vector<size_t> findBreakPoints(const std::string& text, size_t begin, size_t end) {
    std::vector<size_t> points;
    size_t i = begin;
    while (i < end) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        size_t charLen = utf8::charLen(c);
        if (i + charLen > end) break;
        size_t nextI = i + charLen;

        if (c == ' ' || c == '\t' || c == '\r') {
            points.push_back(nextI);
        } else if (isUnicodeSpace(text, i)) {
            points.push_back(nextI);
        }
        i = nextI;
    }
    return points;
}

size_t trimTrailingSpace(const std::string& text, size_t begin, size_t end) {
    while (end > begin) {
        if (isAsciiSpace(text[end - 1])) {
            --end;
        } else if (end - begin >= 3 && isUnicodeSpace(text, end - 3)) {
            end -= 3;
        } else {
            break;
        }
    }
    return end;
}

size_t dominantRun(const std::vector<ResolvedRun>& runs) {
    size_t best = 0;
    for (size_t i = 1; i < runs.size(); ++i) {
        if (runs[i].style.sizePt > runs[best].style.sizePt) best = i;
    }
    return best;
}

} // namespace linebreak

LineBreaker::LineBreaker(const MetricProvider& metrics, float lineSpacing)
    : metrics_(metrics), lineSpacing_(lineSpacing) {}

std::vector<VisualLine> LineBreaker::breakLines(const std::vector<ResolvedRun>& runs,
                                                float contentWidth,
                                                const std::string& prefix,
                                                TextAlign align) const {
    if (!(contentWidth > 0)) {
        throw ConfigurationError("line breaker: content width must be positive, got " +
                                 std::to_string(contentWidth));
    }

    std::vector<VisualLine> lines;
    if (runs.empty()) return lines;

    // One logical string; runOffsets[i] is where run i starts in it
    std::string logical;
    std::vector<size_t> runOffsets;
    runOffsets.reserve(runs.size());
    for (const auto& run : runs) {
        runOffsets.push_back(logical.size());
        logical += run.text;
    }

    // Wrap at the full size of the dominant run: a leading super/subscript
    // run must not shrink the measure for the rest of the block
    RunStyle wrapStyle = runs[linebreak::dominantRun(runs)].style;
    wrapStyle.script = Script::Normal;
    FontSpec wrapFont = wrapStyle.font();

    std::vector<std::pair<size_t, size_t>> ranges;
    size_t lineStart = 0;
    while (lineStart < logical.size()) {
        // Hard breaks bound the segment the greedy pass may use
        size_t newline = logical.find('\n', lineStart);
        size_t segEnd = (newline == std::string::npos) ? logical.size() : newline + 1;

        auto candidates = linebreak::findBreakPoints(logical, lineStart, segEnd);
        if (candidates.empty() || candidates.back() != segEnd) {
            candidates.push_back(segEnd);
        }

        size_t lineEnd = 0;
        for (size_t candidate : candidates) {
            size_t visibleEnd = linebreak::trimTrailingSpace(logical, lineStart, candidate);
            float width = metrics_.measure(
                logical.substr(lineStart, visibleEnd - lineStart), wrapFont);
            if (width <= contentWidth) {
                lineEnd = candidate;
            } else {
                break;
            }
        }

        if (lineEnd == 0) {
            // First word alone is too wide: emit it unsplit
            lineEnd = candidates.front();
            DP_LOGD("breakLines: overwide word at %zu..%zu", lineStart, lineEnd);
        }

        ranges.emplace_back(lineStart, lineEnd);
        lineStart = lineEnd;
    }

    lines.reserve(ranges.size());
    for (const auto& range : ranges) {
        VisualLine line = buildLine(runs, runOffsets, logical, range.first, range.second);
        line.align = align;
        lines.push_back(std::move(line));
    }
    lines.front().prefix = prefix;

    DP_LOGD("breakLines: runs=%zu bytes=%zu width=%.2f lines=%zu",
            runs.size(), logical.size(), contentWidth, lines.size());
    return lines;
}

VisualLine LineBreaker::buildLine(const std::vector<ResolvedRun>& runs,
                                  const std::vector<size_t>& runOffsets,
                                  const std::string& logical,
                                  size_t begin, size_t end) const {
    VisualLine line;
    size_t visibleEnd = linebreak::trimTrailingSpace(logical, begin, end);

    for (size_t i = 0; i < runs.size(); ++i) {
        size_t runBegin = runOffsets[i];
        size_t runEnd = runBegin + runs[i].text.size();
        size_t from = std::max(begin, runBegin);
        size_t to = std::min(end, runEnd);
        if (from >= to) continue;

        LineSlice slice;
        slice.run.style = runs[i].style;
        slice.run.text = logical.substr(from, to - from);
        slice.begin = from;
        slice.end = to;

        size_t measuredEnd = std::min(to, visibleEnd);
        if (measuredEnd > from) {
            line.widthMm += metrics_.measure(logical.substr(from, measuredEnd - from),
                                             slice.run.style.font());
        }
        line.maxSizePt = std::max(line.maxSizePt, slice.run.style.sizePt);
        line.slices.push_back(std::move(slice));
    }

    line.heightMm = metrics_.lineHeight(line.maxSizePt, lineSpacing_);
    return line;
}

} // namespace docprint
