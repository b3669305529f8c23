#include "docprint/paginator.h"
#include "docprint/log.h"
#include <algorithm>

namespace docprint {

namespace {

// Tolerance for accumulated float error when comparing offsets
constexpr float kEpsilonMm = 0.001f;

} // anonymous namespace

Paginator::Paginator(const PageConfig& config, DrawSink& sink)
    : config_(config), sink_(sink) {
    cursor_.offsetMm = top();
}

void Paginator::start() {
    cursor_.pageIndex = 1;
    cursor_.offsetMm = top();
    sink_.beginPage(cursor_.pageIndex, config_.pageWidthMm, config_.pageHeightMm);
}

float Paginator::top() const {
    return config_.marginMm;
}

float Paginator::bottom() const {
    return config_.bottomLimit();
}

bool Paginator::atPageTop() const {
    return cursor_.offsetMm <= top() + kEpsilonMm;
}

bool Paginator::requestSpace(float height) {
    if (cursor_.offsetMm + height <= bottom() + kEpsilonMm) {
        return true;
    }
    if (!atPageTop()) {
        breakPage();
    }
    if (cursor_.offsetMm + height <= bottom() + kEpsilonMm) {
        return true;
    }
    DP_LOGW("paginator: %.2fmm does not fit on an empty page (%.2fmm available)",
            height, remainingHeight());
    return false;
}

void Paginator::advance(float height) {
    cursor_.offsetMm = std::min(cursor_.offsetMm + height, bottom());
}

void Paginator::breakPage() {
    for (auto& span : spans_) {
        if (cursor_.offsetMm > span.startMm) {
            span.painter(span.startMm, cursor_.offsetMm);
        }
        span.startMm = top();
    }

    cursor_.pageIndex += 1;
    cursor_.offsetMm = top();
    sink_.beginPage(cursor_.pageIndex, config_.pageWidthMm, config_.pageHeightMm);
    DP_LOGD("paginator: newPage pageIndex=%d", cursor_.pageIndex);
}

void Paginator::openSpan(SpanPainter painter) {
    spans_.push_back({std::move(painter), cursor_.offsetMm});
}

void Paginator::closeSpan() {
    if (spans_.empty()) return;
    OpenSpan span = std::move(spans_.back());
    spans_.pop_back();
    if (cursor_.offsetMm > span.startMm) {
        span.painter(span.startMm, cursor_.offsetMm);
    }
}

} // namespace docprint
