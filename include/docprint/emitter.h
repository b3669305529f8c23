#pragma once

#include "docprint/page.h"
#include <string>
#include <utility>

namespace docprint {

/// Receives primitive draw instructions page by page.
/// A render drives exactly one sink; sinks are not shared between renders.
class DrawSink {
public:
    virtual ~DrawSink() = default;

    /// Start a new page of the given size (mm). Called before any draw on it.
    virtual void beginPage(int pageIndex, float widthMm, float heightMm) = 0;

    virtual void drawText(const std::string& text, float x, float y,
                          const FontSpec& font, const Rgb& color, float advance) = 0;

    virtual void fillRect(float x, float y, float width, float height, const Rgb& color) = 0;

    virtual void drawLine(float x1, float y1, float x2, float y2,
                          float lineWidth, const Rgb& color) = 0;

    /// No further pages follow
    virtual void finish() {}
};

/// Collects instructions into an OutputArtifact
class ArtifactRecorder : public DrawSink {
public:
    void beginPage(int pageIndex, float widthMm, float heightMm) override;
    void drawText(const std::string& text, float x, float y,
                  const FontSpec& font, const Rgb& color, float advance) override;
    void fillRect(float x, float y, float width, float height, const Rgb& color) override;
    void drawLine(float x1, float y1, float x2, float y2,
                  float lineWidth, const Rgb& color) override;

    const OutputArtifact& artifact() const { return artifact_; }
    OutputArtifact release() { return std::move(artifact_); }

private:
    OutputArtifact artifact_;

    Page& currentPage();
};

/// Replay a finished artifact into another sink (e.g. a PDF writer)
void replay(const OutputArtifact& artifact, DrawSink& sink);

} // namespace docprint
