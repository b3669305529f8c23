#include "docprint/emitter.h"

namespace docprint {

void ArtifactRecorder::beginPage(int pageIndex, float widthMm, float heightMm) {
    artifact_.pageWidthMm = widthMm;
    artifact_.pageHeightMm = heightMm;
    Page page;
    page.pageIndex = pageIndex;
    artifact_.pages.push_back(std::move(page));
}

Page& ArtifactRecorder::currentPage() {
    if (artifact_.pages.empty()) {
        artifact_.pages.push_back(Page{});
    }
    return artifact_.pages.back();
}

void ArtifactRecorder::drawText(const std::string& text, float x, float y,
                                const FontSpec& font, const Rgb& color, float advance) {
    DrawInstruction ins;
    ins.kind = DrawKind::Text;
    ins.x = x;
    ins.y = y;
    ins.width = advance;
    ins.text = text;
    ins.font = font;
    ins.color = color;
    currentPage().instructions.push_back(std::move(ins));
}

void ArtifactRecorder::fillRect(float x, float y, float width, float height, const Rgb& color) {
    DrawInstruction ins;
    ins.kind = DrawKind::Rect;
    ins.x = x;
    ins.y = y;
    ins.width = width;
    ins.height = height;
    ins.color = color;
    currentPage().instructions.push_back(ins);
}

void ArtifactRecorder::drawLine(float x1, float y1, float x2, float y2,
                                float lineWidth, const Rgb& color) {
    DrawInstruction ins;
    ins.kind = DrawKind::Line;
    ins.x = x1;
    ins.y = y1;
    ins.x2 = x2;
    ins.y2 = y2;
    ins.lineWidth = lineWidth;
    ins.color = color;
    currentPage().instructions.push_back(ins);
}

void replay(const OutputArtifact& artifact, DrawSink& sink) {
    for (const auto& page : artifact.pages) {
        sink.beginPage(page.pageIndex, artifact.pageWidthMm, artifact.pageHeightMm);
        for (const auto& ins : page.instructions) {
            switch (ins.kind) {
                case DrawKind::Text:
                    sink.drawText(ins.text, ins.x, ins.y, ins.font, ins.color, ins.width);
                    break;
                case DrawKind::Rect:
                    sink.fillRect(ins.x, ins.y, ins.width, ins.height, ins.color);
                    break;
                case DrawKind::Line:
                    sink.drawLine(ins.x, ins.y, ins.x2, ins.y2, ins.lineWidth, ins.color);
                    break;
            }
        }
    }
    sink.finish();
}

} // namespace docprint
