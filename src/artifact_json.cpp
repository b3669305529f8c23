#include "docprint/artifact_json.h"
#include <memory>
#include <sstream>

namespace docprint {

namespace {

Json::Value colorToJson(const Rgb& color) {
    Json::Value value(Json::arrayValue);
    value.append(static_cast<int>(color.r));
    value.append(static_cast<int>(color.g));
    value.append(static_cast<int>(color.b));
    return value;
}

Json::Value instructionToJson(const DrawInstruction& ins) {
    Json::Value value(Json::objectValue);
    switch (ins.kind) {
        case DrawKind::Text:
            value["kind"] = "text";
            value["x"] = ins.x;
            value["y"] = ins.y;
            value["width"] = ins.width;
            value["text"] = ins.text;
            value["font"] = familyName(ins.font.family);
            value["sizePt"] = ins.font.sizePt;
            value["bold"] = ins.font.bold;
            value["italic"] = ins.font.italic;
            break;
        case DrawKind::Rect:
            value["kind"] = "rect";
            value["x"] = ins.x;
            value["y"] = ins.y;
            value["width"] = ins.width;
            value["height"] = ins.height;
            break;
        case DrawKind::Line:
            value["kind"] = "line";
            value["x1"] = ins.x;
            value["y1"] = ins.y;
            value["x2"] = ins.x2;
            value["y2"] = ins.y2;
            value["lineWidth"] = ins.lineWidth;
            break;
    }
    value["color"] = colorToJson(ins.color);
    return value;
}

} // anonymous namespace

Json::Value artifactToJson(const OutputArtifact& artifact) {
    Json::Value root(Json::objectValue);
    root["pageWidthMm"] = artifact.pageWidthMm;
    root["pageHeightMm"] = artifact.pageHeightMm;

    Json::Value pages(Json::arrayValue);
    for (const auto& page : artifact.pages) {
        Json::Value pageValue(Json::objectValue);
        pageValue["index"] = page.pageIndex;
        Json::Value instructions(Json::arrayValue);
        for (const auto& ins : page.instructions) {
            instructions.append(instructionToJson(ins));
        }
        pageValue["instructions"] = std::move(instructions);
        pages.append(std::move(pageValue));
    }
    root["pages"] = std::move(pages);
    return root;
}

std::string serializeArtifact(const OutputArtifact& artifact) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    std::ostringstream oss;
    writer->write(artifactToJson(artifact), &oss);
    return oss.str();
}

} // namespace docprint
