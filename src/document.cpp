#include "docprint/document.h"
#include "docprint/errors.h"
#include "docprint/log.h"
#include "docprint/metrics.h"
#include <cctype>
#include <memory>
#include <sstream>

namespace docprint {

namespace {

/// Map an editor node type to a block kind
BlockKind kindForType(const std::string& type) {
    if (type == "heading") return BlockKind::Heading;
    if (type == "paragraph") return BlockKind::Paragraph;
    if (type == "bulletList") return BlockKind::BulletList;
    if (type == "orderedList") return BlockKind::OrderedList;
    if (type == "listItem") return BlockKind::ListItem;
    if (type == "blockquote") return BlockKind::Blockquote;
    if (type == "codeBlock") return BlockKind::CodeBlock;
    if (type == "horizontalRule") return BlockKind::HorizontalRule;
    return BlockKind::Unknown;
}

bool ownsInlineContent(BlockKind kind) {
    return kind == BlockKind::Heading || kind == BlockKind::Paragraph ||
           kind == BlockKind::CodeBlock;
}

TextAlign parseAlign(const Json::Value& attrs) {
    if (!attrs.isMember("textAlign") || !attrs["textAlign"].isString()) {
        return TextAlign::Left;
    }
    std::string value = attrs["textAlign"].asString();
    if (value == "center") return TextAlign::Center;
    if (value == "right") return TextAlign::Right;
    if (value == "justify") return TextAlign::Justify;
    return TextAlign::Left;
}

/// Attribute value as a string: strings as-is, numbers printed, else nullopt
std::optional<std::string> attrString(const Json::Value& attrs, const char* name) {
    if (!attrs.isObject() || !attrs.isMember(name)) return std::nullopt;
    const Json::Value& value = attrs[name];
    if (value.isString()) {
        if (value.asString().empty()) return std::nullopt;
        return value.asString();
    }
    if (value.isNumeric()) {
        std::ostringstream oss;
        oss << value.asDouble();
        return oss.str();
    }
    return std::nullopt;
}

/// `content` or `marks`: absent is fine, present must be an array
const Json::Value* sequenceField(const Json::Value& node, const char* name,
                                 const std::string& path) {
    if (!node.isMember(name) || node[name].isNull()) return nullptr;
    const Json::Value& field = node[name];
    if (!field.isArray()) {
        throw InvalidDocumentError(path + "." + name + " must be an array");
    }
    return &field;
}

const Json::Value& attrsOf(const Json::Value& node) {
    static const Json::Value kEmpty(Json::objectValue);
    if (node.isMember("attrs") && node["attrs"].isObject()) return node["attrs"];
    return kEmpty;
}

void applyMarks(InlineRun& run, const Json::Value& node, const std::string& path) {
    const Json::Value* marks = sequenceField(node, "marks", path);
    if (!marks) return;

    for (Json::ArrayIndex i = 0; i < marks->size(); ++i) {
        const Json::Value& mark = (*marks)[i];
        if (!mark.isObject() || !mark["type"].isString()) {
            throw InvalidDocumentError(path + ".marks[" + std::to_string(i) +
                                       "] must be an object with a type");
        }
        std::string type = mark["type"].asString();
        const Json::Value& attrs = attrsOf(mark);

        if (type == "bold") run.bold = true;
        else if (type == "italic") run.italic = true;
        else if (type == "underline") run.underline = true;
        else if (type == "strike") run.strike = true;
        else if (type == "superscript") run.superscript = true;
        else if (type == "subscript") run.subscript = true;
        else if (type == "code") run.fontFamily = std::string("monospace");
        else if (type == "textStyle") {
            if (auto family = attrString(attrs, "fontFamily")) run.fontFamily = family;
            if (auto size = attrString(attrs, "fontSize")) run.fontSize = size;
            if (auto color = attrString(attrs, "color")) run.color = color;
        } else if (type == "highlight") {
            run.highlight = attrString(attrs, "color").value_or("#ffff00");
        } else {
            DP_LOGD("document: ignoring mark '%s' at %s", type.c_str(), path.c_str());
        }
    }
}

void parseInlines(const Json::Value& content, const std::string& path,
                  std::vector<InlineRun>& out) {
    for (Json::ArrayIndex i = 0; i < content.size(); ++i) {
        const Json::Value& node = content[i];
        std::string nodePath = path + ".content[" + std::to_string(i) + "]";
        if (!node.isObject() || !node["type"].isString()) {
            throw InvalidDocumentError(nodePath + " must be an object with a type");
        }
        std::string type = node["type"].asString();

        if (type == "text") {
            if (node.isMember("text") && !node["text"].isString()) {
                throw InvalidDocumentError(nodePath + ".text must be a string");
            }
            InlineRun run;
            run.text = node["text"].asString();
            applyMarks(run, node, nodePath);
            out.push_back(std::move(run));
        } else if (type == "hardBreak") {
            out.push_back(InlineRun::lineBreak());
        } else {
            DP_LOGD("document: ignoring inline node '%s' at %s", type.c_str(), nodePath.c_str());
        }
    }
}

Block parseBlock(const Json::Value& node, const std::string& path) {
    if (!node.isObject() || !node["type"].isString()) {
        throw InvalidDocumentError(path + " must be an object with a type");
    }

    Block block;
    block.typeName = node["type"].asString();
    block.kind = kindForType(block.typeName);

    const Json::Value& attrs = attrsOf(node);
    block.align = parseAlign(attrs);
    if (block.kind == BlockKind::Heading && attrs["level"].isIntegral()) {
        block.level = attrs["level"].asInt();
    }
    if (block.kind == BlockKind::OrderedList && attrs["start"].isIntegral()) {
        block.start = attrs["start"].asInt();
    }

    const Json::Value* content = sequenceField(node, "content", path);
    if (!content) return block;

    if (ownsInlineContent(block.kind)) {
        parseInlines(*content, path, block.inlines);
    } else {
        for (Json::ArrayIndex i = 0; i < content->size(); ++i) {
            block.children.push_back(
                parseBlock((*content)[i], path + ".content[" + std::to_string(i) + "]"));
        }
    }
    return block;
}

void validateBlock(const Block& block, const std::string& path) {
    switch (block.kind) {
        case BlockKind::Heading:
        case BlockKind::Paragraph:
        case BlockKind::CodeBlock:
            if (!block.children.empty()) {
                throw InvalidDocumentError(path + ": " + block.typeName +
                                           " holds inline content, not blocks");
            }
            break;
        case BlockKind::BulletList:
        case BlockKind::OrderedList:
            for (size_t i = 0; i < block.children.size(); ++i) {
                if (block.children[i].kind != BlockKind::ListItem) {
                    throw InvalidDocumentError(path + ".content[" + std::to_string(i) +
                                               "]: lists may only contain list items");
                }
            }
            [[fallthrough]];
        case BlockKind::ListItem:
        case BlockKind::Blockquote:
            if (!block.inlines.empty()) {
                throw InvalidDocumentError(path + ": container holds inline text");
            }
            break;
        case BlockKind::HorizontalRule:
            if (!block.inlines.empty() || !block.children.empty()) {
                throw InvalidDocumentError(path + ": horizontal rule has content");
            }
            break;
        case BlockKind::Unknown:
            break;
    }

    for (size_t i = 0; i < block.children.size(); ++i) {
        validateBlock(block.children[i], path + ".content[" + std::to_string(i) + "]");
    }
}

void countText(const std::string& text, DocumentStats& stats, bool& inWord) {
    for (size_t pos = 0; pos < text.size();) {
        char32_t cp = utf8::decode(text, pos);
        bool space = cp == ' ' || cp == '\t' || cp == '\n' || cp == '\r' || cp == 0xA0;
        if (cp != '\n') ++stats.characters;
        if (space) {
            inWord = false;
        } else if (!inWord) {
            inWord = true;
            ++stats.words;
        }
    }
}

void collectStats(const std::vector<Block>& blocks, DocumentStats& stats) {
    for (const auto& block : blocks) {
        bool inWord = false;
        countText(block.plainText(), stats, inWord);
        collectStats(block.children, stats);
    }
}

} // anonymous namespace

DocumentTree documentFromJson(const Json::Value& root) {
    if (!root.isObject() || !root["type"].isString() || root["type"].asString() != "doc") {
        throw InvalidDocumentError("root node must be of type 'doc'");
    }

    DocumentTree tree;
    const Json::Value* content = sequenceField(root, "content", "doc");
    if (content) {
        tree.blocks.reserve(content->size());
        for (Json::ArrayIndex i = 0; i < content->size(); ++i) {
            tree.blocks.push_back(parseBlock((*content)[i], "doc.content[" + std::to_string(i) + "]"));
        }
    }

    DP_LOGD("documentFromJson: blocks=%zu", tree.blocks.size());
    return tree;
}

DocumentTree parseDocumentJson(const std::string& json) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(json.data(), json.data() + json.size(), &root, &errors)) {
        throw InvalidDocumentError("document is not valid JSON: " + errors);
    }
    return documentFromJson(root);
}

void validateDocument(const DocumentTree& tree) {
    for (size_t i = 0; i < tree.blocks.size(); ++i) {
        validateBlock(tree.blocks[i], "doc.content[" + std::to_string(i) + "]");
    }
}

DocumentStats documentStats(const DocumentTree& tree) {
    DocumentStats stats;
    collectStats(tree.blocks, stats);
    return stats;
}

std::string exportFileName(const std::string& title) {
    std::string name = title.empty() ? "Untitled Document" : title;
    for (auto& c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c))) c = '_';
    }
    return name + ".pdf";
}

} // namespace docprint
