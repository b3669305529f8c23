#pragma once

#include <json/json.h>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace docprint {

/// Node-level text alignment
enum class TextAlign {
    Left,
    Center,
    Right,
    Justify,
};

/// A contiguous span of text sharing one set of formatting marks.
/// Unset optionals mean "inherit the block default".
struct InlineRun {
    std::string text;

    bool bold = false;
    bool italic = false;
    bool underline = false;
    bool strike = false;
    bool superscript = false;   // Wins over subscript when both are set
    bool subscript = false;

    std::optional<std::string> fontFamily;  // CSS family list, e.g. "'Times New Roman', serif"
    std::optional<std::string> fontSize;    // "14pt", "16px" or a bare number (points)
    std::optional<std::string> color;       // CSS color
    std::optional<std::string> highlight;   // CSS color

    static InlineRun plain(const std::string& t) {
        InlineRun run;
        run.text = t;
        return run;
    }
    static InlineRun bolded(const std::string& t) {
        InlineRun run;
        run.text = t;
        run.bold = true;
        return run;
    }
    static InlineRun italicized(const std::string& t) {
        InlineRun run;
        run.text = t;
        run.italic = true;
        return run;
    }
    /// A hard line break inside a paragraph
    static InlineRun lineBreak() {
        return plain("\n");
    }
};

/// Block-level node kinds. Unknown keeps editor nodes this engine does
/// not know about; they render their children, if any.
enum class BlockKind {
    Heading,
    Paragraph,
    BulletList,
    OrderedList,
    ListItem,
    Blockquote,
    CodeBlock,
    HorizontalRule,
    Unknown,
};

/// One structural node of the document
struct Block {
    BlockKind kind = BlockKind::Paragraph;
    TextAlign align = TextAlign::Left;
    int level = 1;                     // Heading: 1..3
    int start = 1;                     // OrderedList: number of the first item
    std::string typeName;              // Node type as written by the editor
    std::vector<InlineRun> inlines;    // Heading, Paragraph, CodeBlock
    std::vector<Block> children;       // Lists, ListItem, Blockquote, Unknown

    /// Concatenated text of the inline content
    std::string plainText() const {
        std::string result;
        for (const auto& run : inlines) {
            result += run.text;
        }
        return result;
    }

    static Block heading(int level, std::vector<InlineRun> inlines) {
        Block b;
        b.kind = BlockKind::Heading;
        b.level = level;
        b.inlines = std::move(inlines);
        return b;
    }
    static Block paragraph(std::vector<InlineRun> inlines) {
        Block b;
        b.kind = BlockKind::Paragraph;
        b.inlines = std::move(inlines);
        return b;
    }
    static Block paragraph(const std::string& text) {
        return paragraph(std::vector<InlineRun>{InlineRun::plain(text)});
    }
    static Block container(BlockKind kind, std::vector<Block> children) {
        Block b;
        b.kind = kind;
        b.children = std::move(children);
        return b;
    }
    static Block codeBlock(const std::string& source) {
        Block b;
        b.kind = BlockKind::CodeBlock;
        b.inlines.push_back(InlineRun::plain(source));
        return b;
    }
    static Block horizontalRule() {
        Block b;
        b.kind = BlockKind::HorizontalRule;
        return b;
    }
};

/// Root `doc` node. Owned by the caller and never mutated by the engine.
struct DocumentTree {
    std::vector<Block> blocks;
};

/// Word and character counts of a document's text
struct DocumentStats {
    int words = 0;
    int characters = 0;   // Unicode code points, line breaks excluded
};

/// Parse the editor's JSON document format ({"type":"doc","content":[...]}).
/// Throws InvalidDocumentError if the text is not JSON, the root is not a
/// `doc` node, or a `content`/`marks` field is present but not an array.
DocumentTree parseDocumentJson(const std::string& json);

/// Same as parseDocumentJson, from an already parsed value
DocumentTree documentFromJson(const Json::Value& root);

/// Shape check run before rendering: node kinds that own inline content
/// must not carry children and vice versa. Throws InvalidDocumentError.
void validateDocument(const DocumentTree& tree);

/// Count words (whitespace separated) and characters over all blocks
DocumentStats documentStats(const DocumentTree& tree);

/// File name for an exported document: non-alphanumerics become '_',
/// an empty title becomes "Untitled Document".
std::string exportFileName(const std::string& title);

} // namespace docprint
