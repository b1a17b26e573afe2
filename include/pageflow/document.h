#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

namespace pageflow {

/// Structural role of a node during break search
enum class NodeKind {
    Leaf,       // Holds inline content only (paragraph, heading, text, atoms)
    Container,  // Holds block children (table, row, cell, blockquote)
};

/// A node of the document snapshot.
/// Text nodes carry `text`; every other node carries `content`.
struct DocNode {
    using StringAttrs = std::map<std::string, std::string>;

    std::string type;                           // "paragraph", "table", "tableRow", "text", ...
    Json::Value attrs{Json::objectValue};       // Typed values as found in the snapshot
    std::string text;                           // UTF-8, for type == "text" only
    Json::Value marks{Json::nullValue};         // For type == "text" only
    std::vector<DocNode> content;
    bool isBlock = true;
    bool isAtom = false;                        // Inline leaf such as a hard break

    static Json::Value attrsFrom(const StringAttrs& values) {
        Json::Value result(Json::objectValue);
        for (const auto& entry : values) result[entry.first] = entry.second;
        return result;
    }

    static DocNode textNode(const std::string& t) {
        DocNode node;
        node.type = "text";
        node.text = t;
        node.isBlock = false;
        return node;
    }
    static DocNode block(const std::string& type,
                         std::vector<DocNode> children,
                         const StringAttrs& attrs = {}) {
        DocNode node;
        node.type = type;
        node.content = std::move(children);
        node.attrs = attrsFrom(attrs);
        return node;
    }
    static DocNode paragraph(const std::string& t,
                             const StringAttrs& attrs = {}) {
        std::vector<DocNode> children;
        if (!t.empty()) children.push_back(textNode(t));
        return block("paragraph", std::move(children), attrs);
    }
    static DocNode inlineAtom(const std::string& type,
                              const StringAttrs& attrs = {}) {
        DocNode node;
        node.type = type;
        node.attrs = attrsFrom(attrs);
        node.isBlock = false;
        node.isAtom = true;
        return node;
    }

    bool isText() const { return type == "text"; }
    bool isLeaf() const { return isText() || isAtom; }

    /// Size in document positions (text: UTF-16 code units, atoms: 1, others: content + 2)
    int nodeSize() const;
    int contentSize() const;

    int childCount() const { return static_cast<int>(content.size()); }
    const DocNode& child(int index) const { return content[index]; }
    const std::vector<DocNode>& children() const { return content; }

    bool containsBlockChildren() const;
    NodeKind kind() const {
        return containsBlockChildren() ? NodeKind::Container : NodeKind::Leaf;
    }

    /// Character at content offset `offset` of a textblock, 0 when the offset
    /// is out of range or lands on an inline atom
    char32_t charAt(int offset) const;

    /// String attribute value, or empty string when absent or not a string
    std::string attr(const std::string& key) const;

    Json::Value toJson() const;
};

/// Result of locating a child by content offset
struct ChildIndex {
    int index = 0;    // Child index (== childCount when at the end)
    int offset = 0;   // Content offset where that child starts
};

/// Locate the child of `node` at `pos` (relative to its content start)
ChildIndex findChildIndex(const DocNode& node, int pos);

/// A position resolved into its ancestor chain
class ResolvedPos {
public:
    struct Frame {
        const DocNode* node = nullptr;
        int index = 0;       // Index of the child the position points into
        int childStart = 0;  // Absolute position where that child starts
    };

    ResolvedPos(int pos, std::vector<Frame> path) : pos_(pos), path_(std::move(path)) {}

    int pos() const { return pos_; }
    int depth() const { return static_cast<int>(path_.size()) - 1; }
    const DocNode& node(int depth) const { return *path_[depth].node; }
    const DocNode& parent() const { return node(depth()); }

    /// Absolute position at the start of the content of the ancestor at `depth`
    int start(int depth) const { return depth == 0 ? 0 : path_[depth - 1].childStart + 1; }
    /// Absolute position right before the ancestor at `depth` (depth > 0)
    int before(int depth) const { return path_[depth - 1].childStart; }
    int parentOffset() const { return pos_ - start(depth()); }

private:
    int pos_ = 0;
    std::vector<Frame> path_;
};

/// Immutable document snapshot with position arithmetic
class Document {
public:
    Document();
    explicit Document(DocNode root);
    Document(DocNode root, Json::Value source);

    const DocNode& root() const { return root_; }
    int contentSize() const { return root_.contentSize(); }

    /// Node starting directly after `pos`, or nullptr
    const DocNode* nodeAt(int pos) const;

    /// Resolve `pos` into its ancestor chain; nullopt when out of range
    std::optional<ResolvedPos> resolve(int pos) const;

    /// Visit every descendant in document order with its absolute position.
    /// Returning false from the callback skips that node's children.
    void descendants(const std::function<bool(const DocNode&, int)>& callback) const;

    /// Serialized snapshot handed back to the caller unchanged.
    /// Documents built from JSON return the parsed input as is.
    Json::Value toJson() const;

private:
    DocNode root_;
    Json::Value source_;
};

/// Parse a serialized snapshot ({"type":"doc","content":[...]}).
/// Throws std::runtime_error on malformed input.
Document parseDocumentJson(const std::string& json);

/// Build a document from an already parsed JSON value
Document documentFromJson(const Json::Value& value);

/// Length of UTF-8 text in UTF-16 code units
int utf16Length(const std::string& utf8);

/// Code point covering UTF-16 unit `unit` of `utf8`, 0 when out of range
char32_t codePointAtUtf16(const std::string& utf8, int unit);

/// Clamp a position into [0, docSize] when the size is known
int clampToDoc(int pos, std::optional<int> docSize);

/// Move a forced break position past trailing section-break paragraphs so
/// the break coincides with the section change instead of splitting it.
int extendBreakPositionWithSectionMarkers(const Document& doc, int pos);

} // namespace pageflow
