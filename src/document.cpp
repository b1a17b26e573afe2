#include "pageflow/document.h"
#include "pageflow/log.h"
#include <algorithm>
#include <set>
#include <sstream>
#include <stdexcept>

namespace pageflow {

namespace {

/// Inline node types that occupy a single position
const std::set<std::string> kInlineAtomTypes = {
    "hardBreak", "lineBreak", "tab", "image", "fieldAnnotation", "contentBlock",
    "pageNumber", "totalPageCount", "bookmarkStart", "bookmarkEnd",
};

/// Block node types that have no content and occupy a single position
const std::set<std::string> kBlockAtomTypes = {
    "horizontalRule", "pageBreak",
};

/// Decode one code point starting at `index`, advancing it.
/// Malformed sequences decode to U+FFFD one byte at a time.
char32_t decodeUtf8(const std::string& utf8, size_t& index) {
    auto lead = static_cast<unsigned char>(utf8[index]);
    int length = 0;
    char32_t cp = 0;
    if (lead < 0x80) {
        ++index;
        return lead;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        cp = lead & 0x07;
    } else {
        ++index;
        return 0xFFFD;
    }

    if (index + length > utf8.size()) {
        ++index;
        return 0xFFFD;
    }
    for (int i = 1; i < length; ++i) {
        auto next = static_cast<unsigned char>(utf8[index + i]);
        if ((next & 0xC0) != 0x80) {
            ++index;
            return 0xFFFD;
        }
        cp = (cp << 6) | (next & 0x3F);
    }
    index += length;
    return cp;
}

int utf16Units(char32_t cp) {
    return cp >= 0x10000 ? 2 : 1;
}

DocNode nodeFromJson(const Json::Value& value) {
    if (!value.isObject()) {
        throw std::runtime_error("document node must be an object");
    }
    if (!value["type"].isString()) {
        throw std::runtime_error("document node without a type");
    }

    DocNode node;
    node.type = value["type"].asString();

    const Json::Value& attrs = value["attrs"];
    if (attrs.isObject()) {
        node.attrs = attrs;
    }

    if (node.type == "text") {
        node.isBlock = false;
        node.text = value["text"].asString();
        if (value.isMember("marks")) node.marks = value["marks"];
        return node;
    }

    if (kInlineAtomTypes.count(node.type)) {
        node.isBlock = false;
        node.isAtom = true;
        return node;
    }
    if (kBlockAtomTypes.count(node.type)) {
        node.isAtom = true;
        return node;
    }

    const Json::Value& content = value["content"];
    if (content.isArray()) {
        node.content.reserve(content.size());
        for (const auto& child : content) {
            node.content.push_back(nodeFromJson(child));
        }
    }
    return node;
}

void visitDescendants(const DocNode& node, int contentStart,
                      const std::function<bool(const DocNode&, int)>& callback) {
    int pos = contentStart;
    for (const auto& child : node.content) {
        bool descend = callback(child, pos);
        if (descend && !child.content.empty()) {
            visitDescendants(child, pos + 1, callback);
        }
        pos += child.nodeSize();
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// DocNode
// ---------------------------------------------------------------------------

int DocNode::nodeSize() const {
    if (isText()) return utf16Length(text);
    if (isAtom) return 1;
    return contentSize() + 2;
}

int DocNode::contentSize() const {
    int size = 0;
    for (const auto& child : content) {
        size += child.nodeSize();
    }
    return size;
}

bool DocNode::containsBlockChildren() const {
    return std::any_of(content.begin(), content.end(),
                       [](const DocNode& child) { return child.isBlock; });
}

char32_t DocNode::charAt(int offset) const {
    if (offset < 0) return 0;
    int start = 0;
    for (const auto& child : content) {
        int size = child.nodeSize();
        if (offset < start + size) {
            return child.isText() ? codePointAtUtf16(child.text, offset - start) : 0;
        }
        start += size;
    }
    return 0;
}

std::string DocNode::attr(const std::string& key) const {
    const Json::Value& value = attrs[key];
    return value.isString() ? value.asString() : std::string();
}

Json::Value DocNode::toJson() const {
    Json::Value value(Json::objectValue);
    value["type"] = type;
    if (attrs.isObject() && !attrs.empty()) {
        value["attrs"] = attrs;
    }
    if (isText()) {
        value["text"] = text;
        if (!marks.isNull()) value["marks"] = marks;
    } else if (!content.empty()) {
        Json::Value children(Json::arrayValue);
        for (const auto& child : content) {
            children.append(child.toJson());
        }
        value["content"] = children;
    }
    return value;
}

ChildIndex findChildIndex(const DocNode& node, int pos) {
    if (pos <= 0) return {0, 0};
    int size = node.contentSize();
    if (pos >= size) return {node.childCount(), size};

    int offset = 0;
    for (int i = 0; i < node.childCount(); ++i) {
        int end = offset + node.child(i).nodeSize();
        if (end >= pos) {
            if (end == pos) return {i + 1, end};
            return {i, offset};
        }
        offset = end;
    }
    return {node.childCount(), offset};
}

// ---------------------------------------------------------------------------
// Document
// ---------------------------------------------------------------------------

Document::Document() : root_(DocNode::block("doc", {})) {}

Document::Document(DocNode root) : root_(std::move(root)) {}

Document::Document(DocNode root, Json::Value source)
    : root_(std::move(root)), source_(std::move(source)) {}

const DocNode* Document::nodeAt(int pos) const {
    if (pos < 0 || pos > contentSize()) return nullptr;

    const DocNode* node = &root_;
    while (true) {
        ChildIndex found = findChildIndex(*node, pos);
        if (found.index >= node->childCount()) return nullptr;
        node = &node->child(found.index);
        if (found.offset == pos || node->isText()) return node;
        pos -= found.offset + 1;
    }
}

std::optional<ResolvedPos> Document::resolve(int pos) const {
    if (pos < 0 || pos > contentSize()) return std::nullopt;

    std::vector<ResolvedPos::Frame> path;
    const DocNode* node = &root_;
    int start = 0;
    int parentOffset = pos;
    while (true) {
        ChildIndex found = findChildIndex(*node, parentOffset);
        int remainder = parentOffset - found.offset;
        path.push_back({node, found.index, start + found.offset});
        if (remainder == 0) break;
        node = &node->child(found.index);
        if (node->isText()) break;
        parentOffset = remainder - 1;
        start += found.offset + 1;
    }
    return ResolvedPos(pos, std::move(path));
}

void Document::descendants(const std::function<bool(const DocNode&, int)>& callback) const {
    visitDescendants(root_, 0, callback);
}

Json::Value Document::toJson() const {
    if (!source_.isNull()) return source_;
    return root_.toJson();
}

Document documentFromJson(const Json::Value& value) {
    return Document(nodeFromJson(value), value);
}

Document parseDocumentJson(const std::string& json) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream stream(json);
    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        throw std::runtime_error("invalid document snapshot: " + errors);
    }
    Document doc = documentFromJson(root);
    PF_LOGD("parseDocumentJson: type='%s' children=%d size=%d",
            doc.root().type.c_str(), doc.root().childCount(), doc.contentSize());
    return doc;
}

// ---------------------------------------------------------------------------
// Position helpers
// ---------------------------------------------------------------------------

int utf16Length(const std::string& utf8) {
    int units = 0;
    size_t index = 0;
    while (index < utf8.size()) {
        units += utf16Units(decodeUtf8(utf8, index));
    }
    return units;
}

char32_t codePointAtUtf16(const std::string& utf8, int unit) {
    if (unit < 0) return 0;
    int units = 0;
    size_t index = 0;
    while (index < utf8.size()) {
        char32_t cp = decodeUtf8(utf8, index);
        units += utf16Units(cp);
        if (unit < units) return cp;
    }
    return 0;
}

int clampToDoc(int pos, std::optional<int> docSize) {
    if (!docSize) return std::max(pos, 0);
    return std::max(0, std::min(pos, *docSize));
}

int extendBreakPositionWithSectionMarkers(const Document& doc, int pos) {
    const DocNode& root = doc.root();
    int size = doc.contentSize();
    if (pos < 0 || pos > size) return pos;

    ChildIndex found = findChildIndex(root, pos);
    if (found.index < 0 || found.index >= root.childCount()) return pos;

    int adjusted = pos;
    int index = found.index;

    // Inside a node: the break belongs after it
    if (found.offset < pos) {
        adjusted = found.offset + root.child(index).nodeSize();
        index += 1;
    }

    while (index < root.childCount()) {
        const DocNode& next = root.child(index);
        if (next.type != "paragraph" || next.attr("pageBreakSource") != "sectPr") break;
        adjusted += next.nodeSize();
        index += 1;
    }

    return std::max(pos, std::min(adjusted, size));
}

} // namespace pageflow
