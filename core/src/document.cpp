// Copyright (c) Created by MWAC-dev on 2026.
// core/src/document.cpp
#include "nls/document.hpp"

#include <utility>

namespace nls {

bool Attribute::operator==(const Attribute& other) const {
    return leading == other.leading && name == other.name && assign == other.assign &&
           quote == other.quote && value == other.value;
}

const Attribute* Node::attribute(const std::string& attr_name) const {
    for (const auto& a : attributes) {
        if (a.name == attr_name) return &a;
    }
    return nullptr;
}

const Node* Node::child(const std::string& child_name) const {
    for (const auto& c : children) {
        if (c.is_element() && c.name == child_name) return &c;
    }
    return nullptr;
}

std::string Node::raw_text() const {
    std::string out;
    for (const auto& c : children) {
        if (c.kind == NodeKind::Text) out += c.text;
    }
    return out;
}

bool Node::has_child_elements() const {
    for (const auto& c : children) {
        if (c.is_element()) return true;
    }
    return false;
}

bool Node::operator==(const Node& other) const {
    return kind == other.kind && name == other.name && text == other.text &&
           attributes == other.attributes && children == other.children &&
           open_tail == other.open_tail && close_tail == other.close_tail &&
           self_closing == other.self_closing;
}

Document::Document(std::vector<Node> nodes, bool bom)
    : nodes_(std::move(nodes)), bom_(bom) {}

const Node* Document::root() const {
    for (const auto& n : nodes_) {
        if (n.is_element()) return &n;
    }
    return nullptr;
}

const Node* Document::find(const std::string& path) const {
    const Node* node = root();
    std::size_t start = 0;
    while (node && start < path.size()) {
        std::size_t end = path.find('/', start);
        if (end == std::string::npos) end = path.size();
        if (end > start) node = node->child(path.substr(start, end - start));
        start = end + 1;
    }
    return node;
}

bool Document::operator==(const Document& other) const {
    return bom_ == other.bom_ && nodes_ == other.nodes_;
}

} // namespace nls
