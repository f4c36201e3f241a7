//
// Created by MWAC-dev on 10/16/2026.
//

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace nls {

    enum class NodeKind {
        Element,
        Text,
        Comment,
        CData,
        ProcessingInstruction,
        Doctype
    };

    // Attribute values are kept raw (still escaped) so untouched values serialize byte-identical.
    struct Attribute {
        std::string leading{" "};    // whitespace before the name
        std::string name;
        std::string assign{"="};     // everything between the name and the opening quote
        char quote{'"'};
        std::string value;

        bool operator==(const Attribute& other) const;
        bool operator!=(const Attribute& other) const { return !(*this == other); }
    };

    struct Node {
        NodeKind kind{NodeKind::Element};
        std::string name;                 // element tag name
        std::string text;                 // raw markup for every non-element kind
        std::vector<Attribute> attributes;
        std::vector<Node> children;
        std::string open_tail;            // whitespace before '>' or '/>' of the start tag
        std::string close_tail;           // whitespace before '>' of the end tag
        bool self_closing{false};
        std::size_t line{0};              // source line, not part of equality

        bool is_element() const { return kind == NodeKind::Element; }

        const Attribute* attribute(const std::string& attr_name) const;

        // First child element with the given name, or nullptr
        const Node* child(const std::string& child_name) const;

        // Concatenated raw text of the direct text children
        std::string raw_text() const;

        bool has_child_elements() const;

        bool operator==(const Node& other) const;
        bool operator!=(const Node& other) const { return !(*this == other); }
    };

    // Immutable once constructed; transforms build a new Document.
    class Document {
    public:
        Document() = default;
        Document(std::vector<Node> nodes, bool bom);

        const std::vector<Node>& nodes() const { return nodes_; }
        bool has_bom() const { return bom_; }

        // The single top-level element, or nullptr for an empty document
        const Node* root() const;

        // Element at a slash separated path below the root ("material/renderpass/texunit")
        const Node* find(const std::string& path) const;

        bool operator==(const Document& other) const;
        bool operator!=(const Document& other) const { return !(*this == other); }

    private:
        std::vector<Node> nodes_;
        bool bom_{false};
    };
}
