// Copyright (c) Created by MWAC-dev on 2026.
// core/src/markup.cpp
#include "nls/markup.hpp"
#include "nls/errors.hpp"
#include "nls/log.hpp"

#include <cctype>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace nls {

namespace {

constexpr std::string_view kBom = "\xEF\xBB\xBF";

bool is_name_start(unsigned char c) {
    return std::isalpha(c) || c == '_' || c == ':' || c >= 0x80;
}

bool is_name_char(unsigned char c) {
    return is_name_start(c) || std::isdigit(c) || c == '-' || c == '.';
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

bool all_space(std::string_view s) {
    for (char c : s) {
        if (!is_space(c)) return false;
    }
    return true;
}

class Parser {
public:
    Parser(std::string_view src, const std::string& source) : src_(src), source_(source) {}

    Document parse() {
        bool bom = false;
        if (src_.substr(0, kBom.size()) == kBom) {
            bom = true;
            pos_ = kBom.size();
            line_start_ = pos_;
        }

        std::vector<Node> nodes;
        bool have_root = false;
        while (!eof()) {
            if (peek() != '<') {
                Node text = read_text();
                if (!all_space(text.text)) fail("text outside the root element");
                nodes.push_back(std::move(text));
            } else if (starts_with("<?")) {
                nodes.push_back(read_delimited(NodeKind::ProcessingInstruction, "<?", "?>", "processing instruction"));
            } else if (starts_with("<!--")) {
                nodes.push_back(read_delimited(NodeKind::Comment, "<!--", "-->", "comment"));
            } else if (starts_with("<!DOCTYPE")) {
                if (have_root) fail("DOCTYPE after the root element");
                nodes.push_back(read_doctype());
            } else if (starts_with("</")) {
                fail("closing tag without a matching start tag");
            } else if (starts_with("<!")) {
                fail("unexpected markup declaration outside the root element");
            } else {
                if (have_root) fail("more than one root element");
                nodes.push_back(read_element());
                have_root = true;
            }
        }
        if (!have_root) fail("document has no root element");
        return Document(std::move(nodes), bom);
    }

private:
    [[noreturn]] void fail(const std::string& what) const {
        throw MalformedInputError(source_, line_, pos_ - line_start_ + 1, what);
    }

    bool eof() const { return pos_ >= src_.size(); }
    char peek() const { return src_[pos_]; }
    bool starts_with(std::string_view s) const { return src_.substr(pos_, s.size()) == s; }

    std::string_view take(std::size_t n) {
        std::string_view out = src_.substr(pos_, n);
        for (char c : out) {
            ++pos_;
            if (c == '\n') {
                ++line_;
                line_start_ = pos_;
            }
        }
        return out;
    }

    std::string read_space() {
        std::size_t n = 0;
        while (pos_ + n < src_.size() && is_space(src_[pos_ + n])) ++n;
        return std::string(take(n));
    }

    std::string read_name() {
        std::size_t n = 0;
        if (eof() || !is_name_start(static_cast<unsigned char>(peek()))) return {};
        while (pos_ + n < src_.size() && is_name_char(static_cast<unsigned char>(src_[pos_ + n]))) ++n;
        return std::string(take(n));
    }

    Node read_text() {
        Node node;
        node.kind = NodeKind::Text;
        node.line = line_;
        std::size_t end = src_.find('<', pos_);
        if (end == std::string_view::npos) end = src_.size();
        node.text = std::string(take(end - pos_));
        return node;
    }

    Node read_delimited(NodeKind kind, std::string_view open, std::string_view close, const char* what) {
        Node node;
        node.kind = kind;
        node.line = line_;
        std::size_t end = src_.find(close, pos_ + open.size());
        if (end == std::string_view::npos) fail(std::string("unterminated ") + what);
        node.text = std::string(take(end + close.size() - pos_));
        return node;
    }

    Node read_doctype() {
        Node node;
        node.kind = NodeKind::Doctype;
        node.line = line_;
        std::size_t i = pos_;
        int depth = 0;
        char quote = 0;
        for (; i < src_.size(); ++i) {
            char c = src_[i];
            if (quote) {
                if (c == quote) quote = 0;
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '[') {
                ++depth;
            } else if (c == ']') {
                --depth;
            } else if (c == '>' && depth <= 0) {
                break;
            }
        }
        if (i >= src_.size()) fail("unterminated DOCTYPE");
        node.text = std::string(take(i + 1 - pos_));
        return node;
    }

    void read_attributes(Node& node) {
        for (;;) {
            std::string space = read_space();
            if (eof()) fail("unterminated start tag <" + node.name + ">");
            if (peek() == '>') {
                node.open_tail = std::move(space);
                take(1);
                return;
            }
            if (starts_with("/>")) {
                node.open_tail = std::move(space);
                node.self_closing = true;
                take(2);
                return;
            }
            if (space.empty()) fail("expected whitespace before attribute in <" + node.name + ">");

            Attribute attr;
            attr.leading = std::move(space);
            attr.name = read_name();
            if (attr.name.empty()) fail("invalid attribute name in <" + node.name + ">");
            if (node.attribute(attr.name)) fail("duplicate attribute '" + attr.name + "'");

            attr.assign = read_space();
            if (eof() || peek() != '=') fail("attribute '" + attr.name + "' has no value");
            attr.assign += std::string(take(1));
            attr.assign += read_space();

            if (eof() || (peek() != '"' && peek() != '\'')) {
                fail("value of attribute '" + attr.name + "' must be quoted");
            }
            attr.quote = peek();
            take(1);
            std::size_t end = src_.find(attr.quote, pos_);
            if (end == std::string_view::npos) fail("unterminated value of attribute '" + attr.name + "'");
            std::string_view value = src_.substr(pos_, end - pos_);
            if (value.find('<') != std::string_view::npos) fail("'<' inside value of attribute '" + attr.name + "'");
            attr.value = std::string(take(end - pos_));
            take(1);
            node.attributes.push_back(std::move(attr));
        }
    }

    Node read_element() {
        Node node;
        node.kind = NodeKind::Element;
        node.line = line_;
        take(1);
        node.name = read_name();
        if (node.name.empty()) fail("invalid tag name");
        read_attributes(node);
        if (node.self_closing) return node;

        for (;;) {
            if (eof()) fail("unexpected end of input inside <" + node.name + "> opened on line " + std::to_string(node.line));
            if (peek() != '<') {
                node.children.push_back(read_text());
            } else if (starts_with("</")) {
                take(2);
                std::string closing = read_name();
                if (closing != node.name) {
                    fail("mismatched closing tag </" + closing + ">, expected </" + node.name + ">");
                }
                node.close_tail = read_space();
                if (eof() || peek() != '>') fail("unterminated closing tag </" + closing + ">");
                take(1);
                return node;
            } else if (starts_with("<!--")) {
                node.children.push_back(read_delimited(NodeKind::Comment, "<!--", "-->", "comment"));
            } else if (starts_with("<![CDATA[")) {
                node.children.push_back(read_delimited(NodeKind::CData, "<![CDATA[", "]]>", "CDATA section"));
            } else if (starts_with("<?")) {
                node.children.push_back(read_delimited(NodeKind::ProcessingInstruction, "<?", "?>", "processing instruction"));
            } else if (starts_with("<!")) {
                fail("unexpected markup declaration inside <" + node.name + ">");
            } else {
                node.children.push_back(read_element());
            }
        }
    }

    std::string_view src_;
    const std::string& source_;
    std::size_t pos_ = 0;
    std::size_t line_ = 1;
    std::size_t line_start_ = 0;
};

void serialize_node(const Node& node, std::string& out) {
    if (!node.is_element()) {
        out += node.text;
        return;
    }
    out += '<';
    out += node.name;
    for (const auto& a : node.attributes) {
        out += a.leading;
        out += a.name;
        out += a.assign;
        out += a.quote;
        out += a.value;
        out += a.quote;
    }
    out += node.open_tail;
    if (node.self_closing) {
        out += "/>";
        return;
    }
    out += '>';
    for (const auto& c : node.children) serialize_node(c, out);
    out += "</";
    out += node.name;
    out += node.close_tail;
    out += '>';
}

void append_utf8(std::uint32_t cp, std::string& out) {
    if (cp < 0x80) {
        out += char(cp);
    } else if (cp < 0x800) {
        out += char(0xC0 | (cp >> 6));
        out += char(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += char(0xE0 | (cp >> 12));
        out += char(0x80 | ((cp >> 6) & 0x3F));
        out += char(0x80 | (cp & 0x3F));
    } else {
        out += char(0xF0 | (cp >> 18));
        out += char(0x80 | ((cp >> 12) & 0x3F));
        out += char(0x80 | ((cp >> 6) & 0x3F));
        out += char(0x80 | (cp & 0x3F));
    }
}

bool decode_numeric_reference(std::string_view body, std::string& out) {
    // body is what sits between "&#" and ";"
    if (body.empty()) return false;
    bool hex = body[0] == 'x' || body[0] == 'X';
    if (hex) body.remove_prefix(1);
    if (body.empty() || body.size() > 8) return false;
    std::uint32_t cp = 0;
    for (char c : body) {
        std::uint32_t digit;
        if (c >= '0' && c <= '9') digit = std::uint32_t(c - '0');
        else if (hex && c >= 'a' && c <= 'f') digit = std::uint32_t(c - 'a' + 10);
        else if (hex && c >= 'A' && c <= 'F') digit = std::uint32_t(c - 'A' + 10);
        else return false;
        cp = cp * (hex ? 16 : 10) + digit;
    }
    if (cp > 0x10FFFF) return false;
    append_utf8(cp, out);
    return true;
}

} // namespace

Document ParseDocument(std::string_view text, const std::string& source_name) {
    Parser parser(text, source_name);
    return parser.parse();
}

Document LoadDocument(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw IOReadError("failed to open: " + path.string());
    std::ostringstream buffer;
    buffer << f.rdbuf();
    if (f.bad()) throw IOReadError("failed to read: " + path.string());
    SDL_LogDebug(NLS_LOG_PARSE, "parsing %s", path.string().c_str());
    return ParseDocument(buffer.str(), path.string());
}

std::string SerializeDocument(const Document& doc) {
    std::string out;
    if (doc.has_bom()) out += kBom;
    for (const auto& n : doc.nodes()) serialize_node(n, out);
    return out;
}

void WriteDocument(const Document& doc, const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) throw IOWriteError("cannot create " + path.parent_path().string() + ": " + ec.message());
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw IOWriteError("failed to open for writing: " + path.string());
    const std::string content = SerializeDocument(doc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) throw IOWriteError("failed to write: " + path.string());
}

std::string UnescapeText(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    std::size_t i = 0;
    while (i < raw.size()) {
        if (raw[i] != '&') {
            out += raw[i++];
            continue;
        }
        std::size_t semi = raw.find(';', i);
        if (semi == std::string_view::npos) {
            out += raw.substr(i);
            break;
        }
        std::string_view entity = raw.substr(i + 1, semi - i - 1);
        if (entity.find_first_of(" \t\r\n&<") != std::string_view::npos) {
            // a bare '&', not the start of a reference
            out += raw[i++];
            continue;
        }
        if (entity == "amp") out += '&';
        else if (entity == "lt") out += '<';
        else if (entity == "gt") out += '>';
        else if (entity == "apos") out += '\'';
        else if (entity == "quot") out += '"';
        else if (entity.empty() || entity[0] != '#' || !decode_numeric_reference(entity.substr(1), out)) {
            // unknown entity stays verbatim
            out += raw.substr(i, semi - i + 1);
        }
        i = semi + 1;
    }
    return out;
}

std::string EscapeText(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out += c; break;
        }
    }
    return out;
}

} // namespace nls
