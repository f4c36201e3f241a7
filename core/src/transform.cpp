// Copyright (c) Created by MWAC-dev on 2026.
// core/src/transform.cpp
#include "nls/transform.hpp"
#include "nls/errors.hpp"
#include "nls/log.hpp"
#include "nls/markup.hpp"
#include "nls/naming.hpp"
#include "nls/numeric.hpp"

#include <utility>

namespace nls {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

// [begin, end) of raw without surrounding whitespace
void trim_bounds(const std::string& raw, std::size_t& begin, std::size_t& end) {
    begin = 0;
    end = raw.size();
    while (begin < end && is_space(raw[begin])) ++begin;
    while (end > begin && is_space(raw[end - 1])) --end;
}

std::string trimmed_value(const std::string& raw) {
    std::size_t begin, end;
    trim_bounds(raw, begin, end);
    return UnescapeText(std::string_view(raw).substr(begin, end - begin));
}

class Rewriter {
public:
    Rewriter(const ScaleFactor& factor, const DocumentRules& rules, const std::string& source)
        : factor_(factor), rules_(rules), source_(source) {}

    void visit(Node& node, std::vector<std::string>& path) {
        for (auto& attr : node.attributes) {
            if (const auto* rule = rules_.find(path, attr.name)) {
                attr.value = apply(*rule, attr.value, node.line, path, attr.name);
            }
        }

        const auto* text_rule = path.empty() ? nullptr : rules_.find(path, "");
        if (text_rule && text_rule->kind != TransformKind::Identity) {
            if (node.has_child_elements()) {
                SDL_LogDebug(NLS_LOG_TRANSFORM, "%s: <%s> on line %zu has child elements, text rule ignored",
                             source_.c_str(), node.name.c_str(), node.line);
            } else {
                for (auto& c : node.children) {
                    if (c.kind == NodeKind::Text) c.text = apply(*text_rule, c.text, c.line, path, "");
                }
            }
        }

        for (auto& c : node.children) {
            if (!c.is_element()) continue;
            path.push_back(c.name);
            visit(c, path);
            path.pop_back();
        }
    }

private:
    std::string apply(const TransformRule& rule, const std::string& raw, std::size_t line,
                      const std::vector<std::string>& path, const std::string& attr) {
        switch (rule.kind) {
            case TransformKind::Identity:
                return raw;
            case TransformKind::ScaleLinear:
                return scale(raw, factor_.numerator, factor_.denominator, rule.decimals, line, path, attr);
            case TransformKind::ScaleInverse:
                return scale(raw, factor_.denominator, factor_.numerator, rule.decimals, line, path, attr);
            case TransformKind::FilenameSuffix:
                return rename(raw);
        }
        return raw;
    }

    std::string scale(const std::string& raw, std::int64_t numerator, std::int64_t denominator, int decimals,
                      std::size_t line, const std::vector<std::string>& path, const std::string& attr) {
        std::string out, bad;
        if (!ScaleNumericText(raw, numerator, denominator, decimals, out, bad)) {
            throw MalformedInputError(source_, line, 0,
                                      "field '" + FieldKey(path, attr) + "' is not numeric: '" + bad + "'");
        }
        return out;
    }

    std::string rename(const std::string& raw) {
        std::size_t begin, end;
        trim_bounds(raw, begin, end);
        if (begin == end) return raw;
        const std::string value = UnescapeText(std::string_view(raw).substr(begin, end - begin));
        const std::string renamed = ScaledFileName(value, factor_);
        if (renamed == value) return raw;
        return raw.substr(0, begin) + EscapeText(renamed) + raw.substr(end);
    }

    const ScaleFactor& factor_;
    const DocumentRules& rules_;
    const std::string& source_;
};

template <typename F>
void walk(const Node& node, std::vector<std::string>& path, F&& visit) {
    for (const auto& c : node.children) {
        if (!c.is_element()) continue;
        path.push_back(c.name);
        visit(c, path);
        walk(c, path, visit);
        path.pop_back();
    }
}

} // namespace

Document Transform(const Document& doc, const ScaleFactor& factor, const RuleTable& table,
                   const DocumentRules& rules, const std::string& sourceName) {
    if (!table.supports(factor)) {
        throw UnsupportedScaleFactorError("scale '" + factor.tag + "' (" + std::to_string(factor.numerator) + "/" +
                                          std::to_string(factor.denominator) + ") is not a supported scale factor");
    }

    std::vector<Node> nodes = doc.nodes();
    Rewriter rewriter(factor, rules, sourceName);
    for (auto& n : nodes) {
        if (!n.is_element()) continue;
        std::vector<std::string> path;
        rewriter.visit(n, path);
    }
    SDL_LogDebug(NLS_LOG_TRANSFORM, "%s: applied %s rules at %s", sourceName.c_str(), rules.name.c_str(),
                 factor.tag.c_str());
    return Document(std::move(nodes), doc.has_bom());
}

void CheckRoot(const Document& doc, const DocumentRules& rules, const std::string& sourceName) {
    const Node* root = doc.root();
    if (!root) throw MalformedInputError(sourceName, 0, 0, "document has no root element");
    if (!rules.root.empty() && root->name != rules.root) {
        throw MalformedInputError(sourceName, root->line, 0,
                                  "root element <" + root->name + "> is not <" + rules.root + "> as required for " +
                                  rules.extension + " files");
    }
}

std::vector<FieldValue> CollectReferences(const Document& doc, const DocumentRules& rules) {
    std::vector<FieldValue> out;
    const Node* root = doc.root();
    if (!root) return out;
    std::vector<std::string> path;
    walk(*root, path, [&](const Node& node, const std::vector<std::string>& p) {
        for (const auto& attr : node.attributes) {
            const auto* rule = rules.find(p, attr.name);
            if (rule && rule->kind == TransformKind::FilenameSuffix) {
                std::string value = trimmed_value(attr.value);
                if (!value.empty()) out.push_back({FieldKey(p, attr.name), std::move(value), node.line});
            }
        }
        const auto* rule = rules.find(p, "");
        if (rule && rule->kind == TransformKind::FilenameSuffix && !node.has_child_elements()) {
            std::string value = trimmed_value(node.raw_text());
            if (!value.empty()) out.push_back({FieldKey(p, ""), std::move(value), node.line});
        }
    });
    return out;
}

std::vector<FieldValue> CollectCompanions(const Document& doc, const DocumentRules& rules) {
    std::vector<FieldValue> out;
    const Node* root = doc.root();
    if (!root || rules.companions.empty()) return out;
    std::vector<std::string> path;
    walk(*root, path, [&](const Node& node, const std::vector<std::string>& p) {
        for (const auto& companion : rules.companions) {
            if (companion.attribute.empty()) {
                if (companion.matches(p, "") && !node.has_child_elements()) {
                    std::string value = trimmed_value(node.raw_text());
                    if (!value.empty()) out.push_back({FieldKey(p, ""), std::move(value), node.line});
                }
            } else if (const Attribute* attr = node.attribute(companion.attribute)) {
                if (companion.matches(p, attr->name)) {
                    std::string value = trimmed_value(attr->value);
                    if (!value.empty()) out.push_back({FieldKey(p, attr->name), std::move(value), node.line});
                }
            }
        }
    });
    return out;
}

} // namespace nls
