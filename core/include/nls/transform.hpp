//
// Created by MWAC-dev on 10/16/2026.
//

#pragma once

#include "document.hpp"
#include "rules.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace nls {

    // Returns a new document with the rules applied; `doc` is left untouched.
    // Fields without a rule pass through verbatim.
    // Throws UnsupportedScaleFactorError, or MalformedInputError for a non-numeric scaled field.
    Document Transform(const Document& doc, const ScaleFactor& factor, const RuleTable& table,
                       const DocumentRules& rules, const std::string& sourceName = {});

    // Throws MalformedInputError when the root tag differs from the template's.
    void CheckRoot(const Document& doc, const DocumentRules& rules, const std::string& sourceName = {});

    struct FieldValue {
        std::string path;       // FieldKey of the matched field
        std::string value;      // unescaped, trimmed
        std::size_t line{0};
    };

    // Values of every filename-suffix field (material references)
    std::vector<FieldValue> CollectReferences(const Document& doc, const DocumentRules& rules);

    // Values of every companion field (texture maps, previews)
    std::vector<FieldValue> CollectCompanions(const Document& doc, const DocumentRules& rules);
}
