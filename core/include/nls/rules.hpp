//
// Created by MWAC-dev on 10/16/2026.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace nls {

    struct ScaleFactor {
        std::string tag;                 // output directory segment, "x2"
        std::int64_t numerator{1};
        std::int64_t denominator{1};
        std::string file_suffix;         // inserted before the extension, "{tag}" expands

        bool is_identity() const { return numerator == denominator; }
        double value() const { return double(numerator) / double(denominator); }

        // Same tag and same ratio
        bool operator==(const ScaleFactor& other) const;
        bool operator!=(const ScaleFactor& other) const { return !(*this == other); }
    };

    enum class TransformKind {
        Identity,
        ScaleLinear,
        ScaleInverse,
        FilenameSuffix
    };

    const char* to_string(TransformKind kind);
    bool ParseTransformKind(const std::string& text, TransformKind& out);

    // "material/renderpass/texunit/map" or "sceneobject/shape@length", relative to the root element.
    // A "*" segment matches any element name.
    struct FieldPath {
        std::vector<std::string> segments;
        std::string attribute;           // empty targets the element's text

        static bool Parse(const std::string& text, FieldPath& out, std::string& errorOut);

        bool matches(const std::vector<std::string>& elementPath, const std::string& attr) const;
        bool has_wildcard() const;
        std::string str() const;
    };

    struct TransformRule {
        FieldPath path;
        TransformKind kind{TransformKind::Identity};
        int decimals{-1};                // forced output precision, -1 keeps the input's
    };

    enum class DocumentRole {
        Material,
        Object
    };

    const char* to_string(DocumentRole role);

    struct DocumentRules {
        std::string name;                // "material", "object"
        DocumentRole role{DocumentRole::Material};
        std::string extension;           // lowercase, with the dot
        std::string root;                // expected root tag, empty accepts any
        std::vector<TransformRule> rules;
        std::vector<FieldPath> companions;
        std::string source;              // template file the rules came from

        // Builds the exact-path index; called once after loading.
        void resolve();

        // Exact path beats wildcard, otherwise first in file order. nullptr means identity.
        const TransformRule* find(const std::vector<std::string>& elementPath, const std::string& attr) const;

    private:
        std::unordered_map<std::string, std::size_t> exact_;
        std::vector<std::size_t> wildcards_;
    };

    struct RuleTable {
        std::string config_version{"1.0.0"};
        std::vector<ScaleFactor> scales;
        std::vector<std::string> default_scales;   // tags; empty selects all scales
        std::vector<DocumentRules> documents;

        // Matches the file extension case-insensitively
        const DocumentRules* find_document(const std::filesystem::path& file) const;

        // Looks up by tag ("x2") or by value ("2", "3/2", "1.5")
        const ScaleFactor* find_scale(const std::string& tagOrFactor) const;

        bool supports(const ScaleFactor& factor) const;

        // Throws UnsupportedScaleFactorError when default_scales names an unknown tag
        std::vector<ScaleFactor> default_set() const;
    };

    // "2", "1.5", "3/2" -> reduced positive ratio
    bool ParseRatio(const std::string& text, std::int64_t& numerator, std::int64_t& denominator);
    bool RatioFromDouble(double value, std::int64_t& numerator, std::int64_t& denominator);

    // Element path key used by the exact index: "a/b/c" or "a/b/c@attr"
    std::string FieldKey(const std::vector<std::string>& elementPath, const std::string& attr);
}
