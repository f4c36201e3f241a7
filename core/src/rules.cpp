// Copyright (c) Created by MWAC-dev on 2026.
// core/src/rules.cpp
#include "nls/rules.hpp"
#include "nls/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <numeric>

namespace nls {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return char(std::tolower(c)); });
    return s;
}

bool valid_segment(const std::string& s) {
    if (s.empty()) return false;
    if (s == "*") return true;
    for (unsigned char c : s) {
        if (!(std::isalnum(c) || c == '_' || c == '-' || c == '.' || c == ':' || c >= 0x80)) return false;
    }
    return true;
}

bool parse_int(const std::string& s, std::int64_t& out) {
    if (s.empty()) return false;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return false;
    }
    if (s.size() > 15) return false;
    out = std::strtoll(s.c_str(), nullptr, 10);
    return true;
}

void reduce(std::int64_t& numerator, std::int64_t& denominator) {
    const std::int64_t g = std::gcd(numerator, denominator);
    if (g > 1) {
        numerator /= g;
        denominator /= g;
    }
}

} // namespace

bool ScaleFactor::operator==(const ScaleFactor& other) const {
    // both sides are kept reduced
    return tag == other.tag && numerator == other.numerator && denominator == other.denominator;
}

const char* to_string(TransformKind kind) {
    switch (kind) {
        case TransformKind::Identity: return "identity";
        case TransformKind::ScaleLinear: return "scale-linear";
        case TransformKind::ScaleInverse: return "scale-inverse";
        case TransformKind::FilenameSuffix: return "filename-suffix";
    }
    return "identity";
}

bool ParseTransformKind(const std::string& text, TransformKind& out) {
    if (text == "identity") out = TransformKind::Identity;
    else if (text == "scale-linear") out = TransformKind::ScaleLinear;
    else if (text == "scale-inverse") out = TransformKind::ScaleInverse;
    else if (text == "filename-suffix") out = TransformKind::FilenameSuffix;
    else return false;
    return true;
}

const char* to_string(DocumentRole role) {
    return role == DocumentRole::Object ? "object" : "material";
}

bool FieldPath::Parse(const std::string& text, FieldPath& out, std::string& errorOut) {
    out = FieldPath{};
    std::string elements = text;
    const std::size_t at = text.find('@');
    if (at != std::string::npos) {
        elements = text.substr(0, at);
        out.attribute = text.substr(at + 1);
        if (!valid_segment(out.attribute) || out.attribute == "*") {
            errorOut = "invalid attribute in field path '" + text + "'";
            return false;
        }
    }
    std::size_t start = 0;
    while (start <= elements.size()) {
        std::size_t end = elements.find('/', start);
        if (end == std::string::npos) end = elements.size();
        std::string segment = elements.substr(start, end - start);
        if (!valid_segment(segment)) {
            errorOut = "invalid segment '" + segment + "' in field path '" + text + "'";
            return false;
        }
        out.segments.push_back(std::move(segment));
        start = end + 1;
    }
    return true;
}

bool FieldPath::matches(const std::vector<std::string>& elementPath, const std::string& attr) const {
    if (attr != attribute || elementPath.size() != segments.size()) return false;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (segments[i] != "*" && segments[i] != elementPath[i]) return false;
    }
    return true;
}

bool FieldPath::has_wildcard() const {
    return std::find(segments.begin(), segments.end(), "*") != segments.end();
}

std::string FieldPath::str() const {
    return FieldKey(segments, attribute);
}

std::string FieldKey(const std::vector<std::string>& elementPath, const std::string& attr) {
    std::string out;
    for (std::size_t i = 0; i < elementPath.size(); ++i) {
        if (i) out += '/';
        out += elementPath[i];
    }
    if (!attr.empty()) out += "@" + attr;
    return out;
}

void DocumentRules::resolve() {
    exact_.clear();
    wildcards_.clear();
    for (std::size_t i = 0; i < rules.size(); ++i) {
        if (rules[i].path.has_wildcard()) wildcards_.push_back(i);
        else exact_.emplace(rules[i].path.str(), i);   // first one wins
    }
}

const TransformRule* DocumentRules::find(const std::vector<std::string>& elementPath, const std::string& attr) const {
    auto it = exact_.find(FieldKey(elementPath, attr));
    if (it != exact_.end()) return &rules[it->second];
    for (std::size_t i : wildcards_) {
        if (rules[i].path.matches(elementPath, attr)) return &rules[i];
    }
    return nullptr;
}

const DocumentRules* RuleTable::find_document(const std::filesystem::path& file) const {
    const std::string ext = lowercase(file.extension().string());
    if (ext.empty()) return nullptr;
    for (const auto& d : documents) {
        if (d.extension == ext) return &d;
    }
    return nullptr;
}

const ScaleFactor* RuleTable::find_scale(const std::string& tagOrFactor) const {
    for (const auto& s : scales) {
        if (s.tag == tagOrFactor) return &s;
    }
    std::int64_t n, d;
    if (!ParseRatio(tagOrFactor, n, d)) return nullptr;
    for (const auto& s : scales) {
        if (s.numerator == n && s.denominator == d) return &s;
    }
    return nullptr;
}

bool RuleTable::supports(const ScaleFactor& factor) const {
    return std::find(scales.begin(), scales.end(), factor) != scales.end();
}

std::vector<ScaleFactor> RuleTable::default_set() const {
    if (default_scales.empty()) return scales;
    std::vector<ScaleFactor> out;
    for (const auto& tag : default_scales) {
        const ScaleFactor* s = nullptr;
        for (const auto& candidate : scales) {
            if (candidate.tag == tag) s = &candidate;
        }
        if (!s) throw UnsupportedScaleFactorError("default scale '" + tag + "' is not defined by the scales template");
        out.push_back(*s);
    }
    return out;
}

bool ParseRatio(const std::string& text, std::int64_t& numerator, std::int64_t& denominator) {
    const std::size_t slash = text.find('/');
    if (slash != std::string::npos) {
        if (!parse_int(text.substr(0, slash), numerator) || !parse_int(text.substr(slash + 1), denominator)) return false;
        if (numerator <= 0 || denominator <= 0) return false;
        reduce(numerator, denominator);
        return true;
    }
    if (text.empty()) return false;
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) return false;
    return RatioFromDouble(value, numerator, denominator);
}

bool RatioFromDouble(double value, std::int64_t& numerator, std::int64_t& denominator) {
    if (!std::isfinite(value) || value <= 0 || value > 1e9) return false;
    std::int64_t scale = 1;
    for (int i = 0; i <= 6; ++i, scale *= 10) {
        const double scaled = value * double(scale);
        if (std::fabs(scaled - std::round(scaled)) < 1e-7) {
            numerator = static_cast<std::int64_t>(std::llround(scaled));
            denominator = scale;
            if (numerator <= 0) return false;
            reduce(numerator, denominator);
            return true;
        }
    }
    return false;
}

} // namespace nls
