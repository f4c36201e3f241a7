//
// Created by MWAC-dev on 10/16/2026.
//
#pragma once

#include "errors.hpp"
#include "rules.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <string>

namespace nls {

    inline void to_json(nlohmann::json& j, const ScaleFactor& s) {
        j = nlohmann::json{
            {"tag", s.tag},
            {"factor", std::to_string(s.numerator) + "/" + std::to_string(s.denominator)},
            {"file_suffix", s.file_suffix}
        };
    }

    inline void from_json(const nlohmann::json& j, ScaleFactor& s) {
        j.at("tag").get_to(s.tag);
        if (s.tag.empty() || s.tag.find_first_of("/\\") != std::string::npos || s.tag == "." || s.tag == "..") {
            throw TemplateLoadError("invalid scale tag '" + s.tag + "'");
        }
        const auto& factor = j.at("factor");
        bool ok = false;
        if (factor.is_number_integer()) {
            s.numerator = factor.get<std::int64_t>();
            s.denominator = 1;
            ok = s.numerator > 0 && s.numerator <= 1000000000;
        } else if (factor.is_number()) {
            ok = RatioFromDouble(factor.get<double>(), s.numerator, s.denominator);
        } else if (factor.is_string()) {
            ok = ParseRatio(factor.get<std::string>(), s.numerator, s.denominator);
        }
        if (!ok) throw TemplateLoadError("scale '" + s.tag + "' has an invalid factor " + factor.dump());
        s.file_suffix = j.value("file_suffix", "");
    }

    inline void to_json(nlohmann::json& j, const FieldPath& p) {
        j = p.str();
    }

    inline void from_json(const nlohmann::json& j, FieldPath& p) {
        std::string err;
        if (!FieldPath::Parse(j.get<std::string>(), p, err)) throw TemplateLoadError(err);
    }

    inline void to_json(nlohmann::json& j, const TransformRule& r) {
        j = nlohmann::json{
            {"path", r.path},
            {"kind", to_string(r.kind)}
        };
        if (r.decimals >= 0) j["decimals"] = r.decimals;
    }

    inline void from_json(const nlohmann::json& j, TransformRule& r) {
        j.at("path").get_to(r.path);
        const std::string kind = j.at("kind").get<std::string>();
        if (!ParseTransformKind(kind, r.kind)) {
            throw TemplateLoadError("unknown transform kind '" + kind + "' for " + r.path.str());
        }
        r.decimals = j.value("decimals", -1);
        if (r.decimals < -1 || r.decimals > 12) {
            throw TemplateLoadError("decimals out of range for " + r.path.str());
        }
    }

    inline void to_json(nlohmann::json& j, const DocumentRules& d) {
        j = nlohmann::json{
            {"document", d.name},
            {"role", to_string(d.role)},
            {"extension", d.extension},
            {"root", d.root},
            {"rules", d.rules},
            {"companions", d.companions}
        };
    }

    inline void from_json(const nlohmann::json& j, DocumentRules& d) {
        j.at("document").get_to(d.name);
        const std::string role = j.value("role", d.name);
        if (role == "material") d.role = DocumentRole::Material;
        else if (role == "object") d.role = DocumentRole::Object;
        else throw TemplateLoadError("unknown document role '" + role + "'");

        j.at("extension").get_to(d.extension);
        if (d.extension.size() < 2 || d.extension[0] != '.') {
            throw TemplateLoadError("extension must start with a dot: '" + d.extension + "'");
        }
        for (auto& c : d.extension) c = char(std::tolower(static_cast<unsigned char>(c)));

        d.root = j.value("root", "");
        if (j.contains("rules")) {
            j.at("rules").get_to(d.rules);
        }
        if (j.contains("companions")) {
            j.at("companions").get_to(d.companions);
        }
        d.resolve();
    }

    inline void to_json(nlohmann::json& j, const RuleTable& t) {
        j = nlohmann::json{
            {"config_version", t.config_version},
            {"scales", t.scales},
            {"default_scales", t.default_scales},
            {"documents", t.documents}
        };
    }
}
