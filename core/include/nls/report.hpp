//
// Created by MWAC-dev on 10/16/2026.
//
#pragma once

#include "batch.hpp"
#include "errors.hpp"

#include <nlohmann/json.hpp>

namespace nls {

    inline nlohmann::json error_json(const std::optional<ErrorKind>& error) {
        if (!error) return nullptr;
        return to_string(*error);
    }

    inline void to_json(nlohmann::json& j, const VariantResult& v) {
        j = nlohmann::json{
            {"scale", v.scale_tag},
            {"output", v.output.generic_string()},
            {"written", v.written},
            {"stage", to_string(v.stage)},
            {"error", error_json(v.error)},
            {"message", v.message}
        };
    }

    inline void to_json(nlohmann::json& j, const FileResult& f) {
        j = nlohmann::json{
            {"source", f.source.generic_string()},
            {"relative", f.relative.generic_string()},
            {"status", to_string(f.status)},
            {"stage", to_string(f.stage)},
            {"error", error_json(f.error)},
            {"message", f.message},
            {"warnings", f.warnings},
            {"variants", f.variants}
        };
    }

    inline void to_json(nlohmann::json& j, const GroupResult& g) {
        j = nlohmann::json{
            {"folder", g.folder.generic_string()},
            {"status", to_string(g.status)},
            {"files", g.files}
        };
    }

    inline void to_json(nlohmann::json& j, const BatchSummary& s) {
        j = nlohmann::json{
            {"groups_succeeded", s.groups_succeeded},
            {"groups_partial", s.groups_partial},
            {"groups_failed", s.groups_failed},
            {"groups_cancelled", s.groups_cancelled},
            {"files_written", s.files_written},
            {"files_skipped", s.files_skipped},
            {"files_failed", s.files_failed}
        };
    }

    inline void to_json(nlohmann::json& j, const BatchReport& r) {
        j = nlohmann::json{
            {"ok", r.ok()},
            {"summary", r.summary()},
            {"groups", r.groups},
            {"rejected", r.rejected}
        };
    }
}
