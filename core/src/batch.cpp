// Copyright (c) Created by MWAC-dev on 2026.
// core/src/batch.cpp
#include "nls/batch.hpp"
#include "nls/document.hpp"
#include "nls/log.hpp"
#include "nls/markup.hpp"
#include "nls/naming.hpp"
#include "nls/transform.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <mutex>
#include <set>
#include <system_error>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

namespace nls {

namespace {

// References are matched the way the simulator on Windows resolves them: case-insensitively.
std::string path_key(const fs::path& p) {
    std::string s = p.lexically_normal().generic_string();
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return char(std::tolower(c)); });
    return s;
}

fs::path reference_path(const std::string& value) {
    std::string v = value;
    std::replace(v.begin(), v.end(), '\\', '/');
    return fs::path(v);
}

bool escapes_folder(const fs::path& rel) {
    if (rel.is_absolute() || rel.has_root_name()) return true;
    for (const auto& part : rel.lexically_normal()) {
        if (part == "..") return true;
    }
    return false;
}

void fail_file(FileResult& file, Stage stage, ErrorKind kind, const std::string& message) {
    file.status = FileStatus::Failed;
    if (!file.error) {
        file.error = kind;
        file.stage = stage;
        file.message = message;
    }
}

// Companion destinations of one batch. Groups may run in parallel and two folders can ship
// a texture under the same name, the first source to claim a destination keeps it.
class CompanionClaims {
public:
    enum class Claim { Fresh, AlreadyCopied, Taken };

    Claim claim(const fs::path& destination, const fs::path& source, fs::path& owner) {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto inserted = owners_.emplace(path_key(destination), source);
        if (inserted.second) return Claim::Fresh;
        owner = inserted.first->second;
        return path_key(owner) == path_key(source) ? Claim::AlreadyCopied : Claim::Taken;
    }

private:
    std::mutex mutex_;
    std::map<std::string, fs::path> owners_;
};

struct Work {
    const SourceFile* source{nullptr};
    FileResult result;
    std::optional<Document> doc;
    std::vector<FieldValue> companions;
};

class GroupRun {
public:
    GroupRun(const RuleTable& table, const BatchOptions& options, const BatchGroup& group, CompanionClaims& claims)
        : table_(table), options_(options), group_(group), claims_(claims) {}

    GroupResult run() {
        GroupResult out;
        out.folder = group_.folder;

        std::vector<Work> materials;
        materials.reserve(group_.materials.size());
        for (const auto& m : group_.materials) {
            materials.push_back(start(m));
            parse(materials.back());
        }

        // material outputs written per scale, for the reference check below
        std::vector<std::set<std::string>> written(options_.scales.size());
        for (auto& w : materials) {
            if (!w.doc) continue;
            for (std::size_t si = 0; si < options_.scales.size(); ++si) {
                if (write_variant(w, si)) written[si].insert(path_key(w.result.variants.back().output));
            }
        }

        std::optional<Work> object;
        if (group_.object) {
            object = start(*group_.object);
            parse(*object);
            if (object->doc) write_object(*object, written);
        }

        for (auto& w : materials) out.files.push_back(finish(std::move(w.result)));
        if (object) out.files.push_back(finish(std::move(object->result)));
        for (const auto& skipped : group_.skipped) out.files.push_back(skipped);

        out.status = group_status(out.files);
        return out;
    }

private:
    Work start(const SourceFile& source) const {
        Work w;
        w.source = &source;
        w.result.source = source.path;
        w.result.relative = source.relative;
        w.result.status = FileStatus::Written;
        w.result.stage = Stage::Discovered;
        return w;
    }

    VariantResult variant_for(const Work& w, std::size_t si) const {
        VariantResult v;
        v.scale_tag = options_.scales[si].tag;
        v.output = ScaledOutputPath(options_.destination, options_.scales[si], w.source->relative);
        v.stage = Stage::Parsed;
        return v;
    }

    void fail_variant(Work& w, VariantResult v, Stage stage, ErrorKind kind, const std::string& message) {
        v.written = false;
        v.stage = stage;
        v.error = kind;
        v.message = message;
        SDL_LogError(NLS_LOG_BATCH, "%s [%s]: %s", w.source->path.string().c_str(), v.scale_tag.c_str(), message.c_str());
        fail_file(w.result, stage, kind, message);
        w.result.variants.push_back(std::move(v));
    }

    // One parse per source; a failure here fails every scale of the file.
    void parse(Work& w) {
        const std::string name = w.source->path.string();
        try {
            w.doc = LoadDocument(w.source->path);
            CheckRoot(*w.doc, *w.source->rules, name);
            w.companions = CollectCompanions(*w.doc, *w.source->rules);
            w.result.stage = Stage::Parsed;
            return;
        } catch (const Error& e) {
            fail_all(w, Stage::Parsed, e.kind(), e.what());
        } catch (const std::exception& e) {
            fail_all(w, Stage::Parsed, ErrorKind::Internal, e.what());
        }
        w.doc.reset();
    }

    void fail_all(Work& w, Stage stage, ErrorKind kind, const std::string& message) {
        for (std::size_t si = 0; si < options_.scales.size(); ++si) {
            fail_variant(w, variant_for(w, si), stage, kind, message);
        }
    }

    bool write_variant(Work& w, std::size_t si) {
        VariantResult v = variant_for(w, si);
        const ScaleFactor& scale = options_.scales[si];
        Stage attempt = Stage::Transformed;
        try {
            Document scaled = Transform(*w.doc, scale, table_, *w.source->rules, w.source->path.string());
            v.stage = Stage::Transformed;
            attempt = Stage::Written;
            SDL_LogInfo(NLS_LOG_BATCH, "creating %s", v.output.string().c_str());
            WriteDocument(scaled, v.output);
            v.stage = Stage::Written;
            v.written = true;
        } catch (const Error& e) {
            fail_variant(w, std::move(v), attempt, e.kind(), e.what());
            return false;
        } catch (const std::exception& e) {
            fail_variant(w, std::move(v), attempt, ErrorKind::Internal, e.what());
            return false;
        }

        if (options_.copy_companions) copy_companions(w, v.output);
        w.result.variants.push_back(std::move(v));
        return true;
    }

    void write_object(Work& w, const std::vector<std::set<std::string>>& written) {
        const auto references = CollectReferences(*w.doc, *w.source->rules);

        std::set<std::string> group_materials;
        for (const auto& m : group_.materials) group_materials.insert(path_key(m.path));

        std::vector<std::string> targets;   // reference values, resolved below per scale
        std::string missing;
        for (const auto& ref : references) {
            const std::string key = path_key(w.source->path.parent_path() / reference_path(ref.value));
            if (!group_materials.count(key)) {
                if (!missing.empty()) missing += ", ";
                missing += "'" + ref.value + "' (line " + std::to_string(ref.line) + ")";
                continue;
            }
            targets.push_back(ref.value);
        }
        if (!missing.empty()) {
            const std::string message = "references materials that are not part of the group: " + missing;
            fail_all(w, Stage::Transformed, ErrorKind::ReferentialIntegrity, message);
            return;
        }

        for (std::size_t si = 0; si < options_.scales.size(); ++si) {
            const ScaleFactor& scale = options_.scales[si];
            // the rewritten reference has to name a file that was written next to this object
            const fs::path folder = ScaledOutputPath(options_.destination, scale, w.source->relative).parent_path();
            std::string unwritten;
            for (const auto& target : targets) {
                const fs::path expected = folder / ScaledFileName(reference_path(target).generic_string(), scale);
                if (written[si].count(path_key(expected))) continue;
                if (!unwritten.empty()) unwritten += ", ";
                unwritten += "'" + target + "'";
            }
            if (!unwritten.empty()) {
                fail_variant(w, variant_for(w, si), Stage::Transformed, ErrorKind::ReferentialIntegrity,
                             "referenced materials were not written next to the object at " + scale.tag + ": " +
                             unwritten);
                continue;
            }
            write_variant(w, si);
        }
    }

    // Missing companions are warnings, the scaled document itself is already written.
    void copy_companions(Work& w, const fs::path& output) {
        for (const auto& companion : w.companions) {
            const fs::path rel = reference_path(companion.value);
            if (escapes_folder(rel)) {
                warn(w, "companion '" + companion.value + "' points outside the source folder, not copied");
                continue;
            }
            const fs::path src = w.source->path.parent_path() / rel;
            const fs::path dst = (output.parent_path() / rel).lexically_normal();
            fs::path owner;
            const auto claim = claims_.claim(dst, src, owner);
            if (claim == CompanionClaims::Claim::AlreadyCopied) continue;
            if (claim == CompanionClaims::Claim::Taken) {
                warn(w, "companion " + dst.string() + " is already copied from " + owner.string() + ", not copied");
                continue;
            }

            SDL_LogInfo(NLS_LOG_BATCH, "copying %s to %s", src.string().c_str(), dst.string().c_str());
            std::error_code ec;
            fs::create_directories(dst.parent_path(), ec);
            if (!ec) fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
            if (ec) warn(w, "skipped " + src.string() + ", since the file cannot be accessed: " + ec.message());
        }
    }

    void warn(Work& w, const std::string& message) {
        SDL_LogWarn(NLS_LOG_BATCH, "%s: %s", w.source->path.string().c_str(), message.c_str());
        if (std::find(w.result.warnings.begin(), w.result.warnings.end(), message) == w.result.warnings.end()) {
            w.result.warnings.push_back(message);
        }
    }

    static FileResult finish(FileResult result) {
        if (result.status == FileStatus::Failed) return result;
        const bool all_written = !result.variants.empty() &&
            std::all_of(result.variants.begin(), result.variants.end(), [](const VariantResult& v) { return v.written; });
        if (all_written) {
            result.status = FileStatus::Written;
            result.stage = Stage::Done;
        } else {
            result.status = FileStatus::Skipped;
            result.message = "nothing was written";
        }
        return result;
    }

    static GroupStatus group_status(const std::vector<FileResult>& files) {
        std::size_t total = 0;
        std::size_t written = 0;
        bool failed = false;
        for (const auto& f : files) {
            if (f.status == FileStatus::Failed) failed = true;
            for (const auto& v : f.variants) {
                ++total;
                if (v.written) ++written;
            }
        }
        if (total > 0 && written == total && !failed) return GroupStatus::Succeeded;
        if (written > 0) return GroupStatus::Partial;
        return GroupStatus::Failed;
    }

    const RuleTable& table_;
    const BatchOptions& options_;
    const BatchGroup& group_;
    CompanionClaims& claims_;
};

GroupResult cancelled_result(const BatchGroup& group) {
    GroupResult out;
    out.folder = group.folder;
    out.status = GroupStatus::Cancelled;
    auto add = [&out](const SourceFile& s) {
        FileResult r;
        r.source = s.path;
        r.relative = s.relative;
        r.status = FileStatus::Skipped;
        r.stage = Stage::Discovered;
        r.message = "batch was cancelled before this group ran";
        out.files.push_back(std::move(r));
    };
    for (const auto& m : group.materials) add(m);
    if (group.object) add(*group.object);
    for (const auto& s : group.skipped) out.files.push_back(s);
    return out;
}

GroupResult process_group(const RuleTable& table, const BatchOptions& options, const BatchGroup& group,
                          CompanionClaims& claims) {
    try {
        GroupRun run(table, options, group, claims);
        return run.run();
    } catch (const std::exception& e) {
        // per-file errors are handled inside; this keeps anything else from leaving the group
        SDL_LogCritical(NLS_LOG_BATCH, "group %s aborted: %s", group.folder.string().c_str(), e.what());
        GroupResult out = cancelled_result(group);
        out.status = GroupStatus::Failed;
        for (auto& f : out.files) {
            if (f.status == FileStatus::Skipped && f.stage == Stage::Discovered && !f.error) {
                f.status = FileStatus::Failed;
                f.error = ErrorKind::Internal;
                f.message = e.what();
            }
        }
        return out;
    }
}

} // namespace

const char* to_string(Stage stage) {
    switch (stage) {
        case Stage::Discovered: return "discovered";
        case Stage::Parsed: return "parsed";
        case Stage::Transformed: return "transformed";
        case Stage::Written: return "written";
        case Stage::Done: return "done";
    }
    return "discovered";
}

const char* to_string(FileStatus status) {
    switch (status) {
        case FileStatus::Written: return "written";
        case FileStatus::Skipped: return "skipped";
        case FileStatus::Failed: return "failed";
    }
    return "failed";
}

const char* to_string(GroupStatus status) {
    switch (status) {
        case GroupStatus::Succeeded: return "succeeded";
        case GroupStatus::Partial: return "partial";
        case GroupStatus::Failed: return "failed";
        case GroupStatus::Cancelled: return "cancelled";
    }
    return "failed";
}

BatchSummary BatchReport::summary() const {
    BatchSummary s;
    auto count_file = [&s](const FileResult& f) {
        switch (f.status) {
            case FileStatus::Written: ++s.files_written; break;
            case FileStatus::Skipped: ++s.files_skipped; break;
            case FileStatus::Failed: ++s.files_failed; break;
        }
    };
    for (const auto& g : groups) {
        switch (g.status) {
            case GroupStatus::Succeeded: ++s.groups_succeeded; break;
            case GroupStatus::Partial: ++s.groups_partial; break;
            case GroupStatus::Failed: ++s.groups_failed; break;
            case GroupStatus::Cancelled: ++s.groups_cancelled; break;
        }
        for (const auto& f : g.files) count_file(f);
    }
    for (const auto& f : rejected) count_file(f);
    return s;
}

bool BatchReport::ok() const {
    const BatchSummary s = summary();
    return s.groups_partial == 0 && s.groups_failed == 0 && s.groups_cancelled == 0 && s.files_failed == 0;
}

const FileResult* BatchReport::find(const fs::path& source) const {
    const fs::path wanted = fs::absolute(source).lexically_normal();
    for (const auto& g : groups) {
        for (const auto& f : g.files) {
            if (f.source == wanted) return &f;
        }
    }
    for (const auto& f : rejected) {
        if (f.source == wanted) return &f;
    }
    return nullptr;
}

Orchestrator::Orchestrator(const RuleTable& table, BatchOptions options)
    : table_(table), options_(std::move(options)) {
    if (options_.scales.empty()) options_.scales = table_.default_set();

    std::vector<ScaleFactor> unique;
    for (const auto& s : options_.scales) {
        if (!table_.supports(s)) {
            throw UnsupportedScaleFactorError("scale '" + s.tag + "' is not a supported scale factor");
        }
        if (std::find(unique.begin(), unique.end(), s) == unique.end()) unique.push_back(s);
    }
    if (unique.empty()) throw UnsupportedScaleFactorError("no scale factor selected");
    options_.scales = std::move(unique);
    if (options_.jobs == 0) options_.jobs = 1;
}

GroupResult Orchestrator::ProcessGroup(const BatchGroup& group) const {
    CompanionClaims claims;
    return process_group(table_, options_, group, claims);
}

BatchReport Orchestrator::Run(const std::vector<fs::path>& inputs) const {
    BatchReport report;
    Discovery found;
    try {
        found = DiscoverGroups(inputs, table_);
    } catch (const std::exception& e) {
        SDL_LogError(NLS_LOG_BATCH, "discovery failed: %s", e.what());
        FileResult r;
        r.status = FileStatus::Failed;
        r.error = ErrorKind::Internal;
        r.message = std::string("discovery failed: ") + e.what();
        report.rejected.push_back(std::move(r));
        return report;
    }

    report.rejected = std::move(found.rejected);
    report.groups.reserve(found.groups.size());
    for (const auto& g : found.groups) report.groups.push_back(cancelled_result(g));

    SDL_LogInfo(NLS_LOG_BATCH, "%zu groups, %zu scales, destination %s", found.groups.size(), options_.scales.size(),
                options_.destination.string().c_str());

    // each group owns its slot in report.groups, workers never share one
    std::atomic<std::size_t> next{0};
    CompanionClaims claims;
    auto worker = [&]() {
        for (;;) {
            if (options_.cancel && options_.cancel->load()) return;
            const std::size_t i = next.fetch_add(1);
            if (i >= found.groups.size()) return;
            report.groups[i] = process_group(table_, options_, found.groups[i], claims);
        }
    };

    const std::size_t wanted = std::min<std::size_t>(options_.jobs, std::max<std::size_t>(found.groups.size(), 1));
    std::vector<std::thread> threads;
    for (std::size_t t = 1; t < wanted; ++t) {
        try {
            threads.emplace_back(worker);
        } catch (const std::system_error& e) {
            SDL_LogWarn(NLS_LOG_BATCH, "could not start worker thread: %s", e.what());
            break;
        }
    }
    worker();
    for (auto& t : threads) t.join();

    if (options_.cancel && options_.cancel->load()) {
        SDL_LogWarn(NLS_LOG_BATCH, "batch cancelled, remaining groups were not processed");
    }
    return report;
}

} // namespace nls
