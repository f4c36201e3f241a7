// Copyright (c) Created by MWAC-dev on 2026.
// core/src/discovery.cpp
#include "nls/batch.hpp"
#include "nls/log.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace nls {

namespace {

fs::path normalized(const fs::path& p) {
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    if (ec) abs = p;
    abs = abs.lexically_normal();
    if (!abs.has_filename() && abs.has_relative_path()) abs = abs.parent_path();
    return abs;
}

FileResult make_result(const fs::path& source, const fs::path& relative, FileStatus status,
                       std::optional<ErrorKind> error, const std::string& message) {
    FileResult r;
    r.source = source;
    r.relative = relative;
    r.status = status;
    r.stage = Stage::Discovered;
    r.error = error;
    r.message = message;
    return r;
}

bool by_path(const SourceFile& a, const SourceFile& b) {
    return a.path < b.path;
}

struct FolderFiles {
    fs::path folder;
    std::vector<SourceFile> objects;
    std::vector<SourceFile> materials;
};

class Collector {
public:
    explicit Collector(const RuleTable& table) : table_(table) {}

    void add_input(const fs::path& input) {
        const fs::path path = normalized(input);
        std::error_code ec;
        const auto st = fs::status(path, ec);
        if (ec || !fs::exists(st)) {
            reject(make_result(path, {}, FileStatus::Failed, ErrorKind::IORead, "no such file or directory"));
            return;
        }

        if (fs::is_directory(st)) {
            add_directory(path);
        } else if (fs::is_regular_file(st)) {
            add_file(path, nullptr);
        } else {
            reject(make_result(path, {}, FileStatus::Skipped, std::nullopt, "not a regular file"));
        }
    }

    Discovery finish() {
        // every file of a folder shares one base, so a loose file dropped together with its
        // own folder lands next to its siblings
        for (const auto& entry : pending_) {
            const fs::path folder = entry.path.parent_path();
            const auto based = bases_.find(folder);
            const fs::path relative = entry.path.lexically_relative(based != bases_.end() ? based->second : folder);
            place(entry, relative);
        }

        for (auto& folder : folders_) {
            BatchGroup group;
            group.folder = folder.folder;
            std::sort(folder.objects.begin(), folder.objects.end(), by_path);
            std::sort(folder.materials.begin(), folder.materials.end(), by_path);

            if (!folder.objects.empty()) {
                group.object = folder.objects.front();
                for (std::size_t i = 1; i < folder.objects.size(); ++i) {
                    const auto& extra = folder.objects[i];
                    SDL_LogWarn(NLS_LOG_BATCH,
                                "found more than one object file in '%s', only '%s' is used",
                                folder.folder.string().c_str(), group.object->path.filename().string().c_str());
                    group.skipped.push_back(make_result(extra.path, extra.relative, FileStatus::Skipped, std::nullopt,
                                                        "folder has more than one object file, '" +
                                                        group.object->path.filename().string() + "' is used"));
                }
            }
            group.materials = std::move(folder.materials);
            SDL_LogDebug(NLS_LOG_BATCH, "group %s: %s, %zu materials", group.folder.string().c_str(),
                         group.object ? group.object->path.filename().string().c_str() : "no object file",
                         group.materials.size());
            out_.groups.push_back(std::move(group));
        }
        return std::move(out_);
    }

private:
    void reject(FileResult result) {
        if (result.status == FileStatus::Failed) {
            SDL_LogError(NLS_LOG_BATCH, "%s: %s", result.source.string().c_str(), result.message.c_str());
        } else {
            SDL_LogWarn(NLS_LOG_BATCH, "skipped %s: %s", result.source.string().c_str(), result.message.c_str());
        }
        out_.rejected.push_back(std::move(result));
    }

    void add_directory(const fs::path& dir) {
        // relative paths keep the dropped folder's own name: shapes/track.nl2sco
        const fs::path base = dir.parent_path();
        std::vector<fs::path> files;
        std::error_code ec;
        for (auto it = fs::recursive_directory_iterator(dir, fs::directory_options::skip_permission_denied, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            std::error_code fec;
            if (it->is_regular_file(fec)) files.push_back(it->path().lexically_normal());
        }
        if (ec) {
            reject(make_result(dir, {}, FileStatus::Failed, ErrorKind::IORead, "cannot walk directory: " + ec.message()));
        }
        std::sort(files.begin(), files.end());
        for (const auto& file : files) {
            add_file(file, &base);
        }
    }

    struct Pending {
        fs::path path;
        const DocumentRules* rules;
    };

    // `base` is the parent of the dropped directory, nullptr for a loose file
    void add_file(const fs::path& path, const fs::path* base) {
        const DocumentRules* rules = table_.find_document(path);
        if (!rules) {
            if (!base) {
                reject(make_result(path, path.filename(), FileStatus::Skipped, std::nullopt,
                                   "no template for '" + path.extension().string() + "' files"));
            }
            return;
        }
        if (base) bases_.emplace(path.parent_path(), *base);
        if (!seen_.insert(path).second) return;
        pending_.push_back(Pending{path, rules});
    }

    void place(const Pending& entry, const fs::path& relative) {
        auto taken = outputs_.find(relative);
        if (taken != outputs_.end()) {
            reject(make_result(entry.path, relative, FileStatus::Skipped, std::nullopt,
                               "output path " + relative.generic_string() + " is already produced by " +
                               taken->second.string()));
            return;
        }
        outputs_.emplace(relative, entry.path);

        const fs::path folder = entry.path.parent_path();
        auto found = folder_index_.find(folder);
        if (found == folder_index_.end()) {
            found = folder_index_.emplace(folder, folders_.size()).first;
            folders_.push_back(FolderFiles{folder, {}, {}});
        }
        auto& bucket = folders_[found->second];
        SourceFile source{entry.path, relative, entry.rules};
        if (entry.rules->role == DocumentRole::Object) bucket.objects.push_back(std::move(source));
        else bucket.materials.push_back(std::move(source));
    }

    const RuleTable& table_;
    std::vector<FolderFiles> folders_;
    std::map<fs::path, std::size_t> folder_index_;
    std::set<fs::path> seen_;
    std::vector<Pending> pending_;
    std::map<fs::path, fs::path> bases_;       // folder -> base of its relative paths
    std::map<fs::path, fs::path> outputs_;
    Discovery out_;
};

} // namespace

Discovery DiscoverGroups(const std::vector<fs::path>& inputs, const RuleTable& table) {
    Collector collector(table);
    for (const auto& input : inputs) collector.add_input(input);
    return collector.finish();
}

} // namespace nls
