//
// Created by MWAC-dev on 10/16/2026.
//

#pragma once

#include "errors.hpp"
#include "rules.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace nls {

    enum class Stage {
        Discovered,
        Parsed,
        Transformed,
        Written,
        Done
    };

    enum class FileStatus {
        Written,
        Skipped,
        Failed
    };

    enum class GroupStatus {
        Succeeded,
        Partial,
        Failed,
        Cancelled
    };

    const char* to_string(Stage stage);
    const char* to_string(FileStatus status);
    const char* to_string(GroupStatus status);

    struct VariantResult {
        std::string scale_tag;
        std::filesystem::path output;
        bool written{false};
        Stage stage{Stage::Parsed};          // last stage reached, or the failing one
        std::optional<ErrorKind> error;
        std::string message;
    };

    struct FileResult {
        std::filesystem::path source;
        std::filesystem::path relative;
        FileStatus status{FileStatus::Skipped};
        Stage stage{Stage::Discovered};
        std::optional<ErrorKind> error;      // first failure
        std::string message;
        std::vector<VariantResult> variants;
        std::vector<std::string> warnings;
    };

    struct SourceFile {
        std::filesystem::path path;          // absolute, normalized
        std::filesystem::path relative;      // below the scale-tag directory
        const DocumentRules* rules{nullptr};
    };

    struct BatchGroup {
        std::filesystem::path folder;
        std::optional<SourceFile> object;
        std::vector<SourceFile> materials;
        std::vector<FileResult> skipped;     // extra object files of the folder
    };

    struct Discovery {
        std::vector<BatchGroup> groups;
        std::vector<FileResult> rejected;    // missing paths, unknown types, output collisions
    };

    // Groups files by folder. Directories are walked recursively; loose files are grouped
    // by their parent folder and land at the scale root, unless their folder is also reached
    // through a dropped directory.
    Discovery DiscoverGroups(const std::vector<std::filesystem::path>& inputs, const RuleTable& table);

    struct GroupResult {
        std::filesystem::path folder;
        GroupStatus status{GroupStatus::Cancelled};
        std::vector<FileResult> files;
    };

    struct BatchSummary {
        std::size_t groups_succeeded{0};
        std::size_t groups_partial{0};
        std::size_t groups_failed{0};
        std::size_t groups_cancelled{0};
        std::size_t files_written{0};
        std::size_t files_skipped{0};
        std::size_t files_failed{0};
    };

    struct BatchReport {
        std::vector<GroupResult> groups;
        std::vector<FileResult> rejected;

        BatchSummary summary() const;

        // Every group succeeded and nothing failed
        bool ok() const;

        // Result of a source file, nullptr when it was never seen
        const FileResult* find(const std::filesystem::path& source) const;
    };

    struct BatchOptions {
        std::filesystem::path destination;
        std::vector<ScaleFactor> scales;         // empty selects the table's default set
        unsigned jobs{1};
        const std::atomic<bool>* cancel{nullptr};
        bool copy_companions{true};
    };

    class Orchestrator {
    public:
        // Throws UnsupportedScaleFactorError when a selected scale is not in the table.
        Orchestrator(const RuleTable& table, BatchOptions options);

        // Never throws for per-file problems; they end up in the report.
        BatchReport Run(const std::vector<std::filesystem::path>& inputs) const;

        GroupResult ProcessGroup(const BatchGroup& group) const;

        const std::vector<ScaleFactor>& scales() const { return options_.scales; }

    private:
        const RuleTable& table_;
        BatchOptions options_;
    };
}
