// Copyright (c) Created by MWAC-dev on 2026.
// core/src/naming.cpp
#include "nls/naming.hpp"

namespace nls {

namespace {

std::string expand_suffix(const std::string& pattern, const std::string& tag) {
    static const std::string placeholder = "{tag}";
    std::string out = pattern;
    std::size_t pos = 0;
    while ((pos = out.find(placeholder, pos)) != std::string::npos) {
        out.replace(pos, placeholder.size(), tag);
        pos += tag.size();
    }
    return out;
}

} // namespace

std::string ScaledFileName(const std::string& name, const ScaleFactor& factor) {
    if (factor.file_suffix.empty() || name.empty()) return name;
    const std::string suffix = expand_suffix(factor.file_suffix, factor.tag);

    const std::size_t sep = name.find_last_of("/\\");
    const std::size_t base = sep == std::string::npos ? 0 : sep + 1;
    const std::size_t dot = name.find_last_of('.');
    // no extension, or a leading dot only ("dir/.hidden")
    if (dot == std::string::npos || dot <= base) return name + suffix;
    return name.substr(0, dot) + suffix + name.substr(dot);
}

std::filesystem::path ScaledOutputPath(const std::filesystem::path& destination, const ScaleFactor& factor,
                                       const std::filesystem::path& relative) {
    return destination / factor.tag / relative.parent_path() /
           ScaledFileName(relative.filename().string(), factor);
}

} // namespace nls
