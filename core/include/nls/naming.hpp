//
// Created by MWAC-dev on 10/16/2026.
//

#pragma once

#include "rules.hpp"

#include <filesystem>
#include <string>

namespace nls {

    // The one naming function for scaled files. Both the reference rewrite in object
    // documents and the output path of written documents go through it.
    // "dir/rail.nl2mat" with suffix "_{tag}" at x2 -> "dir/rail_x2.nl2mat"
    std::string ScaledFileName(const std::string& name, const ScaleFactor& factor);

    // <destination>/<tag>/<relative dir>/<ScaledFileName(relative file name)>
    std::filesystem::path ScaledOutputPath(const std::filesystem::path& destination, const ScaleFactor& factor,
                                           const std::filesystem::path& relative);
}
