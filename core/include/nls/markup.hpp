//
// Created by MWAC-dev on 10/16/2026.
//

#pragma once

#include "document.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace nls {

    // Lossless parse of .nl2mat/.nl2sco markup. Throws MalformedInputError.
    Document ParseDocument(std::string_view text, const std::string& source_name = {});

    // Reads the file in binary and parses it. Throws IOReadError or MalformedInputError.
    Document LoadDocument(const std::filesystem::path& path);

    // Left inverse of ParseDocument: SerializeDocument(ParseDocument(t)) == t.
    std::string SerializeDocument(const Document& doc);

    // Creates parent directories as needed. Throws IOWriteError.
    void WriteDocument(const Document& doc, const std::filesystem::path& path);

    // Predefined entities and numeric character references
    std::string UnescapeText(std::string_view raw);
    std::string EscapeText(std::string_view text);
}
