// Copyright (c) Created by MWAC-dev on 2026.
// core/src/errors.cpp
#include "nls/errors.hpp"

namespace nls {

namespace {

std::string located_message(const std::string& source, std::size_t line, std::size_t column,
                            const std::string& what) {
    std::string out = source.empty() ? std::string("<memory>") : source;
    if (line > 0) {
        out += ":" + std::to_string(line);
        if (column > 0) out += ":" + std::to_string(column);
    }
    out += ": " + what;
    return out;
}

} // namespace

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedInput: return "MalformedInputError";
        case ErrorKind::UnsupportedScaleFactor: return "UnsupportedScaleFactorError";
        case ErrorKind::TemplateLoad: return "TemplateLoadError";
        case ErrorKind::ReferentialIntegrity: return "ReferentialIntegrityError";
        case ErrorKind::IOWrite: return "IOWriteError";
        case ErrorKind::IORead: return "IOReadError";
        case ErrorKind::Internal: return "InternalError";
    }
    return "InternalError";
}

MalformedInputError::MalformedInputError(const std::string& source, std::size_t line,
                                         std::size_t column, const std::string& what)
    : Error(ErrorKind::MalformedInput, located_message(source, line, column, what)),
      source_(source), line_(line), column_(column) {}

} // namespace nls
