//
// Created by MWAC-dev on 10/16/2026.
//

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace nls {

    enum class ErrorKind {
        MalformedInput,
        UnsupportedScaleFactor,
        TemplateLoad,
        ReferentialIntegrity,
        IOWrite,
        IORead,
        Internal
    };

    const char* to_string(ErrorKind kind);

    class Error : public std::runtime_error {
    public:
        Error(ErrorKind kind, const std::string& message)
            : std::runtime_error(message), kind_(kind) {}

        ErrorKind kind() const { return kind_; }

    private:
        ErrorKind kind_;
    };

    // line/column are 1-based, 0 when unknown
    class MalformedInputError : public Error {
    public:
        MalformedInputError(const std::string& source, std::size_t line, std::size_t column,
                            const std::string& what);

        const std::string& source() const { return source_; }
        std::size_t line() const { return line_; }
        std::size_t column() const { return column_; }

    private:
        std::string source_;
        std::size_t line_;
        std::size_t column_;
    };

    class UnsupportedScaleFactorError : public Error {
    public:
        explicit UnsupportedScaleFactorError(const std::string& message)
            : Error(ErrorKind::UnsupportedScaleFactor, message) {}
    };

    class TemplateLoadError : public Error {
    public:
        explicit TemplateLoadError(const std::string& message)
            : Error(ErrorKind::TemplateLoad, message) {}
    };

    class ReferentialIntegrityError : public Error {
    public:
        explicit ReferentialIntegrityError(const std::string& message)
            : Error(ErrorKind::ReferentialIntegrity, message) {}
    };

    class IOWriteError : public Error {
    public:
        explicit IOWriteError(const std::string& message)
            : Error(ErrorKind::IOWrite, message) {}
    };

    class IOReadError : public Error {
    public:
        explicit IOReadError(const std::string& message)
            : Error(ErrorKind::IORead, message) {}
    };
}
