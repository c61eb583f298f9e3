#pragma once

#include "export.hpp"

#include <stdexcept>
#include <string>

namespace filechunker {

enum class SplitErrorKind {
    Configuration,
    NotFound,
    Permission,
    Decode,
    IO
};

/**
 * @brief Base of every failure raised by a split run.
 *
 * All kinds are fatal to the current run and reach the caller with their
 * original message; none is downgraded to a partial result.
 */
class FILECHUNKER_API SplitError : public std::runtime_error {
public:
    SplitError(SplitErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    SplitErrorKind kind() const noexcept { return kind_; }

    static const char* kindName(SplitErrorKind kind) noexcept;

private:
    SplitErrorKind kind_;
};

// Malformed policy or missing inputs; raised before any I/O
class FILECHUNKER_API ConfigurationError : public SplitError {
public:
    explicit ConfigurationError(const std::string& message)
        : SplitError(SplitErrorKind::Configuration, message) {}
};

// Source path is not an existing regular file; raised before any I/O
class FILECHUNKER_API NotFoundError : public SplitError {
public:
    explicit NotFoundError(const std::string& message)
        : SplitError(SplitErrorKind::NotFound, message) {}
};

// Output directory cannot be created or written; raised before any chunk
class FILECHUNKER_API PermissionError : public SplitError {
public:
    explicit PermissionError(const std::string& message)
        : SplitError(SplitErrorKind::Permission, message) {}
};

// Page-structured source cannot be parsed; raised before any output
class FILECHUNKER_API DecodeError : public SplitError {
public:
    explicit DecodeError(const std::string& message)
        : SplitError(SplitErrorKind::Decode, message) {}
};

// Read or write failed mid-stream; earlier chunks stay on disk
class FILECHUNKER_API IOError : public SplitError {
public:
    explicit IOError(const std::string& message)
        : SplitError(SplitErrorKind::IO, message) {}
};

} // namespace filechunker
