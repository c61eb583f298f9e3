#include "filechunker/errors.hpp"

namespace filechunker
{

const char *SplitError::kindName(SplitErrorKind kind) noexcept
{
    switch (kind)
    {
    case SplitErrorKind::Configuration:
        return "ConfigurationError";
    case SplitErrorKind::NotFound:
        return "NotFoundError";
    case SplitErrorKind::Permission:
        return "PermissionError";
    case SplitErrorKind::Decode:
        return "DecodeError";
    case SplitErrorKind::IO:
        return "IOError";
    default:
        return "SplitError";
    }
}

} // namespace filechunker
