#ifndef SLICECAP_ERRORS_HPP
#define SLICECAP_ERRORS_HPP

#include <stdexcept>
#include <string>

enum class FormatErrorKind {
    InvalidMagic,
    UnsupportedVersion,
    ShortFile,
    TruncatedRead,
    BoundaryNotFound,
    CorruptRecord
};

inline const char* format_error_kind_name(FormatErrorKind kind) {
    switch (kind) {
        case FormatErrorKind::InvalidMagic:       return "InvalidMagic";
        case FormatErrorKind::UnsupportedVersion: return "UnsupportedVersion";
        case FormatErrorKind::ShortFile:          return "ShortFile";
        case FormatErrorKind::TruncatedRead:      return "TruncatedRead";
        case FormatErrorKind::BoundaryNotFound:   return "BoundaryNotFound";
        default:                                  return "CorruptRecord";
    }
}

// The capture itself cannot be sliced. Raised before any worker is spawned.
class FormatError : public std::runtime_error {
public:
    FormatError(FormatErrorKind kind, const std::string& what)
        : std::runtime_error(std::string(format_error_kind_name(kind)) + ": " + what),
          kind_(kind) {}

    FormatErrorKind kind() const { return kind_; }

private:
    FormatErrorKind kind_;
};

// Bad user input (slice count, parallelism, command template, ...).
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

#endif // SLICECAP_ERRORS_HPP
