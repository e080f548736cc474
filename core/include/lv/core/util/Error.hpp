#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace lv {

enum class ErrorKind {
    Invalid,
    Missing,
    UnsupportedCompression,
    MalformedChunk,
    Io,
    Task,
    Open
};

/// Name used as the "code" tag when an error is reported to a caller.
const char* errorKindName(ErrorKind kind);

/**
 * @brief Engine error carrying its kind
 *
 * Every failure surfaced by an inspection operation is one of these. The
 * what() text is the kind prefix followed by the detail, e.g.
 * "not found: /data/index.json".
 */
class Error : public std::runtime_error
{
public:
    Error(ErrorKind kind, const std::string& detail);

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& detail() const noexcept { return detail_; }

    static Error invalid(const std::string& detail) { return {ErrorKind::Invalid, detail}; }
    static Error missing(const std::string& detail) { return {ErrorKind::Missing, detail}; }
    static Error unsupportedCompression(const std::string& scheme)
    {
        return {ErrorKind::UnsupportedCompression, scheme};
    }
    static Error malformedChunk() { return {ErrorKind::MalformedChunk, ""}; }
    static Error io(const std::string& detail) { return {ErrorKind::Io, detail}; }
    static Error task(const std::string& detail) { return {ErrorKind::Task, detail}; }
    static Error open(const std::string& detail) { return {ErrorKind::Open, detail}; }

private:
    ErrorKind kind_;
    std::string detail_;
};

/// {"code": "<Kind>", "message": "<what()>"}
nlohmann::json toJson(const Error& err);

}  // namespace lv
