#include "lv/core/util/Error.hpp"

#include <nlohmann/json.hpp>

namespace lv {

namespace {

std::string composeMessage(ErrorKind kind, const std::string& detail)
{
    switch (kind) {
        case ErrorKind::Invalid:
            return "invalid request: " + detail;
        case ErrorKind::Missing:
            return "not found: " + detail;
        case ErrorKind::UnsupportedCompression:
            return "unsupported compression: " + detail;
        case ErrorKind::MalformedChunk:
            return "malformed chunk";
        case ErrorKind::Io:
            return "io error: " + detail;
        case ErrorKind::Task:
            return "task error: " + detail;
        case ErrorKind::Open:
            return "open error: " + detail;
    }
    return detail;
}

}  // namespace

const char* errorKindName(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::Invalid: return "Invalid";
        case ErrorKind::Missing: return "Missing";
        case ErrorKind::UnsupportedCompression: return "UnsupportedCompression";
        case ErrorKind::MalformedChunk: return "MalformedChunk";
        case ErrorKind::Io: return "Io";
        case ErrorKind::Task: return "Task";
        case ErrorKind::Open: return "Open";
    }
    return "Unknown";
}

Error::Error(ErrorKind kind, const std::string& detail)
    : std::runtime_error(composeMessage(kind, detail))
    , kind_(kind)
    , detail_(detail)
{
}

nlohmann::json toJson(const Error& err)
{
    return {{"code", errorKindName(err.kind())}, {"message", err.what()}};
}

}  // namespace lv
