#include "lv/core/util/Logging.hpp"

#include <array>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <vector>

#include "lv/core/util/Error.hpp"

namespace lv {

namespace {

using Level = MinimalLogger::Level;

constexpr std::array<std::pair<std::string_view, Level>, 6> kLevelNames{{
    {"debug", Level::Debug},
    {"info", Level::Info},
    {"warn", Level::Warn},
    {"warning", Level::Warn},
    {"error", Level::Error},
    {"off", Level::Off},
}};

const char* tag(Level level)
{
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO ";
        case Level::Warn:  return "WARN ";
        case Level::Error: return "ERROR";
        case Level::Off:   break;
    }
    return "?????";
}

// Local wall-clock time with milliseconds
std::string stamp()
{
    using namespace std::chrono;
    auto now = system_clock::now();
    auto secs = system_clock::to_time_t(now);
    auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&secs, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%F %T") << '.' << std::setfill('0') << std::setw(3) << millis;
    return out.str();
}

}  // namespace

class LogSinks {
public:
    std::mutex mutex;
    bool console_stderr = false;
    std::vector<std::ofstream> files;
};

MinimalLogger::MinimalLogger() : _sinks(std::make_unique<LogSinks>()) {}

MinimalLogger::~MinimalLogger() = default;

void MinimalLogger::publish(Level level, const std::string& msg)
{
    std::string line = "[" + stamp() + "] [" + tag(level) + "] " + msg + "\n";

    std::lock_guard<std::mutex> lock(_sinks->mutex);
    (_sinks->console_stderr ? std::cerr : std::cout) << line << std::flush;
    for (auto& file : _sinks->files) {
        file << line << std::flush;
    }
}

void MinimalLogger::add_file(const std::filesystem::path& path)
{
    std::ofstream file(path, std::ios::app);
    if (!file) {
        throw Error::io("cannot open log file " + path.string());
    }
    std::lock_guard<std::mutex> lock(_sinks->mutex);
    _sinks->files.push_back(std::move(file));
}

void MinimalLogger::use_stderr(bool enable)
{
    std::lock_guard<std::mutex> lock(_sinks->mutex);
    _sinks->console_stderr = enable;
}

auto Logger() -> std::shared_ptr<MinimalLogger>
{
    static auto logger = std::make_shared<MinimalLogger>();
    return logger;
}

void AddLogFile(const std::filesystem::path& path) { Logger()->add_file(path); }

std::optional<MinimalLogger::Level> ParseLogLevel(std::string_view name)
{
    std::string lower;
    lower.reserve(name.size());
    for (unsigned char c : name) {
        lower.push_back(static_cast<char>(std::tolower(c)));
    }
    for (const auto& [key, level] : kLevelNames) {
        if (lower == key) return level;
    }
    return std::nullopt;
}

void SetLogLevel(std::string_view name)
{
    auto level = ParseLogLevel(name);
    if (!level) {
        throw Error::invalid("unknown log level: " + std::string(name));
    }
    Logger()->set_level(*level);
}

}  // namespace lv
