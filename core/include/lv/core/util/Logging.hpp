#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace lv {

class LogSinks;

// Process-wide logger. Messages use {} placeholders filled left to right;
// surplus placeholders are left as written, surplus arguments are dropped.
class MinimalLogger {
public:
    enum class Level { Debug, Info, Warn, Error, Off };

    MinimalLogger();
    ~MinimalLogger();

    MinimalLogger(const MinimalLogger&) = delete;
    MinimalLogger& operator=(const MinimalLogger&) = delete;

    template<typename... Args>
    void debug(std::string_view fmt, const Args&... args) { emit(Level::Debug, fmt, args...); }
    template<typename... Args>
    void info(std::string_view fmt, const Args&... args) { emit(Level::Info, fmt, args...); }
    template<typename... Args>
    void warn(std::string_view fmt, const Args&... args) { emit(Level::Warn, fmt, args...); }
    template<typename... Args>
    void error(std::string_view fmt, const Args&... args) { emit(Level::Error, fmt, args...); }

    void set_level(Level level) { _level.store(level, std::memory_order_relaxed); }
    Level level() const { return _level.load(std::memory_order_relaxed); }
    bool enabled(Level level) const { return level != Level::Off && level >= this->level(); }

    // Throws lv::Error (Io) when the file cannot be opened for appending
    void add_file(const std::filesystem::path& path);

    // Console lines go to stdout unless redirected (the CLI keeps stdout for
    // JSON results)
    void use_stderr(bool enable);

private:
    template<typename... Args>
    void emit(Level level, std::string_view fmt, const Args&... args)
    {
        if (!enabled(level)) return;
        std::ostringstream out;
        std::size_t pos = 0;
        (substitute(out, fmt, pos, args), ...);
        out << fmt.substr(pos);
        publish(level, out.str());
    }

    template<typename T>
    static void substitute(std::ostringstream& out, std::string_view fmt, std::size_t& pos, const T& value)
    {
        auto hole = fmt.find("{}", pos);
        if (hole == std::string_view::npos) return;
        out << fmt.substr(pos, hole - pos);
        if constexpr (std::is_same_v<T, std::filesystem::path>) {
            out << value.string();
        } else {
            out << value;
        }
        pos = hole + 2;
    }

    void publish(Level level, const std::string& msg);

    std::atomic<Level> _level{Level::Info};
    std::unique_ptr<LogSinks> _sinks;
};

auto Logger() -> std::shared_ptr<MinimalLogger>;

void AddLogFile(const std::filesystem::path& path);

// Case-insensitive: debug, info, warn/warning, error, off
std::optional<MinimalLogger::Level> ParseLogLevel(std::string_view name);

// Throws lv::Error (Invalid) for an unknown level name
void SetLogLevel(std::string_view name);

}  // namespace lv
