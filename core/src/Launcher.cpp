#include "lv/core/util/Launcher.hpp"

#include <cstdlib>
#include <string>

#include "lv/core/util/Error.hpp"
#include "lv/core/util/Logging.hpp"

namespace lv {

namespace {

#if defined(__APPLE__)
constexpr const char* kOpener = "open";
#else
constexpr const char* kOpener = "xdg-open";
#endif

std::string shellQuote(const std::string& s)
{
    std::string out = "'";
    for (char c : s) {
        if (c == '\'')
            out += "'\\''";
        else
            out += c;
    }
    out += "'";
    return out;
}

}  // namespace

void openWithDefaultApp(const std::filesystem::path& path)
{
    const std::string probe = std::string("command -v ") + kOpener + " >/dev/null 2>&1";
    if (std::system(probe.c_str()) != 0) {
        throw Error::open(std::string(kOpener) + " not available to open " + path.string());
    }

    const std::string cmd = std::string(kOpener) + " " + shellQuote(path.string()) + " >/dev/null 2>&1 &";
    Logger()->debug("launching viewer: {}", cmd);
    int sysResult = std::system(cmd.c_str());
    if (sysResult != 0) {
        throw Error::open("failed to launch " + std::string(kOpener) + " (code " +
                          std::to_string(sysResult) + ") for " + path.string());
    }
}

}  // namespace lv
