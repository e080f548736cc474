#include "lv/core/util/Filesystem.hpp"

#include <fstream>
#include <random>
#include <system_error>

#include "lv/core/util/Error.hpp"

namespace lv {

fs::path create_temp_directory(const std::string& prefix)
{
    std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<unsigned> suffix(0, 999999);
    const auto base = fs::temp_directory_path();

    // create_directory reports false when the name is already taken
    for (int attempt = 0; attempt < 100; ++attempt) {
        auto dir = base / (prefix + "_" + std::to_string(suffix(rng)));
        std::error_code ec;
        if (fs::create_directory(dir, ec)) {
            return dir;
        }
        if (ec) {
            throw Error::io("cannot create " + dir.string() + ": " + ec.message());
        }
    }
    throw Error::io("no free temporary directory name under " + base.string());
}

void ensure_directory(const fs::path& dir)
{
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw Error::io("cannot create " + dir.string() + ": " + ec.message());
    }
}

void write_file(const fs::path& path, const std::vector<uint8_t>& bytes)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw Error::io("cannot create " + path.string());
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out) {
        throw Error::io("write failed: " + path.string());
    }
}

}  // namespace lv
