#include "lv/core/util/ZstdCodec.hpp"

#include <fstream>
#include <memory>

#include <zstd.h>

#include "lv/core/util/Error.hpp"

namespace lv {

namespace {

struct DStreamDeleter {
    void operator()(ZSTD_DStream* s) const { ZSTD_freeDStream(s); }
};

using DStreamPtr = std::unique_ptr<ZSTD_DStream, DStreamDeleter>;

DStreamPtr makeDStream()
{
    DStreamPtr stream(ZSTD_createDStream());
    if (!stream) {
        throw Error::invalid("zstd: cannot allocate decompression stream");
    }
    std::size_t rc = ZSTD_initDStream(stream.get());
    if (ZSTD_isError(rc)) {
        throw Error::invalid(std::string("zstd: ") + ZSTD_getErrorName(rc));
    }
    return stream;
}

// Feeds one input block through the stream, appending to out. Returns the
// decoder hint; 0 means the current frame is complete and fully flushed.
std::size_t pump(ZSTD_DStream* stream, const uint8_t* data, std::size_t len,
                 std::vector<uint8_t>& out, std::vector<uint8_t>& scratch)
{
    ZSTD_inBuffer input{data, len, 0};
    std::size_t hint = 0;
    bool outputFull = false;
    // A full output buffer may leave decoded bytes inside the stream, so keep
    // calling until it comes back short. Once a frame has finished (hint 0) with
    // the input used up, another call would start waiting on the next frame.
    while (input.pos < input.size || (outputFull && hint != 0)) {
        ZSTD_outBuffer output{scratch.data(), scratch.size(), 0};
        hint = ZSTD_decompressStream(stream, &output, &input);
        if (ZSTD_isError(hint)) {
            throw Error::invalid(std::string("zstd decompression failed: ") +
                                 ZSTD_getErrorName(hint));
        }
        out.insert(out.end(), scratch.data(), scratch.data() + output.pos);
        outputFull = output.pos == output.size;
    }
    return hint;
}

}  // namespace

std::vector<uint8_t> ZstdCodec::encode(const uint8_t* data, std::size_t len) const
{
    std::size_t maxOut = ZSTD_compressBound(len);
    std::vector<uint8_t> out(maxOut);

    std::size_t compSize = ZSTD_compress(out.data(), maxOut, data, len, level);
    if (ZSTD_isError(compSize)) {
        throw Error::invalid(std::string("zstd compression failed: ") +
                             ZSTD_getErrorName(compSize));
    }

    out.resize(compSize);
    return out;
}

std::vector<uint8_t> ZstdCodec::decode(const uint8_t* data, std::size_t len) const
{
    std::vector<uint8_t> out;
    if (len == 0) return out;

    auto stream = makeDStream();
    std::vector<uint8_t> scratch(ZSTD_DStreamOutSize());
    std::size_t hint = pump(stream.get(), data, len, out, scratch);
    if (hint != 0) {
        throw Error::invalid("zstd decompression failed: truncated stream");
    }
    return out;
}

std::vector<uint8_t> ZstdCodec::decode(std::istream& in) const
{
    auto stream = makeDStream();
    std::vector<uint8_t> inBuf(ZSTD_DStreamInSize());
    std::vector<uint8_t> scratch(ZSTD_DStreamOutSize());
    std::vector<uint8_t> out;

    bool sawInput = false;
    std::size_t hint = 0;
    while (in) {
        in.read(reinterpret_cast<char*>(inBuf.data()),
                static_cast<std::streamsize>(inBuf.size()));
        auto got = static_cast<std::size_t>(in.gcount());
        if (got == 0) break;
        sawInput = true;
        hint = pump(stream.get(), inBuf.data(), got, out, scratch);
    }
    if (in.bad()) {
        throw Error::io("read failure while decompressing");
    }
    if (sawInput && hint != 0) {
        throw Error::invalid("zstd decompression failed: truncated stream");
    }
    return out;
}

std::vector<uint8_t> ZstdCodec::decodeFile(const std::filesystem::path& path) const
{
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        throw Error::io("cannot open " + path.string());
    }
    return decode(f);
}

}  // namespace lv
