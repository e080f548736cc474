#include "test.hpp"

#include <algorithm>
#include <optional>
#include <string>

#include "fixtures.hpp"
#include "lv/core/util/ContentSniffer.hpp"

using namespace lv_test;

namespace {

Bytes wavHeader()
{
    auto b = bytes_of("RIFF");
    put_u32(b, 36);
    auto wave = bytes_of("WAVEfmt ");
    b.insert(b.end(), wave.begin(), wave.end());
    return b;
}

const Bytes kOpaque = {0x00, 0x01, 0x02, 0x03, 0xFE, 0x9A};
const Bytes kJpeg = {0xFF, 0xD8, 0xFF, 0xE0, 0x00, 0x10, 'J', 'F', 'I', 'F'};
const Bytes kPng = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A, 0, 0, 0, 0x0D};

std::optional<std::string> guess(const char* token, const Bytes& data)
{
    return lv::guessExtension(std::optional<std::string>(token), data);
}

}  // namespace

// --- magic -------------------------------------------------------------------

TEST(MagicSniff, RecognizesAudioContainers)
{
    EXPECT_EQ(lv::detectMagicExtension(wavHeader()), std::optional<std::string>("wav"));
    EXPECT_EQ(lv::detectMagicExtension(bytes_of("ID3\x04")), std::optional<std::string>("mp3"));
    EXPECT_EQ(lv::detectMagicExtension(Bytes{0xFF, 0xFB, 0x90}), std::optional<std::string>("mp3"));
    EXPECT_EQ(lv::detectMagicExtension(bytes_of("fLaC")), std::optional<std::string>("flac"));
}

TEST(MagicSniff, IgnoresOtherBytes)
{
    EXPECT_FALSE(lv::detectMagicExtension(kOpaque).has_value());
    EXPECT_FALSE(lv::detectMagicExtension(kJpeg).has_value());
    EXPECT_FALSE(lv::detectMagicExtension(Bytes{}).has_value());
}

// --- declared format ---------------------------------------------------------

TEST(GuessExtension, BytesTokenPrefersMagic)
{
    EXPECT_EQ(guess("bytes", wavHeader()), std::optional<std::string>("wav"));
    EXPECT_EQ(guess("BIN", wavHeader()), std::optional<std::string>("wav"));
}

TEST(GuessExtension, BytesTokenFallsBackToBin)
{
    EXPECT_EQ(guess("bytes", kOpaque), std::optional<std::string>("bin"));
    // a jpeg declared as bytes stays bin: only audio magic is consulted
    EXPECT_EQ(guess("bin", kJpeg), std::optional<std::string>("bin"));
}

TEST(GuessExtension, ColonSubtypeWins)
{
    EXPECT_EQ(guess("myfield:caption", kOpaque), std::optional<std::string>("caption"));
    EXPECT_EQ(guess("image: .jpeg ", kOpaque), std::optional<std::string>("jpeg"));
    EXPECT_EQ(guess("a:b:c", kOpaque), std::optional<std::string>("b:c"));
}

TEST(GuessExtension, EmptySubtypeFallsThrough)
{
    // nothing after the colon: continue with the dot rule
    EXPECT_EQ(guess("file.png:", kOpaque), std::optional<std::string>("png:"));
    // no dot either, and "jpeg:" is not a keyword: content decides
    EXPECT_FALSE(guess("jpeg:", kOpaque).has_value());
    EXPECT_EQ(guess("jpeg:", bytes_of("plain")), std::optional<std::string>("txt"));
}

TEST(GuessExtension, TextAfterLastDot)
{
    EXPECT_EQ(guess("sample.tar.gz", kOpaque), std::optional<std::string>("gz"));
    EXPECT_EQ(guess("image.webp", kOpaque), std::optional<std::string>("webp"));
}

TEST(GuessExtension, KeywordTable)
{
    EXPECT_EQ(guess("jpeg", kOpaque), std::optional<std::string>("jpg"));
    EXPECT_EQ(guess("JPG", kOpaque), std::optional<std::string>("jpg"));
    EXPECT_EQ(guess("pil", kOpaque), std::optional<std::string>("png"));
    EXPECT_EQ(guess("tiff", kOpaque), std::optional<std::string>("tiff"));
    EXPECT_EQ(guess("str", kOpaque), std::optional<std::string>("txt"));
    EXPECT_EQ(guess("int", kOpaque), std::optional<std::string>("txt"));
    EXPECT_EQ(guess("float", kOpaque), std::optional<std::string>("txt"));
    EXPECT_EQ(guess("bool", kOpaque), std::optional<std::string>("txt"));
    EXPECT_EQ(guess("audio", kOpaque), std::optional<std::string>("wav"));
}

TEST(GuessExtension, AudioSubstrings)
{
    EXPECT_EQ(guess("raw_wav_16k", kOpaque), std::optional<std::string>("wav"));
    EXPECT_EQ(guess("MP3Stream", kOpaque), std::optional<std::string>("mp3"));
    EXPECT_EQ(guess("flac24", kOpaque), std::optional<std::string>("flac"));
}

// --- content fallback --------------------------------------------------------

TEST(GuessExtension, UnknownTokenUsesContent)
{
    EXPECT_EQ(guess("numpy", wavHeader()), std::optional<std::string>("wav"));
    EXPECT_EQ(guess("pickle", bytes_of("hello world")), std::optional<std::string>("txt"));
    EXPECT_EQ(guess("pickle", kPng), std::optional<std::string>("png"));
}

TEST(GuessExtension, NoTokenText)
{
    EXPECT_EQ(lv::guessExtension(std::nullopt, bytes_of("caption text")), std::optional<std::string>("txt"));
    // blank text is not enough
    EXPECT_FALSE(lv::guessExtension(std::nullopt, bytes_of(" \n\t ")).has_value());
}

TEST(GuessExtension, NoTokenSignatures)
{
    EXPECT_EQ(lv::guessExtension(std::nullopt, kJpeg), std::optional<std::string>("jpg"));
    EXPECT_EQ(lv::guessExtension(std::nullopt, bytes_of("%PDF-1.7\n\xE2\xE3\xCF\xD3")),
              std::optional<std::string>("pdf"));
    EXPECT_EQ(lv::guessExtension(std::nullopt, Bytes{0x1F, 0x8B, 0x08, 0x00, 0xFF}),
              std::optional<std::string>("gz"));
    EXPECT_FALSE(lv::guessExtension(std::nullopt, kOpaque).has_value());
}

// --- generic inference -------------------------------------------------------

TEST(InferExtension, RiffSubtypes)
{
    auto webp = bytes_of("RIFF");
    put_u32(webp, 100);
    auto tag = bytes_of("WEBPVP8 ");
    webp.insert(webp.end(), tag.begin(), tag.end());
    EXPECT_EQ(lv::inferExtension(webp), std::optional<std::string>("webp"));
    EXPECT_EQ(lv::inferExtension(wavHeader()), std::optional<std::string>("wav"));
}

TEST(InferExtension, IsoBrands)
{
    Bytes mp4;
    put_u32(mp4, 0x18000000);
    auto rest = bytes_of("ftypisom");
    mp4.insert(mp4.end(), rest.begin(), rest.end());
    EXPECT_EQ(lv::inferExtension(mp4), std::optional<std::string>("mp4"));

    Bytes heic;
    put_u32(heic, 0x18000000);
    auto brand = bytes_of("ftypheic");
    heic.insert(heic.end(), brand.begin(), brand.end());
    EXPECT_EQ(lv::inferExtension(heic), std::optional<std::string>("heic"));
}

TEST(InferExtension, TarMagicAtOffset)
{
    Bytes tar(300, 0);
    auto magic = bytes_of("ustar");
    std::copy(magic.begin(), magic.end(), tar.begin() + 257);
    EXPECT_EQ(lv::inferExtension(tar), std::optional<std::string>("tar"));
}
