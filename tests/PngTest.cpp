#include "Png.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

Chunk chunkFromStrings(const std::string& type, const std::string& data) {
    return Chunk(ChunkType::fromString(type), std::vector<uint8_t>(data.begin(), data.end()));
}

std::vector<Chunk> testingChunks() {
    return {
        chunkFromStrings("FrSt", "I am the first chunk"),
        chunkFromStrings("miDl", "I am another chunk"),
        chunkFromStrings("LASt", "I am the last chunk"),
    };
}

Png testingPng() {
    return Png(testingChunks());
}

// Minimal image layout: header, one data chunk, end marker
Png imageLikePng() {
    std::string header("\x00\x00\x00\x01\x00\x00\x00\x01\x08\x02\x00\x00\x00", 13);
    return Png({
        chunkFromStrings("IHDR", header),
        chunkFromStrings("IDAT", "not really deflate data"),
        chunkFromStrings("IEND", ""),
    });
}

std::vector<uint8_t> withSignature(const std::vector<Chunk>& chunks) {
    std::vector<uint8_t> bytes(Png::SIGNATURE.begin(), Png::SIGNATURE.end());
    for (auto& chunk : chunks)
        bytes.insert(bytes.end(), chunk.asBytes().begin(), chunk.asBytes().end());
    return bytes;
}

}

TEST(PngTest, FromChunks) {
    EXPECT_EQ(testingPng().chunks().size(), 3u);
}

TEST(PngTest, Parse) {
    Png png = Png::parse(withSignature(testingChunks()));
    EXPECT_EQ(png.chunks().size(), 3u);
    EXPECT_EQ(png, testingPng());
}

TEST(PngTest, SignatureOnlyHasNoChunks) {
    std::vector<uint8_t> bytes(Png::SIGNATURE.begin(), Png::SIGNATURE.end());
    EXPECT_TRUE(Png::parse(bytes).chunks().empty());
}

TEST(PngTest, InvalidSignature) {
    std::vector<uint8_t> bytes = withSignature(testingChunks());
    bytes[0] = 13;
    EXPECT_THROW(Png::parse(bytes), InvalidSignature);
}

TEST(PngTest, TooShortForSignature) {
    std::vector<uint8_t> bytes(Png::SIGNATURE.begin(), Png::SIGNATURE.begin() + 5);
    EXPECT_THROW(Png::parse(bytes), InvalidSignature);
    EXPECT_THROW(Png::parse(std::vector<uint8_t>()), InvalidSignature);
}

TEST(PngTest, InvalidChunkCrc) {
    std::vector<Chunk> chunks = testingChunks();
    std::vector<uint8_t> bytes = withSignature(chunks);
    // Flip a data byte of the second chunk
    size_t offset = Png::SIGNATURE.size() + chunks[0].asBytes().size() + Chunk::HEADER_SIZE;
    bytes[offset] ^= 0x01;
    EXPECT_THROW(Png::parse(bytes), CrcMismatch);
}

TEST(PngTest, TruncatedLastChunk) {
    std::vector<uint8_t> bytes = withSignature(testingChunks());
    bytes.resize(bytes.size() - 1);
    EXPECT_THROW(Png::parse(bytes), TruncatedChunk);
}

TEST(PngTest, TrailingBytesShorterThanChunk) {
    std::vector<uint8_t> bytes = withSignature(testingChunks());
    bytes.push_back(0);
    bytes.push_back(0);
    EXPECT_THROW(Png::parse(bytes), TruncatedChunk);
}

TEST(PngTest, HugeDeclaredLength) {
    std::vector<uint8_t> bytes(Png::SIGNATURE.begin(), Png::SIGNATURE.end());
    std::vector<uint8_t> chunk = {0xFF, 0xFF, 0xFF, 0xFF, 'R', 'u', 'S', 't', 0, 0, 0, 0};
    bytes.insert(bytes.end(), chunk.begin(), chunk.end());
    EXPECT_THROW(Png::parse(bytes), TruncatedChunk);
}

TEST(PngTest, ParsePastIend) {
    std::vector<Chunk> chunks = imageLikePng().chunks();
    chunks.push_back(chunkFromStrings("RuSt", "after the end"));
    Png png = Png::parse(withSignature(chunks));
    EXPECT_EQ(png.chunks().size(), 4u);
    EXPECT_EQ(png.chunks().back().chunkType().toString(), "RuSt");
}

TEST(PngTest, SerializeMatchesInput) {
    std::vector<uint8_t> bytes = withSignature(testingChunks());
    EXPECT_EQ(Png::parse(bytes).serialize(), bytes);
}

TEST(PngTest, SerializeRoundTrip) {
    Png png = imageLikePng();
    png.appendChunk(chunkFromStrings("RuSt", "message"));
    EXPECT_EQ(Png::parse(png.serialize()), png);
}

TEST(PngTest, ChunksByType) {
    Png png = testingPng();
    png.appendChunk(chunkFromStrings("miDl", "Second middle chunk"));

    std::vector<Chunk> found = png.chunksByType("miDl");
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0].dataAsString(), "I am another chunk");
    EXPECT_EQ(found[1].dataAsString(), "Second middle chunk");

    EXPECT_TRUE(png.chunksByType("nOne").empty());
}

TEST(PngTest, ChunkByType) {
    Png png = testingPng();
    const Chunk* chunk = png.chunkByType("FrSt");
    ASSERT_NE(chunk, nullptr);
    EXPECT_EQ(chunk->dataAsString(), "I am the first chunk");
    EXPECT_EQ(png.chunkByType("nOne"), nullptr);
}

TEST(PngTest, LookupIsCaseSensitive) {
    EXPECT_EQ(testingPng().chunkByType("frst"), nullptr);
}

TEST(PngTest, AppendChunk) {
    Png png = testingPng();
    png.appendChunk(chunkFromStrings("TeSt", "Message"));
    ASSERT_EQ(png.chunks().size(), 4u);
    EXPECT_EQ(png.chunks().back().chunkType().toString(), "TeSt");
    EXPECT_EQ(png.chunks().back().dataAsString(), "Message");
}

TEST(PngTest, InsertChunk) {
    Png png = imageLikePng();
    png.insertChunk(2, chunkFromStrings("RuSt", "hidden"));
    ASSERT_EQ(png.chunks().size(), 4u);
    EXPECT_EQ(png.chunks()[2].chunkType().toString(), "RuSt");
    EXPECT_EQ(png.chunks()[3].chunkType().toString(), "IEND");
    EXPECT_TRUE(png.hasValidLayout());

    EXPECT_THROW(png.insertChunk(5, chunkFromStrings("RuSt", "x")), std::out_of_range);
}

TEST(PngTest, RemoveChunksByType) {
    Png png = testingPng();
    png.appendChunk(chunkFromStrings("TeSt", "Message"));
    png.appendChunk(chunkFromStrings("TeSt", "Again"));

    std::vector<Chunk> removed = png.removeChunksByType("TeSt");
    ASSERT_EQ(removed.size(), 2u);
    EXPECT_EQ(removed[0].dataAsString(), "Message");
    EXPECT_EQ(removed[1].dataAsString(), "Again");
    EXPECT_TRUE(png.chunksByType("TeSt").empty());
    EXPECT_EQ(png, testingPng());
}

TEST(PngTest, RemoveMissingChunk) {
    Png png = testingPng();
    EXPECT_THROW(png.removeChunksByType("TeSt"), ChunkNotFound);
    EXPECT_EQ(png.chunks().size(), 3u);
}

TEST(PngTest, ValidLayout) {
    EXPECT_TRUE(imageLikePng().hasValidLayout());
    EXPECT_FALSE(testingPng().hasValidLayout());
    EXPECT_FALSE(Png().hasValidLayout());

    Png afterEnd = imageLikePng();
    afterEnd.appendChunk(chunkFromStrings("RuSt", "message"));
    EXPECT_FALSE(afterEnd.hasValidLayout());

    Png twoHeaders = imageLikePng();
    Chunk header = twoHeaders.chunks()[0];
    twoHeaders.insertChunk(1, header);
    EXPECT_FALSE(twoHeaders.hasValidLayout());
}

TEST(PngTest, Summary) {
    std::ostringstream os;
    os << testingPng();
    std::string summary = os.str();
    EXPECT_NE(summary.find("Type: FrSt"), std::string::npos);
    EXPECT_NE(summary.find("Type: miDl"), std::string::npos);
    EXPECT_LT(summary.find("Type: FrSt"), summary.find("Type: LASt"));
}
