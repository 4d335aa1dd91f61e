#include "Png.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <algorithm>
#include <stdexcept>

const std::array<uint8_t, 8> Png::SIGNATURE = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};

Png::Png(const std::vector<Chunk>& chunks) : chunkList(chunks) {}

Png Png::parse(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < SIGNATURE.size() ||
        !std::equal(SIGNATURE.begin(), SIGNATURE.end(), bytes.begin()))
        throw InvalidSignature();

    Png png;
    size_t offset = SIGNATURE.size();
    while (offset < bytes.size()) {
        size_t remaining = bytes.size() - offset;
        if (remaining < Chunk::OVERHEAD)
            throw TruncatedChunk("Chunk at offset " + std::to_string(offset) +
                                 " needs at least 12 bytes, " +
                                 std::to_string(remaining) + " left");

        // Length field covers data only
        uint32_t length = readBigEndian(bytes.data() + offset);
        if (length > remaining - Chunk::OVERHEAD)
            throw TruncatedChunk("Chunk at offset " + std::to_string(offset) +
                                 " declares " + std::to_string(length) + " data bytes, " +
                                 std::to_string(remaining - Chunk::OVERHEAD) + " left");
        size_t chunkSize = length + Chunk::OVERHEAD;

        png.chunkList.push_back(Chunk::parse(bytes.data() + offset, chunkSize));
        offset += chunkSize;
    }
    return png;
}

std::vector<uint8_t> Png::serialize() const {
    size_t total = SIGNATURE.size();
    for (auto& chunk : this->chunkList)
        total += chunk.asBytes().size();

    std::vector<uint8_t> bytes;
    bytes.reserve(total);
    bytes.insert(bytes.end(), SIGNATURE.begin(), SIGNATURE.end());
    for (auto& chunk : this->chunkList)
        bytes.insert(bytes.end(), chunk.asBytes().begin(), chunk.asBytes().end());
    return bytes;
}

const std::vector<Chunk>& Png::chunks() const {
    return this->chunkList;
}

std::vector<Chunk> Png::chunksByType(const std::string& type) const {
    std::vector<Chunk> found;
    for (auto& chunk : this->chunkList) {
        if (chunk.chunkType().toString() == type)
            found.push_back(chunk);
    }
    return found;
}

const Chunk* Png::chunkByType(const std::string& type) const {
    for (auto& chunk : this->chunkList) {
        if (chunk.chunkType().toString() == type)
            return &chunk;
    }
    return nullptr;
}

void Png::appendChunk(const Chunk& chunk) {
    this->chunkList.push_back(chunk);
}

void Png::insertChunk(size_t index, const Chunk& chunk) {
    if (index > this->chunkList.size())
        throw std::out_of_range("Chunk index " + std::to_string(index) +
                                " past end of " + std::to_string(this->chunkList.size()) +
                                " chunks");
    this->chunkList.insert(this->chunkList.begin() + index, chunk);
}

std::vector<Chunk> Png::removeChunksByType(const std::string& type) {
    std::vector<Chunk> removed;
    std::vector<Chunk> kept;
    kept.reserve(this->chunkList.size());
    for (auto& chunk : this->chunkList) {
        if (chunk.chunkType().toString() == type)
            removed.push_back(chunk);
        else
            kept.push_back(chunk);
    }

    if (removed.empty())
        throw ChunkNotFound(type);

    this->chunkList.swap(kept);
    return removed;
}

bool Png::hasValidLayout() const {
    if (this->chunkList.empty())
        return false;

    size_t last = this->chunkList.size() - 1;
    for (size_t i = 0; i <= last; ++i) {
        std::string type = this->chunkList[i].chunkType().toString();
        if ((type == "IHDR") != (i == 0))
            return false;
        if ((type == "IEND") != (i == last))
            return false;
    }
    return true;
}

bool Png::operator==(const Png& other) const {
    return this->chunkList == other.chunkList;
}

bool Png::operator!=(const Png& other) const {
    return !(*this == other);
}

std::ostream& operator<<(std::ostream& os, const Png& png) {
    for (auto& chunk : png.chunks())
        os << chunk << "\n";
    return os;
}
