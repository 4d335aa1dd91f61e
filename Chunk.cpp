#include "Chunk.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <limits>
#include <stdexcept>

const size_t Chunk::HEADER_SIZE;
const size_t Chunk::CRC_SIZE;
const size_t Chunk::OVERHEAD;

Chunk::Chunk(const ChunkType& chunkType, const std::vector<uint8_t>& data) {
    if (data.size() > std::numeric_limits<uint32_t>::max())
        throw std::length_error("Chunk data exceeds 2^32 - 1 bytes");

    const std::array<uint8_t, 4>& type = chunkType.bytes();
    uint32_t length = static_cast<uint32_t>(data.size());

    this->raw.reserve(data.size() + OVERHEAD);
    writeBigEndian(this->raw, length);
    this->raw.insert(this->raw.end(), type.begin(), type.end());
    this->raw.insert(this->raw.end(), data.begin(), data.end());
    writeBigEndian(this->raw, calculate_crc(type.data(), data.data(), data.size()));
}

Chunk Chunk::parse(const uint8_t* bytes, size_t size) {
    if (size < OVERHEAD)
        throw TruncatedChunk("Chunk needs at least 12 bytes, got " + std::to_string(size));

    uint32_t length = readBigEndian(bytes);
    if (length != size - OVERHEAD)
        throw TruncatedChunk("Chunk length " + std::to_string(length) +
                             " doesn't match " + std::to_string(size - OVERHEAD) +
                             " bytes of data");

    // Type and data sit between the length field and the trailing crc
    uint32_t stored = readBigEndian(bytes + size - CRC_SIZE);
    uint32_t computed = calculate_crc(bytes + 4, size - 4 - CRC_SIZE);
    if (stored != computed)
        throw CrcMismatch(computed, stored);

    Chunk chunk;
    chunk.raw.assign(bytes, bytes + size);
    return chunk;
}

Chunk Chunk::parse(const std::vector<uint8_t>& bytes) {
    return parse(bytes.data(), bytes.size());
}

uint32_t Chunk::length() const {
    return readBigEndian(this->raw.data());
}

ChunkType Chunk::chunkType() const {
    std::array<uint8_t, 4> type{};
    for (size_t i = 0; i < 4; ++i)
        type[i] = this->raw[4 + i];
    return ChunkType(type);
}

const uint8_t* Chunk::data() const {
    return this->raw.data() + HEADER_SIZE;
}

uint32_t Chunk::crc() const {
    return readBigEndian(this->raw.data() + this->raw.size() - CRC_SIZE);
}

std::string Chunk::dataAsString() const {
    if (!isValidUtf8(this->data(), this->length()))
        throw Utf8DecodeError();
    return std::string(reinterpret_cast<const char*>(this->data()), this->length());
}

const std::vector<uint8_t>& Chunk::asBytes() const {
    return this->raw;
}

bool Chunk::operator==(const Chunk& other) const {
    return this->raw == other.raw;
}

bool Chunk::operator!=(const Chunk& other) const {
    return !(*this == other);
}

std::ostream& operator<<(std::ostream& os, const Chunk& chunk) {
    os << "Chunk {\n";
    os << "  Length: " << chunk.length() << "\n";
    os << "  Type: " << chunk.chunkType() << "\n";
    os << "  Data: " << chunk.length() << " bytes\n";
    os << "  Crc: " << chunk.crc() << "\n";
    os << "}";
    return os;
}
