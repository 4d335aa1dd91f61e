#include "ChunkType.hpp"
#include "errors.hpp"

namespace {

const uint8_t PROPERTY_BIT = 0x20; // Lowercase bit of ASCII letters

inline bool isAsciiLetter(uint8_t byte) {
    return (byte >= 'A' && byte <= 'Z') || (byte >= 'a' && byte <= 'z');
}

}

ChunkType::ChunkType(const std::array<uint8_t, 4>& bytes) : type(bytes) {}

ChunkType ChunkType::fromString(const std::string& str) {
    if (str.size() != 4)
        throw InvalidChunkType(str);

    std::array<uint8_t, 4> bytes{};
    for (size_t i = 0; i < 4; ++i) {
        uint8_t byte = static_cast<uint8_t>(str[i]);
        if (!isAsciiLetter(byte))
            throw InvalidChunkType(str);
        bytes[i] = byte;
    }
    return ChunkType(bytes);
}

const std::array<uint8_t, 4>& ChunkType::bytes() const {
    return this->type;
}

std::string ChunkType::toString() const {
    return std::string(this->type.begin(), this->type.end());
}

bool ChunkType::isValid() const {
    for (uint8_t byte : this->type) {
        if (!isAsciiLetter(byte))
            return false;
    }
    return true;
}

bool ChunkType::isCritical() const {
    return (this->type[0] & PROPERTY_BIT) == 0;
}

bool ChunkType::isPublic() const {
    return (this->type[1] & PROPERTY_BIT) == 0;
}

bool ChunkType::isReservedBitValid() const {
    return (this->type[2] & PROPERTY_BIT) == 0;
}

bool ChunkType::isSafeToCopy() const {
    return (this->type[3] & PROPERTY_BIT) != 0;
}

bool ChunkType::operator==(const ChunkType& other) const {
    return this->type == other.type;
}

bool ChunkType::operator!=(const ChunkType& other) const {
    return !(*this == other);
}

std::ostream& operator<<(std::ostream& os, const ChunkType& chunkType) {
    return os << chunkType.toString();
}
