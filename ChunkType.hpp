#pragma once
#ifndef CHUNK_TYPE_HPP
#define CHUNK_TYPE_HPP

#include <array>
#include <ostream>
#include <stdint.h>
#include <string>

/* 4 byte tag of a chunk. Property bits are bit 5 of each byte:
    Byte 0: ancillary bit    0 (uppercase) = critical,  1 (lowercase) = ancillary
    Byte 1: private bit      0 (uppercase) = public,    1 (lowercase) = private
    Byte 2: reserved bit     must be 0 (uppercase) in current PNG versions
    Byte 3: safe-to-copy bit 0 (uppercase) = unsafe,    1 (lowercase) = safe to copy
*/
class ChunkType {
    std::array<uint8_t, 4> type;
    public:
        // Stores any 4 bytes, use isValid() before relying on them
        explicit ChunkType(const std::array<uint8_t, 4>& bytes);

        // Throws InvalidChunkType unless str is exactly 4 ASCII letters
        static ChunkType fromString(const std::string& str);

        const std::array<uint8_t, 4>& bytes() const;
        std::string toString() const;

        bool isValid() const;
        bool isCritical() const;
        bool isPublic() const;
        bool isReservedBitValid() const;
        bool isSafeToCopy() const;

        bool operator==(const ChunkType& other) const;
        bool operator!=(const ChunkType& other) const;
};

std::ostream& operator<<(std::ostream& os, const ChunkType& chunkType);

#endif
