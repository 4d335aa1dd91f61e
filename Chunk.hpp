#pragma once
#ifndef CHUNK_HPP
#define CHUNK_HPP

#include <ostream>
#include <stdint.h>
#include <string>
#include <vector>
#include "ChunkType.hpp"

/* Chunk layout, all integers big endian
    Length:     4 bytes (size of data only)
    Chunk type: 4 bytes
    Data:       Length bytes
    CRC:        4 bytes (over chunk type and data)
*/
class Chunk {
    std::vector<uint8_t> raw; // Whole chunk exactly as written to file

    Chunk() = default;
    public:
        // Sizes of the fixed fields around the data
        static const size_t HEADER_SIZE = 8;
        static const size_t CRC_SIZE = 4;
        static const size_t OVERHEAD = HEADER_SIZE + CRC_SIZE;

        // Throws std::length_error if data doesn't fit a 32 bit length
        Chunk(const ChunkType& chunkType, const std::vector<uint8_t>& data);

        /*Validates one serialized chunk. Throws TruncatedChunk when size
        disagrees with the length field, CrcMismatch when the crc is wrong*/
        static Chunk parse(const uint8_t* bytes, size_t size);
        static Chunk parse(const std::vector<uint8_t>& bytes);

        uint32_t length() const;
        ChunkType chunkType() const;
        const uint8_t* data() const; // length() bytes
        uint32_t crc() const;
        // Throws Utf8DecodeError if data isn't valid UTF-8
        std::string dataAsString() const;
        const std::vector<uint8_t>& asBytes() const;

        bool operator==(const Chunk& other) const;
        bool operator!=(const Chunk& other) const;
};

std::ostream& operator<<(std::ostream& os, const Chunk& chunk);

#endif
