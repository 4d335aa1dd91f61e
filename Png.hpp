#pragma once
#ifndef PNG_HPP
#define PNG_HPP

#include <array>
#include <ostream>
#include <stdint.h>
#include <string>
#include <vector>
#include "Chunk.hpp"

class Png {
    std::vector<Chunk> chunkList;
    public:
        static const std::array<uint8_t, 8> SIGNATURE;

        Png() = default;
        explicit Png(const std::vector<Chunk>& chunks);

        /*Parses signature followed by chunks until the buffer is exhausted.
        Throws InvalidSignature, TruncatedChunk or CrcMismatch*/
        static Png parse(const std::vector<uint8_t>& bytes);

        std::vector<uint8_t> serialize() const;

        const std::vector<Chunk>& chunks() const;
        std::vector<Chunk> chunksByType(const std::string& type) const;
        // First chunk of given type or nullptr
        const Chunk* chunkByType(const std::string& type) const;

        void appendChunk(const Chunk& chunk);
        // Throws std::out_of_range if index > number of chunks
        void insertChunk(size_t index, const Chunk& chunk);
        // Removes every chunk of given type and returns them, throws ChunkNotFound if none
        std::vector<Chunk> removeChunksByType(const std::string& type);

        /*IHDR first, IEND last, neither of them anywhere else*/
        bool hasValidLayout() const;

        bool operator==(const Png& other) const;
        bool operator!=(const Png& other) const;
};

std::ostream& operator<<(std::ostream& os, const Png& png);

#endif
