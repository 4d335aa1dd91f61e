#pragma once
#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdint.h>
#include <stdexcept>
#include <string>

enum class ErrorKind {
    InvalidChunkType,
    CrcMismatch,
    InvalidSignature,
    TruncatedChunk,
    Utf8DecodeError,
    ChunkNotFound,
    FileError
};

/*Base of every error thrown while reading or editing a PNG*/
class PngError : public std::runtime_error {
    ErrorKind errorKind;
    public:
        PngError(ErrorKind kind, const std::string& message)
            : std::runtime_error(message), errorKind(kind) {}
        ErrorKind kind() const noexcept { return this->errorKind; }
};

class InvalidChunkType : public PngError {
    public:
        explicit InvalidChunkType(const std::string& type)
            : PngError(ErrorKind::InvalidChunkType,
                       "Invalid chunk type \"" + type + "\": expected 4 ASCII letters") {}
};

class CrcMismatch : public PngError {
    uint32_t expectedCrc;
    uint32_t actualCrc;
    public:
        CrcMismatch(uint32_t expected, uint32_t actual)
            : PngError(ErrorKind::CrcMismatch,
                       "Chunk crc " + std::to_string(actual) +
                       " doesn't match computed crc " + std::to_string(expected) +
                       ", file can be corrupted"),
              expectedCrc(expected), actualCrc(actual) {}
        // Crc computed over type and data
        uint32_t expected() const noexcept { return this->expectedCrc; }
        // Crc stored in the chunk
        uint32_t actual() const noexcept { return this->actualCrc; }
};

class InvalidSignature : public PngError {
    public:
        InvalidSignature()
            : PngError(ErrorKind::InvalidSignature, "File doesn't have PNG signature") {}
};

class TruncatedChunk : public PngError {
    public:
        explicit TruncatedChunk(const std::string& message)
            : PngError(ErrorKind::TruncatedChunk, message) {}
};

class Utf8DecodeError : public PngError {
    public:
        Utf8DecodeError()
            : PngError(ErrorKind::Utf8DecodeError, "Chunk data is not valid UTF-8") {}
};

class ChunkNotFound : public PngError {
    public:
        explicit ChunkNotFound(const std::string& type)
            : PngError(ErrorKind::ChunkNotFound, "No chunk of type " + type + " found") {}
};

class FileError : public PngError {
    public:
        FileError(const std::string& message, const std::string& path)
            : PngError(ErrorKind::FileError, message + ": " + path) {}
};

#endif
