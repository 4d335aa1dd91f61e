#include "utils.hpp"
#include <zlib.h>

uint32_t calculate_crc(const uint8_t* type, const uint8_t* data, size_t length) {
    uLong crc = crc32(0L, Z_NULL, 0);                                  // Start CRC
    crc = crc32(crc, reinterpret_cast<const Bytef*>(type), 4);          // Chunk type
    // zlib takes uInt lengths, so feed big payloads in pieces
    while (length > 0) {
        uInt piece = length > 0x40000000 ? 0x40000000 : static_cast<uInt>(length);
        crc = crc32(crc, reinterpret_cast<const Bytef*>(data), piece);  // Chunk data
        data += piece;
        length -= piece;
    }
    return static_cast<uint32_t>(crc);
}


uint32_t calculate_crc(const uint8_t* typeAndData, size_t length) {
    return calculate_crc(typeAndData, typeAndData + 4, length - 4);
}


uint32_t readBigEndian(const uint8_t* bytes) {
    return (static_cast<uint32_t>(bytes[0]) << 24) |
           (static_cast<uint32_t>(bytes[1]) << 16) |
           (static_cast<uint32_t>(bytes[2]) << 8) |
            static_cast<uint32_t>(bytes[3]);
}


void writeBigEndian(std::vector<uint8_t>& buffer, uint32_t value) {
    buffer.push_back(static_cast<uint8_t>((value & 0xFF000000) >> 24));
    buffer.push_back(static_cast<uint8_t>((value & 0x00FF0000) >> 16));
    buffer.push_back(static_cast<uint8_t>((value & 0x0000FF00) >> 8));
    buffer.push_back(static_cast<uint8_t>(value & 0x000000FF));
}


bool isValidUtf8(const uint8_t* bytes, size_t length) {
    size_t i = 0;
    while (i < length) {
        uint8_t lead = bytes[i];
        size_t extra = 0;
        uint32_t codePoint = 0;

        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            codePoint = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            codePoint = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            codePoint = lead & 0x07;
        } else {
            return false;
        }

        if (length - i <= extra) // Sequence cut off by end of data
            return false;

        for (size_t k = 1; k <= extra; ++k) {
            uint8_t next = bytes[i + k];
            if ((next & 0xC0) != 0x80)
                return false;
            codePoint = (codePoint << 6) | (next & 0x3F);
        }

        // Shortest form only
        if ((extra == 1 && codePoint < 0x80) ||
            (extra == 2 && codePoint < 0x800) ||
            (extra == 3 && codePoint < 0x10000))
            return false;
        if (codePoint > 0x10FFFF || (codePoint >= 0xD800 && codePoint <= 0xDFFF))
            return false;

        i += extra + 1;
    }
    return true;
}
