#pragma once
#ifndef UTILS_HPP
#define UTILS_HPP

#include <stdint.h> // uint8_t, uint32_t
#include <stddef.h> // size_t
#include <vector>

/*Calculates crc of chunk over its type and data bytes*/
uint32_t calculate_crc(const uint8_t* type, const uint8_t* data, size_t length);

/*Calculates crc of an already contiguous type + data region*/
uint32_t calculate_crc(const uint8_t* typeAndData, size_t length);

/*Reads big endian value from 4 bytes*/
uint32_t readBigEndian(const uint8_t* bytes);

/*Appends value to the buffer as 4 big endian bytes*/
void writeBigEndian(std::vector<uint8_t>& buffer, uint32_t value);

/*Returns true if bytes are well-formed UTF-8 (no overlongs, no surrogates)*/
bool isValidUtf8(const uint8_t* bytes, size_t length);

#endif
