#pragma once
#ifndef COMMANDS_HPP
#define COMMANDS_HPP

#include <ostream>
#include <stdint.h>
#include <string>
#include <vector>
#include "Chunk.hpp"

/*Reads whole file, throws FileError if it can't be opened or read*/
std::vector<uint8_t> readFile(const std::string& path);

/*Writes (truncating) whole file, throws FileError on failure*/
void writeFile(const std::string& path, const std::vector<uint8_t>& bytes);

/*Adds chunk of given type holding message. Chunk goes right before a
trailing IEND, or at the end if there is none. Writes to outputPath,
or back to filePath when outputPath is empty*/
void encodeMessage(const std::string& filePath, const std::string& chunkType,
                   const std::string& message, const std::string& outputPath = "");

/*Returns text of the first chunk of given type*/
std::string decodeMessage(const std::string& filePath, const std::string& chunkType);

/*Removes every chunk of given type, overwrites file and returns removed chunks*/
std::vector<Chunk> removeMessage(const std::string& filePath, const std::string& chunkType);

/*Writes summary of every chunk into out*/
void printChunks(const std::string& filePath, std::ostream& out);

/*Dispatches command line arguments (without program name). Results go to out,
usage and errors to err. Returns exit status: 0 success, 1 failure, 2 bad usage*/
int runCommand(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

#endif
