#include "commands.hpp"
#include "errors.hpp"
#include "Png.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

std::vector<uint8_t> readFile(const std::string& path) {
    std::ifstream fs(path, std::ios::in | std::ios::binary); // Opening file for reading in binary mode
    if (!fs)
        throw FileError("Could not open file", path);

    std::vector<uint8_t> bytes;
    try {
        bytes.assign(std::istreambuf_iterator<char>(fs), std::istreambuf_iterator<char>());
    } catch (const std::ios_base::failure&) { // e.g. path is a directory
        throw FileError("Could not read file", path);
    }
    if (fs.bad())
        throw FileError("Could not read file", path);
    return bytes;
}

void writeFile(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream output(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!output.is_open())
        throw FileError("Could not open output file", path);

    output.write(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    output.close();
    if (!output)
        throw FileError("Could not write file", path);
}

void encodeMessage(const std::string& filePath, const std::string& chunkType,
                   const std::string& message, const std::string& outputPath) {
    Png png = Png::parse(readFile(filePath));

    Chunk chunk(ChunkType::fromString(chunkType),
                std::vector<uint8_t>(message.begin(), message.end()));

    // Keep IEND as the terminal chunk
    const std::vector<Chunk>& chunks = png.chunks();
    if (!chunks.empty() && chunks.back().chunkType().toString() == "IEND")
        png.insertChunk(chunks.size() - 1, chunk);
    else
        png.appendChunk(chunk);

    writeFile(outputPath.empty() ? filePath : outputPath, png.serialize());
}

std::string decodeMessage(const std::string& filePath, const std::string& chunkType) {
    ChunkType::fromString(chunkType); // Throws on malformed tag
    Png png = Png::parse(readFile(filePath));

    const Chunk* chunk = png.chunkByType(chunkType);
    if (chunk == nullptr)
        throw ChunkNotFound(chunkType);
    return chunk->dataAsString();
}

std::vector<Chunk> removeMessage(const std::string& filePath, const std::string& chunkType) {
    ChunkType::fromString(chunkType); // Throws on malformed tag
    Png png = Png::parse(readFile(filePath));

    std::vector<Chunk> removed = png.removeChunksByType(chunkType);
    writeFile(filePath, png.serialize());
    return removed;
}

void printChunks(const std::string& filePath, std::ostream& out) {
    Png png = Png::parse(readFile(filePath));
    out << png;
}

static void printUsage(std::ostream& os) {
    os << "Usage:\n"
       << "  pngmsg encode <file> <chunk type> <message> [output file]\n"
       << "  pngmsg decode <file> <chunk type>\n"
       << "  pngmsg remove <file> <chunk type>\n"
       << "  pngmsg print <file>\n";
}

int runCommand(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    if (args.empty()) {
        printUsage(err);
        return 2;
    }

    const std::string& command = args[0];
    if (command == "-h" || command == "--help") {
        printUsage(out);
        return 0;
    }

    try {
        if (command == "encode" && (args.size() == 4 || args.size() == 5)) {
            encodeMessage(args[1], args[2], args[3], args.size() == 5 ? args[4] : "");
        } else if (command == "decode" && args.size() == 3) {
            out << decodeMessage(args[1], args[2]) << std::endl;
        } else if (command == "remove" && args.size() == 3) {
            std::vector<Chunk> removed = removeMessage(args[1], args[2]);
            out << "Removed " << removed.size() << " chunk(s) of type " << args[2] << std::endl;
        } else if (command == "print" && args.size() == 2) {
            printChunks(args[1], out);
        } else {
            err << "Unknown command or wrong number of arguments: " << command << "\n";
            printUsage(err);
            return 2;
        }
    } catch (const std::exception& e) { // PngError, std::length_error, std::bad_alloc
        err << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
