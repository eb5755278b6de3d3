/**
 * @file chunk_inspect.cpp
 * @brief Print the fields and property bits of a raw chunk
 *
 * Reads one encoded chunk from a file (optionally at a byte offset,
 * e.g. 8 to skip a PNG signature) and prints what it contains.
 */

#include <pngchunk/chunk_io.hh>
#include <pngchunk/exceptions.hh>
#include <iostream>
#include <fstream>
#include <string>

static const char* yes_no(bool v) {
    return v ? "yes" : "no";
}

int main(int argc, char* argv[]) {
    if (argc != 2 && argc != 3) {
        std::cout << "Usage: " << argv[0] << " <file> [offset]\n";
        std::cout << "\n";
        std::cout << "Decodes the chunk stored at <offset> (default 0) and prints its fields.\n";
        return 1;
    }

    std::ifstream file(argv[1], std::ios::binary);
    if (!file) {
        std::cerr << "Error: Cannot open file '" << argv[1] << "'\n";
        return 1;
    }

    try {
        if (argc == 3) {
            file.seekg(std::stoll(argv[2]));
        }

        pngchunk::parse_options options;
        options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
            std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
        };

        auto chunk = pngchunk::read_chunk(file, options);
        const auto& type = chunk.type();

        std::cout << "Chunk:         " << type << " " << chunk << "\n";
        std::cout << "Length:        " << chunk.length() << " bytes\n";
        std::cout << "CRC:           " << chunk.crc() << "\n";
        std::cout << "Critical:      " << yes_no(type.is_critical()) << "\n";
        std::cout << "Public:        " << yes_no(type.is_public()) << "\n";
        std::cout << "Reserved bit:  " << (type.is_reserved_bit_valid() ? "valid" : "invalid") << "\n";
        std::cout << "Safe to copy:  " << yes_no(type.is_safe_to_copy()) << "\n";

        try {
            std::cout << "Text:          " << chunk.data_as_string() << "\n";
        } catch (const pngchunk::encoding_error&) {
            std::cout << "Text:          (binary payload)\n";
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
