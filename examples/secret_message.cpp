/**
 * @file secret_message.cpp
 * @brief Store a text message in a chunk and read it back
 *
 * Encodes <message> in a chunk of type <type>, writes the chunk to
 * <file>, then reads the file back and prints the recovered message.
 */

#include <pngchunk/chunk_io.hh>
#include <pngchunk/exceptions.hh>
#include <iostream>
#include <fstream>

int main(int argc, char* argv[]) {
    if (argc != 4) {
        std::cout << "Usage: " << argv[0] << " <file> <type> <message>\n";
        std::cout << "\n";
        std::cout << "Example: " << argv[0] << " secret.chunk RuSt \"hello\"\n";
        return 1;
    }

    try {
        pngchunk::chunk_type type(argv[2]);
        if (!type.is_valid()) {
            std::cerr << "Warning: chunk type '" << type << "' has the reserved bit set\n";
        }

        {
            std::ofstream out(argv[1], std::ios::binary);
            if (!out) {
                std::cerr << "Error: Cannot create file '" << argv[1] << "'\n";
                return 1;
            }
            pngchunk::write_chunk(out, pngchunk::chunk(type, std::string_view(argv[3])));
        }

        std::ifstream in(argv[1], std::ios::binary);
        if (!in) {
            std::cerr << "Error: Cannot open file '" << argv[1] << "'\n";
            return 1;
        }
        auto chunk = pngchunk::read_chunk(in);

        std::cout << "Wrote " << chunk.length() + pngchunk::chunk::overhead << " bytes to " << argv[1] << "\n";
        std::cout << "Type:    " << chunk.type() << "\n";
        std::cout << "CRC:     " << chunk.crc() << "\n";
        std::cout << "Message: " << chunk.data_as_string() << "\n";

    } catch (const pngchunk::pngchunk_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
