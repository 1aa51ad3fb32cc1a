/**
 * @file pngstash.cpp
 * @brief Hide, reveal and remove messages stored in PNG chunks
 *
 * Usage:
 *   pngstash encode <in.png> <out.png> <chunk_type> <message>
 *   pngstash decode <in.png> <chunk_type>
 *   pngstash delete <in.png> <chunk_type>
 *   pngstash print  <in.png>
 */

#include <pngstash/png.hh>
#include <pngstash/exceptions.hh>
#include <pngstash/parse_options.hh>
#include <iostream>
#include <fstream>
#include <iterator>
#include <algorithm>
#include <string>
#include <vector>

namespace {

    std::vector<std::byte> read_file(const std::string& filename) {
        std::ifstream file(filename, std::ios::binary);
        THROW_IO_IF(!file, "Cannot open file '", filename, "'");

        std::vector<char> raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        THROW_IO_IF(file.bad(), "Failed to read file '", filename, "'");

        std::vector<std::byte> data(raw.size());
        std::transform(raw.begin(), raw.end(), data.begin(), [](char c) {
            return std::byte(static_cast<unsigned char>(c));
        });
        return data;
    }

    void write_file(const std::string& filename, const std::vector<std::byte>& data) {
        std::ofstream file(filename, std::ios::binary | std::ios::trunc);
        THROW_IO_IF(!file, "Cannot create file '", filename, "'");

        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        THROW_IO_IF(!file, "Failed to write ", data.size(), " bytes to '", filename, "'");
    }

    pngstash::parse_options make_options() {
        pngstash::parse_options options;
        options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
            std::cerr << "Warning at offset " << offset
                      << " [" << category << "]: " << message << "\n";
        };
        return options;
    }

    void encode(const std::string& input, const std::string& output,
                const std::string& type, const std::string& message) {
        auto image = pngstash::png::decode(read_file(input), make_options());
        image.append_chunk(pngstash::chunk::from_text(type, message));
        write_file(output, image.encode());
        std::cout << "Stored " << message.size() << " bytes in chunk '" << type
                  << "' of " << output << "\n";
    }

    void decode(const std::string& input, const std::string& type) {
        auto image = pngstash::png::decode(read_file(input), make_options());
        const pngstash::chunk* found = image.chunk_by_type(type);
        if (!found) {
            THROW_NOT_FOUND("No chunk of type '", type, "' in ", input);
        }
        std::cout << "Decoded message: " << found->data_as_text() << "\n";
    }

    void delete_message(const std::string& input, const std::string& type) {
        auto image = pngstash::png::decode(read_file(input), make_options());
        auto removed = image.remove_chunk(type);
        write_file(input, image.encode());
        std::cout << "Removed " << removed << "\n";
    }

    void print(const std::string& input) {
        auto image = pngstash::png::decode(read_file(input), make_options());
        std::cout << image << "\n";
    }

    void usage(const char* prog) {
        std::cout << "Usage:\n";
        std::cout << "  " << prog << " encode <in.png> <out.png> <chunk_type> <message>\n";
        std::cout << "  " << prog << " decode <in.png> <chunk_type>\n";
        std::cout << "  " << prog << " delete <in.png> <chunk_type>   (alias: remove)\n";
        std::cout << "  " << prog << " print <in.png>\n";
        std::cout << "\n";
        std::cout << "Chunk types are 4 ASCII letters, e.g. ruSt (ancillary, private, safe to copy).\n";
    }
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    try {
        if (command == "encode" && argc == 6) {
            encode(argv[2], argv[3], argv[4], argv[5]);
        } else if (command == "decode" && argc == 4) {
            decode(argv[2], argv[3]);
        } else if ((command == "delete" || command == "remove") && argc == 4) {
            delete_message(argv[2], argv[3]);
        } else if (command == "print" && argc == 3) {
            print(argv[2]);
        } else {
            usage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
