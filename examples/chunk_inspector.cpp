/**
 * @file chunk_inspector.cpp
 * @brief Lists the chunks of a PNG file with their property bits
 *
 * Shows, for every chunk, its offset, length, CRC and what the letter
 * case of its type says: critical or ancillary, public or private,
 * reserved bit, and whether editors may copy it unchanged.
 */

#include <pngstash/parser.hh>
#include <pngstash/parse_options.hh>
#include <iostream>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <map>
#include <sstream>
#include <string>
#include <vector>

class ChunkInspector {
public:
    int inspect(const std::string& filename) {
        std::ifstream file(filename, std::ios::binary);
        if (!file) {
            std::cerr << "Failed to open file: " << filename << "\n";
            return 1;
        }

        std::vector<std::byte> data;
        for (std::istreambuf_iterator<char> it(file), end; it != end; ++it) {
            data.push_back(std::byte(static_cast<unsigned char>(*it)));
        }

        std::cout << "Chunk listing: " << filename << " (" << data.size() << " bytes)\n";
        std::cout << "=========================================\n\n";
        std::cout << std::left << std::setw(10) << "Offset" << std::setw(8) << "Type"
                  << std::setw(12) << "Length" << std::setw(12) << "CRC" << "Properties\n";

        pngstash::parse_options options;
        options.on_warning = [](std::uint64_t offset,
                                std::string_view category,
                                std::string_view message) {
            std::cerr << "Warning at offset " << offset
                      << " [" << category << "]: " << message << "\n";
        };

        try {
            pngstash::for_each_chunk(data, [this](const pngstash::chunk_iterator::chunk_info& info) {
                print_chunk(info);
            }, options);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }

        print_summary();
        return 0;
    }

private:
    void print_chunk(const pngstash::chunk_iterator::chunk_info& info) {
        const auto& type = info.value.type();
        std::ostringstream name;
        name << type;
        std::ostringstream crc;
        crc << "0x" << std::hex << std::setw(8) << std::setfill('0') << info.value.crc();

        std::cout << std::left << std::setw(10) << info.offset
                  << std::setw(8) << name.str()
                  << std::setw(12) << info.value.length()
                  << std::setw(12) << crc.str()
                  << (type.is_critical() ? "critical" : "ancillary")
                  << ", " << (type.is_public() ? "public" : "private")
                  << ", " << (type.is_safe_to_copy() ? "safe-to-copy" : "unsafe-to-copy");
        if (!type.is_valid()) {
            std::cout << ", INVALID";
        }
        std::cout << "\n";

        counts_[type]++;
        bytes_[type] += info.value.length();
    }

    void print_summary() const {
        std::cout << "\nChunks by Type:\n";
        std::cout << "---------------\n";
        for (const auto& [type, count] : counts_) {
            std::cout << "  " << type << ": " << count << " chunk(s), "
                      << bytes_.at(type) << " bytes\n";
        }
    }

    std::map<pngstash::chunk_type, std::size_t> counts_;
    std::map<pngstash::chunk_type, std::uint64_t> bytes_;
};

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cout << "Usage: " << argv[0] << " <file.png>\n";
        std::cout << "\n";
        std::cout << "Lists every chunk of a PNG file with its property bits.\n";
        return 1;
    }

    ChunkInspector inspector;
    return inspector.inspect(argv[1]);
}
