/**
 * @file chunk_lister.cpp
 * @brief Lists every chunk of a PNG-style file with its flags
 *
 * Flag letters: C critical / a ancillary, P public / p private,
 * R reserved bit valid / r reserved bit set, S safe to copy / u unsafe.
 */

#include <pngme/parser.hh>
#include <pngme/exceptions.hh>
#include <pngme/parse_options.hh>
#include <iostream>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <string>
#include <vector>

namespace {

    std::string flags_of(const pngme::chunk_type& t) {
        std::string flags;
        flags += t.is_critical() ? 'C' : 'a';
        flags += t.is_public() ? 'P' : 'p';
        flags += t.is_reserved_bit_valid() ? 'R' : 'r';
        flags += t.is_safe_to_copy() ? 'S' : 'u';
        return flags;
    }

}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <file> [--lenient]\n";
        return 1;
    }

    std::ifstream file(argv[1], std::ios::binary);
    if (!file) {
        std::cerr << "Failed to open file: " << argv[1] << "\n";
        return 1;
    }

    std::vector<char> raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    const auto* p = reinterpret_cast<const std::byte*>(raw.data());
    std::vector<std::byte> data(p, p + raw.size());

    pngme::parse_options options;
    options.strict = !(argc > 2 && std::string(argv[2]) == "--lenient");
    options.on_warning = [](std::uint64_t offset,
                            std::string_view category,
                            std::string_view message) {
        std::cerr << "Warning at offset " << offset
                  << " [" << category << "]: " << message << "\n";
    };

    std::cout << std::left << std::setw(6) << "Type"
              << std::right << std::setw(10) << "Length"
              << std::setw(12) << "CRC"
              << std::setw(10) << "Offset"
              << "  Flags\n";
    std::cout << std::string(44, '-') << "\n";

    std::size_t count = 0;
    try {
        pngme::for_each_chunk(data, [&count](const pngme::chunk_iterator::chunk_info& info) {
            const auto& h = info.header;
            std::cout << std::left << std::setw(6) << h.id.to_string()
                      << std::right << std::setw(10) << h.length
                      << "  0x" << std::hex << std::setw(8) << std::setfill('0') << h.crc
                      << std::dec << std::setfill(' ')
                      << std::setw(10) << h.file_offset
                      << "  " << flags_of(h.id) << "\n";
            count++;
        }, options);
    } catch (const pngme::parse_error& e) {
        std::cerr << "Parse error (" << pngme::to_string(e.kind()) << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n" << count << " chunk(s)\n";
    return 0;
}
