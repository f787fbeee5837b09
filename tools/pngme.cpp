/**
 * @file pngme.cpp
 * @brief Hide, reveal and remove text messages in PNG-style chunk files
 *
 * Usage:
 *   pngme encode <file> <chunk-type> <message>
 *   pngme decode <file> <chunk-type>
 *   pngme remove <file> <chunk-type>
 *   pngme print  <file>
 */

#include <pngme/container.hh>
#include <pngme/exceptions.hh>

#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

    void print_usage(const char* program) {
        std::cout << "Usage: " << program << " <command> [arguments]\n";
        std::cout << "\n";
        std::cout << "Commands:\n";
        std::cout << "  encode <file> <chunk-type> <message>  Append a chunk holding <message>\n";
        std::cout << "  decode <file> <chunk-type>            Print the first chunk of that type\n";
        std::cout << "  remove <file> <chunk-type>            Remove the first chunk of that type\n";
        std::cout << "  print  <file>                         Print every chunk as text\n";
        std::cout << "  help                                  Show this message\n";
        std::cout << "\n";
        std::cout << "Chunk types are four ASCII letters, e.g. RuSt.\n";
    }

    std::vector<std::byte> read_file(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw std::runtime_error("Cannot open file '" + path + "'");
        }

        std::vector<char> raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (file.bad()) {
            throw std::runtime_error("Failed to read file '" + path + "'");
        }

        const auto* p = reinterpret_cast<const std::byte*>(raw.data());
        return {p, p + raw.size()};
    }

    void write_file(const std::string& path, const std::vector<std::byte>& data) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw std::runtime_error("Cannot open file '" + path + "' for writing");
        }
        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!file) {
            throw std::runtime_error("Failed to write file '" + path + "'");
        }
    }

    int cmd_encode(const std::string& path, const std::string& type, const std::string& message) {
        // Validate the type before touching the file
        auto id = pngme::chunk_type::from_string(type);

        auto png = pngme::container::parse(read_file(path));
        png.append(pngme::chunk(id, message));
        write_file(path, png.serialize());

        std::cout << "Encoded " << message.size() << " bytes into chunk " << id << "\n";
        return 0;
    }

    int cmd_decode(const std::string& path, const std::string& type) {
        auto png = pngme::container::parse(read_file(path));

        const pngme::chunk* found = png.chunk_by_type(type);
        if (!found) {
            std::cerr << "Error: No chunk of type '" << type << "' in '" << path << "'\n";
            return 1;
        }

        std::cout << found->data_as_string() << "\n";
        return 0;
    }

    int cmd_remove(const std::string& path, const std::string& type) {
        auto png = pngme::container::parse(read_file(path));
        auto removed = png.remove_first_by_type(type);
        write_file(path, png.serialize());

        std::cout << "Removed chunk " << removed.type() << " (" << removed.length() << " bytes)\n";
        return 0;
    }

    int cmd_print(const std::string& path) {
        auto png = pngme::container::parse(read_file(path));
        std::cout << png << "\n";
        return 0;
    }

}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string_view command = argv[1];

    try {
        if (command == "encode" && argc == 5) {
            return cmd_encode(argv[2], argv[3], argv[4]);
        }
        if (command == "decode" && argc == 4) {
            return cmd_decode(argv[2], argv[3]);
        }
        if (command == "remove" && argc == 4) {
            return cmd_remove(argv[2], argv[3]);
        }
        if (command == "print" && argc == 3) {
            return cmd_print(argv[2]);
        }
        if (command == "help" || command == "--help" || command == "-h") {
            print_usage(argv[0]);
            return 0;
        }

        std::cerr << "Error: Unknown command or wrong number of arguments\n\n";
        print_usage(argv[0]);
        return 1;

    } catch (const pngme::parse_error& e) {
        std::cerr << "Error: Invalid file (" << pngme::to_string(e.kind()) << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
