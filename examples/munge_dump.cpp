/**
 * @file munge_dump.cpp
 * @brief Print the chunk tree of a munge file
 *
 * Every payload that splits exactly into child chunks is shown as a
 * container; everything else is shown as a leaf with a short preview.
 */

#include <munge/parser.hh>
#include <munge/chunk_reader.hh>
#include <munge/parse_options.hh>
#include <iostream>
#include <fstream>
#include <iomanip>
#include <string>

namespace {
    void print_preview(std::istream& stream, const munge::chunk_header& h) {
        auto reader = munge::open_payload(stream, h);
        auto bytes = reader->read_bytes(16);

        std::cout << "  [";
        for (std::size_t i = 0; i < bytes.size(); ++i) {
            if (i > 0) {
                std::cout << ' ';
            }
            std::cout << std::hex << std::setw(2) << std::setfill('0')
                      << static_cast<unsigned>(bytes[i]) << std::dec << std::setfill(' ');
        }
        if (h.payload_size > bytes.size()) {
            std::cout << " ...";
        }
        std::cout << "]";
    }
}

int main(int argc, char* argv[]) {
    bool allow_padding = false;
    bool count_prefix = false;
    std::string path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--padding") {
            allow_padding = true;
        } else if (arg == "--count-prefix") {
            count_prefix = true;
        } else if (path.empty()) {
            path = arg;
        } else {
            path.clear();
            break;
        }
    }

    if (path.empty()) {
        std::cout << "Usage: " << argv[0] << " [--padding] [--count-prefix] <file>\n";
        std::cout << "\n";
        std::cout << "Prints every chunk of a munge file with its size and offset.\n";
        std::cout << "  --padding        tolerate zero padding between chunks\n";
        std::cout << "  --count-prefix   children are preceded by a u32 child count\n";
        return 1;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        std::cerr << "Error: Cannot open file '" << path << "'\n";
        return 1;
    }

    munge::parse_options options;
    options.allow_padding = allow_padding;
    options.count_prefix = count_prefix;
    options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
        std::cerr << "Warning [" << category << "] at 0x" << std::hex << offset << std::dec
                  << ": " << message << "\n";
    };

    std::size_t chunk_count = 0;
    try {
        munge::for_each_chunk(file, [&](const munge::chunk_header& h, int depth, bool is_leaf) {
            ++chunk_count;
            std::cout << std::string(static_cast<std::size_t>(depth) * 2, ' ')
                      << h.name << "  " << h.payload_size << " bytes @ 0x"
                      << std::hex << h.header_offset() << std::dec;
            if (is_leaf && h.payload_size > 0) {
                print_preview(file, h);
            }
            std::cout << "\n";
        }, options);
    } catch (const munge::munge_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n" << chunk_count << " chunk(s)\n";
    return 0;
}
