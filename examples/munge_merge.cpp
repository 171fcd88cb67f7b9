/**
 * @file munge_merge.cpp
 * @brief Merge the top level chunks of several munge files into one
 *
 * Inputs whose root is not 'ucfb' are skipped with a warning. Children are
 * copied byte for byte, without decoding.
 */

#include <munge/parser.hh>
#include <munge/node_writer.hh>
#include <munge/chunk_reader.hh>
#include <munge/level.hh>
#include <iostream>
#include <fstream>
#include <filesystem>
#include <string>
#include <vector>

namespace {
    // Appends every child of the input's root to out. Returns the child count.
    std::size_t merge_file(std::istream& in, munge::node_writer& out) {
        const munge::chunk_header root = munge::read_root(in);

        std::size_t count = 0;
        for (munge::child_iterator it(in, root); it.has_next(); it.next()) {
            const auto& child = it.current();
            auto reader = munge::open_payload(in, child);
            out.build_node(child.name, [&](munge::node_writer& w) {
                w.write_bytes(reader->read_all());
            });
            ++count;
        }
        return count;
    }
}

int main(int argc, char* argv[]) {
    std::string output;
    std::vector<std::string> inputs;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            output = argv[++i];
        } else {
            inputs.push_back(arg);
        }
    }

    if (output.empty() || inputs.empty()) {
        std::cout << "Usage: " << argv[0] << " -o <output> <input>...\n";
        return 1;
    }

    if (std::filesystem::exists(output)) {
        std::cerr << "Error: Output file '" << output << "' already exists\n";
        return 1;
    }

    std::cout << "Merging files into " << output << "...\n";

    munge::node_writer root(munge::root_tag);
    for (const auto& input : inputs) {
        std::cout << "  Merging " << input << "...\n";

        std::ifstream file(input, std::ios::binary);
        if (!file) {
            std::cerr << "    Warning: cannot open file. Skipping...\n";
            continue;
        }

        try {
            std::size_t count = merge_file(file, root);
            std::cout << "    " << count << " chunk(s)\n";
        } catch (const munge::content_error& e) {
            std::cerr << "    Warning: " << e.what() << ". Skipping...\n";
        } catch (const munge::munge_error& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    std::ofstream out(output, std::ios::binary);
    if (!out) {
        std::cerr << "Error: Cannot create file '" << output << "'\n";
        return 1;
    }

    try {
        root.finish(out);
    } catch (const munge::munge_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Wrote " << root.payload_size() + munge::chunk_header::header_size << " bytes\n";
    return 0;
}
