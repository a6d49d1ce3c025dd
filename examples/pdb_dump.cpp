/**
 * @file pdb_dump.cpp
 * @brief Displays the container structure of a MOBI / PalmDoc file
 *
 * This example walks the individual decoding stages instead of calling
 * decode(): PDB preamble, record table, header location and header fields.
 */

#include <mobi/byte_cursor.hh>
#include <mobi/decode_options.hh>
#include <mobi/metadata.hh>
#include <mobi/mobi_header.hh>
#include <mobi/pdb_container.hh>
#include <algorithm>
#include <iostream>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

class PdbDumper {
public:
    void analyze(const std::string& filename, bool verbose = false) {
        std::ifstream file(filename, std::ios::binary);
        if (!file) {
            std::cerr << "Failed to open file: " << filename << "\n";
            return;
        }
        std::vector<char> raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        data_.resize(raw.size());
        std::transform(raw.begin(), raw.end(), data_.begin(),
                       [](char c) { return static_cast<std::byte>(c); });

        verbose_ = verbose;

        std::cout << "PDB Structure: " << filename << "\n";
        std::cout << "=========================================\n\n";

        // Lenient parsing, report everything
        mobi::decode_options options;
        options.strict = false;
        options.on_warning = [](std::uint64_t offset,
                                std::string_view category,
                                std::string_view message) {
            std::cerr << "Warning at offset " << offset
                      << " [" << category << "]: " << message << "\n";
        };

        try {
            mobi::byte_cursor buffer(data_);
            auto container = mobi::read_container(buffer, options);
            print_container(container, buffer);

            auto location = mobi::locate_header(container, buffer);
            auto header = mobi::parse_header(location, buffer, options);
            print_header(container, header, buffer, options);

        } catch (const std::exception& e) {
            std::cerr << "Error analyzing file: " << e.what() << "\n";
        }
    }

private:
    void print_container(const mobi::pdb_container& container, const mobi::byte_cursor& buffer) {
        const auto& h = container.header();

        std::cout << "Container Header:\n";
        std::cout << "-----------------\n";
        std::cout << "  Name:          " << h.name << "\n";
        std::cout << "  Type/Creator:  " << h.type << " " << h.creator << "\n";
        std::cout << "  Attributes:    0x" << std::hex << h.attributes << std::dec << "\n";
        std::cout << "  Version:       " << h.version << "\n";
        std::cout << "  Created:       " << h.creation_time << "\n";
        std::cout << "  Modified:      " << h.modification_time << "\n";
        std::cout << "  Records:       " << h.record_count << "\n";
        std::cout << "  File size:     " << format_size(container.file_size()) << "\n\n";

        std::cout << "Record Table:\n";
        std::cout << "-------------\n";
        for (std::size_t i = 0; i < container.record_count(); i++) {
            const auto& entry = container.records()[i];
            auto span = container.span(i);
            std::cout << "  #" << std::setw(4) << std::left << i << std::right
                      << " @ 0x" << std::hex << std::setw(8) << std::setfill('0') << entry.offset
                      << std::dec << std::setfill(' ')
                      << "  " << std::setw(10) << format_size(span.length);

            auto record = container.record(buffer, i);
            if (record.size() >= 4) {
                auto magic = mobi::tag::from_bytes(record.data());
                if (magic.is_printable() || verbose_) {
                    std::cout << "  " << magic;
                }
            }
            if (verbose_) {
                std::cout << "  attr=0x" << std::hex << static_cast<unsigned>(entry.attributes)
                          << " uid=0x" << entry.unique_id << std::dec;
            }
            std::cout << "\n";
        }
        std::cout << "\n";
    }

    void print_header(const mobi::pdb_container& container, const mobi::format_header& header,
                      const mobi::byte_cursor& buffer, const mobi::decode_options& options) {
        std::cout << "MOBI Header (record " << header.record_index << ", offset "
                  << header.record_offset << "):\n";
        std::cout << "-----------------------------------\n";
        std::cout << "  Declared length: " << header.declared_length << "\n";
        std::cout << "  Type:            " << header.mobi_type << "\n";
        std::cout << "  Encoding:        " << header.text_encoding
                  << (header.is_utf8() ? " (UTF-8)" : " (8-bit)") << "\n";
        std::cout << "  Unique id:       0x" << std::hex << header.unique_id << std::dec << "\n";
        std::cout << "  File version:    " << header.file_version << "\n";
        std::cout << "  Title slice:     " << header.title_offset << " + " << header.title_length << "\n";
        std::cout << "  Author slice:    " << header.author_offset << " + " << header.author_length << "\n";
        std::cout << "  Language code:   0x" << std::hex << header.language_code << std::dec
                  << " (" << mobi::resolve_language(header) << ")\n";
        std::cout << "  Text records:    " << header.first_text_record << ".."
                  << header.last_text_record << "\n\n";

        auto title = mobi::resolve_title(container, header, buffer, options);
        auto author = mobi::resolve_author(container, header, buffer, options);
        std::cout << "Resolved Metadata:\n";
        std::cout << "------------------\n";
        std::cout << "  Title:  " << title.value_or("<none>") << "\n";
        std::cout << "  Author: " << author.value_or("<none>") << "\n";
    }

    static std::string format_size(std::uint64_t size) {
        std::ostringstream oss;
        if (size < 1024) {
            oss << size << " B";
        } else if (size < 1024 * 1024) {
            oss << std::fixed << std::setprecision(1) << (static_cast<double>(size) / 1024.0) << " KB";
        } else {
            oss << std::fixed << std::setprecision(1) << (static_cast<double>(size) / (1024.0 * 1024.0)) << " MB";
        }
        return oss.str();
    }

    std::vector<std::byte> data_;
    bool verbose_ = false;
};

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cout << "Usage: " << argv[0] << " [-v] <file>\n";
        std::cout << "\n";
        std::cout << "Options:\n";
        std::cout << "  -v    Verbose output (record attributes and ids)\n";
        return 1;
    }

    bool verbose = false;
    std::string filename;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-v") {
            verbose = true;
        } else {
            filename = arg;
        }
    }

    if (filename.empty()) {
        std::cerr << "Error: No file specified\n";
        return 1;
    }

    PdbDumper dumper;
    dumper.analyze(filename, verbose);
    return 0;
}
