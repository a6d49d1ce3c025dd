/**
 * @file mobi_info.cpp
 * @brief Prints the metadata and chapter list of a MOBI file
 *
 * This is a minimal example showing how to decode a MOBI file held in
 * memory and inspect the resulting book.
 */

#include <mobi/decoder.hh>
#include <mobi/exceptions.hh>
#include <iostream>
#include <fstream>
#include <iterator>
#include <vector>

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cout << "Usage: " << argv[0] << " <file>\n";
        std::cout << "\n";
        std::cout << "Decodes a MOBI file and lists its metadata and chapters.\n";
        return 1;
    }

    // Load the whole file
    std::ifstream file(argv[1], std::ios::binary);
    if (!file) {
        std::cerr << "Error: Cannot open file '" << argv[1] << "'\n";
        return 1;
    }
    std::vector<char> raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    std::cout << "Decoding: " << argv[1] << "\n";
    std::cout << "====================\n\n";

    try {
        mobi::decode_options options;
        options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
            std::cerr << "Warning at offset " << offset
                      << " [" << category << "]: " << message << "\n";
        };

        auto book = mobi::decode(raw.data(), raw.size(), options, argv[1]);

        std::cout << "Id:       " << book.id << "\n";
        std::cout << "Title:    " << book.title << "\n";
        std::cout << "Author:   " << book.author << "\n";
        std::cout << "Language: " << book.language.value_or("-") << "\n";
        std::cout << "Text:     " << book.full_text.size() << " bytes\n";
        std::cout << "\nChapters (" << book.chapters.size() << "):\n";
        for (const auto& chapter : book.chapters) {
            std::cout << "  " << chapter.id << "  " << chapter.title
                      << "  [" << chapter.start_index << ", " << chapter.end_index << ")\n";
        }

    } catch (const mobi::format_error& e) {
        std::cerr << "Error: " << e.what() << " (" << mobi::to_string(e.code())
                  << " at offset " << e.offset() << ")\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
