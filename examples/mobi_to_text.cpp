/**
 * @file mobi_to_text.cpp
 * @brief Extract the plain text of a MOBI file
 *
 * Writes the decoded text to stdout or a file, or splits it into one file
 * per chapter.
 */

#include <mobi/decoder.hh>
#include <iostream>
#include <fstream>
#include <filesystem>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

class TextExtractor {
public:
    int extract(const std::string& filename, const std::string& output, bool split_chapters) {
        std::ifstream file(filename, std::ios::binary);
        if (!file) {
            std::cerr << "Failed to open file: " << filename << "\n";
            return 1;
        }
        std::vector<char> raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

        mobi::decode_options options;
        options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
            std::cerr << "Warning at offset " << offset
                      << " [" << category << "]: " << message << "\n";
        };

        mobi::book book;
        try {
            book = mobi::decode(raw.data(), raw.size(), options, filename);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }

        if (split_chapters) {
            return save_chapters(book, output.empty() ? std::string(".") : output);
        }
        if (output.empty()) {
            std::cout << book.full_text << "\n";
            return 0;
        }
        return save_text(output, book.full_text);
    }

private:
    int save_chapters(const mobi::book& book, const std::string& directory) {
        std::error_code ec;
        std::filesystem::create_directories(directory, ec);
        if (ec) {
            std::cerr << "Cannot create directory '" << directory << "': " << ec.message() << "\n";
            return 1;
        }

        for (std::size_t i = 0; i < book.chapters.size(); i++) {
            const auto& chapter = book.chapters[i];
            std::ostringstream name;
            name << std::setfill('0') << std::setw(3) << i << "_" << sanitize(chapter.title) << ".txt";
            auto path = std::filesystem::path(directory) / name.str();

            auto text = book.full_text.substr(chapter.start_index, chapter.end_index - chapter.start_index);
            if (save_text(path.string(), text) != 0) {
                return 1;
            }
            std::cout << "  Saved: " << path.string() << " (" << text.size() << " bytes)\n";
        }
        std::cout << "\nWrote " << book.chapters.size() << " chapter(s) of '" << book.title << "'\n";
        return 0;
    }

    static int save_text(const std::string& path, const std::string& text) {
        std::ofstream out(path, std::ios::binary);
        if (!out) {
            std::cerr << "Failed to create file: " << path << "\n";
            return 1;
        }
        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        return out ? 0 : 1;
    }

    // Chapter titles as file names: alphanumerics kept, the rest becomes '_'
    static std::string sanitize(const std::string& title) {
        std::string out;
        for (char c : title) {
            bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
            out.push_back(keep ? c : '_');
            if (out.size() == 40) {
                break;
            }
        }
        return out;
    }
};

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cout << "Usage: " << argv[0] << " [options] <file> [output]\n";
        std::cout << "\nOptions:\n";
        std::cout << "  -c    Write one file per chapter into the output directory\n";
        std::cout << "\nWithout an output path the text is written to stdout.\n";
        return 1;
    }

    bool split = false;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-c") {
            split = true;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty() || positional.size() > 2) {
        std::cerr << "Error: expected <file> [output]\n";
        return 1;
    }

    TextExtractor extractor;
    return extractor.extract(positional[0], positional.size() == 2 ? positional[1] : std::string(), split);
}
