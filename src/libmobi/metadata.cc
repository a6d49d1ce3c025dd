//
// Metadata strings from the MOBI header.
//

#include <mobi/metadata.hh>
#include <mobi/exceptions.hh>
#include "utf8.hh"

#include <map>
#include <utility>

namespace mobi {

    namespace {
        std::string trim(std::string s) {
            auto nul = s.find('\0');
            if (nul != std::string::npos) {
                s.resize(nul);
            }
            auto first = s.find_first_not_of(" \t\r\n");
            if (first == std::string::npos) {
                return {};
            }
            auto last = s.find_last_not_of(" \t\r\n");
            return s.substr(first, last - first + 1);
        }

        std::optional<std::string> name_fallback(const pdb_container& container) {
            const auto& name = container.header().name;
            if (name.empty() || name == placeholder_title) {
                return std::nullopt;
            }
            return name;
        }

        // Decodes [offset, offset + length) of the file; nullopt when unusable
        std::optional<std::string> read_field(const char* what, std::uint32_t offset, std::uint32_t length,
                                              const format_header& header, const byte_cursor& buffer,
                                              const decode_options& options) {
            if (offset >= buffer.size()) {
                options.warn(offset, "metadata",
                             build_error_msg(what, " offset ", offset, " is beyond the end of the file (",
                                             buffer.size(), " bytes)"));
                return std::nullopt;
            }
            if (static_cast<std::uint64_t>(offset) + length > buffer.size()) {
                options.warn(offset, "metadata",
                             build_error_msg(what, " length ", length, " at offset ", offset,
                                             " runs past the end of the file, truncating"));
            }

            auto slice = buffer.clamped_subrange(offset, length);
            auto text = decode_text(slice, header.text_encoding);
            if (!text) {
                options.warn(offset, "metadata", build_error_msg(what, " is not valid UTF-8"));
                return std::nullopt;
            }
            auto trimmed = trim(std::move(*text));
            if (trimmed.empty()) {
                return std::nullopt;
            }
            return trimmed;
        }
    }

    bool is_valid_utf8(const std::string& text) {
        for (std::size_t i = 0; i < text.size();) {
            auto len = utf8::sequence_length(text, i);
            if (len == 0) {
                return false;
            }
            i += len;
        }
        return true;
    }

    std::optional<std::string> decode_text(const byte_cursor& bytes, std::uint32_t encoding) {
        std::string raw = bytes.to_string();
        if (encoding == encoding_utf8) {
            if (!is_valid_utf8(raw)) {
                return std::nullopt;
            }
            return raw;
        }

        std::string out;
        out.reserve(raw.size());
        for (char ch : raw) {
            utf8::append(out, static_cast<unsigned char>(ch));
        }
        return out;
    }

    std::optional<std::string> resolve_title(const pdb_container& container, const format_header& header,
                                             const byte_cursor& buffer, const decode_options& options) {
        if (header.title_offset == 0 || header.title_length == 0) {
            return name_fallback(container);
        }
        auto title = read_field("Title", header.title_offset, header.title_length, header, buffer, options);
        if (title) {
            return title;
        }
        return name_fallback(container);
    }

    std::optional<std::string> resolve_author(const pdb_container& container, const format_header& header,
                                              const byte_cursor& buffer, const decode_options& options) {
        if (header.author_offset == 0 || header.author_length == 0) {
            return std::nullopt;
        }
        auto author = read_field("Author", header.author_offset, header.author_length, header, buffer, options);
        if (author) {
            return author;
        }
        return name_fallback(container);
    }

    std::string resolve_language(const format_header& header) {
        static const std::map<std::uint32_t, std::string> languages = {
            {9, "en"},
            {10, "fr"},
            {11, "de"},
            {12, "it"},
            {13, "es"},
            {14, "pt"},
            {15, "ru"},
            {16, "ja"},
            {17, "zh"},
            {18, "ko"},
        };

        auto primary = header.language_code & 0x3FF;
        auto it = languages.find(primary);
        if (it == languages.end()) {
            return "en";
        }
        return it->second;
    }

} // namespace mobi
