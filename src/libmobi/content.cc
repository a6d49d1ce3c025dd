//
// Text assembly: per-record decompression, markup extraction and fallbacks.
//

#include <mobi/content.hh>
#include <mobi/exceptions.hh>
#include <mobi/metadata.hh>
#include <mobi/palmdoc.hh>
#include "utf8.hh"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <map>
#include <regex>
#include <set>

namespace mobi {

    namespace {
        // Bounded repetitions keep the regex executor's recursion shallow on
        // hostile input such as an unterminated '<'.
        const std::regex& block_tag_regex() {
            static const std::regex re(
                R"(<[ \t\r\n]{0,8}/?[ \t\r\n]{0,8}(?:p|div|br|h[1-6]|li|tr|blockquote|hr|mbp:pagebreak)(?:[ \t\r\n/][^<>]{0,1024})?>)",
                std::regex::ECMAScript | std::regex::icase);
            return re;
        }

        const std::regex& any_tag_regex() {
            static const std::regex re(R"(<[^<>]{0,1024}>)");
            return re;
        }

        const std::regex& entity_regex() {
            static const std::regex re(R"(&(#[0-9]{1,7}|#[xX][0-9a-fA-F]{1,6}|[a-zA-Z]{2,8});)");
            return re;
        }

        std::string decode_entities(const std::string& text) {
            static const std::map<std::string, std::string> named = {
                {"amp", "&"},
                {"lt", "<"},
                {"gt", ">"},
                {"quot", "\""},
                {"apos", "'"},
                {"nbsp", " "},
            };

            std::string out;
            out.reserve(text.size());
            std::size_t last = 0;
            for (std::sregex_iterator it(text.begin(), text.end(), entity_regex()), end; it != end; ++it) {
                const auto& m = *it;
                out.append(text, last, static_cast<std::size_t>(m.position(0)) - last);
                last = static_cast<std::size_t>(m.position(0) + m.length(0));

                std::string ref = m.str(1);
                if (ref[0] == '#') {
                    bool hex = ref.size() > 1 && (ref[1] == 'x' || ref[1] == 'X');
                    auto cp = std::strtoul(ref.c_str() + (hex ? 2 : 1), nullptr, hex ? 16 : 10);
                    utf8::append(out, static_cast<std::uint32_t>(cp));
                } else {
                    auto found = named.find(ref);
                    if (found != named.end()) {
                        out.append(found->second);
                    } else {
                        out.append(m.str(0));
                    }
                }
            }
            out.append(text, last, std::string::npos);
            return out;
        }

        // Runs of spaces and tabs become a single space
        std::string collapse_blanks(std::string_view text) {
            std::string out;
            out.reserve(text.size());
            bool in_blank = false;
            for (char c : text) {
                if (c == ' ' || c == '\t') {
                    if (!in_blank) {
                        out.push_back(' ');
                    }
                    in_blank = true;
                } else {
                    out.push_back(c);
                    in_blank = false;
                }
            }
            return out;
        }

        // Longest unterminated '<...' tail carried into the next record,
        // the same bound the tag regexes use
        constexpr std::size_t max_tag_fragment = 1024;

        const char* const hidden_elements[] = {"head", "script", "style", "title"};

        bool iequals(std::string_view a, std::string_view b) {
            return a.size() == b.size() &&
                   std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                       return std::tolower(static_cast<unsigned char>(x)) ==
                              std::tolower(static_cast<unsigned char>(y));
                   });
        }

        std::size_t ifind(std::string_view text, std::string_view needle, std::size_t from) {
            for (std::size_t i = from; i + needle.size() <= text.size(); i++) {
                if (iequals(text.substr(i, needle.size()), needle)) {
                    return i;
                }
            }
            return std::string_view::npos;
        }

        bool ends_name(std::string_view text, std::size_t pos) {
            if (pos >= text.size()) {
                return true;
            }
            char c = text[pos];
            return c == '>' || c == '/' || c == ' ' || c == '\t' || c == '\r' || c == '\n';
        }

        // Name of the hidden element whose start tag opens at text[pos], if any
        std::string_view hidden_element_at(std::string_view text, std::size_t pos) {
            for (std::string_view name : hidden_elements) {
                auto end = pos + 1 + name.size();
                if (end <= text.size() && iequals(text.substr(pos + 1, name.size()), name) && ends_name(text, end)) {
                    return name;
                }
            }
            return {};
        }

        // Drops head, script, style and title elements with their content.
        // An element that is never closed keeps its content; only its tags
        // are removed later.
        std::string remove_hidden_elements(std::string_view markup) {
            std::string out;
            out.reserve(markup.size());
            std::set<std::string_view> unclosed;
            std::size_t pos = 0;
            while (pos < markup.size()) {
                auto open = markup.find('<', pos);
                if (open == std::string_view::npos) {
                    break;
                }
                out.append(markup, pos, open - pos);
                pos = open;

                auto name = hidden_element_at(markup, open);
                auto tag_end = name.empty() || unclosed.count(name) ? std::string_view::npos
                                                                    : markup.find('>', open);
                if (tag_end == std::string_view::npos) {
                    if (!name.empty()) {
                        unclosed.insert(name);
                    }
                    out.push_back('<');
                    pos = open + 1;
                    continue;
                }
                if (markup[tag_end - 1] == '/') {
                    pos = tag_end + 1;
                    continue;
                }

                std::string closing = "</" + std::string(name);
                auto close = ifind(markup, closing, tag_end + 1);
                while (close != std::string_view::npos && !ends_name(markup, close + closing.size())) {
                    close = ifind(markup, closing, close + 1);
                }
                auto close_end = close == std::string_view::npos ? close : markup.find('>', close);
                if (close_end == std::string_view::npos) {
                    unclosed.insert(name);
                    out.push_back('<');
                    pos = open + 1;
                    continue;
                }
                out.push_back(' ');
                pos = close_end + 1;
            }
            if (pos < markup.size()) {
                out.append(markup, pos, std::string_view::npos);
            }
            return out;
        }

        // Where a record's markup is cut so that a tag or UTF-8 sequence the
        // record boundary split is completed by the next record
        std::size_t carry_point(std::string_view markup, bool utf8_text) {
            std::size_t keep = markup.size();
            auto open = markup.rfind('<');
            if (open != std::string_view::npos && markup.find('>', open) == std::string_view::npos &&
                markup.size() - open <= max_tag_fragment) {
                keep = open;
            }
            if (utf8_text) {
                keep -= utf8::incomplete_tail(markup.substr(0, keep));
            }
            return keep;
        }

        std::string markup_text(const std::string& raw, const byte_cursor& record, std::size_t index,
                                const format_header& header, const html_text_extractor& extractor,
                                const decode_options& options) {
            std::string markup;
            if (header.is_utf8()) {
                markup = utf8::repair(raw);
            } else {
                byte_cursor bytes(reinterpret_cast<const std::byte*>(raw.data()), raw.size());
                markup = *decode_text(bytes, header.text_encoding);
            }

            try {
                return extractor.extract(markup);
            } catch (const std::exception& e) {
                options.warn(record.base(), "markup",
                             build_error_msg("Record ", index, ": ", e.what(), "; stripping tags"));
                return strip_tags(markup);
            }
        }
    }

    std::optional<text_range> resolve_text_range(const pdb_container& container, const format_header& header,
                                                 const decode_options& options) {
        const std::size_t count = container.record_count();
        std::size_t first = header.first_text_record;
        std::size_t last = header.last_text_record;

        if (first == 0 && last == 0) {
            // Range fields absent: everything after the header record
            first = header.record_index + 1;
            last = count == 0 ? 0 : count - 1;
            options.warn(header.record_offset, "text_range",
                         build_error_msg("Header declares no text record range, using records ",
                                         first, "..", last));
        }
        if (first >= count) {
            options.warn(header.record_offset, "text_range",
                         build_error_msg("First text record ", first, " is beyond the record table (",
                                         count, " records)"));
            return std::nullopt;
        }
        if (last >= count) {
            options.warn(header.record_offset, "text_range",
                         build_error_msg("Last text record ", last, " clamped to ", count - 1));
            last = count - 1;
        }
        if (first > last) {
            options.warn(header.record_offset, "text_range",
                         build_error_msg("Text record range ", first, "..", last, " is empty"));
            return std::nullopt;
        }
        return text_range{first, last};
    }

    std::string strip_tags(std::string_view markup) {
        std::string text = remove_hidden_elements(markup);
        text = std::regex_replace(text, block_tag_regex(), "\n");
        text = std::regex_replace(text, any_tag_regex(), " ");
        text = decode_entities(text);
        return collapse_blanks(text);
    }

    std::string scrub_raw(const byte_cursor& bytes) {
        std::string out;
        out.reserve(bytes.size());
        for (std::size_t i = 0; i < bytes.size(); i++) {
            auto b = std::to_integer<unsigned>(bytes.data()[i]);
            if (b >= 32 && b <= 126) {
                out.push_back(static_cast<char>(b));
            } else if (b == '\r' || b == '\n') {
                out.push_back('\n');
            } else if (b == '\t') {
                out.push_back(' ');
            }
        }
        return out;
    }

    std::string normalize_text(std::string_view text) {
        std::string unified;
        unified.reserve(text.size());
        for (std::size_t i = 0; i < text.size(); i++) {
            if (text[i] == '\r') {
                if (i + 1 < text.size() && text[i + 1] == '\n') {
                    i++;
                }
                unified.push_back('\n');
            } else {
                unified.push_back(text[i]);
            }
        }

        std::string lines;
        lines.reserve(unified.size());
        std::size_t newlines = 0;
        for (char c : unified) {
            if (c == '\n') {
                if (++newlines <= 2) {
                    lines.push_back(c);
                }
            } else {
                newlines = 0;
                lines.push_back(c);
            }
        }

        std::string out = collapse_blanks(lines);
        auto first = out.find_first_not_of(" \t\n");
        if (first == std::string::npos) {
            return {};
        }
        auto last = out.find_last_not_of(" \t\n");
        return out.substr(first, last - first + 1);
    }

    std::string assemble_text(const pdb_container& container, const format_header& header,
                              const byte_cursor& buffer, const decode_options& options) {
        expat_html_extractor default_extractor;
        const html_text_extractor& extractor =
            options.html_extractor ? *options.html_extractor : default_extractor;

        std::string joined;
        auto range = resolve_text_range(container, header, options);

        if (range) {
            // Unfinished tag or character at the end of the previous record
            std::string carried;
            for (std::size_t i = range->first; i <= range->last; i++) {
                auto record = container.record(buffer, i);

                std::string text;
                std::vector<std::byte> decompressed;
                bool scrubbed = false;
                try {
                    decompressed = palmdoc::decompress(record, options.max_record_size);
                } catch (const decompression_error& e) {
                    options.warn(record.base(), "decompression",
                                 build_error_msg("Record ", i, ": ", e.what(), "; keeping printable bytes"));
                    carried.clear();
                    text = scrub_raw(record);
                    scrubbed = true;
                }

                if (!scrubbed) {
                    std::string raw = std::move(carried);
                    carried.clear();
                    raw.append(reinterpret_cast<const char*>(decompressed.data()), decompressed.size());
                    if (i < range->last) {
                        auto keep = carry_point(raw, header.is_utf8());
                        carried = raw.substr(keep);
                        raw.resize(keep);
                    }
                    text = markup_text(raw, record, i, header, extractor, options);
                }

                if (text.empty()) {
                    continue;
                }
                if (!joined.empty()) {
                    joined.append("\n\n");
                }
                joined.append(text);

                if (joined.size() > options.max_text_size) {
                    options.warn(record.base(), "size_limit",
                                 build_error_msg("Book text exceeds ", options.max_text_size,
                                                 " bytes, truncating at record ", i));
                    joined.resize(utf8::boundary_before(joined, options.max_text_size));
                    break;
                }
            }
        }

        auto text = normalize_text(joined);
        THROW_FORMAT_IF(text.empty(), format_errc::empty_content, header.record_offset,
                        "No readable text in records ", header.first_text_record, "..",
                        header.last_text_record);
        return text;
    }

} // namespace mobi
