//
// Decoding pipeline.
//

#include <mobi/decoder.hh>
#include <mobi/chapters.hh>
#include <mobi/content.hh>
#include <mobi/cover.hh>
#include <mobi/exceptions.hh>
#include <mobi/metadata.hh>
#include <mobi/mobi_header.hh>
#include <mobi/pdb_container.hh>

#include <atomic>
#include <iomanip>
#include <sstream>

namespace mobi {

    namespace {
        constexpr const char* untitled = "Untitled";
        constexpr const char* unknown_author = "Unknown Author";

        std::atomic<std::uint64_t> id_sequence{0};

        std::uint64_t fnv1a(const byte_cursor& buffer) {
            std::uint64_t hash = 0xcbf29ce484222325ULL;
            for (std::size_t i = 0; i < buffer.size(); i++) {
                hash ^= std::to_integer<std::uint64_t>(buffer.data()[i]);
                hash *= 0x100000001b3ULL;
            }
            return hash;
        }

        std::optional<std::string> store_cover(const pdb_container& container, const format_header& header,
                                               const byte_cursor& buffer, const std::string& book_id,
                                               const decode_options& options) {
            if (!options.cover_storage) {
                return std::nullopt;
            }
            auto image = find_cover_image(container, header, buffer);
            if (!image) {
                return std::nullopt;
            }
            try {
                return options.cover_storage->save(*image, book_id);
            } catch (const std::exception& e) {
                options.warn(header.record_offset, "cover",
                             build_error_msg("Storing cover image failed: ", e.what()));
                return std::nullopt;
            }
        }

        book decode_book(const byte_cursor& buffer, const decode_options& options, std::string_view source) {
            auto container = read_container(buffer, options);
            auto location = locate_header(container, buffer);
            auto header = parse_header(location, buffer, options);

            auto title = resolve_title(container, header, buffer, options);
            auto author = resolve_author(container, header, buffer, options);

            book result;
            result.id = make_book_id(buffer);
            result.title = title ? *title : untitled;
            result.author = author ? *author : unknown_author;
            result.language = resolve_language(header);
            result.source = std::string(source);

            result.full_text = assemble_text(container, header, buffer, options);

            const auto& patterns = options.chapter_patterns.empty()
                ? default_chapter_patterns()
                : options.chapter_patterns;
            result.chapters = segment_chapters(result.full_text, result.id, patterns, options);

            result.cover_image_path = store_cover(container, header, buffer, result.id, options);
            result.added_at = std::chrono::system_clock::now();
            return result;
        }
    }

    std::string make_book_id(const byte_cursor& buffer) {
        auto sequence = id_sequence.fetch_add(1, std::memory_order_relaxed);
        std::ostringstream oss;
        oss << "mobi-" << std::hex << std::setfill('0') << std::setw(16) << fnv1a(buffer)
            << '-' << sequence;
        return oss.str();
    }

    book decode(const byte_cursor& buffer, const decode_options& options, std::string_view source) {
        try {
            return decode_book(buffer, options, source);
        } catch (const format_error& e) {
            if (source.empty()) {
                throw;
            }
            throw format_error(e.code(), e.offset(), e.record_index(),
                               build_error_msg(source, ": ", e.what()));
        }
    }

} // namespace mobi
