//
// Cover image lookup by signature.
//

#include <mobi/cover.hh>
#include <mobi/content.hh>
#include <mobi/decode_options.hh>

#include <algorithm>
#include <array>

namespace mobi {

    namespace {
        struct image_signature {
            std::array<unsigned char, 4> bytes;
            std::size_t length;
        };

        constexpr std::array<image_signature, 4> signatures = {{
            {{0xFF, 0xD8, 0xFF, 0x00}, 3},   // JPEG
            {{0x89, 'P', 'N', 'G'}, 4},      // PNG
            {{'G', 'I', 'F', '8'}, 4},       // GIF
            {{'B', 'M', 0x00, 0x00}, 2},     // BMP
        }};

        bool is_image(const byte_cursor& record) {
            return std::any_of(signatures.begin(), signatures.end(), [&](const image_signature& sig) {
                if (record.size() < sig.length) {
                    return false;
                }
                for (std::size_t i = 0; i < sig.length; i++) {
                    if (std::to_integer<unsigned char>(record.data()[i]) != sig.bytes[i]) {
                        return false;
                    }
                }
                return true;
            });
        }
    }

    std::optional<std::vector<std::byte>> find_cover_image(const pdb_container& container,
                                                           const format_header& header,
                                                           const byte_cursor& buffer) {
        // Same range the text came from; its warnings were already reported
        auto text = resolve_text_range(container, header, decode_options{});
        std::size_t first = header.record_index + 1;
        if (text) {
            first = std::max<std::size_t>(text->last, header.record_index) + 1;
        }
        for (std::size_t i = first; i < container.record_count(); i++) {
            auto record = container.record(buffer, i);
            if (is_image(record)) {
                return record.to_vector();
            }
        }
        return std::nullopt;
    }

} // namespace mobi
