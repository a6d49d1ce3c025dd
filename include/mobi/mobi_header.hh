/**
 * @file mobi_header.hh
 * @brief Locating and parsing the MOBI header record
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include <mobi/export_mobi.h>
#include <mobi/byte_cursor.hh>
#include <mobi/decode_options.hh>
#include <mobi/pdb_container.hh>

namespace mobi {

    /// text_encoding value for UTF-8; anything else is a legacy 8-bit codepage
    inline constexpr std::uint32_t encoding_utf8 = 65001;

    /// text_encoding value for Windows-1252, the usual legacy codepage
    inline constexpr std::uint32_t encoding_cp1252 = 1252;

    /// Smallest declared length that can hold the optional fields
    inline constexpr std::uint32_t optional_fields_threshold = 0x70;

    /// Smallest acceptable declared header length
    inline constexpr std::uint32_t min_header_length = 16;

    /**
     * @brief Fixed positions of header fields, relative to the "MOBI" magic
     */
    namespace header_field {
        inline constexpr std::size_t identifier      = 0x00;
        inline constexpr std::size_t declared_length = 0x04;
        inline constexpr std::size_t mobi_type       = 0x08;
        inline constexpr std::size_t text_encoding   = 0x0C;
        inline constexpr std::size_t unique_id       = 0x10;
        inline constexpr std::size_t file_version    = 0x14;
        inline constexpr std::size_t title_offset    = 0x38;
        inline constexpr std::size_t title_length    = 0x3C;
        inline constexpr std::size_t author_offset   = 0x3C;
        inline constexpr std::size_t author_length   = 0x40;
        inline constexpr std::size_t language_code   = 0x44;
        inline constexpr std::size_t first_text      = 0x68;
        inline constexpr std::size_t last_text       = 0x6C;
    }

    /**
     * @struct header_location
     * @brief Record that holds the MOBI header and its byte span
     */
    struct header_location {
        std::size_t record_index = 0;
        std::uint64_t offset = 0;
        std::size_t length = 0;
    };

    /**
     * @struct format_header
     * @brief Decoded MOBI header fields
     *
     * Optional fields are zero when the declared header length is below
     * optional_fields_threshold, or when reading them would run past the
     * declared length or the record.
     */
    struct format_header {
        std::uint32_t declared_length = 0;
        std::uint32_t mobi_type = 0;
        std::uint32_t text_encoding = 0;
        std::uint32_t unique_id = 0;
        std::uint32_t file_version = 0;
        std::uint32_t title_offset = 0;
        std::uint32_t title_length = 0;
        std::uint32_t author_offset = 0;
        std::uint32_t author_length = 0;
        std::uint32_t language_code = 0;   ///< Low 10 bits primary language, next 10 bits region
        std::uint32_t first_text_record = 0;
        std::uint32_t last_text_record = 0;

        std::size_t record_index = 0;      ///< Record the header was parsed from
        std::uint64_t record_offset = 0;   ///< File offset of that record

        [[nodiscard]] bool is_utf8() const { return text_encoding == encoding_utf8; }
    };

    /**
     * @brief Find the first record whose leading four bytes are "MOBI"
     *
     * Real-world files do not always keep the header in record 0, so every
     * record is inspected in table order.
     *
     * @throws format_error header_not_found if no record matches
     */
    MOBI_EXPORT header_location locate_header(const pdb_container& container, const byte_cursor& buffer);

    /**
     * @brief Parse the header at a located record
     *
     * @throws format_error bad_identifier if the record does not start with "MOBI"
     * @throws format_error bad_header_length if the declared length is below 16
     *         or exceeds the record
     */
    MOBI_EXPORT format_header parse_header(const header_location& location, const byte_cursor& buffer,
                                           const decode_options& options);

} // namespace mobi
