/**
 * @file metadata.hh
 * @brief Title, author and language resolution from the MOBI header
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <mobi/export_mobi.h>
#include <mobi/byte_cursor.hh>
#include <mobi/decode_options.hh>
#include <mobi/mobi_header.hh>
#include <mobi/pdb_container.hh>

namespace mobi {

    /// Container name that never counts as a real title
    inline constexpr const char* placeholder_title = "Untitled";

    /**
     * @brief Convert raw text bytes to UTF-8
     *
     * encoding_utf8 input is validated and returned as is; any other
     * encoding maps every byte to the code point of the same value.
     *
     * @return std::nullopt if UTF-8 input is malformed
     */
    MOBI_EXPORT std::optional<std::string> decode_text(const byte_cursor& bytes, std::uint32_t encoding);

    /// True if the string is well-formed UTF-8 (no overlongs, no surrogates)
    MOBI_EXPORT bool is_valid_utf8(const std::string& text);

    /**
     * @brief Book title from the header's absolute title offset/length
     *
     * Falls back to the container name (unless empty or "Untitled") when
     * the fields are zero, out of bounds or not decodable.
     */
    MOBI_EXPORT std::optional<std::string> resolve_title(const pdb_container& container,
                                                         const format_header& header,
                                                         const byte_cursor& buffer,
                                                         const decode_options& options);

    /**
     * @brief Author from the header's absolute author offset/length
     *
     * Same fallback rules as resolve_title().
     */
    MOBI_EXPORT std::optional<std::string> resolve_author(const pdb_container& container,
                                                          const format_header& header,
                                                          const byte_cursor& buffer,
                                                          const decode_options& options);

    /**
     * @brief ISO 639-1 code for the header's language field
     *
     * Unknown and zero codes resolve to "en".
     */
    MOBI_EXPORT std::string resolve_language(const format_header& header);

} // namespace mobi
