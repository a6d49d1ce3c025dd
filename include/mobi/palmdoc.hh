/**
 * @file palmdoc.hh
 * @brief PalmDoc-style text record decompression
 */

#pragma once

#include <cstddef>
#include <vector>

#include <mobi/export_mobi.h>
#include <mobi/byte_cursor.hh>

namespace mobi::palmdoc {

    /**
     * @brief Decompress one text record
     *
     * Single left-to-right pass. For each input byte b:
     * - 0x00: a space
     * - 0x01..0x08: copy the next b bytes verbatim
     * - 0x09..0x7F: b itself
     * - 0x80..0xBF: a space followed by b & 0x7F
     * - 0xC0..0xFF: back-reference with the following byte b2;
     *   distance = ((b & 0x3F) << 8) | b2, length = ((b2 >> 6) & 3) + 3.
     *   The copy starts at max(0, size - distance) and proceeds one byte at a
     *   time, so overlapping copies repeat; it never reads at or past the
     *   current output size.
     *
     * The function is pure: the same input always yields the same output.
     *
     * @param input Record bytes
     * @param max_output Output size limit
     * @throws decompression_error if the output would exceed max_output
     */
    MOBI_EXPORT std::vector<std::byte> decompress(const byte_cursor& input, std::size_t max_output);

} // namespace mobi::palmdoc
