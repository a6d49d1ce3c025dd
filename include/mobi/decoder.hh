/**
 * @file decoder.hh
 * @brief MOBI decoding entry points
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <mobi/export_mobi.h>
#include <mobi/book.hh>
#include <mobi/byte_cursor.hh>
#include <mobi/decode_options.hh>

namespace mobi {

    /**
     * @brief Decode a MOBI file held in memory
     *
     * Runs the whole pipeline: container, header, metadata, text records,
     * chapters and cover. The decoder performs no I/O of its own apart from
     * what the configured cover_store does. Decoding different buffers
     * concurrently is safe.
     *
     * @param buffer Complete file contents
     * @param options Decoder configuration
     * @param source Identifier of the input, used in diagnostics and copied
     *        to book::source
     * @return Fully populated book
     * @throws format_error on structural problems or when no text survives
     */
    MOBI_EXPORT book decode(const byte_cursor& buffer, const decode_options& options,
                            std::string_view source = {});

    /**
     * @brief Decode with default options
     */
    inline book decode(const std::vector<std::byte>& buffer, std::string_view source = {}) {
        return decode(byte_cursor(buffer), decode_options{}, source);
    }

    inline book decode(const std::vector<std::byte>& buffer, const decode_options& options,
                       std::string_view source = {}) {
        return decode(byte_cursor(buffer), options, source);
    }

    inline book decode(const void* data, std::size_t size, const decode_options& options,
                       std::string_view source = {}) {
        return decode(byte_cursor(static_cast<const std::byte*>(data), size), options, source);
    }

    /**
     * @brief Unique id for a decoded buffer
     *
     * "mobi-" + FNV-1a 64 hash of the content + "-" + a process-wide
     * sequence number, both in hex. Two decodes never share an id, even of
     * identical files on different threads.
     */
    MOBI_EXPORT std::string make_book_id(const byte_cursor& buffer);

} // namespace mobi
