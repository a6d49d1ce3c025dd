/**
 * @file pdb_container.hh
 * @brief Palm Database container: 78-byte preamble and record table
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <mobi/export_mobi.h>
#include <mobi/byte_cursor.hh>
#include <mobi/decode_options.hh>
#include <mobi/tag.hh>

namespace mobi {

    /// Size of the fixed PDB preamble
    inline constexpr std::size_t pdb_header_size = 78;

    /// Size of one record table entry
    inline constexpr std::size_t pdb_record_entry_size = 8;

    /// Offset of the record count inside the preamble
    inline constexpr std::size_t pdb_record_count_offset = 76;

    /**
     * @struct container_header
     * @brief Fields of the PDB preamble, all stored big-endian in the file
     */
    struct container_header {
        std::string name;                    ///< Database name, NUL and whitespace trimmed
        std::uint16_t attributes = 0;
        std::uint16_t version = 0;
        std::uint32_t creation_time = 0;
        std::uint32_t modification_time = 0;
        std::uint32_t backup_time = 0;
        std::uint32_t modification_number = 0;
        std::uint32_t app_info_id = 0;
        std::uint32_t sort_info_id = 0;
        tag type;                            ///< "BOOK" for MOBI, "TEXt" for PalmDoc
        tag creator;                         ///< "MOBI" for MOBI, "REAd" for PalmDoc
        std::uint32_t unique_id_seed = 0;
        std::uint32_t next_record_list_id = 0;
        std::uint16_t record_count = 0;
    };

    /**
     * @struct record_entry
     * @brief One entry of the record table
     */
    struct record_entry {
        std::uint32_t offset = 0;     ///< Absolute position of the record in the file
        std::uint8_t attributes = 0;
        std::uint32_t unique_id = 0;  ///< 24-bit id
    };

    /**
     * @struct record_span
     * @brief Byte range [offset, offset + length) of a record in the file
     */
    struct record_span {
        std::uint64_t offset = 0;
        std::size_t length = 0;
    };

    /**
     * @class pdb_container
     * @brief Parsed container layout
     *
     * After construction the record table satisfies: offsets are
     * non-decreasing and no offset exceeds the buffer size.
     */
    class MOBI_EXPORT pdb_container {
    public:
        pdb_container(container_header header, std::vector<record_entry> records, std::size_t file_size)
            : m_header(std::move(header)),
              m_records(std::move(records)),
              m_file_size(file_size) {}

        [[nodiscard]] const container_header& header() const { return m_header; }
        [[nodiscard]] const std::vector<record_entry>& records() const { return m_records; }
        [[nodiscard]] std::size_t record_count() const { return m_records.size(); }
        [[nodiscard]] std::size_t file_size() const { return m_file_size; }

        /**
         * @brief Byte range of a record
         *
         * A record ends where the next one starts; the last record extends to
         * the end of the file. Throws std::out_of_range for a bad index.
         */
        [[nodiscard]] record_span span(std::size_t index) const;

        /**
         * @brief Cursor over a record's bytes
         * @param buffer Cursor over the whole file the container was read from
         */
        [[nodiscard]] byte_cursor record(const byte_cursor& buffer, std::size_t index) const;

    private:
        container_header m_header;
        std::vector<record_entry> m_records;
        std::size_t m_file_size;
    };

    /**
     * @brief Parse the PDB preamble and record table
     *
     * @throws format_error too_small if the buffer cannot hold the preamble or
     *         the record table
     * @throws format_error no_records if the record count is zero
     * @throws format_error bad_record_table for inconsistent offsets in strict mode
     */
    MOBI_EXPORT pdb_container read_container(const byte_cursor& buffer, const decode_options& options);

} // namespace mobi
