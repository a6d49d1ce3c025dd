//
// PDB preamble and record table.
//

#include <mobi/pdb_container.hh>
#include <mobi/exceptions.hh>

#include <stdexcept>
#include <string>

namespace mobi {

    namespace {
        std::string trim_name(const byte_cursor& field) {
            std::string name = field.to_string();
            auto nul = name.find('\0');
            if (nul != std::string::npos) {
                name.resize(nul);
            }
            auto first = name.find_first_not_of(" \t\r\n");
            if (first == std::string::npos) {
                return {};
            }
            auto last = name.find_last_not_of(" \t\r\n");
            return name.substr(first, last - first + 1);
        }

        void check_container_type(const container_header& header, const decode_options& options) {
            bool is_mobi = header.type == tags::BOOK && header.creator == tags::MOBI;
            bool is_palmdoc = header.type == tags::TEXt && header.creator == tags::REAd;
            if (!is_mobi && !is_palmdoc) {
                options.warn(60, "container_type",
                             build_error_msg("Unexpected type/creator '", header.type.to_string(),
                                             header.creator.to_string(), "', expected 'BOOKMOBI'"));
            }
        }
    }

    record_span pdb_container::span(std::size_t index) const {
        if (index >= m_records.size()) {
            throw std::out_of_range(build_error_msg("Record index ", index, " out of range (",
                                                    m_records.size(), " records)"));
        }
        std::uint64_t start = m_records[index].offset;
        std::uint64_t end = (index + 1 < m_records.size()) ? m_records[index + 1].offset : m_file_size;
        return {start, static_cast<std::size_t>(end - start)};
    }

    byte_cursor pdb_container::record(const byte_cursor& buffer, std::size_t index) const {
        auto s = span(index);
        return buffer.clamped_subrange(static_cast<std::size_t>(s.offset), s.length);
    }

    pdb_container read_container(const byte_cursor& buffer, const decode_options& options) {
        THROW_FORMAT_IF(buffer.size() < pdb_header_size, format_errc::too_small, 0,
                        "File too small to be a PDB container: ", buffer.size(),
                        " bytes, at least ", pdb_header_size, " required");

        container_header header;
        auto c = buffer;

        auto name = c.read_bytes(32);
        header.name = trim_name(name.value);
        c = name.next;

        auto attributes = c.read<std::uint16_t>(byte_order::big);
        header.attributes = attributes.value;
        auto version = attributes.next.read<std::uint16_t>(byte_order::big);
        header.version = version.value;
        c = version.next;

        std::uint32_t* times[] = {
            &header.creation_time, &header.modification_time, &header.backup_time,
            &header.modification_number, &header.app_info_id, &header.sort_info_id
        };
        for (auto* field : times) {
            auto r = c.read<std::uint32_t>(byte_order::big);
            *field = r.value;
            c = r.next;
        }

        auto type = c.read_tag();
        header.type = type.value;
        auto creator = type.next.read_tag();
        header.creator = creator.value;
        c = creator.next;

        auto seed = c.read<std::uint32_t>(byte_order::big);
        header.unique_id_seed = seed.value;
        auto next_list = seed.next.read<std::uint32_t>(byte_order::big);
        header.next_record_list_id = next_list.value;
        auto count = next_list.next.read<std::uint16_t>(byte_order::big);
        header.record_count = count.value;
        c = count.next;

        THROW_FORMAT_IF(header.record_count == 0, format_errc::no_records, pdb_record_count_offset,
                        "PDB container declares no records");

        check_container_type(header, options);

        std::vector<record_entry> records;
        records.reserve(header.record_count);
        std::uint32_t previous = 0;

        for (std::size_t i = 0; i < header.record_count; i++) {
            THROW_FORMAT_IF(c.remaining() < pdb_record_entry_size, format_errc::too_small, c.offset(),
                            "Record table truncated: entry ", i, " of ", header.record_count,
                            " at offset ", c.offset(), " does not fit in ", buffer.size(), " bytes");

            const std::uint64_t entry_offset = c.offset();
            auto offset = c.read<std::uint32_t>(byte_order::big);
            auto attrs = offset.next.read<std::uint8_t>(byte_order::big);
            auto uid = attrs.next.read_u24(byte_order::big);
            c = uid.next;

            record_entry entry;
            entry.offset = offset.value;
            entry.attributes = attrs.value;
            entry.unique_id = uid.value;

            if (entry.offset > buffer.size()) {
                if (options.strict) {
                    THROW_RECORD_FORMAT(format_errc::bad_record_table, entry_offset, i,
                                        "Record ", i, " starts at ", entry.offset,
                                        ", beyond the end of the file (", buffer.size(), " bytes)");
                }
                options.warn(entry_offset, "record_table",
                             build_error_msg("Record ", i, " offset ", entry.offset,
                                             " beyond end of file, clamping to ", buffer.size()));
                entry.offset = static_cast<std::uint32_t>(buffer.size());
            }

            if (entry.offset < previous) {
                if (options.strict) {
                    THROW_RECORD_FORMAT(format_errc::bad_record_table, entry_offset, i,
                                        "Record ", i, " offset ", entry.offset,
                                        " precedes previous record offset ", previous);
                }
                options.warn(entry_offset, "record_table",
                             build_error_msg("Record ", i, " offset ", entry.offset,
                                             " precedes previous offset ", previous, ", clamping"));
                entry.offset = previous;
            }

            previous = entry.offset;
            records.push_back(entry);
        }

        return pdb_container(std::move(header), std::move(records), buffer.size());
    }

} // namespace mobi
