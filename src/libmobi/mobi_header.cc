//
// MOBI header location and field parsing.
//

#include <mobi/mobi_header.hh>
#include <mobi/exceptions.hh>
#include <mobi/tag.hh>

namespace mobi {

    namespace {
        struct field_reader {
            const byte_cursor& header;       // window limited to min(declared length, record)
            std::size_t record_length;
            const decode_options& options;

            // Reads a big-endian u32; an overrun is zero plus a warning
            std::uint32_t read(std::size_t pos, const char* name) const {
                auto value = header.peek_at<std::uint32_t>(pos, byte_order::big);
                if (value) {
                    return *value;
                }
                options.warn(header.base() + pos, "header_field",
                             build_error_msg("Field '", name, "' at header offset 0x", std::hex, pos, std::dec,
                                             " exceeds header bounds (declared ", header.size(),
                                             " bytes, record ", record_length, " bytes); using 0"));
                return 0;
            }
        };
    }

    header_location locate_header(const pdb_container& container, const byte_cursor& buffer) {
        for (std::size_t i = 0; i < container.record_count(); i++) {
            auto span = container.span(i);
            auto start = buffer.seek(static_cast<std::size_t>(span.offset));
            if (!start || !start->starts_with(tags::MOBI)) {
                continue;
            }
            header_location location;
            location.record_index = i;
            location.offset = span.offset;
            location.length = span.length;
            return location;
        }

        THROW_FORMAT(format_errc::header_not_found, pdb_header_size,
                     "No record starts with the MOBI magic (", container.record_count(), " records scanned)");
    }

    format_header parse_header(const header_location& location, const byte_cursor& buffer,
                               const decode_options& options) {
        auto record = buffer.clamped_subrange(static_cast<std::size_t>(location.offset), location.length);

        auto identifier = record.try_read_tag();
        if (!identifier || identifier->value != tags::MOBI) {
            THROW_RECORD_FORMAT(format_errc::bad_identifier, location.offset, location.record_index,
                                "Invalid MOBI header identifier in record ", location.record_index,
                                " at offset ", location.offset);
        }

        auto declared = identifier->next.try_read<std::uint32_t>(byte_order::big);
        if (!declared || declared->value < min_header_length || declared->value > record.size()) {
            THROW_RECORD_FORMAT(format_errc::bad_header_length, location.offset + header_field::declared_length,
                                location.record_index,
                                "Invalid MOBI header length ",
                                declared ? std::to_string(declared->value) : std::string("<missing>"),
                                " in record ", location.record_index, " (record is ", record.size(), " bytes)");
        }

        format_header header;
        header.declared_length = declared->value;
        header.record_index = location.record_index;
        header.record_offset = location.offset;

        // Never look past the declared length
        auto window = record.clamped_subrange(0, header.declared_length);
        field_reader fields{window, record.size(), options};

        header.mobi_type = fields.read(header_field::mobi_type, "mobi_type");
        header.text_encoding = fields.read(header_field::text_encoding, "text_encoding");
        header.unique_id = fields.read(header_field::unique_id, "unique_id");
        header.file_version = fields.read(header_field::file_version, "file_version");

        if (header.declared_length >= optional_fields_threshold) {
            header.title_offset = fields.read(header_field::title_offset, "title_offset");
            header.title_length = fields.read(header_field::title_length, "title_length");
            header.author_offset = fields.read(header_field::author_offset, "author_offset");
            header.author_length = fields.read(header_field::author_length, "author_length");
            header.language_code = fields.read(header_field::language_code, "language_code");
            header.first_text_record = fields.read(header_field::first_text, "first_text_record");
            header.last_text_record = fields.read(header_field::last_text, "last_text_record");
        }

        return header;
    }

} // namespace mobi
