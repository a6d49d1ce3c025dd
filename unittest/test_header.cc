//
// MOBI header location and field parsing
//

#include <doctest/doctest.h>
#include <mobi/exceptions.hh>
#include <mobi/mobi_header.hh>
#include <mobi/pdb_container.hh>
#include <string>
#include <vector>
#include "test_utils.hh"

using namespace mobi;

namespace {
    struct field_warnings {
        std::vector<std::string> messages;
        std::vector<std::uint64_t> offsets;

        void operator()(std::uint64_t offset, std::string_view category, std::string_view message) {
            if (category == "header_field") {
                messages.emplace_back(message);
                offsets.push_back(offset);
            }
        }
    };

    format_header parse(const std::vector<std::byte>& data, const decode_options& opts = {}) {
        byte_cursor buffer(data);
        auto container = read_container(buffer, opts);
        auto location = locate_header(container, buffer);
        return parse_header(location, buffer, opts);
    }
}

TEST_CASE("Header locator") {
    SUBCASE("header in the first record") {
        test::pdb_builder pdb;
        pdb.add_record(test::header_builder().build()).add_record(test::to_bytes("body"));
        auto data = pdb.build();
        byte_cursor buffer(data);
        auto container = read_container(buffer, decode_options{});
        auto location = locate_header(container, buffer);
        CHECK(location.record_index == 0);
        CHECK(location.offset == pdb.record_offset(0));
        CHECK(location.length == 0xE8);
    }

    SUBCASE("header after a PalmDoc record") {
        test::pdb_builder pdb;
        pdb.add_record(test::to_bytes("PalmDOC record 0 is not MOBI"))
           .add_record(test::header_builder().build());
        auto data = pdb.build();
        byte_cursor buffer(data);
        auto container = read_container(buffer, decode_options{});
        auto location = locate_header(container, buffer);
        CHECK(location.record_index == 1);
        CHECK(location.offset == pdb.record_offset(1));
    }

    SUBCASE("magic split by the end of the file is skipped") {
        test::pdb_builder pdb;
        pdb.add_record(test::to_bytes("none")).add_record(test::to_bytes("MOB"));
        auto data = pdb.build();
        byte_cursor buffer(data);
        auto container = read_container(buffer, decode_options{});
        CHECK_THROWS_AS((void)locate_header(container, buffer), format_error);
    }

    SUBCASE("no MOBI record") {
        test::pdb_builder pdb;
        pdb.add_record(test::to_bytes("text")).add_record(test::to_bytes("more text"));
        auto data = pdb.build();
        byte_cursor buffer(data);
        auto container = read_container(buffer, decode_options{});
        try {
            (void)locate_header(container, buffer);
            FAIL("Should have thrown format_error");
        } catch (const format_error& e) {
            CHECK(e.code() == format_errc::header_not_found);
            CHECK(std::string(e.what()).find("2 records") != std::string::npos);
        }
    }
}

TEST_CASE("Header parser - core fields") {
    test::header_builder header;
    header.encoding(1252)
          .language(0x0809)
          .text_records(1, 3)
          .set(header_field::unique_id, 0xCAFEBABE)
          .set(header_field::title_offset, 0x200)
          .set(header_field::title_length, 0x10)
          .set(header_field::author_length, 7);

    test::pdb_builder pdb;
    pdb.add_record(header.build());
    auto data = pdb.build();

    auto h = parse(data);
    CHECK(h.declared_length == 0xE8);
    CHECK(h.mobi_type == 2);
    CHECK(h.text_encoding == 1252);
    CHECK_FALSE(h.is_utf8());
    CHECK(h.unique_id == 0xCAFEBABEu);
    CHECK(h.file_version == 6);
    CHECK(h.title_offset == 0x200);
    CHECK(h.title_length == 0x10);
    CHECK(h.author_offset == 0x10);   // same slot as title_length
    CHECK(h.author_length == 7);
    CHECK(h.language_code == 0x0809);
    CHECK(h.first_text_record == 1);
    CHECK(h.last_text_record == 3);
    CHECK(h.record_index == 0);
    CHECK(h.record_offset == pdb.record_offset(0));
}

TEST_CASE("Header parser - optional fields") {
    SUBCASE("declared length below 0x70 leaves them zero without warnings") {
        test::header_builder header(0x40);
        header.text_records(1, 5).set(header_field::title_offset, 99);
        test::pdb_builder pdb;
        pdb.add_record(header.build());
        auto data = pdb.build();

        decode_options opts;
        field_warnings warnings;
        opts.on_warning = std::ref(warnings);

        auto h = parse(data, opts);
        CHECK(h.declared_length == 0x40);
        CHECK(h.text_encoding == encoding_utf8);
        CHECK(h.title_offset == 0);
        CHECK(h.first_text_record == 0);
        CHECK(h.last_text_record == 0);
        CHECK(warnings.messages.empty());
    }

    SUBCASE("exactly 0x70 holds every field") {
        test::header_builder header(0x70);
        header.text_records(1, 2);
        test::pdb_builder pdb;
        pdb.add_record(header.build());
        auto data = pdb.build();
        auto h = parse(data);
        CHECK(h.first_text_record == 1);
        CHECK(h.last_text_record == 2);
    }

    SUBCASE("fields past the declared length are never read") {
        // The record carries data past the header; the parser must not see it
        test::header_builder header(0x14);
        header.trailer(test::raw({0x00, 0x00, 0x00, 0x09}));
        test::pdb_builder pdb;
        pdb.add_record(header.build());
        auto data = pdb.build();

        decode_options opts;
        field_warnings warnings;
        opts.on_warning = std::ref(warnings);

        auto h = parse(data, opts);
        CHECK(h.file_version == 0);
        REQUIRE(warnings.messages.size() == 1);
        CHECK(warnings.messages[0].find("file_version") != std::string::npos);
        CHECK(warnings.offsets[0] == pdb.record_offset(0) + header_field::file_version);
    }
}

TEST_CASE("Header parser - fatal errors") {
    SUBCASE("declared length larger than the record") {
        auto record = test::to_bytes("MOBI");
        test::put_u32(record, 0xE8);
        record.resize(0x40);
        test::pdb_builder pdb;
        pdb.add_record(record);
        auto data = pdb.build();
        try {
            (void)parse(data);
            FAIL("Should have thrown format_error");
        } catch (const format_error& e) {
            CHECK(e.code() == format_errc::bad_header_length);
            CHECK(e.record_index() == std::optional<std::size_t>(0));
            CHECK(e.offset() == pdb.record_offset(0) + 4);
        }
    }

    SUBCASE("declared length below the minimum") {
        test::pdb_builder pdb;
        pdb.add_record(test::header_builder(8).build());
        auto data = pdb.build();
        try {
            (void)parse(data);
            FAIL("Should have thrown format_error");
        } catch (const format_error& e) {
            CHECK(e.code() == format_errc::bad_header_length);
        }
    }

    SUBCASE("declared length missing") {
        test::pdb_builder pdb;
        pdb.add_record(test::raw({'M', 'O', 'B', 'I', 0x00, 0x01}));
        auto data = pdb.build();
        CHECK_THROWS_AS((void)parse(data), format_error);
    }

    SUBCASE("location that does not hold the magic") {
        test::pdb_builder pdb;
        pdb.add_record(test::header_builder().build()).add_record(test::to_bytes("text"));
        auto data = pdb.build();
        byte_cursor buffer(data);
        auto container = read_container(buffer, decode_options{});

        header_location wrong;
        wrong.record_index = 1;
        wrong.offset = container.span(1).offset;
        wrong.length = container.span(1).length;
        try {
            (void)parse_header(wrong, buffer, decode_options{});
            FAIL("Should have thrown format_error");
        } catch (const format_error& e) {
            CHECK(e.code() == format_errc::bad_identifier);
            CHECK(e.record_index() == std::optional<std::size_t>(1));
        }
    }
}
