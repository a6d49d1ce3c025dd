//
// PDB preamble and record table parsing
//

#include <doctest/doctest.h>
#include <mobi/exceptions.hh>
#include <mobi/pdb_container.hh>
#include <string>
#include <vector>
#include "test_utils.hh"

using namespace mobi;

namespace {
    struct warning_log {
        std::vector<std::pair<std::string, std::uint64_t>> entries;

        void operator()(std::uint64_t offset, std::string_view category, std::string_view) {
            entries.emplace_back(std::string(category), offset);
        }

        std::size_t count(std::string_view category) const {
            std::size_t n = 0;
            for (const auto& e : entries) {
                if (e.first == category) {
                    n++;
                }
            }
            return n;
        }
    };
}

TEST_CASE("Container - preamble fields") {
    test::pdb_builder pdb;
    pdb.name("My Book").add_record(test::to_bytes("MOBI")).add_record(test::to_bytes("text"));
    auto data = pdb.build();

    auto container = read_container(byte_cursor(data), decode_options{});
    const auto& h = container.header();

    CHECK(h.name == "My Book");
    CHECK(h.type == tags::BOOK);
    CHECK(h.creator == tags::MOBI);
    CHECK(h.creation_time == 0x5F5E1000u);
    CHECK(h.record_count == 2);
    CHECK(container.record_count() == 2);
    CHECK(container.file_size() == data.size());

    SUBCASE("record entries") {
        CHECK(container.records()[0].offset == 78 + 16);
        CHECK(container.records()[1].offset == 78 + 16 + 4);
        CHECK(container.records()[1].unique_id == 2);
        CHECK(container.records()[1].attributes == 0);
    }

    SUBCASE("record spans") {
        auto first = container.span(0);
        CHECK(first.offset == 94);
        CHECK(first.length == 4);

        // Last record runs to the end of the file
        auto last = container.span(1);
        CHECK(last.offset == 98);
        CHECK(last.length == 4);

        CHECK(container.record(byte_cursor(data), 1).to_string() == "text");
        CHECK_THROWS_AS((void)container.span(2), std::out_of_range);
    }
}

TEST_CASE("Container - name trimming") {
    SUBCASE("NUL terminated with trailing garbage") {
        test::pdb_builder pdb;
        pdb.name(std::string("Title\0junk", 10)).add_record(test::to_bytes("MOBI"));
        auto data = pdb.build();
        CHECK(read_container(byte_cursor(data), decode_options{}).header().name == "Title");
    }

    SUBCASE("whitespace") {
        test::pdb_builder pdb;
        pdb.name("  Spaced Out  ").add_record(test::to_bytes("MOBI"));
        auto data = pdb.build();
        CHECK(read_container(byte_cursor(data), decode_options{}).header().name == "Spaced Out");
    }

    SUBCASE("full 32 bytes without terminator") {
        std::string name(32, 'N');
        test::pdb_builder pdb;
        pdb.name(name).add_record(test::to_bytes("MOBI"));
        auto data = pdb.build();
        CHECK(read_container(byte_cursor(data), decode_options{}).header().name == name);
    }
}

TEST_CASE("Container - fatal errors") {
    SUBCASE("buffer shorter than the preamble") {
        std::vector<std::byte> data(77, std::byte{0});
        try {
            (void)read_container(byte_cursor(data), decode_options{});
            FAIL("Should have thrown format_error");
        } catch (const format_error& e) {
            CHECK(e.code() == format_errc::too_small);
            CHECK(e.offset() == 0);
            CHECK_FALSE(e.record_index().has_value());
        }
    }

    SUBCASE("zero records") {
        test::pdb_builder pdb;
        auto data = pdb.build();
        REQUIRE(data.size() == 78);
        try {
            (void)read_container(byte_cursor(data), decode_options{});
            FAIL("Should have thrown format_error");
        } catch (const format_error& e) {
            CHECK(e.code() == format_errc::no_records);
            CHECK(e.offset() == 76);
        }
    }

    SUBCASE("record table cut short") {
        test::pdb_builder pdb;
        pdb.add_record({}).add_record({}).add_record({});
        auto data = pdb.build();
        data.resize(78 + 8 + 5);
        try {
            (void)read_container(byte_cursor(data), decode_options{});
            FAIL("Should have thrown format_error");
        } catch (const format_error& e) {
            CHECK(e.code() == format_errc::too_small);
            CHECK(e.offset() == 86);
        }
    }
}

TEST_CASE("Container - record table repair") {
    test::pdb_builder pdb;
    pdb.add_record(test::to_bytes("MOBIxxxx"))
       .add_record(test::to_bytes("aaaa"))
       .add_record(test::to_bytes("bbbb"));

    SUBCASE("offset beyond end of file, lenient") {
        pdb.override_offset(2, 100000);
        auto data = pdb.build();

        decode_options opts;
        warning_log log;
        opts.on_warning = std::ref(log);

        auto container = read_container(byte_cursor(data), opts);
        CHECK(container.records()[2].offset == data.size());
        CHECK(container.span(2).length == 0);
        CHECK(log.count("record_table") == 1);
        CHECK(log.entries[0].second == 78 + 16);
    }

    SUBCASE("decreasing offset, lenient") {
        pdb.override_offset(2, pdb.record_offset(1) - 2);
        auto data = pdb.build();

        decode_options opts;
        warning_log log;
        opts.on_warning = std::ref(log);

        auto container = read_container(byte_cursor(data), opts);
        CHECK(container.records()[2].offset == container.records()[1].offset);
        CHECK(container.span(1).length == 0);
        CHECK(log.count("record_table") == 1);
    }

    SUBCASE("offsets stay monotonic and in range") {
        pdb.override_offset(0, 5000).override_offset(1, 10);
        auto data = pdb.build();
        auto container = read_container(byte_cursor(data), decode_options{});
        std::uint32_t previous = 0;
        for (const auto& entry : container.records()) {
            CHECK(entry.offset >= previous);
            CHECK(entry.offset <= data.size());
            previous = entry.offset;
        }
    }

    SUBCASE("strict mode rejects") {
        pdb.override_offset(1, 100000);
        auto data = pdb.build();

        decode_options opts;
        opts.strict = true;
        try {
            (void)read_container(byte_cursor(data), opts);
            FAIL("Should have thrown format_error");
        } catch (const format_error& e) {
            CHECK(e.code() == format_errc::bad_record_table);
            CHECK(e.record_index() == std::optional<std::size_t>(1));
            CHECK(e.offset() == 78 + 8);
        }
    }
}

TEST_CASE("Container - type and creator") {
    SUBCASE("BOOKMOBI is silent") {
        test::pdb_builder pdb;
        pdb.add_record(test::to_bytes("MOBI"));
        auto data = pdb.build();
        decode_options opts;
        warning_log log;
        opts.on_warning = std::ref(log);
        (void)read_container(byte_cursor(data), opts);
        CHECK(log.count("container_type") == 0);
    }

    SUBCASE("TEXtREAd is silent") {
        test::pdb_builder pdb;
        pdb.type("TEXt", "REAd").add_record(test::to_bytes("MOBI"));
        auto data = pdb.build();
        decode_options opts;
        warning_log log;
        opts.on_warning = std::ref(log);
        auto container = read_container(byte_cursor(data), opts);
        CHECK(container.header().type == tags::TEXt);
        CHECK(log.count("container_type") == 0);
    }

    SUBCASE("anything else warns and continues") {
        test::pdb_builder pdb;
        pdb.type("DATA", "XXXX").add_record(test::to_bytes("MOBI"));
        auto data = pdb.build();
        decode_options opts;
        warning_log log;
        opts.on_warning = std::ref(log);
        auto container = read_container(byte_cursor(data), opts);
        CHECK(container.record_count() == 1);
        CHECK(log.count("container_type") == 1);
        CHECK(log.entries[0].second == 60);
    }
}
