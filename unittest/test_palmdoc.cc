//
// PalmDoc decompression
//

#include <doctest/doctest.h>
#include <mobi/exceptions.hh>
#include <mobi/palmdoc.hh>
#include <string>
#include <vector>
#include "test_utils.hh"

using namespace mobi;

namespace {
    constexpr std::size_t no_limit = 1024 * 1024;

    std::string inflate(const std::vector<std::byte>& input, std::size_t limit = no_limit) {
        return test::to_string(palmdoc::decompress(byte_cursor(input), limit));
    }
}

TEST_SUITE("PalmDoc") {
    TEST_CASE("single-byte codes") {
        SUBCASE("plain bytes pass through") {
            CHECK(inflate(test::to_bytes("Hello World")) == "Hello World");
        }

        SUBCASE("zero byte decodes to a space") {
            CHECK(inflate(test::raw({'a', 0x00, 'b'})) == "a b");
        }

        SUBCASE("0x09 and 0x7F are literals") {
            CHECK(inflate(test::raw({0x09, 0x7F})) == "\t\x7F");
        }

        SUBCASE("space plus character") {
            // 0x80 | 0x2E -> " ."
            CHECK(inflate(test::raw({'e', 'n', 'd', 0xAE})) == "end .");
            CHECK(inflate(test::raw({0x80})) == std::string(" \0", 2));
            CHECK(inflate(test::raw({0xBF})) == " ?");
        }

        SUBCASE("empty input") {
            CHECK(inflate({}).empty());
        }
    }

    TEST_CASE("literal runs") {
        SUBCASE("run copies raw bytes") {
            CHECK(inflate(test::raw({0x03, 0xC3, 0xA9, 0x00, 'x'})) == std::string("\xC3\xA9\0x", 4));
        }

        SUBCASE("maximum run length") {
            CHECK(inflate(test::raw({0x08, '1', '2', '3', '4', '5', '6', '7', '8', '9'})) == "123456789");
        }

        SUBCASE("run truncated at input end") {
            CHECK(inflate(test::raw({'a', 0x05, 'b', 'c'})) == "abc");
        }
    }

    TEST_CASE("back-references") {
        SUBCASE("abcd followed by C0 44") {
            // distance 0x44 reaches past the start and is clamped to 0,
            // length ((0x44 >> 6) & 3) + 3 = 4
            CHECK(inflate(test::raw({'a', 'b', 'c', 'd', 0xC0, 0x44})) == "abcdabcd");
        }

        SUBCASE("overlapping copy replicates") {
            // distance 2, length 3
            CHECK(inflate(test::raw({'a', 'b', 0xC0, 0x02})) == "ababa");
            // distance 1 repeats one byte
            CHECK(inflate(test::raw({'z', 0xC0, 0x01})) == "zzzz");
        }

        SUBCASE("length bits") {
            std::string prefix(300, '.');
            for (std::size_t i = 0; i < prefix.size(); i++) {
                prefix[i] = static_cast<char>('a' + i % 26);
            }
            auto input = test::to_bytes(prefix);
            // distance 0xC8 = 200, length ((0xC8 >> 6) & 3) + 3 = 6
            input.push_back(std::byte{0xC0});
            input.push_back(std::byte{0xC8});
            auto out = inflate(input);
            CHECK(out.size() == 306);
            CHECK(out.substr(300) == prefix.substr(100, 6));
        }

        SUBCASE("high distance bits") {
            std::string prefix(0x150, 'q');
            prefix[0] = 'A';
            prefix[1] = 'B';
            prefix[2] = 'C';
            auto input = test::to_bytes(prefix);
            // distance 0x150 = 336 points at offset 0, length 4
            input.push_back(std::byte{0xC1});
            input.push_back(std::byte{0x50});
            auto out = inflate(input);
            CHECK(out.substr(prefix.size()) == "ABCq");
        }

        SUBCASE("nothing written yet") {
            CHECK(inflate(test::raw({0xC0, 0x10})).empty());
            CHECK(inflate(test::raw({0xC0, 0x10, 'x'})) == "x");
        }

        SUBCASE("distance zero copies nothing") {
            CHECK(inflate(test::raw({'a', 'b', 0xC0, 0x00, 'c'})) == "abc");
        }

        SUBCASE("back-reference cut off by the end of input") {
            CHECK(inflate(test::raw({'a', 'b', 0xC0})) == "ab");
        }
    }

    TEST_CASE("output limit") {
        SUBCASE("exceeding the limit throws") {
            auto input = test::to_bytes(std::string(100, 'x'));
            CHECK_THROWS_AS((void)inflate(input, 99), decompression_error);
        }

        SUBCASE("exactly at the limit") {
            auto input = test::to_bytes(std::string(100, 'x'));
            CHECK(inflate(input, 100).size() == 100);
        }

        SUBCASE("back-reference expansion counts") {
            auto input = test::raw({'a', 0xC0, 0x01, 0xC0, 0x01, 0xC0, 0x01});
            CHECK_THROWS_AS((void)inflate(input, 8), decompression_error);
            CHECK(inflate(input, 10) == "aaaaaaaaaa");
        }
    }

    TEST_CASE("determinism") {
        auto input = test::palmdoc_compress("the quick brown fox jumps over the lazy dog, the quick brown fox");
        auto first = palmdoc::decompress(byte_cursor(input), no_limit);
        auto second = palmdoc::decompress(byte_cursor(input), no_limit);
        CHECK(first == second);
    }

    TEST_CASE("round trip through the reference compressor") {
        SUBCASE("literal only") {
            std::string text = "Plain ASCII, no repetition: 0123456789 !?";
            auto packed = test::palmdoc_compress(text, false);
            CHECK(inflate(packed) == text);
        }

        SUBCASE("space pairs and escapes") {
            std::string text = "a .b ,c\x01\x02 d\xC3\xA9\xE2\x80\x94 \x7F\t!";
            auto packed = test::palmdoc_compress(text, false);
            CHECK(inflate(packed) == text);
        }

        SUBCASE("back-reference heavy") {
            std::string text;
            for (int i = 0; i < 40; i++) {
                text += "Chapter " + std::to_string(i % 7) + ". It was a dark and stormy night. ";
            }
            auto packed = test::palmdoc_compress(text);
            CHECK(packed.size() < text.size());
            CHECK(inflate(packed) == text);
        }

        SUBCASE("long runs") {
            std::string text(2000, ' ');
            text += std::string(500, '=');
            auto packed = test::palmdoc_compress(text);
            CHECK(inflate(packed) == text);
        }

        SUBCASE("UTF-8 prose") {
            std::string text =
                "Gr\xC3\xBC\xC3\x9F" "e aus M\xC3\xBCnchen \xE2\x80\x94 Gr\xC3\xBC\xC3\x9F" "e aus K\xC3\xB6ln. "
                "\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E \xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E";
            auto packed = test::palmdoc_compress(text);
            CHECK(inflate(packed) == text);
        }
    }
}
