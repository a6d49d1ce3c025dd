//
// Four-character codes as stored by Palm databases: type and creator in the
// preamble, the MOBI header magic. Held as the big-endian 32-bit value they
// occupy on disk.
//
#pragma once
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace mobi {
    class tag {
    public:
        constexpr tag() = default;

        constexpr tag(char c0, char c1, char c2, char c3)
            : m_code(pack(c0, 24) | pack(c1, 16) | pack(c2, 8) | pack(c3, 0)) {}

        // Shorter strings are space padded, longer ones cut at four
        explicit constexpr tag(std::string_view sv)
            : tag(char_or_space(sv, 0), char_or_space(sv, 1), char_or_space(sv, 2), char_or_space(sv, 3)) {}

        static tag from_bytes(const void* data) {
            const auto* p = static_cast<const unsigned char*>(data);
            return tag(static_cast<char>(p[0]), static_cast<char>(p[1]),
                       static_cast<char>(p[2]), static_cast<char>(p[3]));
        }

        [[nodiscard]] constexpr std::uint32_t code() const { return m_code; }

        constexpr char operator[](std::size_t i) const {
            return static_cast<char>((m_code >> (24 - 8 * i)) & 0xFF);
        }

        [[nodiscard]] std::string to_string() const {
            return {(*this)[0], (*this)[1], (*this)[2], (*this)[3]};
        }

        [[nodiscard]] constexpr bool is_printable() const {
            for (std::size_t i = 0; i < 4; i++) {
                if (!printable((*this)[i])) {
                    return false;
                }
            }
            return true;
        }

        constexpr bool operator==(const tag& o) const { return m_code == o.m_code; }
        constexpr bool operator!=(const tag& o) const { return m_code != o.m_code; }

        friend std::ostream& operator<<(std::ostream& os, const tag& t) {
            static constexpr char hex[] = "0123456789abcdef";
            os << '\'';
            for (std::size_t i = 0; i < 4; i++) {
                const char c = t[i];
                if (printable(c)) {
                    os << c;
                } else {
                    const auto u = static_cast<unsigned char>(c);
                    os << "\\x" << hex[u >> 4] << hex[u & 0x0F];
                }
            }
            return os << '\'';
        }

    private:
        static constexpr std::uint32_t pack(char c, unsigned shift) {
            return static_cast<std::uint32_t>(static_cast<unsigned char>(c)) << shift;
        }

        static constexpr char char_or_space(std::string_view sv, std::size_t i) {
            return i < sv.size() ? sv[i] : ' ';
        }

        static constexpr bool printable(char c) {
            return c >= 0x20 && c <= 0x7E;
        }

        std::uint32_t m_code = 0x20202020;
    };

    constexpr tag operator""_tag(const char* str, std::size_t len) {
        if (len > 4) {
            throw std::invalid_argument("tag literal must be 4 characters or less");
        }
        return tag(std::string_view(str, len));
    }

    namespace tags {
        inline constexpr tag MOBI("MOBI");
        inline constexpr tag BOOK("BOOK");
        inline constexpr tag TEXt("TEXt");
        inline constexpr tag REAd("REAd");
    }
}
