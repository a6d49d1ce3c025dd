//
// UTF-8 encoding, validation and repair.
//

#include "utf8.hh"

namespace mobi::utf8 {

    namespace {
        constexpr std::uint32_t replacement = 0xFFFD;
    }

    void append(std::string& out, std::uint32_t cp) {
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            cp = replacement;
        }
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    std::size_t sequence_length(std::string_view text, std::size_t i) {
        const std::size_t n = text.size();
        auto c = static_cast<unsigned char>(text[i]);
        std::size_t extra;
        std::uint32_t cp;

        if (c < 0x80) {
            return 1;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
        } else {
            return 0;
        }

        if (i + extra >= n) {
            return 0;
        }
        for (std::size_t k = 1; k <= extra; k++) {
            auto cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return 0;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        static constexpr std::uint32_t min_for_length[] = {0, 0x80, 0x800, 0x10000};
        if (cp < min_for_length[extra] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return 0;
        }
        return extra + 1;
    }

    std::size_t incomplete_tail(std::string_view text) {
        const std::size_t n = text.size();
        for (std::size_t k = 1; k <= 3 && k <= n; k++) {
            auto c = static_cast<unsigned char>(text[n - k]);
            if ((c & 0xC0) == 0x80) {
                continue;
            }
            std::size_t expected = 0;
            if (c >= 0xC2 && c <= 0xDF) {
                expected = 2;
            } else if ((c & 0xF0) == 0xE0) {
                expected = 3;
            } else if (c >= 0xF0 && c <= 0xF4) {
                expected = 4;
            }
            return expected > k ? k : 0;
        }
        return 0;
    }

    std::string repair(std::string_view text) {
        std::string out;
        out.reserve(text.size());
        std::size_t i = 0;
        while (i < text.size()) {
            auto len = sequence_length(text, i);
            if (len == 0) {
                append(out, replacement);
                i++;
            } else {
                out.append(text.data() + i, len);
                i += len;
            }
        }
        return out;
    }

    std::size_t boundary_before(std::string_view text, std::size_t limit) {
        if (limit >= text.size()) {
            return text.size();
        }
        std::size_t n = limit;
        while (n > 0 && (static_cast<unsigned char>(text[n]) & 0xC0) == 0x80) {
            n--;
        }
        return n;
    }

} // namespace mobi::utf8
