//
// UTF-8 helpers shared by the metadata and content code.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace mobi::utf8 {

    /// Appends the UTF-8 encoding of a code point; invalid ones become U+FFFD
    void append(std::string& out, std::uint32_t cp);

    /// Length of the well-formed sequence starting at text[i], 0 if malformed
    std::size_t sequence_length(std::string_view text, std::size_t i);

    /// Copy of text with every malformed sequence replaced by U+FFFD
    std::string repair(std::string_view text);

    /// Number of trailing bytes that begin a sequence the text ends too early to finish
    std::size_t incomplete_tail(std::string_view text);

    /// Largest n <= limit that does not split a sequence
    std::size_t boundary_before(std::string_view text, std::size_t limit);

} // namespace mobi::utf8
