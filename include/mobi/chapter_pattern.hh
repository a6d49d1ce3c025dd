/**
 * @file chapter_pattern.hh
 * @brief Heading strategies used to split book text into chapters
 */

#pragma once

#include <regex>
#include <string>
#include <vector>

#include <mobi/export_mobi.h>

namespace mobi {

    /**
     * @struct chapter_pattern
     * @brief One heading strategy
     *
     * The regex is matched against the beginning of each line (at most
     * decode_options::max_heading_length bytes of it) and must match at the
     * line start. Leading spaces and tabs are part of what the regex sees.
     */
    struct chapter_pattern {
        std::string name;
        std::regex heading;
    };

    /**
     * @brief Built-in strategies in priority order
     *
     * "Chapter N", "CHAPTER N", "N. " and Roman-numeral "IVX. " headings.
     * Letters match in any case, so "chapter 3" and "iv." are headings too.
     * A numbered heading's dot is followed by blanks or ends the line.
     */
    MOBI_EXPORT std::vector<chapter_pattern> default_chapter_patterns();

} // namespace mobi
