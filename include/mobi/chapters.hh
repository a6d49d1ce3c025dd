/**
 * @file chapters.hh
 * @brief Heuristic chapter segmentation of plain text
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <mobi/export_mobi.h>
#include <mobi/book.hh>
#include <mobi/chapter_pattern.hh>
#include <mobi/decode_options.hh>

namespace mobi {

    /// Title of the single chapter produced when no heading pattern matches
    inline constexpr const char* whole_text_title = "Content";

    /// Title of the chapter holding text that precedes the first heading
    inline constexpr const char* front_matter_title = "Front Matter";

    /**
     * @brief Split text into chapters at heading lines
     *
     * Patterns are tried in order; the first one that matches at least one
     * line is used exclusively. Each matching line starts a chapter that runs
     * to the next matching line or the end of the text. Text before the first
     * heading forms a "Front Matter" chapter. Without any match the whole
     * text is one "Content" chapter. Empty spans are dropped, so the result
     * covers [0, text.size()) without gaps or overlaps.
     *
     * @param text Normalized book text
     * @param book_id Id stored in every chapter
     * @param patterns Ordered heading strategies
     * @param options Heading length and chapter count limits, warning sink
     */
    MOBI_EXPORT std::vector<chapter> segment_chapters(std::string_view text,
                                                      const std::string& book_id,
                                                      const std::vector<chapter_pattern>& patterns,
                                                      const decode_options& options);

} // namespace mobi
