/**
 * @file book.hh
 * @brief Decoded book value types
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mobi {

    /**
     * @struct chapter
     * @brief A span of the book text
     *
     * Indices are byte offsets into book::full_text, start inclusive and end
     * exclusive.
     */
    struct chapter {
        std::string id;              ///< "chapter_<n>"
        std::string title;
        std::size_t start_index = 0;
        std::size_t end_index = 0;
        std::string book_id;
    };

    /**
     * @struct book
     * @brief Result of a successful decode
     *
     * full_text is never empty. Chapters are ordered, contiguous and cover
     * the whole of full_text.
     */
    struct book {
        std::string id;
        std::string title;
        std::string author;
        std::string format = "mobi";
        std::optional<std::string> cover_image_path;
        std::vector<chapter> chapters;
        std::string full_text;
        std::optional<std::string> language;
        std::chrono::system_clock::time_point added_at;
        std::string source;          ///< Caller-supplied identifier, diagnostics only
    };

} // namespace mobi
