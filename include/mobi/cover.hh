/**
 * @file cover.hh
 * @brief Cover image lookup and the persistence collaborator
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <mobi/export_mobi.h>
#include <mobi/byte_cursor.hh>
#include <mobi/mobi_header.hh>
#include <mobi/pdb_container.hh>

namespace mobi {

    /**
     * @class cover_store
     * @brief Persists cover images on behalf of the decoder
     *
     * Failures are reported by throwing; the decoder then leaves the cover
     * path unset and carries on.
     */
    class MOBI_EXPORT cover_store {
    public:
        virtual ~cover_store() = default;

        /**
         * @param image Raw image bytes (JPEG, PNG, GIF or BMP)
         * @param book_id Id of the book being decoded
         * @return Opaque location of the stored image
         */
        virtual std::string save(const std::vector<std::byte>& image, const std::string& book_id) = 0;
    };

    /**
     * @brief First image record after the text records
     *
     * Looks at the records following the text range resolve_text_range()
     * settles on (the header record when none is left) and returns the first one that starts with
     * a JPEG, PNG, GIF or BMP signature. EXTH metadata is not consulted, so
     * this is a heuristic: most MOBI writers store the cover as the first
     * image.
     */
    MOBI_EXPORT std::optional<std::vector<std::byte>> find_cover_image(const pdb_container& container,
                                                                       const format_header& header,
                                                                       const byte_cursor& buffer);

} // namespace mobi
