/**
 * @file content.hh
 * @brief Turning decompressed text records into normalized plain text
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <mobi/export_mobi.h>
#include <mobi/byte_cursor.hh>
#include <mobi/decode_options.hh>
#include <mobi/mobi_header.hh>
#include <mobi/pdb_container.hh>

namespace mobi {

    /**
     * @class html_text_extractor
     * @brief Markup-to-text collaborator
     *
     * Implementations may throw (markup_error or any std::exception) on
     * markup they cannot handle; the assembler then falls back to
     * strip_tags().
     */
    class MOBI_EXPORT html_text_extractor {
    public:
        virtual ~html_text_extractor() = default;

        /**
         * @param markup UTF-8 HTML fragment of one text record
         * @return Body text, block elements separated by newlines
         */
        virtual std::string extract(std::string_view markup) const = 0;
    };

    /**
     * @class expat_html_extractor
     * @brief Structured extraction with the expat XML parser
     *
     * The fragment is wrapped in a synthetic root element so that records
     * holding several top-level elements or bare text parse. Text inside
     * head, script and style is dropped; when a body element is present only
     * its text is kept. Markup expat rejects (unclosed tags, HTML-only
     * entities such as &nbsp;) throws markup_error.
     */
    class MOBI_EXPORT expat_html_extractor : public html_text_extractor {
    public:
        std::string extract(std::string_view markup) const override;
    };

    /**
     * @brief Regex tag stripping
     *
     * head, script, style and title elements are removed with their content.
     * Block-level tags become newlines, all other tags spaces. Common named
     * and numeric character references are decoded and runs of spaces and
     * tabs collapse to one space.
     */
    MOBI_EXPORT std::string strip_tags(std::string_view markup);

    /**
     * @brief Last-resort scrubbing of undecodable record bytes
     *
     * Keeps printable ASCII (32..126); CR and LF become '\n', tab becomes a
     * space, everything else is dropped.
     */
    MOBI_EXPORT std::string scrub_raw(const byte_cursor& bytes);

    /**
     * @brief Final whitespace normalization
     *
     * CRLF and lone CR become LF, three or more newlines collapse to two,
     * runs of spaces/tabs collapse to one space, and leading/trailing
     * whitespace is trimmed.
     */
    MOBI_EXPORT std::string normalize_text(std::string_view text);

    /// Inclusive range of text record indices
    struct text_range {
        std::size_t first;
        std::size_t last;
    };

    /**
     * @brief Text records the header designates, clamped to the record table
     *
     * Both range fields zero means the header declares no range; every record
     * after the header record is then text. Every adjustment is reported as a
     * text_range warning.
     *
     * @return nullopt when no text record is left
     */
    MOBI_EXPORT std::optional<text_range> resolve_text_range(const pdb_container& container,
                                                             const format_header& header,
                                                             const decode_options& options);

    /**
     * @brief Decompress and extract every text record, then normalize
     *
     * Records [first_text_record, last_text_record] are processed one by one.
     * A record that fails to decompress is scrubbed with scrub_raw(); a record
     * whose markup the extractor rejects is run through strip_tags(). Non-empty
     * record texts are joined with a blank line.
     *
     * Record boundaries fall at fixed sizes of the uncompressed stream. A tag
     * or UTF-8 sequence left unfinished at the end of a record is moved to
     * the start of the next one before decoding.
     *
     * @throws format_error empty_content if no text survives
     */
    MOBI_EXPORT std::string assemble_text(const pdb_container& container, const format_header& header,
                                          const byte_cursor& buffer, const decode_options& options);

} // namespace mobi
