/**
 * @file decode_options.hh
 * @brief Decoder configuration: strictness, resource guards, collaborators
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>
#include <vector>

#include <mobi/chapter_pattern.hh>

namespace mobi {

    class html_text_extractor;
    class cover_store;

    /**
     * @struct decode_options
     * @brief Configuration options for decoding MOBI files
     *
     * Controls how strictly the container is validated, how much work a
     * single (possibly hostile) file may cause, which collaborators are used
     * and how warnings are reported.
     */
    struct decode_options {
        /**
         * @brief Strict record table validation
         *
         * When true, decreasing or out-of-range record offsets abort with
         * format_errc::bad_record_table. When false, they are clamped and a
         * "record_table" warning is emitted.
         */
        bool strict = false;

        /**
         * @brief Maximum decompressed size of a single text record
         *
         * PalmDoc records decompress to 4096 bytes; anything far beyond that
         * is a corrupt or adversarial back-reference chain.
         */
        std::size_t max_record_size = std::size_t(64) * 1024;

        /**
         * @brief Maximum size of the assembled book text in bytes
         */
        std::size_t max_text_size = std::size_t(64) * 1024 * 1024;

        /**
         * @brief Number of leading bytes of each line that heading patterns see
         *
         * Bounds regex work per line during chapter segmentation.
         */
        std::size_t max_heading_length = 128;

        /**
         * @brief Maximum number of chapters produced
         */
        std::size_t max_chapters = 10000;

        /**
         * @brief Ordered heading strategies; empty means default_chapter_patterns()
         */
        std::vector<chapter_pattern> chapter_patterns;

        /**
         * @brief Markup-to-text collaborator; null selects the expat extractor
         */
        std::shared_ptr<html_text_extractor> html_extractor;

        /**
         * @brief Cover persistence collaborator; null disables cover storage
         */
        std::shared_ptr<cover_store> cover_storage;

        /**
         * @typedef warning_handler
         * @param offset File offset the warning relates to
         * @param category Warning category (e.g. "header_field", "markup")
         * @param message Human-readable message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler
         *
         * Called for every recoverable problem. If not set, warnings are
         * silently dropped.
         */
        warning_handler on_warning;

        /// Invoke on_warning if one is installed
        void warn(std::uint64_t offset, std::string_view category, std::string_view message) const {
            if (on_warning) {
                on_warning(offset, category, message);
            }
        }
    };

} // namespace mobi
