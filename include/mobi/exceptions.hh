/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the MOBI decoder
 *
 * Structural problems with a file are reported as format_error, which carries
 * a machine-readable code plus the byte offset (and record index, when one
 * applies) where the problem was detected.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <sstream>

namespace mobi {

    /**
     * @class mobi_error
     * @brief Base exception class for all decoder errors
     */
    class mobi_error : public std::runtime_error {
    public:
        explicit mobi_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief A bounded read ran past the end of its buffer
     */
    class io_error : public mobi_error {
    public:
        explicit io_error(const std::string& msg)
            : mobi_error(msg) {}
    };

    /**
     * @enum format_errc
     * @brief Structural failure kinds; any of these aborts the decode
     */
    enum class format_errc {
        too_small,          ///< Buffer cannot hold the PDB preamble or record table
        no_records,         ///< Record count is zero
        header_not_found,   ///< No record starts with the MOBI magic
        bad_identifier,     ///< Header record does not start with "MOBI"
        bad_header_length,  ///< Declared header length below 16 or beyond the record
        bad_record_table,   ///< Record offsets decrease or exceed the file (strict mode)
        empty_content       ///< Nothing readable survived text assembly
    };

    /**
     * @brief Short symbolic name of an error code ("too_small", ...)
     */
    inline const char* to_string(format_errc code) {
        switch (code) {
            case format_errc::too_small:
                return "too_small";
            case format_errc::no_records:
                return "no_records";
            case format_errc::header_not_found:
                return "header_not_found";
            case format_errc::bad_identifier:
                return "bad_identifier";
            case format_errc::bad_header_length:
                return "bad_header_length";
            case format_errc::bad_record_table:
                return "bad_record_table";
            case format_errc::empty_content:
                return "empty_content";
        }
        return "unknown";
    }

    /**
     * @class format_error
     * @brief Fatal structural error in a PDB/MOBI file
     *
     * Thrown for violations that make the rest of the file meaningless.
     * No partially decoded book is ever returned alongside it.
     */
    class format_error : public mobi_error {
    public:
        format_error(format_errc code, std::uint64_t offset,
                     std::optional<std::size_t> record_index, const std::string& msg)
            : mobi_error(msg),
              m_code(code),
              m_offset(offset),
              m_record_index(record_index) {}

        [[nodiscard]] format_errc code() const noexcept { return m_code; }

        /// Byte offset in the file where the problem was detected
        [[nodiscard]] std::uint64_t offset() const noexcept { return m_offset; }

        /// Record the problem belongs to, if it is tied to one
        [[nodiscard]] std::optional<std::size_t> record_index() const noexcept { return m_record_index; }

    private:
        format_errc m_code;
        std::uint64_t m_offset;
        std::optional<std::size_t> m_record_index;
    };

    /**
     * @class decompression_error
     * @brief A single text record could not be decompressed
     *
     * Recoverable: the content assembler falls back to scrubbing the raw
     * record bytes.
     */
    class decompression_error : public mobi_error {
    public:
        explicit decompression_error(const std::string& msg)
            : mobi_error(msg) {}
    };

    /**
     * @class markup_error
     * @brief Structured markup parsing of a record failed
     *
     * Recoverable: the content assembler falls back to tag stripping.
     */
    class markup_error : public mobi_error {
    public:
        explicit markup_error(const std::string& msg)
            : mobi_error(msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     *
     * Concatenates all arguments with a C++17 fold expression.
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_IO
     * @brief Throw an io_error with formatted message
     */
    #define THROW_IO(...) \
        throw ::mobi::io_error(::mobi::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_FORMAT
     * @brief Throw a format_error not tied to a particular record
     * @param code format_errc value
     * @param offset byte offset in the file
     */
    #define THROW_FORMAT(code, offset, ...) \
        throw ::mobi::format_error((code), (offset), std::nullopt, ::mobi::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_RECORD_FORMAT
     * @brief Throw a format_error that names the offending record
     */
    #define THROW_RECORD_FORMAT(code, offset, record, ...) \
        throw ::mobi::format_error((code), (offset), (record), ::mobi::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_DECOMPRESSION
     * @brief Throw a decompression_error with formatted message
     */
    #define THROW_DECOMPRESSION(...) \
        throw ::mobi::decompression_error(::mobi::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_MARKUP
     * @brief Throw a markup_error with formatted message
     */
    #define THROW_MARKUP(...) \
        throw ::mobi::markup_error(::mobi::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_IO_IF
     * @brief Conditionally throw an io_error
     */
    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_FORMAT_IF
     * @brief Conditionally throw a format_error
     */
    #define THROW_FORMAT_IF(condition, code, offset, ...) \
        do { if (condition) THROW_FORMAT(code, offset, __VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace mobi
