/**
 * @file byte_cursor.hh
 * @brief Immutable bounded cursor over an in-memory byte buffer
 *
 * A byte_cursor is a (window, position) pair. Reading never modifies the
 * cursor: every read returns the value together with the advanced cursor,
 * so a cursor can be handed to several parsing steps without aliasing.
 *
 * Two flavours of each read are provided:
 * - try_read*() returns std::nullopt when the read does not fit the window
 * - read*() throws io_error naming the absolute offset of the overrun
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

#include <mobi/export_mobi.h>
#include <mobi/byte_order.hh>
#include <mobi/exceptions.hh>
#include <mobi/tag.hh>

namespace mobi {

    class MOBI_EXPORT byte_cursor {
        public:
            /**
             * @brief Value produced by a read plus the cursor positioned after it
             */
            template<typename T>
            struct read_result;

        public:
            byte_cursor() = default;

            /**
             * @param data Start of the window
             * @param size Window length in bytes
             * @param base Absolute file offset of data[0], used for diagnostics
             */
            byte_cursor(const std::byte* data, std::size_t size, std::uint64_t base = 0)
                : m_data(data), m_size(size), m_position(0), m_base(base) {}

            explicit byte_cursor(const std::vector<std::byte>& buffer)
                : byte_cursor(buffer.data(), buffer.size()) {}

            [[nodiscard]] std::size_t size() const { return m_size; }
            [[nodiscard]] std::size_t position() const { return m_position; }
            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }
            [[nodiscard]] bool at_end() const { return m_position >= m_size; }

            /// Absolute file offset of the current position
            [[nodiscard]] std::uint64_t offset() const { return m_base + m_position; }

            /// Absolute file offset of the window start
            [[nodiscard]] std::uint64_t base() const { return m_base; }

            /// Pointer to the window start
            [[nodiscard]] const std::byte* data() const { return m_data; }

            /// Cursor at an absolute position within the window
            [[nodiscard]] std::optional<byte_cursor> seek(std::size_t pos) const;

            /// Cursor advanced by n bytes
            [[nodiscard]] std::optional<byte_cursor> skip(std::size_t n) const;

            /**
             * @brief New window [pos, pos + len) relative to this window's start
             *
             * The returned cursor is positioned at its own start.
             */
            [[nodiscard]] std::optional<byte_cursor> subrange(std::size_t pos, std::size_t len) const;

            /// Same as subrange() but clamps the range to the window instead of failing
            [[nodiscard]] byte_cursor clamped_subrange(std::size_t pos, std::size_t len) const;

            template<typename T>
            [[nodiscard]] std::optional<read_result<T>> try_read(byte_order bo) const {
                if (remaining() < sizeof(T)) {
                    return std::nullopt;
                }
                T value;
                std::memcpy(&value, m_data + m_position, sizeof(T));
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                return read_result<T>{value, advanced(sizeof(T))};
            }

            template<typename T>
            [[nodiscard]] read_result<T> read(byte_order bo) const {
                auto r = try_read<T>(bo);
                THROW_IO_IF(!r, "Failed to read ", sizeof(T), " bytes at offset ", offset(),
                            " (", remaining(), " bytes left)");
                return *r;
            }

            /// Field at a fixed position of the window, cursor position ignored
            template<typename T>
            [[nodiscard]] std::optional<T> peek_at(std::size_t pos, byte_order bo) const {
                auto c = seek(pos);
                if (!c) {
                    return std::nullopt;
                }
                auto r = c->try_read<T>(bo);
                if (!r) {
                    return std::nullopt;
                }
                return r->value;
            }

            /// Three-byte unsigned integer (PDB record unique ids)
            [[nodiscard]] std::optional<read_result<std::uint32_t>> try_read_u24(byte_order bo) const;
            [[nodiscard]] read_result<std::uint32_t> read_u24(byte_order bo) const;

            [[nodiscard]] std::optional<read_result<tag>> try_read_tag() const;
            [[nodiscard]] read_result<tag> read_tag() const;

            /// The next n bytes as their own window
            [[nodiscard]] std::optional<read_result<byte_cursor>> try_read_bytes(std::size_t n) const;
            [[nodiscard]] read_result<byte_cursor> read_bytes(std::size_t n) const;

            /// True if the bytes at the current position equal the tag
            [[nodiscard]] bool starts_with(const tag& t) const;

            /// Copy of the bytes from the current position to the window end
            [[nodiscard]] std::vector<std::byte> to_vector() const;

            /// Bytes from the current position to the window end as chars
            [[nodiscard]] std::string to_string() const;

        private:
            [[nodiscard]] byte_cursor advanced(std::size_t n) const {
                byte_cursor c(*this);
                c.m_position += n;
                return c;
            }

        private:
            const std::byte* m_data = nullptr;
            std::size_t m_size = 0;
            std::size_t m_position = 0;
            std::uint64_t m_base = 0;
    };

    template<typename T>
    struct byte_cursor::read_result {
        T value;
        byte_cursor next;
    };

} // namespace mobi
