//
// Bounded reads over an in-memory buffer.
//

#include <mobi/byte_cursor.hh>
#include <algorithm>

namespace mobi {

    std::optional<byte_cursor> byte_cursor::seek(std::size_t pos) const {
        if (pos > m_size) {
            return std::nullopt;
        }
        byte_cursor c(*this);
        c.m_position = pos;
        return c;
    }

    std::optional<byte_cursor> byte_cursor::skip(std::size_t n) const {
        if (n > remaining()) {
            return std::nullopt;
        }
        return advanced(n);
    }

    std::optional<byte_cursor> byte_cursor::subrange(std::size_t pos, std::size_t len) const {
        if (pos > m_size || len > m_size - pos) {
            return std::nullopt;
        }
        return byte_cursor(m_data + pos, len, m_base + pos);
    }

    byte_cursor byte_cursor::clamped_subrange(std::size_t pos, std::size_t len) const {
        pos = std::min(pos, m_size);
        len = std::min(len, m_size - pos);
        return byte_cursor(m_data + pos, len, m_base + pos);
    }

    std::optional<byte_cursor::read_result<std::uint32_t>> byte_cursor::try_read_u24(byte_order bo) const {
        if (remaining() < 3) {
            return std::nullopt;
        }
        const auto* p = m_data + m_position;
        auto b0 = std::to_integer<std::uint32_t>(p[0]);
        auto b1 = std::to_integer<std::uint32_t>(p[1]);
        auto b2 = std::to_integer<std::uint32_t>(p[2]);

        std::uint32_t value = (bo == byte_order::big)
            ? (b0 << 16) | (b1 << 8) | b2
            : (b2 << 16) | (b1 << 8) | b0;
        return read_result<std::uint32_t>{value, advanced(3)};
    }

    byte_cursor::read_result<std::uint32_t> byte_cursor::read_u24(byte_order bo) const {
        auto r = try_read_u24(bo);
        THROW_IO_IF(!r, "Failed to read 3 bytes at offset ", offset());
        return *r;
    }

    std::optional<byte_cursor::read_result<tag>> byte_cursor::try_read_tag() const {
        if (remaining() < 4) {
            return std::nullopt;
        }
        return read_result<tag>{tag::from_bytes(m_data + m_position), advanced(4)};
    }

    byte_cursor::read_result<tag> byte_cursor::read_tag() const {
        auto r = try_read_tag();
        THROW_IO_IF(!r, "Failed to read tag at offset ", offset());
        return *r;
    }

    std::optional<byte_cursor::read_result<byte_cursor>> byte_cursor::try_read_bytes(std::size_t n) const {
        auto window = subrange(m_position, n);
        if (!window) {
            return std::nullopt;
        }
        return read_result<byte_cursor>{*window, advanced(n)};
    }

    byte_cursor::read_result<byte_cursor> byte_cursor::read_bytes(std::size_t n) const {
        auto r = try_read_bytes(n);
        THROW_IO_IF(!r, "Unexpected end of buffer: requested ", n, " bytes at offset ",
                    offset(), ", got ", remaining());
        return *r;
    }

    bool byte_cursor::starts_with(const tag& t) const {
        auto r = try_read_tag();
        return r && r->value == t;
    }

    std::vector<std::byte> byte_cursor::to_vector() const {
        return {m_data + m_position, m_data + m_size};
    }

    std::string byte_cursor::to_string() const {
        return {reinterpret_cast<const char*>(m_data + m_position), remaining()};
    }

} // namespace mobi
