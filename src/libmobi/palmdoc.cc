//
// PalmDoc text record decompression.
//

#include <mobi/palmdoc.hh>
#include <mobi/exceptions.hh>

#include <algorithm>
#include <cstdint>
#include <utility>

namespace mobi::palmdoc {

    namespace {
        constexpr std::byte space{0x20};

        class output_buffer {
            public:
                output_buffer(std::size_t limit, std::uint64_t record_offset)
                    : m_limit(limit), m_record_offset(record_offset) {
                    m_data.reserve(std::min<std::size_t>(limit, 4096));
                }

                void push(std::byte b) {
                    if (m_data.size() >= m_limit) {
                        THROW_DECOMPRESSION("Decompressed record at offset ", m_record_offset,
                                            " exceeds ", m_limit, " bytes");
                    }
                    m_data.push_back(b);
                }

                // Repeats earlier output; overlapping ranges replicate byte by byte
                void copy_back(std::size_t distance, std::size_t length) {
                    std::size_t pos = m_data.size() >= distance ? m_data.size() - distance : 0;
                    for (std::size_t j = 0; j < length && pos < m_data.size(); j++, pos++) {
                        push(m_data[pos]);
                    }
                }

                std::vector<std::byte> release() { return std::move(m_data); }

            private:
                std::vector<std::byte> m_data;
                std::size_t m_limit;
                std::uint64_t m_record_offset;
        };
    }

    std::vector<std::byte> decompress(const byte_cursor& input, std::size_t max_output) {
        output_buffer out(max_output, input.base());
        const std::byte* in = input.data();
        const std::size_t n = input.size();
        std::size_t i = 0;

        while (i < n) {
            const auto b = std::to_integer<unsigned>(in[i]);

            if (b == 0x00) {
                out.push(space);
                i++;
            } else if (b <= 0x08) {
                // literal run, truncated at the end of the record
                i++;
                for (unsigned k = 0; k < b && i < n; k++) {
                    out.push(in[i++]);
                }
            } else if (b <= 0x7F) {
                out.push(in[i]);
                i++;
            } else if (b <= 0xBF) {
                out.push(space);
                out.push(static_cast<std::byte>(b & 0x7F));
                i++;
            } else {
                if (i + 1 >= n) {
                    // back-reference cut off by the record end
                    break;
                }
                const auto b2 = std::to_integer<unsigned>(in[i + 1]);
                const std::size_t distance = ((b & 0x3F) << 8) | b2;
                const std::size_t length = ((b2 >> 6) & 0x03) + 3;
                out.copy_back(distance, length);
                i += 2;
            }
        }

        return out.release();
    }

} // namespace mobi::palmdoc
