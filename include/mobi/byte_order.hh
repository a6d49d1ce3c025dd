/**
 * @file byte_order.hh
 * @brief Byte order selection for multi-byte reads
 */

#pragma once

#include <mobi/endian.hh>

namespace mobi {
    /**
     * @enum byte_order
     * @brief Byte order of a multi-byte field
     *
     * Every numeric field of the PDB preamble, the record table and the
     * MOBI header is big-endian; little is kept for callers reading
     * embedded payloads.
     */
    enum class byte_order {
        little,
        big
    };

    /**
     * @brief Check if a byte order matches the host
     * @return True when no swapping is needed
     */
    inline bool byte_order_native(byte_order bo) {
        switch (bo) {
            case byte_order::little:
                return is_little_endian;
            case byte_order::big:
                return is_big_endian;
        }
        return false;
    }
}
