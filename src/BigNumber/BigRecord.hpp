#pragma once

#include <cstddef>
#include <cstdint>

#include "Big.hpp"

/**
 * BigRecord - field-level encoding of a Big
 *
 * A record is a direct pass-through of the representation: which state is
 * active plus the fields that state carries. It is meant for storing values
 * (save files, network messages) without going through text.
 *
 * Byte layout (18 bytes):
 * - Byte 0: State (0 = Number, 1 = Zero, 2 = NaN, 3 = Infinity)
 * - Byte 1: Infinity sign (0 = positive, 1 = negative), 0 for other states
 * - Bytes 2-9: Mantissa, IEEE 754 double bits, little endian
 * - Bytes 10-17: Exponent, two's complement, little endian
 */

namespace bignum {

constexpr std::size_t RECORD_SIZE = 18;

enum class RecordState : uint8_t {
    Number = 0,
    Zero = 1,
    NaN = 2,
    Infinity = 3
};

struct BigRecord {
    RecordState state{RecordState::Zero};
    InfinityKind infinity{InfinityKind::Positive};
    double mantissa{0.0};
    int64_t exponent{0};

    BigRecord() = default;
    BigRecord(RecordState s, InfinityKind inf, double m, int64_t e)
        : state(s), infinity(inf), mantissa(m), exponent(e) {}

    // Construct from byte array; an unknown state byte decodes as NaN
    explicit BigRecord(const uint8_t bytes[RECORD_SIZE]);

    // Convert to byte array
    void toBytes(uint8_t bytes[RECORD_SIZE]) const;
};

BigRecord toRecord(const Big& value);

// Number records are normalized on the way in
Big fromRecord(const BigRecord& record);

} // namespace bignum
