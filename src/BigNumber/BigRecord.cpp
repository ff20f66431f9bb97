#include "BigRecord.hpp"

#include <cstring>

namespace bignum {

namespace {

constexpr std::size_t STATE_OFFSET = 0;
constexpr std::size_t SIGN_OFFSET = 1;
constexpr std::size_t MANTISSA_OFFSET = 2;
constexpr std::size_t EXPONENT_OFFSET = 10;

void storeLittleEndian(uint8_t* bytes, uint64_t word) {
    for (int i = 0; i < 8; i++) {
        bytes[i] = static_cast<uint8_t>(word & 0xFF);
        word >>= 8;
    }
}

uint64_t loadLittleEndian(const uint8_t* bytes) {
    uint64_t word = 0;
    for (int i = 7; i >= 0; i--) {
        word = (word << 8) | bytes[i];
    }
    return word;
}

} // namespace

BigRecord::BigRecord(const uint8_t bytes[RECORD_SIZE]) {
    const uint8_t stateByte = bytes[STATE_OFFSET];
    state = stateByte <= static_cast<uint8_t>(RecordState::Infinity)
                ? static_cast<RecordState>(stateByte)
                : RecordState::NaN;
    infinity = bytes[SIGN_OFFSET] != 0 ? InfinityKind::Negative : InfinityKind::Positive;

    // Reinterpret the stored bits
    const uint64_t mantissaBits = loadLittleEndian(bytes + MANTISSA_OFFSET);
    std::memcpy(&mantissa, &mantissaBits, sizeof(double));

    const uint64_t exponentBits = loadLittleEndian(bytes + EXPONENT_OFFSET);
    std::memcpy(&exponent, &exponentBits, sizeof(int64_t));
}

void BigRecord::toBytes(uint8_t bytes[RECORD_SIZE]) const {
    bytes[STATE_OFFSET] = static_cast<uint8_t>(state);
    bytes[SIGN_OFFSET] = infinity == InfinityKind::Negative ? 1 : 0;

    uint64_t mantissaBits;
    std::memcpy(&mantissaBits, &mantissa, sizeof(double));
    storeLittleEndian(bytes + MANTISSA_OFFSET, mantissaBits);

    uint64_t exponentBits;
    std::memcpy(&exponentBits, &exponent, sizeof(int64_t));
    storeLittleEndian(bytes + EXPONENT_OFFSET, exponentBits);
}

BigRecord toRecord(const Big& value) {
    return std::visit([](const auto& v) -> BigRecord {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, Number>) {
            return {RecordState::Number, InfinityKind::Positive, v.m, v.e};
        } else if constexpr (std::is_same_v<T, Zero>) {
            return {RecordState::Zero, InfinityKind::Positive, 0.0, 0};
        } else if constexpr (std::is_same_v<T, NaN>) {
            return {RecordState::NaN, InfinityKind::Positive, 0.0, 0};
        } else {
            return {RecordState::Infinity, v.kind, 0.0, 0};
        }
    }, value.value());
}

Big fromRecord(const BigRecord& record) {
    switch (record.state) {
        case RecordState::Number:
            return Big(record.mantissa, record.exponent);
        case RecordState::Zero:
            return Big(Zero{});
        case RecordState::Infinity:
            return Big(Infinity{record.infinity});
        case RecordState::NaN:
            break;
    }
    return Big(NaN{});
}

} // namespace bignum
