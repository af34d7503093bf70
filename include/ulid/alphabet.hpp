#pragma once

#include <array>
#include <cstdint>
#include <optional>

namespace ulid::alphabet {

// Crockford Base32: digits and uppercase letters without I, L, O and U.
// Symbol order matches value order, so text sorts like the number it encodes.
inline constexpr char SYMBOLS[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
inline constexpr size_t SIZE = sizeof(SYMBOLS) - 1;

// Marks bytes that are not in the alphabet
inline constexpr uint8_t INVALID = 0xFF;

namespace detail {

constexpr std::array<uint8_t, 256> build_inverse() {
    std::array<uint8_t, 256> table{};
    for (size_t i = 0; i < table.size(); ++i) {
        table[i] = INVALID;
    }
    for (size_t v = 0; v < SIZE; ++v) {
        table[static_cast<unsigned char>(SYMBOLS[v])] = static_cast<uint8_t>(v);
    }
    return table;
}

inline constexpr std::array<uint8_t, 256> INVERSE = build_inverse();

} // namespace detail

// Raw table lookup: 0..31, or INVALID
constexpr uint8_t lookup(char c) {
    return detail::INVERSE[static_cast<unsigned char>(c)];
}

inline std::optional<uint8_t> symbol_to_value(char c) {
    uint8_t v = lookup(c);
    if (v == INVALID) return std::nullopt;
    return v;
}

// Only the low five bits of value are used
constexpr char value_to_symbol(uint8_t value) {
    return SYMBOLS[value & 0x1F];
}

} // namespace ulid::alphabet
