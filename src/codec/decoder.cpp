#include <ulid/decoder.hpp>
#include <ulid/alphabet.hpp>

namespace ulid {

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static bool is_hyphen_pos(size_t i) {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

// Printable bytes are quoted, anything else is shown as 0xNN
static std::string describe_byte(char c) {
    auto b = static_cast<unsigned char>(c);
    if (b >= 0x20 && b < 0x7F) return std::string("'") + c + "'";
    static const char* digits = "0123456789ABCDEF";
    return std::string("0x") + digits[b >> 4] + digits[b & 0x0F];
}

static UlidError invalid_char(const char* what, char c, size_t pos) {
    return UlidError(UlidError::InvalidCharacter,
        std::string("invalid ") + what + " character",
        "Invalid char " + describe_byte(c) + " at position " + std::to_string(pos));
}

Result<RawUlid> decode_base32(const std::string& text) {
    if (text.size() != TEXT_LEN) {
        return UlidError(UlidError::InvalidLength,
            "ULID text must be 26 characters",
            "Got " + std::to_string(text.size()) + " characters");
    }

    RawUlid out{};
    size_t n = 0;
    uint32_t buffer = 0;
    int bits = 0;

    for (size_t i = 0; i < TEXT_LEN; ++i) {
        uint8_t v = alphabet::lookup(text[i]);
        if (v == alphabet::INVALID) {
            return invalid_char("Crockford Base32", text[i], i);
        }
        if (i == 0) {
            // The two padding bits of the 130-bit string are dropped
            buffer = v & 0x07;
            bits = 3;
            continue;
        }
        buffer = (buffer << 5) | v;
        bits += 5;
        if (bits >= 8) {
            bits -= 8;
            out[n++] = static_cast<uint8_t>(buffer >> bits);
            buffer &= (1u << bits) - 1;
        }
    }
    return Result<RawUlid>::ok(out);
}

Result<RawUlid> decode_uuid_hex(const std::string& text) {
    if (text.size() != UUID_LEN) {
        return UlidError(UlidError::InvalidLength,
            "UUID string must be 36 characters",
            "Expected format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx");
    }
    for (size_t i = 0; i < UUID_LEN; ++i) {
        if (is_hyphen_pos(i) != (text[i] == '-')) {
            return UlidError(UlidError::InvalidFormat,
                "UUID string has invalid dash positions",
                "Expected dashes at positions 8, 13, 18, 23");
        }
    }

    RawUlid out{};
    size_t byte_idx = 0;
    for (size_t i = 0; i < UUID_LEN; ) {
        if (is_hyphen_pos(i)) { ++i; continue; }
        int hi = hex_val(text[i]);
        if (hi < 0) return invalid_char("hex", text[i], i);
        int lo = hex_val(text[i + 1]);
        if (lo < 0) return invalid_char("hex", text[i + 1], i + 1);
        out[byte_idx++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return Result<RawUlid>::ok(out);
}

} // namespace ulid
