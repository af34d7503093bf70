#include <ulid/encoder.hpp>
#include <ulid/alphabet.hpp>
#include <cstring>

namespace ulid {

static const char hex_chars[] = "0123456789abcdef";

static UlidError wrong_raw_length(size_t len) {
    return UlidError(UlidError::InvalidLength,
        "raw ULID must be 16 bytes",
        "Got " + std::to_string(len) + " bytes");
}

std::string encode_base32(const RawUlid& raw) {
    std::string out;
    out.reserve(TEXT_LEN);

    // Start with the two padding bits already in the buffer
    uint32_t buffer = 0;
    int bits = 2;
    for (uint8_t b : raw) {
        buffer = (buffer << 8) | b;
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out += alphabet::value_to_symbol(static_cast<uint8_t>(buffer >> bits));
        }
        buffer &= (1u << bits) - 1;
    }
    return out;
}

Result<std::string> encode_base32(const uint8_t* data, size_t len) {
    if (len != RAW_LEN) return wrong_raw_length(len);
    RawUlid raw;
    std::memcpy(raw.data(), data, RAW_LEN);
    return Result<std::string>::ok(encode_base32(raw));
}

// ---- xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx ----

std::string encode_uuid_hex(const RawUlid& raw) {
    std::string out;
    out.reserve(UUID_LEN);
    for (size_t i = 0; i < RAW_LEN; ++i) {
        out += hex_chars[raw[i] >> 4];
        out += hex_chars[raw[i] & 0x0F];
        if (i == 3 || i == 5 || i == 7 || i == 9) {
            out += '-';
        }
    }
    return out;
}

Result<std::string> encode_uuid_hex(const uint8_t* data, size_t len) {
    if (len != RAW_LEN) return wrong_raw_length(len);
    RawUlid raw;
    std::memcpy(raw.data(), data, RAW_LEN);
    return Result<std::string>::ok(encode_uuid_hex(raw));
}

} // namespace ulid
