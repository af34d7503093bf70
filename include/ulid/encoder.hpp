#pragma once

#include <ulid/result.hpp>
#include <ulid/types.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

namespace ulid {

// 16 bytes -> 26 Crockford symbols. Two zero bits are prepended so the
// 130-bit string splits into 26 quintets; the first symbol is always 0..7.
std::string encode_base32(const RawUlid& raw);
Result<std::string> encode_base32(const uint8_t* data, size_t len);

// 16 bytes -> lowercase 8-4-4-4-12 hex
std::string encode_uuid_hex(const RawUlid& raw);
Result<std::string> encode_uuid_hex(const uint8_t* data, size_t len);

} // namespace ulid
