#pragma once

#include <ulid/result.hpp>
#include <ulid/types.hpp>
#include <ulid/random.hpp>
#include <cstdint>
#include <string>

namespace ulid {

// Milliseconds since the Unix epoch
uint64_t now_ms();

// ---- Generation ----
// Timestamps wider than 48 bits keep only their low 48 bits.

Result<RawUlid> generate_raw();
Result<RawUlid> generate_raw(uint64_t timestamp_ms);
Result<RawUlid> generate_raw(uint64_t timestamp_ms, RandomSource& rng);

Result<std::string> generate_text();
Result<std::string> generate_text(uint64_t timestamp_ms);
Result<std::string> generate_text(uint64_t timestamp_ms, RandomSource& rng);

Result<std::string> generate_uuid_text();
Result<std::string> generate_uuid_text(uint64_t timestamp_ms);
Result<std::string> generate_uuid_text(uint64_t timestamp_ms, RandomSource& rng);

// ---- Validation and shape dispatch ----

// 26 characters, all from the Crockford alphabet. The leading symbol is not
// range-checked.
bool is_valid_text(const std::string& text);

// Representation implied by a value's byte length
enum class Shape {
    Text,     // 26-char Crockford Base32
    Uuid,     // 36-char hyphenated hex
    Raw,      // 16 raw bytes
    Unknown
};

Shape classify(const std::string& value);
const char* shape_name(Shape shape);

// Normalizes a text or UUID string to text. Anything else, or a value its
// validator rejects, fails with Invalid.
Result<std::string> cast(const std::string& value);

// ---- Conversion ----

// value is 26-char text or 16 raw bytes
Result<std::string> to_uuid(const std::string& value);
std::string to_uuid(const RawUlid& raw);

Result<std::string> from_uuid(const std::string& uuid);

// value is 26-char text, 16 raw bytes or 36-char UUID text
Result<uint64_t> extract_timestamp(const std::string& value);
uint64_t extract_timestamp(const RawUlid& raw);

// Copies a 16-byte string into a RawUlid (InvalidLength otherwise)
Result<RawUlid> raw_from_bytes(const std::string& bytes);

// RawUlid as a 16-byte std::string
std::string raw_to_bytes(const RawUlid& raw);

} // namespace ulid
