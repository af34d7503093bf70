#include <ulid/ulid.hpp>
#include <ulid/decoder.hpp>
#include <ulid/encoder.hpp>
#include <ulid/alphabet.hpp>
#include <chrono>
#include <cstring>

namespace ulid {

uint64_t now_ms() {
    auto now = std::chrono::system_clock::now();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count());
}

// ---- Generation ----

Result<RawUlid> generate_raw(uint64_t timestamp_ms, RandomSource& rng) {
    RawUlid raw{};
    for (size_t i = 0; i < TIMESTAMP_LEN; ++i) {
        raw[i] = static_cast<uint8_t>(timestamp_ms >> (8 * (TIMESTAMP_LEN - 1 - i)));
    }
    ULID_TRY(rng.fill(raw.data() + TIMESTAMP_LEN, RANDOM_LEN));
    return Result<RawUlid>::ok(raw);
}

Result<RawUlid> generate_raw(uint64_t timestamp_ms) {
    return generate_raw(timestamp_ms, system_random());
}

Result<RawUlid> generate_raw() {
    return generate_raw(now_ms());
}

Result<std::string> generate_text(uint64_t timestamp_ms, RandomSource& rng) {
    return generate_raw(timestamp_ms, rng).map(
        [](const RawUlid& raw) { return encode_base32(raw); });
}

Result<std::string> generate_text(uint64_t timestamp_ms) {
    return generate_text(timestamp_ms, system_random());
}

Result<std::string> generate_text() {
    return generate_text(now_ms());
}

Result<std::string> generate_uuid_text(uint64_t timestamp_ms, RandomSource& rng) {
    return generate_raw(timestamp_ms, rng).map(
        [](const RawUlid& raw) { return encode_uuid_hex(raw); });
}

Result<std::string> generate_uuid_text(uint64_t timestamp_ms) {
    return generate_uuid_text(timestamp_ms, system_random());
}

Result<std::string> generate_uuid_text() {
    return generate_uuid_text(now_ms());
}

// ---- Validation and shape dispatch ----

bool is_valid_text(const std::string& text) {
    if (text.size() != TEXT_LEN) return false;
    for (char c : text) {
        if (alphabet::lookup(c) == alphabet::INVALID) return false;
    }
    return true;
}

Shape classify(const std::string& value) {
    switch (value.size()) {
        case TEXT_LEN: return Shape::Text;
        case UUID_LEN: return Shape::Uuid;
        case RAW_LEN:  return Shape::Raw;
        default:       return Shape::Unknown;
    }
}

const char* shape_name(Shape shape) {
    switch (shape) {
        case Shape::Text:    return "text";
        case Shape::Uuid:    return "uuid";
        case Shape::Raw:     return "raw";
        case Shape::Unknown: return "unknown";
    }
    return "unknown";
}

static UlidError unexpected_length(const std::string& value, const char* accepted) {
    return UlidError(UlidError::InvalidLength,
        "unexpected ULID length " + std::to_string(value.size()),
        std::string("accepted: ") + accepted);
}

Result<std::string> cast(const std::string& value) {
    switch (classify(value)) {
        case Shape::Text:
            if (is_valid_text(value)) return Result<std::string>::ok(value);
            return UlidError(UlidError::Invalid,
                "not a valid ULID: '" + value + "'",
                "ULIDs use the Crockford alphabet 0-9 A-Z without I, L, O, U");
        case Shape::Uuid: {
            auto raw = decode_uuid_hex(value);
            if (raw.is_err()) {
                return UlidError(UlidError::Invalid,
                    "not a valid UUID: '" + value + "'", raw.error().hint);
            }
            return Result<std::string>::ok(encode_base32(raw.value()));
        }
        case Shape::Raw:
        case Shape::Unknown:
            break;
    }
    return UlidError(UlidError::Invalid,
        "cannot cast a value of length " + std::to_string(value.size()) + " to a ULID",
        "expected 26-character text or 36-character UUID");
}

// ---- Conversion ----

std::string to_uuid(const RawUlid& raw) {
    return encode_uuid_hex(raw);
}

Result<std::string> to_uuid(const std::string& value) {
    switch (classify(value)) {
        case Shape::Text: {
            auto raw = decode_base32(value);
            ULID_TRY(raw);
            return Result<std::string>::ok(encode_uuid_hex(raw.value()));
        }
        case Shape::Raw:
            return encode_uuid_hex(reinterpret_cast<const uint8_t*>(value.data()), value.size());
        case Shape::Uuid:
        case Shape::Unknown:
            break;
    }
    return unexpected_length(value, "26-character text or 16 raw bytes");
}

Result<std::string> from_uuid(const std::string& uuid) {
    return decode_uuid_hex(uuid).map(
        [](const RawUlid& raw) { return encode_base32(raw); });
}

uint64_t extract_timestamp(const RawUlid& raw) {
    uint64_t ts = 0;
    for (size_t i = 0; i < TIMESTAMP_LEN; ++i) {
        ts = (ts << 8) | raw[i];
    }
    return ts;
}

static Result<RawUlid> normalize(const std::string& value) {
    switch (classify(value)) {
        case Shape::Text:    return decode_base32(value);
        case Shape::Uuid:    return decode_uuid_hex(value);
        case Shape::Raw:     return raw_from_bytes(value);
        case Shape::Unknown: break;
    }
    return unexpected_length(value, "26-character text, 36-character UUID or 16 raw bytes");
}

Result<uint64_t> extract_timestamp(const std::string& value) {
    return normalize(value).map(
        [](const RawUlid& raw) { return extract_timestamp(raw); });
}

Result<RawUlid> raw_from_bytes(const std::string& bytes) {
    if (bytes.size() != RAW_LEN) {
        return UlidError(UlidError::InvalidLength,
            "raw ULID must be 16 bytes",
            "Got " + std::to_string(bytes.size()) + " bytes");
    }
    RawUlid raw;
    std::memcpy(raw.data(), bytes.data(), RAW_LEN);
    return Result<RawUlid>::ok(raw);
}

std::string raw_to_bytes(const RawUlid& raw) {
    return std::string(reinterpret_cast<const char*>(raw.data()), raw.size());
}

} // namespace ulid
