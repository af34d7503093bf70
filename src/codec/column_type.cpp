#include <ulid/column_type.hpp>
#include <ulid/ulid.hpp>
#include <ulid/decoder.hpp>
#include <ulid/encoder.hpp>

namespace ulid {

CastError::CastError(const std::string& value, const std::string& type_name,
                     const UlidError& cause)
    : std::runtime_error("cannot cast " + (value.empty() ? std::string("\"\"") : "'" + value + "'")
                         + " to type " + type_name + ": " + cause.message),
      value_(value), type_name_(type_name), cause_(cause) {}

Result<std::string> UlidType::cast(const std::string& value) {
    return ulid::cast(value);
}

std::string UlidType::cast_strict(const std::string& value) {
    auto r = ulid::cast(value);
    if (r.is_err()) {
        throw CastError(value, name(), r.error());
    }
    return std::move(r).value();
}

Result<RawUlid> UlidType::dump(const std::string& value) {
    switch (classify(value)) {
        case Shape::Text: return decode_base32(value);
        case Shape::Uuid: return decode_uuid_hex(value);
        case Shape::Raw:
        case Shape::Unknown:
            break;
    }
    return UlidError(UlidError::InvalidLength,
        "cannot dump a value of length " + std::to_string(value.size()),
        "expected 26-character text or 36-character UUID");
}

Result<std::string> UlidType::load(const uint8_t* data, size_t len) {
    return encode_base32(data, len);
}

Result<std::string> UlidType::load(const std::string& bytes) {
    return load(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
}

Result<std::string> UlidType::autogenerate() {
    return generate_text();
}

bool UlidType::equal(const std::string& a, const std::string& b) {
    return a == b;
}

} // namespace ulid
