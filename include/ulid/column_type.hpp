#pragma once

#include <ulid/result.hpp>
#include <ulid/types.hpp>
#include <stdexcept>
#include <string>

namespace ulid {

// Thrown by UlidType::cast_strict when a value the caller promised was
// valid turns out not to be
class CastError : public std::runtime_error {
public:
    CastError(const std::string& value, const std::string& type_name,
              const UlidError& cause);

    const std::string& value() const { return value_; }
    const std::string& type_name() const { return type_name_; }
    const UlidError& cause() const { return cause_; }

private:
    std::string value_;
    std::string type_name_;
    UlidError cause_;
};

// Hooks a database-mapping layer calls to treat ULIDs as a column type.
// Application values are 26-char text; stored values are 16 raw bytes.
struct UlidType {
    static const char* name() { return "ulid"; }

    // Column type the raw bytes are persisted in
    static const char* storage_type() { return "uuid"; }

    // User input (text or UUID string) -> text
    static Result<std::string> cast(const std::string& value);
    static std::string cast_strict(const std::string& value);

    // Text or UUID string -> raw bytes for storage
    static Result<RawUlid> dump(const std::string& value);

    // Stored bytes -> text
    static Result<std::string> load(const std::string& bytes);
    static Result<std::string> load(const uint8_t* data, size_t len);

    // Default value for a new row
    static Result<std::string> autogenerate();

    static bool equal(const std::string& a, const std::string& b);
};

} // namespace ulid
