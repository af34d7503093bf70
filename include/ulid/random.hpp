#pragma once

#include <ulid/result.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

namespace ulid {

// Source of the 80 random bits in each ULID
class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual Status fill(uint8_t* buf, size_t len) = 0;
};

// Reads bytes from an entropy device such as /dev/urandom. A device that
// cannot be opened or runs short is a Random error, logged as a warning.
class DeviceRandom : public RandomSource {
public:
    explicit DeviceRandom(std::string path = "/dev/urandom") : path_(std::move(path)) {}
    Status fill(uint8_t* buf, size_t len) override;
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

// Kernel CSPRNG: getrandom(2), then /dev/urandom. Stateless and safe to
// share between threads. Never falls back to a non-cryptographic generator.
class SystemRandom : public RandomSource {
public:
    Status fill(uint8_t* buf, size_t len) override;
private:
    DeviceRandom device_;
};

// Process-wide SystemRandom
RandomSource& system_random();

} // namespace ulid
