#include <catch2/catch.hpp>
#include <ulid/decoder.hpp>
#include <ulid/encoder.hpp>
#include <ulid/ulid.hpp>
#include <chrono>
#include <string>
#include <vector>

using namespace ulid;

static std::vector<RawUlid> make_values(size_t n) {
    std::vector<RawUlid> values;
    values.reserve(n);
    uint64_t ts = 1469918176385ULL;
    for (size_t i = 0; i < n; ++i) {
        auto r = generate_raw(ts + i);
        if (r.is_err()) break;
        values.push_back(r.value());
    }
    REQUIRE(values.size() == n);
    return values;
}

TEST_CASE("codec perf: 1M base32 encode+decode under 3s", "[codec][bench]") {
    auto values = make_values(1000000);

    auto start = std::chrono::high_resolution_clock::now();
    size_t mismatches = 0;
    for (const auto& raw : values) {
        auto text = encode_base32(raw);
        auto back = decode_base32(text);
        if (back.is_err() || back.value() != raw) ++mismatches;
    }
    auto end = std::chrono::high_resolution_clock::now();

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    INFO("Values: " << values.size());
    INFO("Time: " << ms << " ms");

    REQUIRE(mismatches == 0);
    REQUIRE(ms < 3000);
}

TEST_CASE("codec perf: 1M UUID encode+decode under 3s", "[codec][bench]") {
    auto values = make_values(1000000);

    auto start = std::chrono::high_resolution_clock::now();
    size_t mismatches = 0;
    for (const auto& raw : values) {
        auto back = decode_uuid_hex(encode_uuid_hex(raw));
        if (back.is_err() || back.value() != raw) ++mismatches;
    }
    auto end = std::chrono::high_resolution_clock::now();

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    INFO("Values: " << values.size());
    INFO("Time: " << ms << " ms");

    REQUIRE(mismatches == 0);
    REQUIRE(ms < 3000);
}

TEST_CASE("generation perf: 100K ULIDs under 3s", "[ulid][bench]") {
    auto start = std::chrono::high_resolution_clock::now();
    int failures = 0;
    for (int i = 0; i < 100000; ++i) {
        if (generate_text().is_err()) ++failures;
    }
    auto end = std::chrono::high_resolution_clock::now();

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    INFO("Time: " << ms << " ms");
    REQUIRE(failures == 0);
    REQUIRE(ms < 3000);
}
