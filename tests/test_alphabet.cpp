#include <catch2/catch.hpp>
#include <ulid/alphabet.hpp>
#include <string>

using namespace ulid;

TEST_CASE("alphabet has 32 symbols", "[alphabet]") {
    REQUIRE(alphabet::SIZE == 32);
    REQUIRE(std::string(alphabet::SYMBOLS) == "0123456789ABCDEFGHJKMNPQRSTVWXYZ");
}

TEST_CASE("alphabet symbols are in ascending ASCII order", "[alphabet]") {
    // Lexicographic order of text must match numeric order
    for (size_t i = 1; i < alphabet::SIZE; ++i) {
        REQUIRE(alphabet::SYMBOLS[i - 1] < alphabet::SYMBOLS[i]);
    }
}

TEST_CASE("value_to_symbol and symbol_to_value are inverse", "[alphabet]") {
    for (uint8_t v = 0; v < 32; ++v) {
        char c = alphabet::value_to_symbol(v);
        auto back = alphabet::symbol_to_value(c);
        REQUIRE(back.has_value());
        REQUIRE(*back == v);
    }
}

TEST_CASE("excluded letters are not symbols", "[alphabet]") {
    for (char c : std::string("ILOUilou")) {
        REQUIRE_FALSE(alphabet::symbol_to_value(c).has_value());
        REQUIRE(alphabet::lookup(c) == alphabet::INVALID);
    }
}

TEST_CASE("lowercase letters are not symbols", "[alphabet]") {
    REQUIRE_FALSE(alphabet::symbol_to_value('a').has_value());
    REQUIRE_FALSE(alphabet::symbol_to_value('z').has_value());
}

TEST_CASE("inverse table covers exactly 32 bytes", "[alphabet]") {
    int valid = 0;
    for (int b = 0; b < 256; ++b) {
        if (alphabet::lookup(static_cast<char>(b)) != alphabet::INVALID) ++valid;
    }
    REQUIRE(valid == 32);
}

TEST_CASE("lookup is usable at compile time", "[alphabet]") {
    static_assert(alphabet::lookup('Z') == 31, "Z is the last symbol");
    static_assert(alphabet::lookup('$') == alphabet::INVALID, "$ is not a symbol");
    static_assert(alphabet::value_to_symbol(10) == 'A', "A is 10");
    SUCCEED();
}
