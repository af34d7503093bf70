#include <catch2/catch.hpp>
#include <ulid/config.hpp>
#include <ulid/log.hpp>
#include <ulid/random.hpp>
#include <ulid/ulid.hpp>
#include <cstdio>
#include <fstream>
#include <functional>
#include <string>
#include <unistd.h>

using namespace ulid;

// Helper: capture stderr output from a callable
static std::string capture_stderr(std::function<void()> fn) {
    std::fflush(stderr);
    int saved_stderr = dup(fileno(stderr));

    int pipefd[2];
    REQUIRE(pipe(pipefd) == 0);
    dup2(pipefd[1], fileno(stderr));
    close(pipefd[1]);

    fn();

    std::fflush(stderr);
    dup2(saved_stderr, fileno(stderr));
    close(saved_stderr);

    std::string output;
    char buf[1024];
    ssize_t n;
    while ((n = read(pipefd[0], buf, sizeof(buf))) > 0) {
        output.append(buf, static_cast<size_t>(n));
    }
    close(pipefd[0]);
    return output;
}

// Applies a parsed config the way the CLI does and restores the defaults after
struct ScopedLogConfig {
    explicit ScopedLogConfig(const std::string& toml) {
        auto cfg = Config::parse(toml);
        REQUIRE(cfg.is_ok());
        log::set_level(cfg.value().log_level);
        log::set_color_enabled(cfg.value().color_set && cfg.value().color);
    }
    ~ScopedLogConfig() {
        log::set_level(log::Info);
        log::set_color_enabled(false);
    }
};

static std::string short_device_path() {
    return "/tmp/ulid_test_entropy_" + std::to_string(getpid());
}

// ===== Entropy device warnings =====

TEST_CASE("missing entropy device is logged and reported", "[log]") {
    ScopedLogConfig scope("");
    DeviceRandom device("/nonexistent/ulid/urandom");
    uint8_t buf[RANDOM_LEN];

    Status st = ok_status();
    auto output = capture_stderr([&] { st = device.fill(buf, sizeof(buf)); });

    REQUIRE(st.is_err());
    REQUIRE(st.error().code == UlidError::Random);
    REQUIRE(st.error().hint == "cannot open /nonexistent/ulid/urandom");
    REQUIRE(output == "warn: cannot open entropy device /nonexistent/ulid/urandom\n");
}

TEST_CASE("short read from an entropy device is logged", "[log]") {
    ScopedLogConfig scope("");
    auto path = short_device_path();
    {
        std::ofstream f(path, std::ios::binary);
        f << "abc";
    }
    DeviceRandom device(path);
    uint8_t buf[RANDOM_LEN];

    Status st = ok_status();
    auto output = capture_stderr([&] { st = device.fill(buf, sizeof(buf)); });
    std::remove(path.c_str());

    REQUIRE(st.is_err());
    REQUIRE(st.error().code == UlidError::Random);
    REQUIRE(output == "warn: short read from " + path + ": 3 of 10 bytes\n");
}

TEST_CASE("a working entropy device logs nothing", "[log]") {
    ScopedLogConfig scope("[log]\nlevel = \"trace\"\n");
    DeviceRandom device;
    REQUIRE(device.path() == "/dev/urandom");

    Result<std::string> text = UlidError{UlidError::Invalid, "unset"};
    auto output = capture_stderr([&] { text = generate_text(1469918176385ULL, device); });

    REQUIRE(text.is_ok());
    REQUIRE(output.empty());
}

TEST_CASE("generation failure surfaces the device warning once", "[log]") {
    ScopedLogConfig scope("");
    DeviceRandom device("/nonexistent/ulid/urandom");

    Result<std::string> text = Result<std::string>::ok("");
    auto output = capture_stderr([&] { text = generate_uuid_text(0, device); });

    REQUIRE(text.is_err());
    REQUIRE(text.error().code == UlidError::Random);
    REQUIRE(output.find("warn: cannot open entropy device") == 0);
    REQUIRE(output.find("warn:", 1) == std::string::npos);
}

// ===== Levels from config =====

TEST_CASE("error level from config silences device warnings", "[log]") {
    ScopedLogConfig scope("[log]\nlevel = \"error\"\n");
    REQUIRE(log::get_level() == log::Error);

    DeviceRandom device("/nonexistent/ulid/urandom");
    uint8_t buf[RANDOM_LEN];
    Status st = ok_status();
    auto output = capture_stderr([&] { st = device.fill(buf, sizeof(buf)); });

    REQUIRE(st.is_err());
    REQUIRE(output.empty());
}

TEST_CASE("\"warning\" in config is the warn threshold", "[log]") {
    ScopedLogConfig scope("[log]\nlevel = \"warning\"\n");
    REQUIRE(log::get_level() == log::Warn);

    auto output = capture_stderr([] {
        log::info("generating %llu ULID(s) as %s", 3ULL, "text");
        log::warn("cannot open entropy device %s", "/dev/hwrng");
    });
    REQUIRE(output == "warn: cannot open entropy device /dev/hwrng\n");
}

TEST_CASE("debug level from config shows CLI debug lines", "[log]") {
    ScopedLogConfig scope("[log]\nlevel = \"debug\"\n");

    auto output = capture_stderr([] {
        log::trace("not shown");
        log::debug("'%s' is %s", "01ARYZ6S4124TJP2BQQZX06FKM", "valid");
    });
    REQUIRE(output == "debug: '01ARYZ6S4124TJP2BQQZX06FKM' is valid\n");
}

TEST_CASE("color from config wraps the level name", "[log]") {
    ScopedLogConfig scope("[log]\ncolor = true\n");
    REQUIRE(log::is_color_enabled());

    auto output = capture_stderr([] { log::error("%s failed", "cast"); });
    REQUIRE(output == "\033[31merror\033[0m: cast failed\n");
}

TEST_CASE("every level name parses back to its level", "[log]") {
    for (log::Level lvl : {log::Trace, log::Debug, log::Info, log::Warn, log::Error}) {
        auto r = log::parse_level(log::level_name(lvl));
        REQUIRE(r.is_ok());
        REQUIRE(r.value() == lvl);
    }
    auto bad = log::parse_level("verbose");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == UlidError::Config);
    REQUIRE(bad.error().hint.find("trace, debug, info, warn, error") != std::string::npos);
}
