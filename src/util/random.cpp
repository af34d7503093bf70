#include <ulid/random.hpp>
#include <ulid/log.hpp>
#include <cerrno>
#include <cstring>
#include <fstream>

#if defined(__linux__)
#include <sys/random.h>
#endif

namespace ulid {

#if defined(__linux__)
static bool fill_getrandom(uint8_t* buf, size_t len) {
    size_t done = 0;
    while (done < len) {
        ssize_t n = getrandom(buf + done, len - done, 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            log::warn("getrandom failed (%s), reading /dev/urandom", std::strerror(errno));
            return false;
        }
        done += static_cast<size_t>(n);
    }
    return true;
}
#endif

Status DeviceRandom::fill(uint8_t* buf, size_t len) {
    std::ifstream device(path_, std::ios::binary);
    if (!device.is_open()) {
        log::warn("cannot open entropy device %s", path_.c_str());
        return UlidError(UlidError::Random,
            "secure random source unavailable",
            "cannot open " + path_);
    }
    device.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
    auto got = static_cast<size_t>(device.gcount());
    if (got != len) {
        log::warn("short read from %s: %zu of %zu bytes", path_.c_str(), got, len);
        return UlidError(UlidError::Random,
            "secure random source unavailable",
            "short read from " + path_);
    }
    return ok_status();
}

Status SystemRandom::fill(uint8_t* buf, size_t len) {
#if defined(__linux__)
    if (fill_getrandom(buf, len)) return ok_status();
#endif
    return device_.fill(buf, len);
}

RandomSource& system_random() {
    static SystemRandom instance;
    return instance;
}

} // namespace ulid
