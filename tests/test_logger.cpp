#include <cassert>
#include <cstdio>
#include <string>

#include "../src/core/logger.hpp"

static std::string slurp(std::FILE* f) {
    std::string out;
    std::rewind(f);
    char buf[256];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) out.append(buf, n);
    return out;
}

int main() {
    std::FILE* f = std::tmpfile();
    if (!f) return 1;
    slc::Logger log("canary", {slc::LogLevel::INFO, f});
    log.debug("hidden");
    log.info("probing /dev/log");
    log.warn("write to /dev/log timed out");
    std::string out = slurp(f);
    if (out != "INFO[canary] probing /dev/log\nWARN[canary] write to /dev/log timed out\n") return 2;
    std::fclose(f);

    f = std::tmpfile();
    if (!f) return 1;
    slc::Logger quiet("canary", {slc::LogLevel::WARN, f});
    assert(!quiet.enabled(slc::LogLevel::INFO));
    assert(quiet.enabled(slc::LogLevel::ERROR));
    quiet.info("hidden");
    quiet.error("boom");
    if (slurp(f) != "ERROR[canary] boom\n") return 3;
    std::fclose(f);
    return 0;
}
