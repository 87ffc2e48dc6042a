#include "diffmap/core/utils.hpp"
#include "diffmap/core/errors.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

namespace diffmap::core {

namespace {

// strftime into a fixed buffer; utc selects gmtime over localtime
std::string format_time(std::time_t t, const char* fmt, bool utc) {
    std::tm parts{};
    if (utc) {
        gmtime_r(&t, &parts);
    } else {
        localtime_r(&t, &parts);
    }
    char buf[32];
    const size_t n = std::strftime(buf, sizeof(buf), fmt, &parts);
    return std::string(buf, n);
}

} // namespace

// 2026-01-31T12:34:56.789Z
std::string get_iso_timestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const long millis = static_cast<long>(
        duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000);

    std::ostringstream oss;
    oss << format_time(system_clock::to_time_t(now), "%Y-%m-%dT%H:%M:%S", true)
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

// Local start time plus 32 random bits: 20260131_123456_0badf00d
std::string get_run_id() {
    std::random_device rd;
    const std::uint32_t tag = static_cast<std::uint32_t>(rd());

    std::ostringstream oss;
    oss << format_time(std::time(nullptr), "%Y%m%d_%H%M%S", false) << '_'
        << std::hex << std::setw(8) << std::setfill('0') << tag;
    return oss.str();
}

double elapsed_ms(std::chrono::steady_clock::time_point since) {
    auto d = std::chrono::steady_clock::now() - since;
    return std::chrono::duration<double, std::milli>(d).count();
}

std::string read_text(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    if (prefix.size() > str.size()) return false;
    return str.compare(0, prefix.size(), prefix) == 0;
}

} // namespace diffmap::core
