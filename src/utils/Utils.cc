#include "keepsake/utils/Utils.hh"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace keepsake {

std::string Utils::generateUniqueId(const std::string& prefix, int length) {
    // The engine runs on a single cooperative context, so the generator is
    // only touched from one thread.
    static std::mt19937 gen(std::random_device{}());
    static std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << prefix;

    for (int i = 0; i < length; i++) {
        ss << std::hex << dis(gen);
    }

    return ss.str();
}

std::string Utils::currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&time, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace keepsake
