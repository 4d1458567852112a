#include "util/Utils.hpp"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace MT::Utils {

auto formatUtcTimestamp(std::chrono::system_clock::time_point tp) -> std::string {
    auto const micros = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count() % 1000000;
    auto const timeT  = std::chrono::system_clock::to_time_t(tp);
    std::tm    utc{};
    gmtime_r(&timeT, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(6)
        << (micros < 0 ? micros + 1000000 : micros) << 'Z';
    return oss.str();
}

auto readTextFile(std::filesystem::path const& path) -> Expected<std::string> {
    std::ifstream stream(path);
    if (!stream) {
        return std::unexpected(Error{Error::Code::NotFound, "File not found: " + path.string()});
    }
    std::ostringstream oss;
    oss << stream.rdbuf();
    if (!stream.good() && !stream.eof()) {
        return std::unexpected(Error{Error::Code::UnknownError, "Failed to read file: " + path.string()});
    }
    return oss.str();
}

} // namespace MT::Utils
