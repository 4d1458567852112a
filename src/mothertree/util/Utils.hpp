#pragma once

#include "core/Error.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace MT::Utils {

// "2024-05-01T09:30:12.123456Z"
[[nodiscard]] auto formatUtcTimestamp(std::chrono::system_clock::time_point tp) -> std::string;

[[nodiscard]] auto readTextFile(std::filesystem::path const& path) -> Expected<std::string>;

} // namespace MT::Utils
