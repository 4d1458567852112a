#include "util/Utils.hpp"

#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>

using namespace MT;

TEST_CASE("formatUtcTimestamp uses ISO-8601 with microseconds") {
    std::chrono::system_clock::time_point tp{std::chrono::microseconds{1714555812123456}};
    CHECK(Utils::formatUtcTimestamp(tp) == "2024-05-01T09:30:12.123456Z");

    std::chrono::system_clock::time_point epoch{};
    CHECK(Utils::formatUtcTimestamp(epoch) == "1970-01-01T00:00:00.000000Z");
}

TEST_CASE("readTextFile returns contents or NotFound") {
    auto path = std::filesystem::temp_directory_path() / "mothertree_utils_read.txt";
    {
        std::ofstream out(path);
        out << "line one\nline two\n";
    }
    auto text = Utils::readTextFile(path);
    REQUIRE(text.has_value());
    CHECK(*text == "line one\nline two\n");
    std::filesystem::remove(path);

    auto missing = Utils::readTextFile(path);
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == Error::Code::NotFound);
}
