#pragma once

#include <chrono>
#include <ctime>
#include <filesystem>
#include <random>
#include <string>

namespace sw::util {

inline std::string generate_random_suffix(const size_t length = 8) {
    static constexpr char charset[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<> dist(0, sizeof(charset) - 2);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) result += charset[dist(rng)];
    return result;
}

inline std::time_t toTimeT(const std::filesystem::file_time_type ft) {
    return std::chrono::system_clock::to_time_t(
        std::chrono::time_point_cast<std::chrono::system_clock::duration>(std::chrono::file_clock::to_sys(ft)));
}

inline std::filesystem::file_time_type toFileTime(const std::time_t t) {
    return std::chrono::file_clock::from_sys(std::chrono::system_clock::from_time_t(t));
}

}
