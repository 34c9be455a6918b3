#ifndef CRYSTAL_TEST_UTILS_HPP
#define CRYSTAL_TEST_UTILS_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

// Fresh directory under the system temp path, unique per call
inline std::filesystem::path make_test_directory(const std::string& prefix) {
    static std::atomic<uint64_t> counter{0};
    std::filesystem::path dir = std::filesystem::temp_directory_path() /
        (prefix + "_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count())
         + "_" + std::to_string(counter++));
    std::filesystem::create_directories(dir);
    return dir;
}

// Deterministic pseudo random bytes
inline std::vector<uint8_t> random_bytes(size_t size, uint32_t seed = 42) {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dis(0, 255);
    std::vector<uint8_t> data(size);
    for (auto& byte : data) {
        byte = static_cast<uint8_t>(dis(gen));
    }
    return data;
}

// Highly compressible text
inline std::vector<uint8_t> repetitive_bytes(size_t size) {
    const std::string pattern = "crystal storage fragment ";
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>(pattern[i % pattern.size()]);
    }
    return data;
}

#endif // CRYSTAL_TEST_UTILS_HPP
