#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class TempDir {
public:
    TempDir() {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        dir = fs::temp_directory_path() / ("spd_test_" + std::to_string(gen()));
        fs::create_directories(dir);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return dir; }
    std::string file(const std::string& name) const { return (dir / name).string(); }

private:
    fs::path dir;
};

inline std::vector<char> makeContent(std::size_t size) {
    std::vector<char> data(size);
    std::uint32_t x = 2463534242u;
    for (auto& c : data) {
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        c = static_cast<char>(x & 0xff);
    }
    return data;
}

inline std::vector<char> readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<char>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void writeFile(const std::string& path, const std::vector<char>& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
}

inline std::vector<char> slice(const std::vector<char>& data, std::int64_t start, std::int64_t end) {
    return std::vector<char>(data.begin() + start, data.begin() + end + 1);
}
