#include <fstream>
#include <random>
#include <stdexcept>
#include <system_error>
#include "testUtil.hpp"

namespace fs = std::filesystem;

TempDir::TempDir(){
    std::random_device rd;
    std::mt19937_64 gen(rd());
    for (int attempt = 0; attempt < 16; ++attempt) {
        fs::path p = fs::temp_directory_path() / ("accelprep_test_" + std::to_string(gen()));
        if (fs::create_directory(p)) {
            path_ = p;
            return;
        }
    }
    throw std::runtime_error("cannot create temp directory");
}

TempDir::~TempDir(){
    std::error_code ec;
    fs::remove_all(path_, ec);
}

std::string TempDir::write(const std::string& name, const std::string& content) const {
    const fs::path p = path_ / name;
    std::ofstream out(p, std::ios::binary);
    out << content;
    if (!out) throw std::runtime_error("cannot write " + p.string());
    return p.string();
}

std::string records(std::size_t n, int x, int y, int z){
    std::string s;
    for (std::size_t i = 0; i < n; ++i) {
        s += std::to_string(x) + "\t" + std::to_string(y) + "\t" + std::to_string(z) + "\n";
    }
    return s;
}
