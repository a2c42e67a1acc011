#include "gtx8cfg/cfg_bin.hpp"
#include "gtx8cfg/json.hpp"

#include "cfg_bin_fixture.hpp"

#include <chrono>
#include <iostream>
#include <random>
#include <string>
#include <vector>

static double ms_since(const std::chrono::high_resolution_clock::time_point& t0) {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(high_resolution_clock::now() - t0).count();
}

// Packages with random ic config payloads, sized like real GT9886 configs.
static std::vector<std::uint8_t> make_bin(std::size_t pkg_count, std::size_t cfg_len) {
    std::mt19937 rng(123);
    std::uniform_int_distribution<int> dist(0, 255);

    std::vector<gtx8cfg::fixture::Package> pkgs(pkg_count);
    for (std::size_t i = 0; i < pkg_count; ++i) {
        pkgs[i].cfg_type = static_cast<std::uint8_t>(i);
        pkgs[i].sensor_id = static_cast<std::uint8_t>(i % 6);
        pkgs[i].config.resize(cfg_len);
        for (auto& b : pkgs[i].config) b = static_cast<std::uint8_t>(dist(rng));
    }
    return gtx8cfg::fixture::build_cfg_bin(pkgs);
}

static void bench_one(std::size_t pkg_count, std::size_t cfg_len, int iterations) {
    auto bin = make_bin(pkg_count, cfg_len);
    double kb = static_cast<double>(bin.size()) / 1024.0;

    std::cout << "=== packages=" << pkg_count << " cfg_len=" << cfg_len
              << " file=" << kb << " KiB ===\n";

    auto t0 = std::chrono::high_resolution_clock::now();
    std::size_t members = 0;
    for (int i = 0; i < iterations; ++i) {
        gtx8cfg::Value root = gtx8cfg::decode_cfg_bin(bin);
        members += root.at("cfg_pkgs").size();
    }
    double d_ms = ms_since(t0);
    std::cout << "decode: " << (d_ms / iterations) << " ms/iter (" << members << " packages total)\n";

    gtx8cfg::Value root = gtx8cfg::decode_cfg_bin(bin);
    t0 = std::chrono::high_resolution_clock::now();
    std::size_t chars = 0;
    for (int i = 0; i < iterations; ++i) {
        chars += gtx8cfg::to_json(root).size();
    }
    double j_ms = ms_since(t0);
    std::cout << "json  : " << (j_ms / iterations) << " ms/iter (" << (chars / iterations) << " chars)\n";
}

int main(int argc, char** argv) {
    try {
        int iterations = (argc >= 2) ? std::stoi(argv[1]) : 200;
        if (iterations <= 0) iterations = 1;
        bench_one(1, 1024, iterations);
        bench_one(6, 2048, iterations);
        bench_one(12, 4096, iterations);
    } catch (const std::exception& e) {
        std::cerr << "bench error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
