// Writes the cfg images the command-line tests run gtx8cfg against.

#include "cfg_bin_fixture.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fx = gtx8cfg::fixture;

static void write_file(const std::filesystem::path& p, const std::vector<std::uint8_t>& bin) {
    std::ofstream os(p, std::ios::binary | std::ios::trunc);
    os.write(reinterpret_cast<const char*>(bin.data()), static_cast<std::streamsize>(bin.size()));
    if (!os) throw std::runtime_error("failed to write " + p.string());
}

static std::vector<fx::Package> packages(std::uint8_t second_cfg_type) {
    fx::Package a;
    a.cfg_type = 3;
    a.sensor_id = 1;
    a.config = {0x41, 0x42, 0x43, 0x44, 0x45};

    fx::Package b;
    b.cfg_type = second_cfg_type;
    b.sensor_id = 2;
    b.config = {0x01, 0x02, 0x03};
    return {a, b};
}

int main(int argc, char** argv) {
    if (argc != 2) {
        std::cerr << "usage: make_cli_fixtures <DIR>\n";
        return 2;
    }
    try {
        const std::filesystem::path dir = argv[1];
        std::filesystem::create_directories(dir);

        const auto valid = fx::build_cfg_bin(packages(1));
        write_file(dir / "valid.bin", valid);
        write_file(dir / "dup_cfg_type.bin", fx::build_cfg_bin(packages(3)));

        // Cut inside the head's reserved gap.
        write_file(dir / "truncated.bin", std::vector<std::uint8_t>(valid.begin(), valid.begin() + 10));
        write_file(dir / "empty.bin", {});

        auto bad = valid;
        bad[4] = static_cast<std::uint8_t>(bad[4] + 1);
        write_file(dir / "bad_checksum.bin", bad);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    return 0;
}
