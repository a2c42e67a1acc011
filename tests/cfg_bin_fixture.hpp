#pragma once

#include "gtx8cfg/cfg_bin.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Builds cfg group images byte by byte for tests and benchmarks.
namespace gtx8cfg::fixture {

inline void put_u16_le(std::vector<std::uint8_t>& out, std::uint16_t v) {
    out.push_back(static_cast<std::uint8_t>(v & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFFu));
}

inline void put_u32_le(std::vector<std::uint8_t>& out, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu));
}

inline void put_u16_at(std::vector<std::uint8_t>& out, std::size_t at, std::uint16_t v) {
    out[at] = static_cast<std::uint8_t>(v & 0xFFu);
    out[at + 1] = static_cast<std::uint8_t>((v >> 8) & 0xFFu);
}

inline void put_u32_at(std::vector<std::uint8_t>& out, std::size_t at, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) out[at + i] = static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu);
}

inline void put_fixed(std::vector<std::uint8_t>& out, const std::string& s, std::size_t len) {
    for (std::size_t i = 0; i < len; ++i) {
        out.push_back(i < s.size() ? static_cast<std::uint8_t>(s[i]) : 0);
    }
}

struct Package {
    std::string ic_type{"GT9886"};
    std::uint8_t cfg_type{0};
    std::uint8_t sensor_id{0};
    std::uint16_t x_res_offset{0};
    std::uint16_t y_res_offset{0};
    std::uint16_t trigger_offset{0};
    // Register addresses in reg_info order (14 entries).
    std::vector<std::uint16_t> reg_addrs{};
    std::vector<std::uint8_t> config{};
};

// One package: const info, reg info, then the ic config payload.
inline std::vector<std::uint8_t> build_package(const Package& p) {
    std::vector<std::uint8_t> out;
    const std::size_t pkg_len = kPkgHeadLen + p.config.size();

    put_u32_le(out, static_cast<std::uint32_t>(pkg_len));
    put_fixed(out, p.ic_type, kIcTypeNameMaxLen);
    out.push_back(p.cfg_type);
    out.push_back(p.sensor_id);
    put_fixed(out, "PID", kPkgPidLen);
    put_fixed(out, "VID", kPkgVidLen);
    put_fixed(out, "mask", kPkgFwMaskLen);
    put_fixed(out, "", kPkgFwPatchLen);
    put_u16_le(out, p.x_res_offset);
    put_u16_le(out, p.y_res_offset);
    put_u16_le(out, p.trigger_offset);

    for (std::size_t i = 0; i < 14; ++i) {
        put_u16_le(out, i < p.reg_addrs.size() ? p.reg_addrs[i] : 0);
        out.push_back(0); // reserved1
        out.push_back(0); // reserved2
    }
    put_fixed(out, "", kPkgRegReservedLen);

    out.insert(out.end(), p.config.begin(), p.config.end());
    return out;
}

// Whole file with a correct bin_len and checksum.
inline std::vector<std::uint8_t> build_cfg_bin(const std::vector<Package>& pkgs,
                                               const std::string& version = "V1.0") {
    std::vector<std::uint8_t> out;
    put_u32_le(out, 0);          // bin_len, patched below
    out.push_back(0);            // checksum, patched below
    put_fixed(out, version, kBinVersionLen);
    out.push_back(static_cast<std::uint8_t>(pkgs.size()));
    put_fixed(out, "", kBinHeadReservedLen);

    const std::size_t table = out.size();
    for (std::size_t i = 0; i < pkgs.size(); ++i) put_u16_le(out, 0);

    for (std::size_t i = 0; i < pkgs.size(); ++i) {
        put_u16_at(out, table + i * kPkgOffsetLen, static_cast<std::uint16_t>(out.size()));
        auto body = build_package(pkgs[i]);
        out.insert(out.end(), body.begin(), body.end());
    }

    put_u32_at(out, 0, static_cast<std::uint32_t>(out.size()));
    out[4] = cfg_bin_checksum(out);
    return out;
}

// Recompute bin_len and checksum after a test edits the image.
inline void reseal(std::vector<std::uint8_t>& bin) {
    put_u32_at(bin, 0, static_cast<std::uint32_t>(bin.size()));
    bin[4] = cfg_bin_checksum(bin);
}

} // namespace gtx8cfg::fixture
