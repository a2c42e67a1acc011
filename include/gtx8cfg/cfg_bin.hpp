#pragma once

#include "gtx8cfg/layout.hpp"
#include "gtx8cfg/value.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace gtx8cfg {

// ------------------------------
// GTX8 cfg group layout constants
// ------------------------------

constexpr std::size_t kBinVersionStart = 5;   // checksum covers [5, bin_len)
constexpr std::size_t kBinVersionLen = 4;
constexpr std::size_t kBinHeadReservedLen = 6;
constexpr std::size_t kBinHeadLen = 16;       // head fields + reserved gap
constexpr std::size_t kPkgOffsetLen = 2;
constexpr std::size_t kIcTypeNameMaxLen = 15;
constexpr std::size_t kPkgPidLen = 8;
constexpr std::size_t kPkgVidLen = 8;
constexpr std::size_t kPkgFwMaskLen = 9;
constexpr std::size_t kPkgFwPatchLen = 4;
constexpr std::size_t kPkgRegReservedLen = 9;
constexpr std::size_t kPkgConstInfoLen = 56;
constexpr std::size_t kPkgRegInfoLen = 65;
constexpr std::size_t kPkgHeadLen = kPkgConstInfoLen + kPkgRegInfoLen;
// Size of the driver's ic config buffer.
constexpr std::size_t kMaxConfigLen = 4096;

// Schema tables, mirroring the driver structures field for field.
const Schema& cfg_bin_head_schema();   // goodix_cfg_bin_head + reserved gap
const Schema& cfg_bin_layout_schema(); // head followed by the package offset table
const Schema& pkg_reg_schema();        // goodix_cfg_pkg_reg
const Schema& pkg_const_info_schema(); // goodix_cfg_pkg_const_info
const Schema& pkg_reg_info_schema();   // goodix_cfg_pkg_reg_info

// ------------------------------
// API
// ------------------------------

struct DecodeOptions {
    bool validate{true}; // check head.bin_len against the file size and head.checksum
};

/// 8-bit wrapping sum of bin[kBinVersionStart..end).
std::uint8_t cfg_bin_checksum(const std::vector<std::uint8_t>& bin);

/// Decode a whole cfg group file image. The result is
/// { head, pkg_offsets, cfg_pkgs, ic_configs } in that order.
Value decode_cfg_bin(const std::vector<std::uint8_t>& bin, const DecodeOptions& opts = DecodeOptions{});

/// Read the whole file into memory. Throws CfgError(Io).
std::vector<std::uint8_t> read_bin_file(const std::filesystem::path& file);

/// The ic config payload of package `index` of a decoded file, sliced from the
/// file image it was decoded from. Unlike `ic_configs`, which keeps one entry
/// per cfg_type, this addresses every package. InvalidData if `root` does not
/// describe `bin`.
Value::Bytes package_config(const std::vector<std::uint8_t>& bin, const Value& root, std::size_t index);

/// read_bin_file + decode_cfg_bin.
Value read_cfg_bin(const std::filesystem::path& file, const DecodeOptions& opts = DecodeOptions{});

// ------------------------------
// Utilities
// ------------------------------

/// Byte array up to the first NUL as text (ic_type and friends).
std::string c_string(const Value::Bytes& b);

/// CRC-32 (zlib polynomial) of a byte array, used to fingerprint ic config payloads.
std::uint32_t crc32_of(const Value::Bytes& b);

} // namespace gtx8cfg
