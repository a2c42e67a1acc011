#include "gtx8cfg/cfg_bin.hpp"

#include <fstream>
#include <iterator>
#include <map>
#include <sstream>

#include <zlib.h>

namespace gtx8cfg {

// ------------------------------
// Schema tables
// ------------------------------

const Schema& cfg_bin_head_schema() {
    static const Schema s{
        "goodix_cfg_bin_head",
        {
            u32("bin_len"),
            u8("checksum"),
            bytes("bin_version", kBinVersionLen),
            u8("pkg_num"),
            reserved("reserved", kBinHeadReservedLen),
        },
    };
    return s;
}

const Schema& cfg_bin_layout_schema() {
    static const Schema s{
        "goodix_cfg_bin",
        {
            record("head", cfg_bin_head_schema()),
            repeat("pkg_offsets", "head.pkg_num", u16("offset")),
        },
    };
    return s;
}

const Schema& pkg_reg_schema() {
    static const Schema s{
        "goodix_cfg_pkg_reg",
        {
            u16("addr"),
            u8("reserved1"),
            u8("reserved2"),
        },
    };
    return s;
}

const Schema& pkg_const_info_schema() {
    static const Schema s{
        "goodix_cfg_pkg_const_info",
        {
            u32("pkg_len"),
            bytes("ic_type", kIcTypeNameMaxLen),
            u8("cfg_type"),
            u8("sensor_id"),
            bytes("hw_pid", kPkgPidLen),
            bytes("hw_vid", kPkgVidLen),
            bytes("fw_mask", kPkgFwMaskLen),
            bytes("fw_patch", kPkgFwPatchLen),
            u16("x_res_offset"),
            u16("y_res_offset"),
            u16("trigger_offset"),
        },
    };
    return s;
}

const Schema& pkg_reg_info_schema() {
    static const Schema s{
        "goodix_cfg_pkg_reg_info",
        {
            record("cfg_send_flag", pkg_reg_schema()),
            record("version_base", pkg_reg_schema()),
            record("pid", pkg_reg_schema()),
            record("vid", pkg_reg_schema()),
            record("sensor_id", pkg_reg_schema()),
            record("fw_mask", pkg_reg_schema()),
            record("fw_status", pkg_reg_schema()),
            record("cfg_addr", pkg_reg_schema()),
            record("esd", pkg_reg_schema()),
            record("command", pkg_reg_schema()),
            record("coor", pkg_reg_schema()),
            record("gesture", pkg_reg_schema()),
            record("fw_request", pkg_reg_schema()),
            record("proximity", pkg_reg_schema()),
            bytes("reserved", kPkgRegReservedLen),
        },
    };
    return s;
}

// ------------------------------
// Whole-file decode
// ------------------------------

std::uint8_t cfg_bin_checksum(const std::vector<std::uint8_t>& bin) {
    std::uint8_t sum = 0;
    for (std::size_t i = kBinVersionStart; i < bin.size(); ++i) {
        sum = static_cast<std::uint8_t>(sum + bin[i]);
    }
    return sum;
}

static void validate_head(const std::vector<std::uint8_t>& bin, const Value& head) {
    const auto bin_len = static_cast<std::uint64_t>(head.at("bin_len").as_integer());
    if (bin_len != bin.size()) {
        std::ostringstream oss;
        oss << "bin_len " << bin_len << " does not match file size " << bin.size();
        throw CfgError(ErrorKind::SchemaViolation, oss.str(), "head.bin_len");
    }

    const auto expected = static_cast<unsigned>(head.at("checksum").as_integer());
    const unsigned got = cfg_bin_checksum(bin);
    if (expected != got) {
        std::ostringstream oss;
        oss << "checksum mismatch: expected " << expected << ", got " << got;
        throw CfgError(ErrorKind::SchemaViolation, oss.str(), "head.checksum");
    }
}

static std::string pkg_path(std::size_t i) {
    return "cfg_pkgs[" + std::to_string(i) + "]";
}

Value decode_cfg_bin(const std::vector<std::uint8_t>& bin, const DecodeOptions& opts) {
    Decoded layout = decode_record(cfg_bin_layout_schema(), bin, 0, "");
    const Value& head = layout.value.at("head");
    const Value::Array& offsets = layout.value.at("pkg_offsets").as_array();

    if (opts.validate) {
        validate_head(bin, head);
    }

    Value::Array pkgs;
    pkgs.reserve(offsets.size());
    std::map<Value::Integer, Value> ic_configs;

    for (std::size_t i = 0; i < offsets.size(); ++i) {
        const std::string where = pkg_path(i);
        const auto offset1 = static_cast<std::size_t>(offsets[i].as_integer());
        if (offset1 > bin.size()) {
            std::ostringstream oss;
            oss << "package offset " << offset1 << " is past end of file (" << bin.size() << " bytes)";
            throw CfgError(ErrorKind::TruncatedInput, oss.str(), where, offset1 + kPkgHeadLen, bin.size());
        }

        std::size_t pkg_len = 0;
        if (i + 1 == offsets.size()) {
            pkg_len = bin.size() - offset1;
        } else {
            const auto offset2 = static_cast<std::size_t>(offsets[i + 1].as_integer());
            if (offset2 <= offset1) {
                std::ostringstream oss;
                oss << "package offset " << offset2 << " is not after previous offset " << offset1;
                throw CfgError(ErrorKind::SchemaViolation, oss.str(),
                               "pkg_offsets[" + std::to_string(i + 1) + "]");
            }
            pkg_len = offset2 - offset1;
            if (offset2 > bin.size()) {
                std::ostringstream oss;
                oss << "package " << i << " ends at " << offset2 << ", past end of file (" << bin.size() << " bytes)";
                throw CfgError(ErrorKind::TruncatedInput, oss.str(), where, offset2, bin.size());
            }
        }

        // Both records and the payload are bounded by the package, not the file.
        const std::uint8_t* pkg = bin.data() + offset1;
        Decoded cnst = decode_record(pkg_const_info_schema(), pkg, pkg_len, where + ".cnst_info");
        Decoded regs = decode_record(pkg_reg_info_schema(), pkg + cnst.consumed, pkg_len - cnst.consumed,
                                     where + ".reg_info");

        const std::size_t cfg_len = pkg_len - kPkgHeadLen;
        if (cfg_len > kMaxConfigLen) {
            std::ostringstream oss;
            oss << "ic config of " << cfg_len << " bytes exceeds the " << kMaxConfigLen << "-byte config buffer";
            throw CfgError(ErrorKind::SchemaViolation, oss.str(), where + ".cfg");
        }

        const std::uint8_t* cfg = pkg + kPkgHeadLen;
        const Value::Integer cfg_type = cnst.value.at("cfg_type").as_integer();

        Value ic = Value::make_object();
        ic.set("len", Value::make_integer(static_cast<Value::Integer>(cfg_len)));
        ic.set("data", Value::make_bytes(Value::Bytes(cfg, cfg + cfg_len)));
        ic_configs[cfg_type] = std::move(ic);

        Value p = Value::make_object();
        p.set("cnst_info", std::move(cnst.value));
        p.set("reg_info", std::move(regs.value));
        p.set("pkg_len", Value::make_integer(static_cast<Value::Integer>(pkg_len)));
        pkgs.push_back(std::move(p));
    }

    Value::Object configs;
    for (auto& kv : ic_configs) {
        configs.emplace_back(std::to_string(kv.first), std::move(kv.second));
    }

    Value root = Value::make_object();
    root.set("head", head);
    root.set("pkg_offsets", layout.value.at("pkg_offsets"));
    root.set("cfg_pkgs", Value::make_array(std::move(pkgs)));
    root.set("ic_configs", Value::make_object(std::move(configs)));
    return root;
}

Value::Bytes package_config(const std::vector<std::uint8_t>& bin, const Value& root, std::size_t index) {
    const Value::Array& offsets = root.at("pkg_offsets").as_array();
    const Value::Array& pkgs = root.at("cfg_pkgs").as_array();
    if (index >= pkgs.size() || index >= offsets.size()) {
        throw CfgError(ErrorKind::InvalidData, "no package " + std::to_string(index), pkg_path(index));
    }

    const auto offset = static_cast<std::size_t>(offsets[index].as_integer());
    const auto pkg_len = static_cast<std::size_t>(pkgs[index].at("pkg_len").as_integer());
    if (pkg_len < kPkgHeadLen || offset > bin.size() || pkg_len > bin.size() - offset) {
        std::ostringstream oss;
        oss << "package " << index << " (" << pkg_len << " bytes at " << offset
            << ") does not fit a " << bin.size() << "-byte file";
        throw CfgError(ErrorKind::InvalidData, oss.str(), pkg_path(index));
    }

    const std::uint8_t* cfg = bin.data() + offset + kPkgHeadLen;
    return Value::Bytes(cfg, cfg + (pkg_len - kPkgHeadLen));
}

std::vector<std::uint8_t> read_bin_file(const std::filesystem::path& file) {
    std::ifstream is(file, std::ios::binary);
    if (!is) {
        throw CfgError(ErrorKind::Io, "failed to open file: " + file.string());
    }
    std::vector<std::uint8_t> out((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
    if (is.bad()) {
        throw CfgError(ErrorKind::Io, "failed to read file: " + file.string());
    }
    return out;
}

Value read_cfg_bin(const std::filesystem::path& file, const DecodeOptions& opts) {
    return decode_cfg_bin(read_bin_file(file), opts);
}

// ------------------------------
// Utilities
// ------------------------------

std::string c_string(const Value::Bytes& b) {
    std::string out;
    for (auto c : b) {
        if (c == 0) break;
        out.push_back(static_cast<char>(c));
    }
    return out;
}

std::uint32_t crc32_of(const Value::Bytes& b) {
    uLong crc = ::crc32(0L, Z_NULL, 0);
    if (!b.empty()) {
        crc = ::crc32(crc, reinterpret_cast<const Bytef*>(b.data()), static_cast<uInt>(b.size()));
    }
    return static_cast<std::uint32_t>(crc);
}

} // namespace gtx8cfg
