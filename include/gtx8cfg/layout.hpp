#pragma once

#include "gtx8cfg/value.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

namespace gtx8cfg {

// ------------------------------
// Schema tables
// ------------------------------
//
// A schema is an ordered list of field descriptors laid out back to back.
// All multi-byte integers are little-endian: that is the byte order of the
// touch controller and of the files it consumes, not an assumption about the
// host.

enum class FieldKind {
    UInt,     // unsigned integer, width 1/2/4
    Int,      // two's complement integer, width 1/2/4
    Bytes,    // fixed-size byte array
    Bitfield, // integer container split into bit ranges
    Record,   // nested schema
    Repeat,   // element repeated N times, N taken from an earlier integer field
    Reserved, // padding gap; consumed but not represented in the tree
};

struct BitRange {
    const char* name;
    unsigned shift; // bit 0 is the least significant bit of the container
    unsigned width;
    bool flag{false}; // 1-bit range rendered as true/false
};

struct Schema;

struct FieldDesc {
    const char* name{""};
    FieldKind kind{FieldKind::UInt};
    // Integer or bitfield container width, array length, or gap length.
    std::size_t width{0};
    std::vector<BitRange> bits{};
    const Schema* sub{nullptr};
    // Repeat only: dotted path of the count field relative to the enclosing record.
    const char* count_field{nullptr};
    // Repeat only: exactly one element descriptor.
    std::vector<FieldDesc> element{};
    // Reserved only: non-zero content is a SchemaViolation.
    bool must_be_zero{false};
};

struct Schema {
    const char* name;
    std::vector<FieldDesc> fields;
};

// Descriptor builders used by the schema tables.
FieldDesc u8(const char* name);
FieldDesc u16(const char* name);
FieldDesc u32(const char* name);
FieldDesc i8(const char* name);
FieldDesc i16(const char* name);
FieldDesc i32(const char* name);
FieldDesc bytes(const char* name, std::size_t len);
FieldDesc bitfield(const char* name, std::size_t width, std::initializer_list<BitRange> bits);
FieldDesc record(const char* name, const Schema& sub);
FieldDesc repeat(const char* name, const char* count_field, FieldDesc element);
FieldDesc reserved(const char* name, std::size_t len, bool must_be_zero = false);

/// Minimum byte size of a field: its fixed width, zero for a repeated block.
std::size_t min_size(const FieldDesc& f);
/// Sum of min_size over all fields.
std::size_t min_size(const Schema& s);

// ------------------------------
// Decoding
// ------------------------------

/// Assemble an unsigned little-endian integer of `width` bytes (1..8).
std::uint64_t read_uint_le(const std::uint8_t* p, std::size_t width);
/// Same, sign-extended from the top bit of the `width`-byte value.
std::int64_t read_int_le(const std::uint8_t* p, std::size_t width);
/// Extract `width` bits starting at `shift` (LSB = 0).
std::uint64_t extract_bits(std::uint64_t word, unsigned shift, unsigned width);

struct Decoded {
    Value value;
    std::size_t consumed{0};
};

/// Decode one record from `data[0..size)`. `path` prefixes field names in
/// error reports. Throws CfgError(TruncatedInput | SchemaViolation | InvalidData).
Decoded decode_record(
    const Schema& schema,
    const std::uint8_t* data,
    std::size_t size,
    const std::string& path
);

/// Decode one record starting at `offset` of `buf`, bounded by the end of `buf`.
Decoded decode_record(
    const Schema& schema,
    const std::vector<std::uint8_t>& buf,
    std::size_t offset,
    const std::string& path
);

} // namespace gtx8cfg
