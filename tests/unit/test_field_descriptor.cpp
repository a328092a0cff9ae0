#include "reg/field_descriptor.hpp"
#include "common/reg_error.hpp"
#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/* All comments are in English */

using namespace pc;
using namespace pc::reg;

namespace {
int g_failures = 0;
void CHECK(bool cond, const std::string& msg) {
    if (!cond) { ++g_failures; std::cerr << "[FAIL] " << msg << "\n"; }
}

#define EXPECT_THROW(stmt, ExType, msg)                         \
    do {                                                        \
        bool threw = false;                                     \
        try { (void)(stmt); }                                   \
        catch (const ExType&) { threw = true; }                 \
        CHECK(threw, msg);                                      \
    } while (0)

FieldDescriptor MakeUint(const std::string& name, std::size_t bits) {
    FieldDescriptor::Params p;
    p.model_name = name;
    p.bit_width  = bits;
    return FieldDescriptor(p);
}

FieldDescriptor MakeSigned(const std::string& name, std::size_t bits) {
    FieldDescriptor::Params p;
    p.model_name = name;
    p.bit_width  = bits;
    p.is_signed  = true;
    return FieldDescriptor(p);
}

void TEST_UnsignedRange() {
    std::cout << "[RUN ] UnsignedRange\n";
    FieldDescriptor f = MakeUint("threshold_mask_bits", 5);
    CHECK(f.min_value() == 0 && f.max_value() == 31, "5-bit unsigned spans [0, 31]");
    CHECK(!f.Validate(31, 1).has_value(), "31 fits in 5 bits");

    auto v = f.Validate(32, 1);
    CHECK(v.has_value(), "32 does not fit in 5 bits");
    CHECK(v && v->kind == ErrorKind::kOutOfRange, "overflow reported as OutOfRange");
    CHECK(v && v->field == "threshold_mask_bits", "violation names the field");
    CHECK(f.Validate(-1, 1).has_value(), "negative value rejected by unsigned field");
    CHECK(f.manual_name() == "threshold_mask_bits" && f.export_key() == "threshold_mask_bits",
          "manual name and export key default to the model name");
    std::cout << "[DONE] UnsignedRange\n";
}

void TEST_SignedEncodeDecode() {
    std::cout << "[RUN ] SignedEncodeDecode\n";
    FieldDescriptor f = MakeSigned("reset_v", 30);
    CHECK(f.min_value() == -(std::int64_t{1} << 29), "30-bit signed min");
    CHECK(f.max_value() == (std::int64_t{1} << 29) - 1, "30-bit signed max");

    CHECK(f.Encode(-1) == 0x3FFFFFFFull, "-1 encodes to all ones in 30 bits");
    CHECK(f.Encode(5) == 5u, "positive value encodes unchanged");
    CHECK(f.Decode(0x3FFFFFFFull) == std::optional<std::int64_t>(-1), "all ones decodes to -1");
    CHECK(f.Decode(std::uint64_t{1} << 29) == std::optional<std::int64_t>(-(std::int64_t{1} << 29)),
          "sign bit alone decodes to the minimum");
    CHECK(f.Decode(f.Encode(-123456)) == std::optional<std::int64_t>(-123456),
          "negative value survives encode/decode");
    CHECK(f.Validate(std::int64_t{1} << 29, 1).has_value(), "2^29 overflows a 30-bit signed field");
    std::cout << "[DONE] SignedEncodeDecode\n";
}

void TEST_EnumerationDomain() {
    std::cout << "[RUN ] EnumerationDomain\n";
    FieldDescriptor::Params p;
    p.model_name  = "weight_width";
    p.bit_width   = 2;
    p.enumeration = {{1, 0, "WEIGHT_WIDTH_1BIT"}, {2, 1, "WEIGHT_WIDTH_2BIT"},
                     {4, 2, "WEIGHT_WIDTH_4BIT"}, {8, 3, "WEIGHT_WIDTH_8BIT"}};
    FieldDescriptor f(p);

    CHECK(f.is_enum(), "descriptor has an enumeration domain");
    CHECK(f.InDomain(8) && !f.InDomain(3), "domain holds semantic values, not codes");
    CHECK(f.Encode(8) == 3u, "8-bit weights encode to code 3");
    CHECK(f.Decode(0) == std::optional<std::int64_t>(1), "code 0 decodes to 1-bit");
    CHECK(f.ValueOfLabel("WEIGHT_WIDTH_4BIT") == std::optional<std::int64_t>(4), "label lookup");
    CHECK(!f.ValueOfLabel("WEIGHT_WIDTH_3BIT").has_value(), "unknown label");
    CHECK(f.LabelOf(2) == std::optional<std::string>("WEIGHT_WIDTH_2BIT"), "value to label");

    auto v = f.Validate(3, 1);
    CHECK(v && v->kind == ErrorKind::kOutOfRange, "value outside enumeration rejected");
    EXPECT_THROW(f.Encode(3), RegisterError, "Encode of a non-member throws");

    // Three-value enum in two bits leaves code 3 unused.
    FieldDescriptor::Params r;
    r.model_name  = "reset_mode";
    r.bit_width   = 2;
    r.enumeration = {{0, 0, "MODE_NORMAL"}, {1, 1, "MODE_LINEAR"}, {2, 2, "MODE_NONRESET"}};
    FieldDescriptor rm(r);
    CHECK(!rm.Decode(3).has_value(), "unused code decodes to nothing");
    std::cout << "[DONE] EnumerationDomain\n";
}

void TEST_ArityAndBroadcast() {
    std::cout << "[RUN ] ArityAndBroadcast\n";
    FieldDescriptor scalar = MakeUint("bit_truncation", 5);
    auto v = scalar.Validate(std::vector<std::int64_t>{1, 2}, 1);
    CHECK(v && v->kind == ErrorKind::kArityMismatch, "array given to scalar field");

    FieldDescriptor::Params p;
    p.model_name   = "tick_relative";
    p.bit_width    = 8;
    p.array_valued = true;
    FieldDescriptor arr(p);

    auto short_arr = arr.Validate(std::vector<std::int64_t>{1, 2, 3}, 4);
    CHECK(short_arr && short_arr->kind == ErrorKind::kArityMismatch, "3 elements for a group of 4");
    CHECK(!arr.Validate(std::vector<std::int64_t>{1, 2, 3, 4}, 4).has_value(), "exact group size");

    auto bad_elem = arr.Validate(std::vector<std::int64_t>{1, 256, 3, 4}, 4);
    CHECK(bad_elem && bad_elem->kind == ErrorKind::kOutOfRange, "each element is range checked");
    CHECK(bad_elem && bad_elem->message.find("index 1") != std::string::npos,
          "message names the bad element");

    std::vector<std::int64_t> expanded = arr.Expand(7, 4);
    CHECK(expanded == std::vector<std::int64_t>({7, 7, 7, 7}), "scalar broadcast over the group");
    CHECK(scalar.Expand(9, 4).size() == 1, "scalar field keeps one element");
    std::cout << "[DONE] ArityAndBroadcast\n";
}

void TEST_ReadOnly() {
    std::cout << "[RUN ] ReadOnly\n";
    FieldDescriptor::Params p;
    p.model_name    = "vjt_init";
    p.bit_width     = 30;
    p.is_signed     = true;
    p.read_only     = true;
    p.default_value = 0;
    FieldDescriptor f(p);

    auto w = f.CheckWritable();
    CHECK(w && w->kind == ErrorKind::kReadOnlyViolation, "read-only field refuses writes");
    CHECK(!MakeUint("x", 3).CheckWritable().has_value(), "writable field accepts writes");

    FieldDescriptor::Params no_default = p;
    no_default.default_value.reset();
    EXPECT_THROW(FieldDescriptor(no_default), std::invalid_argument,
                 "read-only field without default rejected");
    std::cout << "[DONE] ReadOnly\n";
}

void TEST_InconsistentDeclarations() {
    std::cout << "[RUN ] InconsistentDeclarations\n";
    FieldDescriptor::Params zero;
    zero.model_name = "zero";
    EXPECT_THROW(FieldDescriptor(zero), std::invalid_argument, "zero width rejected");

    FieldDescriptor::Params wide;
    wide.model_name = "wide";
    wide.bit_width  = 4;
    wide.max_value  = 16;
    EXPECT_THROW(FieldDescriptor(wide), std::invalid_argument, "range wider than bit width rejected");

    FieldDescriptor::Params bad_default;
    bad_default.model_name    = "tick_wait_start";
    bad_default.bit_width     = 15;
    bad_default.default_value = 1 << 15;
    EXPECT_THROW(FieldDescriptor(bad_default), std::invalid_argument, "default outside domain rejected");

    FieldDescriptor::Params bad_code;
    bad_code.model_name  = "flag";
    bad_code.bit_width   = 1;
    bad_code.enumeration = {{0, 0, "OFF"}, {1, 2, "ON"}};
    EXPECT_THROW(FieldDescriptor(bad_code), std::invalid_argument, "enum code wider than field rejected");
    std::cout << "[DONE] InconsistentDeclarations\n";
}

void TEST_Reserved() {
    std::cout << "[RUN ] Reserved\n";
    FieldDescriptor r = FieldDescriptor::Reserved("reserved", 123);
    CHECK(r.reserved() && r.bit_width() == 123, "reserved padding may exceed 64 bits");
    CHECK(r.InDomain(0) && !r.InDomain(1), "reserved padding only holds zero");
    CHECK(r.Encode(0) == 0u, "reserved encodes to zero");
    CHECK(r.ToString().find("reserved") != std::string::npos, "ToString marks reserved fields");
    std::cout << "[DONE] Reserved\n";
}

} // namespace

int main() {
    std::cout << "=== FieldDescriptor Unit Tests ===\n";
    TEST_UnsignedRange();
    TEST_SignedEncodeDecode();
    TEST_EnumerationDomain();
    TEST_ArityAndBroadcast();
    TEST_ReadOnly();
    TEST_InconsistentDeclarations();
    TEST_Reserved();
    if (g_failures == 0) {
        std::cout << "[PASS] All tests passed.\n";
        return 0;
    } else {
        std::cout << "[FAIL] " << g_failures << " test(s) failed.\n";
        return 1;
    }
}
