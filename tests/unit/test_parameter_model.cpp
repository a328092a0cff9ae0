#include "reg/parameter_model.hpp"
#include "reg/schema_registry.hpp"
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

// Runs fn and returns the RegisterError it throws, if any.
template <typename Fn>
std::optional<RegisterError> ErrorOf(Fn&& fn) {
    try { fn(); }
    catch (const RegisterError& e) { return e; }
    return std::nullopt;
}

NamedValues CoreValues() {
    return {{"weight_width", 8}, {"LCN", 1},         {"input_width", 1},
            {"spike_width", 1},  {"neuron_num", 100}, {"pool_max", 0},
            {"tick_wait_start", 1}, {"tick_wait_end", 100}, {"SNN_EN", 1},
            {"target_LCN", 1},   {"test_chip_addr", 0}};
}

NamedValues NeuronValues() {
    return {{"tick_relative", 0},    {"addr_axon", 10},     {"addr_core_x", 1},
            {"addr_core_y", 2},      {"addr_core_x_ex", 0}, {"addr_core_y_ex", 0},
            {"addr_chip_x", 0},      {"addr_chip_y", 0},    {"reset_mode", 0},
            {"reset_v", -5},         {"leak_post", 0},      {"threshold_mask_ctrl", 0},
            {"threshold_neg_mode", 1}, {"threshold_neg", 0}, {"threshold_pos", 10},
            {"leak_reversal_flag", 0}, {"leak_det_stoch", 0}, {"leak_v", -1},
            {"weight_det_stoch", 0}, {"bit_truncate", 8}};
}

NamedValues OnlineCoreValues() {
    return {{"bit_select", 1},        {"group_select", 2},    {"lateral_inhi_value", -100},
            {"weight_decay_value", 3}, {"upper_weight", 100}, {"lower_weight", -100},
            {"neuron_start", 0},      {"neuron_end", 511},    {"inhi_core_x_star", 1},
            {"inhi_core_y_star", 2},  {"test_address", 0}};
}

std::shared_ptr<const RegisterSchema> Schema(RegisterKind kind, std::size_t group = 1) {
    ModeFlags f;
    f.neuron_group_size = group;
    return SchemaRegistry::Default().Resolve(kind, f);
}

void TEST_BuildAndGet() {
    std::cout << "[RUN ] BuildAndGet\n";
    ParameterModel m = ParameterModel::FromNamedValues(Schema(RegisterKind::kOfflineCore), CoreValues());

    CHECK(m.Get("weight_width") == 8, "semantic weight width");
    CHECK(m.Get("neuron_num") == 100 && m.Get("num_dendrite") == 100, "manual and model names agree");
    CHECK(m.Get("snn_en") == 1, "export key accepted by Get");
    CHECK(m.GetAs<WeightWidth>("weight_width") == WeightWidth::kWidth8Bit, "typed enum view");
    CHECK(m.GetAs<LcnExtension>("LCN") == LcnExtension::kLcn1X, "LCN 1 is LCN_1X");
    CHECK(m.core_mode() == std::optional<CoreMode>(CoreMode::kSnn), "1-bit in, 1-bit out, SNN on");
    std::cout << "[DONE] BuildAndGet\n";
}

void TEST_MissingAndDomain() {
    std::cout << "[RUN ] MissingAndDomain\n";
    auto schema = Schema(RegisterKind::kOfflineCore);

    NamedValues missing = CoreValues();
    missing.erase("neuron_num");
    missing.erase("tick_wait_end");  // defaulted
    auto e1 = ErrorOf([&] { ParameterModel::FromNamedValues(schema, missing); });
    CHECK(e1 && e1->kind() == ErrorKind::kMissingField, "only a missing field: MissingField");
    CHECK(e1 && e1->HasViolation("num_dendrite", ErrorKind::kMissingField), "names the missing field");
    CHECK(e1 && !e1->HasViolation("tick_wait_end"), "defaulted field is not missing");

    NamedValues bad = CoreValues();
    bad.insert_or_assign("neuron_num", FieldInput(9000));
    bad.insert_or_assign("LCN", FieldInput(3));
    auto e2 = ErrorOf([&] { ParameterModel::FromNamedValues(schema, bad); });
    CHECK(e2 && e2->kind() == ErrorKind::kValidationError, "domain errors aggregate");
    CHECK(e2 && e2->HasViolation("num_dendrite", ErrorKind::kOutOfRange), "13-bit overflow reported");
    CHECK(e2 && e2->HasViolation("lcn_extension", ErrorKind::kOutOfRange), "LCN 3 is not a factor");
    CHECK(e2 && e2->violations().size() == 2, "both violations in one pass");

    NamedValues unknown = CoreValues();
    unknown.insert_or_assign("no_such_field", FieldInput(1));
    auto e3 = ErrorOf([&] { ParameterModel::FromNamedValues(schema, unknown); });
    CHECK(e3 && e3->kind() == ErrorKind::kUnknownName, "unknown name is structural");

    NamedValues twice = CoreValues();
    twice.insert_or_assign("weight_precision", FieldInput(8));
    auto e4 = ErrorOf([&] { ParameterModel::FromNamedValues(schema, twice); });
    CHECK(e4 && e4->HasViolation("weight_width"), "one field given under two names");
    std::cout << "[DONE] MissingAndDomain\n";
}

void TEST_CoreCrossField() {
    std::cout << "[RUN ] CoreCrossField\n";
    auto schema = Schema(RegisterKind::kOfflineCore);

    NamedValues ann_snn = CoreValues();
    ann_snn.insert_or_assign("input_width", FieldInput(8));
    auto e1 = ErrorOf([&] { ParameterModel::FromNamedValues(schema, ann_snn); });
    CHECK(e1 && e1->HasViolation("snn_mode_en"), "8-bit input with SNN enabled");

    NamedValues many = CoreValues();
    many.insert_or_assign("neuron_num", FieldInput(600));
    auto e2 = ErrorOf([&] { ParameterModel::FromNamedValues(schema, many); });
    CHECK(e2 && e2->HasViolation("num_dendrite", ErrorKind::kOutOfRange), "SNN mode caps dendrites at 512");

    many.insert_or_assign("SNN_EN", FieldInput(0));
    ParameterModel ann = ParameterModel::FromNamedValues(schema, many);
    CHECK(ann.Get("neuron_num") == 600, "ANN mode allows up to 4096 dendrites");
    CHECK(ann.core_mode() == std::optional<CoreMode>(CoreMode::kBann), "1-bit in/out without SNN");

    NamedValues pool = CoreValues();
    pool.insert_or_assign("pool_max", FieldInput(1));
    ParameterModel coerced = ParameterModel::FromNamedValues(schema, pool);
    CHECK(coerced.Get("pool_max") == 0, "max pooling forced off for 1-bit input");

    NamedValues pool8 = CoreValues();
    pool8.insert_or_assign("pool_max", FieldInput(1));
    pool8.insert_or_assign("input_width", FieldInput(8));
    pool8.insert_or_assign("SNN_EN", FieldInput(0));
    ParameterModel kept = ParameterModel::FromNamedValues(schema, pool8);
    CHECK(kept.Get("pool_max") == 1, "max pooling kept for 8-bit input");
    CHECK(kept.core_mode() == std::optional<CoreMode>(CoreMode::kAnnToBannOrSnn), "8-bit in, 1-bit out");
    std::cout << "[DONE] CoreCrossField\n";
}

void TEST_OnlineCoreCrossField() {
    std::cout << "[RUN ] OnlineCoreCrossField\n";
    auto schema = Schema(RegisterKind::kOnlineCore);
    ParameterModel m = ParameterModel::FromNamedValues(schema, OnlineCoreValues());
    CHECK(m.Get("weight_width") == 1 && m.Get("bit_select") == 1, "bit_select is the weight width");
    CHECK(m.Get("random_seed") == 1 && m.Get("online_mode_en") == 1, "online defaults");
    CHECK(!m.core_mode().has_value(), "core mode only for offline cores");

    NamedValues inverted = OnlineCoreValues();
    inverted.insert_or_assign("lower_weight", FieldInput(101));
    auto e = ErrorOf([&] { ParameterModel::FromNamedValues(schema, inverted); });
    CHECK(e && e->HasViolation("lower_weight"), "lower_weight above upper_weight");

    NamedValues window = OnlineCoreValues();
    window.insert_or_assign("neuron_start", FieldInput(600));
    auto e2 = ErrorOf([&] { ParameterModel::FromNamedValues(schema, window); });
    CHECK(e2 && e2->HasViolation("neuron_start"), "neuron_start after neuron_end");
    std::cout << "[DONE] OnlineCoreCrossField\n";
}

void TEST_ReadOnlyField() {
    std::cout << "[RUN ] ReadOnlyField\n";
    auto schema = Schema(RegisterKind::kOfflineNeuron);

    NamedValues at_default = NeuronValues();
    at_default.insert_or_assign("vjt_pre", FieldInput(0));
    ParameterModel m = ParameterModel::FromNamedValues(schema, at_default);
    CHECK(m.Get("vjt_init") == 0, "read-only field accepted at its default");

    NamedValues written = NeuronValues();
    written.insert_or_assign("vjt_pre", FieldInput(5));
    auto e = ErrorOf([&] { ParameterModel::FromNamedValues(schema, written); });
    CHECK(e && e->HasViolation("vjt_init", ErrorKind::kReadOnlyViolation), "read-only field written");

    const ParameterModel before = m;
    auto e2 = ErrorOf([&] { m.Set("vjt_pre", 0); });
    CHECK(e2 && e2->kind() == ErrorKind::kReadOnlyViolation, "Set on a read-only field");
    CHECK(m == before, "model unchanged after refused Set");
    std::cout << "[DONE] ReadOnlyField\n";
}

void TEST_Set() {
    std::cout << "[RUN ] Set\n";
    ParameterModel m = ParameterModel::FromNamedValues(Schema(RegisterKind::kOfflineNeuron), NeuronValues());
    const ParameterModel before = m;

    auto e = ErrorOf([&] { m.Set("threshold_pos", std::int64_t{1} << 29); });
    CHECK(e && e->kind() == ErrorKind::kOutOfRange, "out-of-range Set throws");
    CHECK(m == before, "model unchanged after failed Set");

    auto e2 = ErrorOf([&] { m.Set("no_such_field", 1); });
    CHECK(e2 && e2->kind() == ErrorKind::kUnknownName, "Set on an unknown name");

    m.Set("ResetModeType", 1);
    CHECK(m.GetAs<ResetMode>("reset_mode") == ResetMode::kLinear, "legacy name accepted by Set");
    CHECK(m != before, "successful Set changes the model");
    std::cout << "[DONE] Set\n";
}

void TEST_NeuronGroup() {
    std::cout << "[RUN ] NeuronGroup\n";
    auto schema = Schema(RegisterKind::kOfflineNeuron, 4);

    NamedValues v = NeuronValues();
    v.insert_or_assign("leak_v", FieldInput(std::vector<std::int64_t>{1, -2, 3, -4}));
    v.insert_or_assign("addr_axon", FieldInput(std::vector<std::int64_t>{0, 1, 2, 3}));
    ParameterModel m = ParameterModel::FromNamedValues(schema, v);

    CHECK(m.GetArray("leak_v") == std::vector<std::int64_t>({1, -2, 3, -4}), "per-neuron leak_v");
    CHECK(m.GetArray("tick_relative") == std::vector<std::int64_t>({0, 0, 0, 0}), "scalar broadcast");
    bool threw = false;
    try { m.Get("leak_v"); } catch (const RegisterError& e) { threw = e.kind() == ErrorKind::kArityMismatch; }
    CHECK(threw, "Get on a multi-element array");

    nlohmann::json j = m.Export();
    CHECK(j.at("leak_v").is_array() && j.at("leak_v").size() == 4, "array field exported as array");
    CHECK(j.at("reset_v").is_number_integer() && j.at("reset_v").get<std::int64_t>() == -5,
          "scalar field exported as scalar");

    NamedValues short_arr = NeuronValues();
    short_arr.insert_or_assign("leak_v", FieldInput(std::vector<std::int64_t>{1, 2, 3}));
    auto e = ErrorOf([&] { ParameterModel::FromNamedValues(schema, short_arr); });
    CHECK(e && e->HasViolation("leak_v", ErrorKind::kArityMismatch), "3 values for a group of 4");

    NamedValues axon = NeuronValues();
    axon.insert_or_assign("addr_axon", FieldInput(1152));
    auto e2 = ErrorOf([&] { ParameterModel::FromNamedValues(Schema(RegisterKind::kOfflineNeuron), axon); });
    CHECK(e2 && e2->HasViolation("addr_axon", ErrorKind::kOutOfRange), "addr_axon capped at 1151");
    std::cout << "[DONE] NeuronGroup\n";
}

void TEST_OnlineNeuronByKind() {
    std::cout << "[RUN ] OnlineNeuronByKind\n";
    NamedValues v = {{"leak_v", -3},         {"threshold", 100},  {"floor_thres", -10},
                     {"reset_potential", 0}, {"initial_potential", 0}, {"addr_core_x", 0},
                     {"addr_core_y", 0},     {"addr_core_x_ex", 0}, {"addr_core_y_ex", 0},
                     {"addr_chip_x", 0},     {"addr_chip_y", 0},  {"addr_axon", 5},
                     {"tick_relative", 1}};

    NamedValues one_bit = v;
    one_bit.insert_or_assign("weight_width", FieldInput(1));
    ParameterModel m1 = ParameterModel::FromNamedValues(RegisterKind::kOnlineNeuron, one_bit);
    CHECK(m1.schema().total_bit_width() == 128, "1-bit core precision picks 128 bits");

    NamedValues eight_bit = v;
    eight_bit.insert_or_assign("bit_select", FieldInput(8));
    ParameterModel m8 = ParameterModel::FromNamedValues(RegisterKind::kOnlineNeuron, eight_bit);
    CHECK(m8.schema().total_bit_width() == 256, "8-bit core precision picks 256 bits");
    CHECK(m8.Get("plasticity_start") == 0, "plasticity window defaults");

    ParameterModel dflt = ParameterModel::FromNamedValues(RegisterKind::kOnlineNeuron, v);
    CHECK(dflt.schema().total_bit_width() == 256, "precision defaults to 8-bit");

    NamedValues odd = v;
    odd.insert_or_assign("weight_width", FieldInput(3));
    auto e = ErrorOf([&] { ParameterModel::FromNamedValues(RegisterKind::kOnlineNeuron, odd); });
    CHECK(e && e->kind() == ErrorKind::kUnknownKind, "3-bit weights have no layout");

    NamedValues window = v;
    window.insert_or_assign("plasticity_start", FieldInput(10));
    window.insert_or_assign("plasticity_end", FieldInput(5));
    auto e2 = ErrorOf([&] { ParameterModel::FromNamedValues(RegisterKind::kOnlineNeuron, window); });
    CHECK(e2 && e2->HasViolation("plasticity_start"), "plasticity window must not be inverted");
    std::cout << "[DONE] OnlineNeuronByKind\n";
}

void TEST_ExportKeys() {
    std::cout << "[RUN ] ExportKeys\n";
    ParameterModel m = ParameterModel::FromNamedValues(Schema(RegisterKind::kOfflineCore), CoreValues());
    nlohmann::json j = m.Export();
    CHECK(j.size() == 11, "every named field exported exactly once");
    CHECK(!j.contains("reserved"), "reserved padding not exported");
    CHECK(j.contains("neuron_num") && j.contains("snn_en") && j.contains("pool_max"),
          "export uses export keys");
    CHECK(!j.contains("num_dendrite") && !j.contains("SNN_EN"), "no model or manual names in export");
    CHECK(j.at("weight_width").get<int>() == 8, "semantic value exported");

    NamedValues named = m.ToNamedValues();
    CHECK(named.count("num_dendrite") == 1 && named.count("reserved") == 0, "ToNamedValues uses model names");
    CHECK(ParameterModel::FromNamedValues(m.schema_ptr(), named) == m, "ToNamedValues rebuilds the model");
    std::cout << "[DONE] ExportKeys\n";
}

} // namespace

int main() {
    std::cout << "=== ParameterModel Unit Tests ===\n";
    TEST_BuildAndGet();
    TEST_MissingAndDomain();
    TEST_CoreCrossField();
    TEST_OnlineCoreCrossField();
    TEST_ReadOnlyField();
    TEST_Set();
    TEST_NeuronGroup();
    TEST_OnlineNeuronByKind();
    TEST_ExportKeys();
    if (g_failures == 0) {
        std::cout << "[PASS] All tests passed.\n";
        return 0;
    } else {
        std::cout << "[FAIL] " << g_failures << " test(s) failed.\n";
        return 1;
    }
}
