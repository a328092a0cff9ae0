#include "reg/layouts.hpp"
#include <array>
#include <string>
#include <utility>
#include <vector>

#include "common/hw_defs.hpp"

namespace pc { namespace reg {

namespace {

using Params = FieldDescriptor::Params;

Params Base(const std::string& model, const std::string& manual, std::size_t bits) {
  Params p;
  p.model_name  = model;
  p.manual_name = manual;
  p.bit_width   = bits;
  return p;
}

FieldDescriptor Uint(const std::string& model, const std::string& manual, std::size_t bits) {
  return FieldDescriptor(Base(model, manual, bits));
}

FieldDescriptor UintDefault(const std::string& model, const std::string& manual,
                            std::size_t bits, std::int64_t def) {
  Params p = Base(model, manual, bits);
  p.default_value = def;
  return FieldDescriptor(std::move(p));
}

FieldDescriptor Sint(const std::string& model, const std::string& manual, std::size_t bits) {
  Params p = Base(model, manual, bits);
  p.is_signed = true;
  return FieldDescriptor(std::move(p));
}

// Enumerations whose model value is the register code.
template <typename E, std::size_t N>
std::vector<EnumEntry> CodeDomain(const std::array<E, N>& all) {
  std::vector<EnumEntry> d;
  for (E e : all) {
    const auto code = static_cast<std::uint64_t>(e);
    d.push_back({static_cast<std::int64_t>(code), code, ToString(e)});
  }
  return d;
}

std::vector<EnumEntry> WeightWidthDomain() {
  std::vector<EnumEntry> d;
  for (WeightWidth w : kAllWeightWidths) {
    d.push_back({BitsOf(w), static_cast<std::uint64_t>(w), ToString(w)});
  }
  return d;
}

// Online cores only encode LCN_1X..LCN_8X.
std::vector<EnumEntry> LcnDomain(std::size_t count) {
  std::vector<EnumEntry> d;
  for (std::size_t i = 0; i < count && i < kAllLcnExtensions.size(); ++i) {
    const LcnExtension l = kAllLcnExtensions[i];
    d.push_back({FactorOf(l), static_cast<std::uint64_t>(l), ToString(l)});
  }
  return d;
}

template <typename E>
std::vector<EnumEntry> WidthFormatDomain(const std::array<E, 2>& all) {
  std::vector<EnumEntry> d;
  for (E e : all) {
    d.push_back({BitsOf(e), static_cast<std::uint64_t>(e), ToString(e)});
  }
  return d;
}

FieldDescriptor Enum(Params p, std::vector<EnumEntry> domain) {
  p.enumeration = std::move(domain);
  return FieldDescriptor(std::move(p));
}

FieldDescriptor EnableField(const std::string& model, const std::string& manual,
                            const std::string& export_key, std::int64_t def) {
  Params p = Base(model, manual, 1);
  p.export_key    = export_key;
  p.default_value = def;
  return Enum(std::move(p), CodeDomain(kAllEnableFlags));
}

// Destination fields shared by every neuron layout. Array-valued fields hold
// one element per neuron of the group.
void AppendDestination(std::vector<FieldDescriptor>& f) {
  f.push_back(Uint("addr_core_x",    "addr_core_x",    kCoreXBits));
  f.push_back(Uint("addr_core_y",    "addr_core_y",    kCoreYBits));
  f.push_back(Uint("addr_core_x_ex", "addr_core_x_ex", kCoreXBits));
  f.push_back(Uint("addr_core_y_ex", "addr_core_y_ex", kCoreYBits));
  f.push_back(Uint("addr_chip_x",    "addr_chip_x",    kChipXBits));
  f.push_back(Uint("addr_chip_y",    "addr_chip_y",    kChipYBits));
}

FieldDescriptor AddrAxon() {
  Params p = Base("addr_axon", "addr_axon", 11);
  p.max_value    = kAddrAxonMax;
  p.array_valued = true;
  return FieldDescriptor(std::move(p));
}

FieldDescriptor TickRelative() {
  Params p = Base("tick_relative", "tick_relative", 8);
  p.array_valued = true;
  return FieldDescriptor(std::move(p));
}

FieldDescriptor LeakV(std::size_t bits) {
  Params p = Base("leak_v", "leak_v", bits);
  p.is_signed    = true;
  p.array_valued = true;
  return FieldDescriptor(std::move(p));
}

// Membrane potential, written by the hardware at run time.
FieldDescriptor Potential(const std::string& model, const std::string& manual,
                          const std::string& export_key, std::size_t bits) {
  Params p = Base(model, manual, bits);
  p.export_key    = export_key;
  p.is_signed     = true;
  p.default_value = 0;
  p.read_only     = true;
  return FieldDescriptor(std::move(p));
}

} // namespace

std::shared_ptr<const RegisterSchema> MakeOfflineCoreSchema() {
  std::vector<FieldDescriptor> f;

  Params ww = Base("weight_width", "weight_width", 2);
  ww.legacy_names = {"weight_precision"};
  f.push_back(Enum(std::move(ww), WeightWidthDomain()));

  Params lcn = Base("lcn_extension", "LCN", 4);
  lcn.legacy_names = {"lcn_ex"};
  lcn.export_key   = "LCN";
  f.push_back(Enum(std::move(lcn), LcnDomain(kAllLcnExtensions.size())));

  Params iw = Base("input_width_format", "input_width", 1);
  iw.export_key = "input_width";
  f.push_back(Enum(std::move(iw), WidthFormatDomain(kAllInputWidths)));

  Params sw = Base("spike_width_format", "spike_width", 1);
  sw.export_key = "spike_width";
  f.push_back(Enum(std::move(sw), WidthFormatDomain(kAllSpikeWidths)));

  Params nd = Base("num_dendrite", "neuron_num", 13);
  nd.legacy_names = {"num_valid_dendrite"};
  nd.export_key   = "neuron_num";
  f.push_back(FieldDescriptor(std::move(nd)));

  f.push_back(EnableField("max_pooling_en", "pool_max", "pool_max", 0));
  f.push_back(UintDefault("tick_wait_start", "tick_wait_start", 15, 1));
  f.push_back(UintDefault("tick_wait_end", "tick_wait_end", 15, 0));

  Params snn = Base("snn_mode_en", "SNN_EN", 1);
  snn.export_key = "snn_en";
  f.push_back(Enum(std::move(snn), CodeDomain(kAllEnableFlags)));

  Params tl = Base("target_lcn", "target_LCN", 4);
  tl.export_key = "target_LCN";
  f.push_back(Enum(std::move(tl), LcnDomain(kAllLcnExtensions.size())));

  f.push_back(Uint("test_chip_addr", "test_chip_addr", kChipAddrBits));
  f.push_back(FieldDescriptor::Reserved("reserved", 23));

  return std::make_shared<const RegisterSchema>(RegisterKind::kOfflineCore, "offline",
                                                kOfflineCoreLayoutVersion,
                                                kOfflineCoreRegBits, std::move(f));
}

std::shared_ptr<const RegisterSchema> MakeOnlineCoreSchema() {
  std::vector<FieldDescriptor> f;

  Params ww = Base("weight_width", "bit_select", 2);
  ww.legacy_names = {"weight_precision"};
  ww.export_key   = "bit_select";
  f.push_back(Enum(std::move(ww), WeightWidthDomain()));

  Params lcn = Base("lcn_extension", "group_select", 2);
  lcn.legacy_names = {"LCN"};
  lcn.export_key   = "group_select";
  f.push_back(Enum(std::move(lcn), LcnDomain(4)));

  f.push_back(Sint("lateral_inhi_value", "lateral_inhi_value", 32));
  f.push_back(Sint("weight_decay_value", "weight_decay_value", 8));
  f.push_back(Sint("upper_weight", "upper_weight", 8));
  f.push_back(Sint("lower_weight", "lower_weight", 8));
  f.push_back(Uint("neuron_start", "neuron_start", 10));
  f.push_back(Uint("neuron_end", "neuron_end", 10));
  f.push_back(Uint("inhi_core_x_star", "inhi_core_x_star", kCoreXBits));
  f.push_back(Uint("inhi_core_y_star", "inhi_core_y_star", kCoreYBits));

  Params tws = Base("tick_wait_start", "core_start_time", 15);
  tws.export_key    = "core_start_time";
  tws.default_value = 1;
  f.push_back(FieldDescriptor(std::move(tws)));

  Params twe = Base("tick_wait_end", "core_hold_time", 15);
  twe.export_key    = "core_hold_time";
  twe.default_value = 0;
  f.push_back(FieldDescriptor(std::move(twe)));

  f.push_back(EnableField("lut_random_en", "lut_random_en", "lut_random_en", 0));
  f.push_back(EnableField("decay_random_en", "decay_random_en", "decay_random_en", 0));

  Params lo = Base("leakage_order", "leakage_order", 1);
  lo.default_value = 0;
  f.push_back(Enum(std::move(lo), CodeDomain(kAllLeakageOrders)));

  f.push_back(EnableField("online_mode_en", "online_mode_en", "online_mode_en", 1));

  Params tca = Base("test_chip_addr", "test_address", kChipAddrBits);
  tca.export_key = "test_address";
  f.push_back(FieldDescriptor(std::move(tca)));

  f.push_back(UintDefault("random_seed", "random_seed", 32, 1));
  f.push_back(FieldDescriptor::Reserved("reserved", 26));

  return std::make_shared<const RegisterSchema>(RegisterKind::kOnlineCore, "online",
                                                kOnlineCoreLayoutVersion,
                                                kOnlineCoreRegBits, std::move(f));
}

std::shared_ptr<const RegisterSchema> MakeOfflineNeuronSchema(std::size_t group_size) {
  std::vector<FieldDescriptor> f;

  f.push_back(FieldDescriptor::Reserved("reserved", 42));
  f.push_back(TickRelative());
  f.push_back(AddrAxon());
  AppendDestination(f);

  Params rm = Base("reset_mode", "reset_mode", 2);
  rm.legacy_names = {"ResetModeType"};
  f.push_back(Enum(std::move(rm), CodeDomain(kAllResetModes)));

  f.push_back(Sint("reset_v", "reset_v", 30));

  Params lc = Base("leak_comparison", "leak_post", 1);
  lc.legacy_names = {"LeakComparisonType"};
  lc.export_key   = "leak_post";
  f.push_back(Enum(std::move(lc), CodeDomain(kAllLeakComparisonModes)));

  Params tm = Base("threshold_mask_bits", "threshold_mask_ctrl", 5);
  tm.export_key = "threshold_mask_ctrl";
  f.push_back(FieldDescriptor(std::move(tm)));

  Params ntm = Base("neg_thres_mode", "threshold_neg_mode", 1);
  ntm.legacy_names = {"NegativeThresholdType"};
  ntm.export_key   = "threshold_neg_mode";
  f.push_back(Enum(std::move(ntm), CodeDomain(kAllNegativeThresholdModes)));

  Params nt = Base("neg_threshold", "threshold_neg", 29);
  nt.export_key = "threshold_neg";
  f.push_back(FieldDescriptor(std::move(nt)));

  Params pt = Base("pos_threshold", "threshold_pos", 29);
  pt.export_key = "threshold_pos";
  f.push_back(FieldDescriptor(std::move(pt)));

  Params ld = Base("leak_direction", "leak_reversal_flag", 1);
  ld.legacy_names = {"LeakDirectionType"};
  ld.export_key   = "leak_reversal_flag";
  f.push_back(Enum(std::move(ld), CodeDomain(kAllLeakDirectionModes)));

  Params lim = Base("leak_integration_mode", "leak_det_stoch", 1);
  lim.legacy_names = {"LeakModeType"};
  lim.export_key   = "leak_det_stoch";
  f.push_back(Enum(std::move(lim), CodeDomain(kAllLeakIntegrationModes)));

  f.push_back(LeakV(30));

  Params sim = Base("synaptic_integration_mode", "weight_det_stoch", 1);
  sim.legacy_names = {"SynapticModeType"};
  sim.export_key   = "weight_det_stoch";
  f.push_back(Enum(std::move(sim), CodeDomain(kAllSynapticIntegrationModes)));

  Params bt = Base("bit_truncation", "bit_truncate", 5);
  bt.export_key = "bit_truncate";
  f.push_back(FieldDescriptor(std::move(bt)));

  f.push_back(Potential("vjt_init", "vjt_pre", "vjt_init", 30));

  return std::make_shared<const RegisterSchema>(RegisterKind::kOfflineNeuron, "offline",
                                                kOfflineNeuronLayoutVersion,
                                                kOfflineNeuronRamBits, std::move(f), group_size);
}

std::shared_ptr<const RegisterSchema> MakeOnlineNeuronSchema(WeightWidth weight_width,
                                                             std::size_t group_size) {
  const bool one_bit = (weight_width == WeightWidth::kWidth1Bit);
  std::vector<FieldDescriptor> f;

  f.push_back(LeakV(15));
  f.push_back(Uint("threshold", "threshold", 15));

  Params ft = Base("floor_threshold", "floor_thres", 7);
  ft.is_signed  = true;
  ft.export_key = "floor_thres";
  f.push_back(FieldDescriptor(std::move(ft)));

  Params rv = Base("reset_v", "reset_potential", 6);
  rv.is_signed  = true;
  rv.export_key = "reset_potential";
  f.push_back(FieldDescriptor(std::move(rv)));

  Params iv = Base("init_v", "initial_potential", 6);
  iv.is_signed  = true;
  iv.export_key = "initial_potential";
  f.push_back(FieldDescriptor(std::move(iv)));

  f.push_back(Potential("voltage", "potential", "potential", 15));
  AppendDestination(f);
  f.push_back(AddrAxon());
  f.push_back(TickRelative());

  if (one_bit) {
    f.push_back(FieldDescriptor::Reserved("reserved", 15));
    return std::make_shared<const RegisterSchema>(RegisterKind::kOnlineNeuron1Bit, "online_1bit",
                                                  kOnlineNeuronLayoutVersion,
                                                  kOnlineNeuronRamBits1Bit, std::move(f),
                                                  group_size);
  }

  // The second neuron address carries the plasticity window.
  f.push_back(UintDefault("plasticity_start", "plasticity_start", 10, 0));
  f.push_back(UintDefault("plasticity_end", "plasticity_end", 10, 0));
  f.push_back(FieldDescriptor::Reserved("reserved", 123));
  return std::make_shared<const RegisterSchema>(RegisterKind::kOnlineNeuron,
                                                std::string("online_") +
                                                    std::to_string(BitsOf(weight_width)) + "bit",
                                                kOnlineNeuronLayoutVersion,
                                                kOnlineNeuronRamBitsNBit, std::move(f),
                                                group_size);
}

}} // namespace pc::reg
