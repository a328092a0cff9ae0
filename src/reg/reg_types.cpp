#include "reg/reg_types.hpp"

namespace pc { namespace reg {

const char* ToString(RegisterKind kind) {
  switch (kind) {
    case RegisterKind::kOfflineCore:      return "offline_core";
    case RegisterKind::kOnlineCore:       return "online_core";
    case RegisterKind::kOfflineNeuron:    return "offline_neuron";
    case RegisterKind::kOnlineNeuron:     return "online_neuron";
    case RegisterKind::kOnlineNeuron1Bit: return "online_neuron_1bit";
  }
  return "unknown";
}

std::optional<RegisterKind> ParseRegisterKind(const std::string& name) {
  for (RegisterKind k : kAllRegisterKinds) {
    if (name == ToString(k)) return k;
  }
  return std::nullopt;
}

bool IsNeuronKind(RegisterKind kind) {
  switch (kind) {
    case RegisterKind::kOfflineNeuron:
    case RegisterKind::kOnlineNeuron:
    case RegisterKind::kOnlineNeuron1Bit:
      return true;
    case RegisterKind::kOfflineCore:
    case RegisterKind::kOnlineCore:
      return false;
  }
  return false;
}

std::optional<CoreMode> GetCoreMode(InputWidthFormat iw, SpikeWidthFormat sw, SnnModeEnable snn) {
  const bool snn_en = (snn == EnableFlag::kEnable);
  if (iw == InputWidthFormat::kWidth1Bit) {
    if (sw == SpikeWidthFormat::kWidth1Bit) {
      return snn_en ? CoreMode::kSnn : CoreMode::kBann;
    }
    return snn_en ? CoreMode::kBannOrSnnToSnn : CoreMode::kBannOrSnnToAnn;
  }
  // 8-bit input never runs in SNN mode.
  if (snn_en) return std::nullopt;
  return (sw == SpikeWidthFormat::kWidth1Bit) ? CoreMode::kAnnToBannOrSnn : CoreMode::kAnn;
}

bool IsSnn(CoreMode mode) {
  return mode == CoreMode::kSnn || mode == CoreMode::kBannOrSnnToSnn;
}

const char* ToString(WeightWidth v) {
  switch (v) {
    case WeightWidth::kWidth1Bit: return "WEIGHT_WIDTH_1BIT";
    case WeightWidth::kWidth2Bit: return "WEIGHT_WIDTH_2BIT";
    case WeightWidth::kWidth4Bit: return "WEIGHT_WIDTH_4BIT";
    case WeightWidth::kWidth8Bit: return "WEIGHT_WIDTH_8BIT";
  }
  return "unknown";
}

const char* ToString(LcnExtension v) {
  switch (v) {
    case LcnExtension::kLcn1X:  return "LCN_1X";
    case LcnExtension::kLcn2X:  return "LCN_2X";
    case LcnExtension::kLcn4X:  return "LCN_4X";
    case LcnExtension::kLcn8X:  return "LCN_8X";
    case LcnExtension::kLcn16X: return "LCN_16X";
    case LcnExtension::kLcn32X: return "LCN_32X";
    case LcnExtension::kLcn64X: return "LCN_64X";
  }
  return "unknown";
}

const char* ToString(InputWidthFormat v) {
  switch (v) {
    case InputWidthFormat::kWidth1Bit: return "WIDTH_1BIT";
    case InputWidthFormat::kWidth8Bit: return "WIDTH_8BIT";
  }
  return "unknown";
}

const char* ToString(SpikeWidthFormat v) {
  switch (v) {
    case SpikeWidthFormat::kWidth1Bit: return "WIDTH_1BIT";
    case SpikeWidthFormat::kWidth8Bit: return "WIDTH_8BIT";
  }
  return "unknown";
}

const char* ToString(EnableFlag v) {
  switch (v) {
    case EnableFlag::kDisable: return "DISABLE";
    case EnableFlag::kEnable:  return "ENABLE";
  }
  return "unknown";
}

const char* ToString(LeakageOrder v) {
  switch (v) {
    case LeakageOrder::kLeakBeforeIntegration: return "LEAK_BEFORE_INTEGRATION";
    case LeakageOrder::kLeakAfterIntegration:  return "LEAK_AFTER_INTEGRATION";
  }
  return "unknown";
}

const char* ToString(CoreMode v) {
  switch (v) {
    case CoreMode::kBann:           return "MODE_BANN";
    case CoreMode::kSnn:            return "MODE_SNN";
    case CoreMode::kBannOrSnnToAnn: return "MODE_BANN_OR_SNN_TO_ANN";
    case CoreMode::kBannOrSnnToSnn: return "MODE_BANN_OR_SNN_TO_SNN";
    case CoreMode::kAnnToBannOrSnn: return "MODE_ANN_TO_BANN_OR_SNN";
    case CoreMode::kAnn:            return "MODE_ANN";
  }
  return "unknown";
}

const char* ToString(ResetMode v) {
  switch (v) {
    case ResetMode::kNormal:   return "MODE_NORMAL";
    case ResetMode::kLinear:   return "MODE_LINEAR";
    case ResetMode::kNonReset: return "MODE_NONRESET";
  }
  return "unknown";
}

const char* ToString(LeakComparisonMode v) {
  switch (v) {
    case LeakComparisonMode::kLeakBeforeComp: return "LEAK_BEFORE_COMP";
    case LeakComparisonMode::kLeakAfterComp:  return "LEAK_AFTER_COMP";
  }
  return "unknown";
}

const char* ToString(NegativeThresholdMode v) {
  switch (v) {
    case NegativeThresholdMode::kReset:      return "MODE_RESET";
    case NegativeThresholdMode::kSaturation: return "MODE_SATURATION";
  }
  return "unknown";
}

const char* ToString(LeakDirectionMode v) {
  switch (v) {
    case LeakDirectionMode::kForward:  return "MODE_FORWARD";
    case LeakDirectionMode::kReversal: return "MODE_REVERSAL";
  }
  return "unknown";
}

const char* ToString(LeakIntegrationMode v) {
  switch (v) {
    case LeakIntegrationMode::kDeterministic: return "MODE_DETERMINISTIC";
    case LeakIntegrationMode::kStochastic:    return "MODE_STOCHASTIC";
  }
  return "unknown";
}

const char* ToString(SynapticIntegrationMode v) {
  switch (v) {
    case SynapticIntegrationMode::kDeterministic: return "MODE_DETERMINISTIC";
    case SynapticIntegrationMode::kStochastic:    return "MODE_STOCHASTIC";
  }
  return "unknown";
}

std::int64_t BitsOf(WeightWidth v) {
  return std::int64_t{1} << static_cast<unsigned>(v);
}

std::int64_t FactorOf(LcnExtension v) {
  return std::int64_t{1} << static_cast<unsigned>(v);
}

std::int64_t BitsOf(InputWidthFormat v) {
  return v == InputWidthFormat::kWidth1Bit ? 1 : 8;
}

std::int64_t BitsOf(SpikeWidthFormat v) {
  return v == SpikeWidthFormat::kWidth1Bit ? 1 : 8;
}

std::optional<WeightWidth> WeightWidthFromBits(std::int64_t bits) {
  for (WeightWidth w : kAllWeightWidths) {
    if (BitsOf(w) == bits) return w;
  }
  return std::nullopt;
}

}} // namespace pc::reg
