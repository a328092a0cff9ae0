// reg/reg_types.hpp
#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>

/* All comments are in English.
 * Closed enumerations of register and neuron RAM parameters (V2.1 manual,
 * Sections 2.4.1 / 2.4.2). The enumerator value is the register code.
 */

namespace pc { namespace reg {

// -----------------------------------------------------------------------------
// Register kinds
// -----------------------------------------------------------------------------
enum class RegisterKind : std::uint8_t {
  kOfflineCore,
  kOnlineCore,
  kOfflineNeuron,
  kOnlineNeuron,       // multi-bit weights, two neuron addresses (256 bits)
  kOnlineNeuron1Bit    // 1-bit weights, one neuron address (128 bits)
};

inline constexpr std::array<RegisterKind, 5> kAllRegisterKinds = {
  RegisterKind::kOfflineCore, RegisterKind::kOnlineCore, RegisterKind::kOfflineNeuron,
  RegisterKind::kOnlineNeuron, RegisterKind::kOnlineNeuron1Bit};

const char* ToString(RegisterKind kind);
std::optional<RegisterKind> ParseRegisterKind(const std::string& name);
bool IsNeuronKind(RegisterKind kind);

// -----------------------------------------------------------------------------
// Core register parameters
// -----------------------------------------------------------------------------

// Crossbar weight precision, 2-bit. Default 8-bit.
enum class WeightWidth : std::uint8_t {
  kWidth1Bit = 0,
  kWidth2Bit = 1,
  kWidth4Bit = 2,
  kWidth8Bit = 3
};
inline constexpr std::array<WeightWidth, 4> kAllWeightWidths = {
  WeightWidth::kWidth1Bit, WeightWidth::kWidth2Bit, WeightWidth::kWidth4Bit,
  WeightWidth::kWidth8Bit};

// Fan-in extension, 4-bit on offline cores. LCN_1X is 144x in ANN mode and
// 1152x in SNN/BANN mode.
enum class LcnExtension : std::uint8_t {
  kLcn1X  = 0,
  kLcn2X  = 1,
  kLcn4X  = 2,
  kLcn8X  = 3,
  kLcn16X = 4,
  kLcn32X = 5,
  kLcn64X = 6
};
inline constexpr std::array<LcnExtension, 7> kAllLcnExtensions = {
  LcnExtension::kLcn1X, LcnExtension::kLcn2X, LcnExtension::kLcn4X, LcnExtension::kLcn8X,
  LcnExtension::kLcn16X, LcnExtension::kLcn32X, LcnExtension::kLcn64X};

enum class InputWidthFormat : std::uint8_t { kWidth1Bit = 0, kWidth8Bit = 1 };
enum class SpikeWidthFormat : std::uint8_t { kWidth1Bit = 0, kWidth8Bit = 1 };
inline constexpr std::array<InputWidthFormat, 2> kAllInputWidths = {
  InputWidthFormat::kWidth1Bit, InputWidthFormat::kWidth8Bit};
inline constexpr std::array<SpikeWidthFormat, 2> kAllSpikeWidths = {
  SpikeWidthFormat::kWidth1Bit, SpikeWidthFormat::kWidth8Bit};

// Shared by every 1-bit enable flag (pool_max, SNN_EN, online random enables).
enum class EnableFlag : std::uint8_t { kDisable = 0, kEnable = 1 };
inline constexpr std::array<EnableFlag, 2> kAllEnableFlags = {
  EnableFlag::kDisable, EnableFlag::kEnable};

using MaxPoolingEnable = EnableFlag;
using SnnModeEnable    = EnableFlag;

// Online cores: order of leakage relative to integration, 1-bit.
enum class LeakageOrder : std::uint8_t { kLeakBeforeIntegration = 0, kLeakAfterIntegration = 1 };
inline constexpr std::array<LeakageOrder, 2> kAllLeakageOrders = {
  LeakageOrder::kLeakBeforeIntegration, LeakageOrder::kLeakAfterIntegration};

/* Working mode of an offline core, decided by (input_width, spike_width, SNN_EN).
 *
 *   Mode                        input_width  spike_width  SNN_EN
 *   BANN                             0            0         0
 *   SNN                              0            0         1
 *   BANN/SNN to ANN                  0            1         0
 *   BANN/SNN to SNN with values      0            1         1
 *   ANN to BANN/SNN                  1            0         0
 *   ANN                              1            1         0
 */
enum class CoreMode : std::uint8_t {
  kBann,
  kSnn,
  kBannOrSnnToAnn,
  kBannOrSnnToSnn,
  kAnnToBannOrSnn,
  kAnn
};

std::optional<CoreMode> GetCoreMode(InputWidthFormat iw, SpikeWidthFormat sw, SnnModeEnable snn);
bool IsSnn(CoreMode mode);

// -----------------------------------------------------------------------------
// Neuron RAM parameters
// -----------------------------------------------------------------------------

// Same as `reset_mode` in V2.1. 2-bit.
enum class ResetMode : std::uint8_t { kNormal = 0, kLinear = 1, kNonReset = 2 };
inline constexpr std::array<ResetMode, 3> kAllResetModes = {
  ResetMode::kNormal, ResetMode::kLinear, ResetMode::kNonReset};

// Same as `leak_post` in V2.1.
enum class LeakComparisonMode : std::uint8_t { kLeakBeforeComp = 0, kLeakAfterComp = 1 };
inline constexpr std::array<LeakComparisonMode, 2> kAllLeakComparisonModes = {
  LeakComparisonMode::kLeakBeforeComp, LeakComparisonMode::kLeakAfterComp};

// Same as `threshold_neg_mode` in V2.1.
enum class NegativeThresholdMode : std::uint8_t { kReset = 0, kSaturation = 1 };
inline constexpr std::array<NegativeThresholdMode, 2> kAllNegativeThresholdModes = {
  NegativeThresholdMode::kReset, NegativeThresholdMode::kSaturation};

// Same as `leak_reversal_flag` in V2.1.
enum class LeakDirectionMode : std::uint8_t { kForward = 0, kReversal = 1 };
inline constexpr std::array<LeakDirectionMode, 2> kAllLeakDirectionModes = {
  LeakDirectionMode::kForward, LeakDirectionMode::kReversal};

// Same as `leak_det_stoch` in V2.1.
enum class LeakIntegrationMode : std::uint8_t { kDeterministic = 0, kStochastic = 1 };
inline constexpr std::array<LeakIntegrationMode, 2> kAllLeakIntegrationModes = {
  LeakIntegrationMode::kDeterministic, LeakIntegrationMode::kStochastic};

// Same as `weight_det_stoch` in V2.1.
enum class SynapticIntegrationMode : std::uint8_t { kDeterministic = 0, kStochastic = 1 };
inline constexpr std::array<SynapticIntegrationMode, 2> kAllSynapticIntegrationModes = {
  SynapticIntegrationMode::kDeterministic, SynapticIntegrationMode::kStochastic};

// -----------------------------------------------------------------------------
// Labels and semantic values
// -----------------------------------------------------------------------------
const char* ToString(WeightWidth v);
const char* ToString(LcnExtension v);
const char* ToString(InputWidthFormat v);
const char* ToString(SpikeWidthFormat v);
const char* ToString(EnableFlag v);
const char* ToString(LeakageOrder v);
const char* ToString(CoreMode v);
const char* ToString(ResetMode v);
const char* ToString(LeakComparisonMode v);
const char* ToString(NegativeThresholdMode v);
const char* ToString(LeakDirectionMode v);
const char* ToString(LeakIntegrationMode v);
const char* ToString(SynapticIntegrationMode v);

// Width and LCN fields carry their semantic value in models (8 for 8-bit
// weights, 4 for LCN_4X); the register holds the enumerator code.
std::int64_t BitsOf(WeightWidth v);
std::int64_t FactorOf(LcnExtension v);
std::int64_t BitsOf(InputWidthFormat v);
std::int64_t BitsOf(SpikeWidthFormat v);

std::optional<WeightWidth> WeightWidthFromBits(std::int64_t bits);

}} // namespace pc::reg
