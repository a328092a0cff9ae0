// common/hw_defs.hpp
#pragma once
// All comments are in English.

#include <cstddef>
#include <cstdint>

namespace pc {

// -----------------------------------------------------------------------------
// Chip / core coordinates
// -----------------------------------------------------------------------------
inline constexpr unsigned kCoreXBits = 5;
inline constexpr unsigned kCoreYBits = 5;
inline constexpr unsigned kChipXBits = 5;
inline constexpr unsigned kChipYBits = 5;
inline constexpr unsigned kChipAddrBits = kChipXBits + kChipYBits;  // test_chip_addr

inline constexpr std::size_t kNumCoreMaxInChip = 1024;
inline constexpr std::size_t kNumCoreOffline   = 1008;
inline constexpr std::size_t kNumCoreOnline    = kNumCoreMaxInChip - kNumCoreOffline;

// -----------------------------------------------------------------------------
// Dendrites / axons
// -----------------------------------------------------------------------------
inline constexpr std::int64_t kFanInPerDendriteMax = 1152;
inline constexpr std::int64_t kFanInPerDendriteAnn = 144;   // 8-bit input
inline constexpr std::int64_t kNumDendriteMaxSnn   = 512;
inline constexpr std::int64_t kNumDendriteMaxAnn   = 4096;
inline constexpr std::int64_t kAddrAxonMax         = kFanInPerDendriteMax - 1;
inline constexpr std::int64_t kNumTimeslotMax      = 256;

// Neurons of one core; also the largest neuron group a schema may carry.
inline constexpr std::size_t kNumNeuronMaxSnn = 512;
inline constexpr std::size_t kNumNeuronMaxAnn = 1888;

// -----------------------------------------------------------------------------
// Frame payloads (consumed by the frame layer, not built here)
// -----------------------------------------------------------------------------
inline constexpr std::size_t kFramePayloadBits = 30;  // core parameter register frames
inline constexpr std::size_t kRamPackageBits   = 64;  // neuron RAM packages

// -----------------------------------------------------------------------------
// Register widths per kind
// -----------------------------------------------------------------------------
inline constexpr std::size_t kOfflineCoreRegBits      = 3 * kFramePayloadBits;  // 90
inline constexpr std::size_t kOnlineCoreRegBits       = 3 * kRamPackageBits;    // 192
inline constexpr std::size_t kOfflineNeuronRamBits    = 4 * kRamPackageBits;    // 256, 214 used
inline constexpr std::size_t kOnlineNeuronSlotBits    = 2 * kRamPackageBits;    // one neuron address
inline constexpr std::size_t kOnlineNeuronRamBits1Bit = kOnlineNeuronSlotBits;      // 128
inline constexpr std::size_t kOnlineNeuronRamBitsNBit = 2 * kOnlineNeuronSlotBits;  // 256

// -----------------------------------------------------------------------------
// Sanity checks
// -----------------------------------------------------------------------------
static_assert(kNumCoreOnline == 16, "online core count must be 16");
static_assert(kOfflineCoreRegBits % kFramePayloadBits == 0, "core register must split into payloads");
static_assert(kOfflineNeuronRamBits % kRamPackageBits == 0, "neuron RAM must split into packages");
static_assert(kOnlineNeuronRamBitsNBit == 2 * kOnlineNeuronRamBits1Bit,
              "multi-bit online neuron uses two neuron addresses");

} // namespace pc
