// reg/layouts.hpp
#pragma once
#include <cstddef>
#include <memory>

#include "reg/register_schema.hpp"
#include "reg/reg_types.hpp"

/* All comments are in English.
 * Built-in register layouts. Each factory returns a fresh schema; the
 * registry caches them per (kind, variant, group size).
 *
 *   kind                 bits  payload split
 *   offline core          90   3 x 30-bit frame payloads, MSB first
 *   online core          192   3 x 64-bit packages
 *   offline neuron       256   4 x 64-bit RAM packages, LSB first (214 used)
 *   online neuron 1-bit  128   one neuron address
 *   online neuron n-bit  256   two neuron addresses
 */

namespace pc { namespace reg {

inline constexpr unsigned kOfflineCoreLayoutVersion   = 1;
inline constexpr unsigned kOnlineCoreLayoutVersion    = 1;
inline constexpr unsigned kOfflineNeuronLayoutVersion = 1;
inline constexpr unsigned kOnlineNeuronLayoutVersion  = 1;

std::shared_ptr<const RegisterSchema> MakeOfflineCoreSchema();
std::shared_ptr<const RegisterSchema> MakeOnlineCoreSchema();
std::shared_ptr<const RegisterSchema> MakeOfflineNeuronSchema(std::size_t group_size = 1);

// 1-bit weights select the 128-bit layout, any other precision the 256-bit one.
std::shared_ptr<const RegisterSchema> MakeOnlineNeuronSchema(WeightWidth weight_width,
                                                             std::size_t group_size = 1);

}} // namespace pc::reg
