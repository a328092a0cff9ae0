// reg/schema_registry.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <tuple>
#include <unordered_map>

#include "reg/register_schema.hpp"
#include "reg/reg_types.hpp"

namespace pc { namespace reg {

// Mode information needed to pick a concrete layout.
struct ModeFlags {
  WeightWidth weight_width      = WeightWidth::kWidth8Bit;  // of the owning core
  std::size_t neuron_group_size = 1;
};

using SchemaFactory = std::function<std::shared_ptr<const RegisterSchema>(const ModeFlags&)>;

/**
 * SchemaRegistry
 * Maps (kind, resolved variant) to a layout factory and caches the schemas it
 * builds. Factories are registered once and read many times: Resolve takes a
 * shared lock, Register an exclusive one.
 *
 * The online neuron width depends on the core's weight precision, so
 * kOnlineNeuron resolves to kOnlineNeuron1Bit when the precision is 1-bit.
 */
class SchemaRegistry {
public:
  // `verbose` logs each registration on std::cerr.
  explicit SchemaRegistry(bool verbose = false) : verbose_(verbose) {}
  SchemaRegistry(const SchemaRegistry&) = delete;
  SchemaRegistry& operator=(const SchemaRegistry&) = delete;

  // Process-wide registry with the built-in layouts installed on first use.
  static SchemaRegistry& Default();

  // Installs the five built-in layouts.
  static void RegisterBuiltins(SchemaRegistry& reg);

  // Throws std::invalid_argument if `kind` already has a factory.
  void Register(RegisterKind kind, SchemaFactory factory);

  bool Contains(RegisterKind kind) const;

  // Throws RegisterError(kUnknownKind) if no layout exists for kind/flags and
  // RegisterError(kArityMismatch) for a neuron group larger than one core.
  std::shared_ptr<const RegisterSchema> Resolve(RegisterKind kind,
                                                const ModeFlags& flags = ModeFlags{}) const;

  // Kind whose layout serves `kind` under `flags`.
  static RegisterKind ResolveKind(RegisterKind kind, const ModeFlags& flags);

  std::size_t cached_schemas() const;

private:
  // (resolved kind, weight width code, group size)
  using CacheKey = std::tuple<RegisterKind, std::uint8_t, std::size_t>;

  bool                                              verbose_ = false;
  mutable std::shared_mutex                         mu_;
  std::unordered_map<RegisterKind, SchemaFactory>   factories_;
  mutable std::map<CacheKey, std::shared_ptr<const RegisterSchema>> cache_;
};

}} // namespace pc::reg
