#include "reg/schema_registry.hpp"
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "common/hw_defs.hpp"
#include "common/reg_error.hpp"
#include "reg/layouts.hpp"

namespace pc { namespace reg {

namespace {

bool ValidWeightWidth(WeightWidth w) {
  for (WeightWidth k : kAllWeightWidths) {
    if (k == w) return true;
  }
  return false;
}

} // namespace

SchemaRegistry& SchemaRegistry::Default() {
  static SchemaRegistry reg;
  static const bool installed = [] {
    RegisterBuiltins(reg);
    return true;
  }();
  (void)installed;
  return reg;
}

void SchemaRegistry::RegisterBuiltins(SchemaRegistry& reg) {
  reg.Register(RegisterKind::kOfflineCore,
               [](const ModeFlags&) { return MakeOfflineCoreSchema(); });
  reg.Register(RegisterKind::kOnlineCore,
               [](const ModeFlags&) { return MakeOnlineCoreSchema(); });
  reg.Register(RegisterKind::kOfflineNeuron, [](const ModeFlags& f) {
    return MakeOfflineNeuronSchema(f.neuron_group_size);
  });
  reg.Register(RegisterKind::kOnlineNeuron, [](const ModeFlags& f) {
    return MakeOnlineNeuronSchema(f.weight_width, f.neuron_group_size);
  });
  reg.Register(RegisterKind::kOnlineNeuron1Bit, [](const ModeFlags& f) {
    return MakeOnlineNeuronSchema(WeightWidth::kWidth1Bit, f.neuron_group_size);
  });
}

void SchemaRegistry::Register(RegisterKind kind, SchemaFactory factory) {
  if (!factory) {
    throw std::invalid_argument("SchemaRegistry::Register: empty factory for " +
                                std::string(ToString(kind)));
  }
  {
    std::unique_lock<std::shared_mutex> lock(mu_);
    if (factories_.count(kind)) {
      throw std::invalid_argument("SchemaRegistry::Register: " + std::string(ToString(kind)) +
                                  " already registered");
    }
    factories_.emplace(kind, std::move(factory));
  }
  if (verbose_) std::cerr << "[Registry] registered layout " << ToString(kind) << "\n";
}

std::size_t SchemaRegistry::cached_schemas() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return cache_.size();
}

bool SchemaRegistry::Contains(RegisterKind kind) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return factories_.count(kind) != 0;
}

RegisterKind SchemaRegistry::ResolveKind(RegisterKind kind, const ModeFlags& flags) {
  if (!ValidWeightWidth(flags.weight_width)) {
    throw RegisterError(ErrorKind::kUnknownKind,
                        "weight width code " +
                            std::to_string(static_cast<unsigned>(flags.weight_width)) +
                            " has no layout");
  }
  const bool one_bit = (flags.weight_width == WeightWidth::kWidth1Bit);
  switch (kind) {
    case RegisterKind::kOnlineNeuron:
      return one_bit ? RegisterKind::kOnlineNeuron1Bit : RegisterKind::kOnlineNeuron;
    case RegisterKind::kOnlineNeuron1Bit:
      if (!one_bit) {
        throw RegisterError(ErrorKind::kUnknownKind,
                            std::string(ToString(kind)) + " requires 1-bit weights, got " +
                                ToString(flags.weight_width));
      }
      return kind;
    case RegisterKind::kOfflineCore:
    case RegisterKind::kOnlineCore:
    case RegisterKind::kOfflineNeuron:
      return kind;
  }
  throw RegisterError(ErrorKind::kUnknownKind, "unknown register kind");
}

std::shared_ptr<const RegisterSchema> SchemaRegistry::Resolve(RegisterKind kind,
                                                              const ModeFlags& flags) const {
  const RegisterKind resolved = ResolveKind(kind, flags);
  if (flags.neuron_group_size == 0) {
    throw std::invalid_argument("SchemaRegistry::Resolve: neuron_group_size must be > 0");
  }
  // Bounds the cache: at most one entry per group size a core can hold.
  if (IsNeuronKind(resolved) && flags.neuron_group_size > kNumNeuronMaxAnn) {
    throw RegisterError(ErrorKind::kArityMismatch,
                        "neuron group of " + std::to_string(flags.neuron_group_size) +
                            " exceeds the " + std::to_string(kNumNeuronMaxAnn) +
                            " neurons of one core");
  }

  // Only neuron layouts depend on the group; only online neurons on the weight width.
  ModeFlags eff = flags;
  if (!IsNeuronKind(resolved)) eff.neuron_group_size = 1;
  if (resolved != RegisterKind::kOnlineNeuron) eff.weight_width = WeightWidth::kWidth8Bit;
  const CacheKey key{resolved, static_cast<std::uint8_t>(eff.weight_width),
                     eff.neuron_group_size};

  SchemaFactory factory;
  {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto hit = cache_.find(key);
    if (hit != cache_.end()) return hit->second;

    auto it = factories_.find(resolved);
    if (it == factories_.end()) {
      throw RegisterError(ErrorKind::kUnknownKind,
                          "no layout registered for " + std::string(ToString(resolved)));
    }
    factory = it->second;
  }

  std::shared_ptr<const RegisterSchema> schema = factory(eff);
  if (!schema || schema->kind() != resolved) {
    throw std::logic_error("SchemaRegistry: factory for " + std::string(ToString(resolved)) +
                           " returned a mismatching schema");
  }

  std::unique_lock<std::shared_mutex> lock(mu_);
  // Another thread may have built it first; keep the first one.
  auto ins = cache_.emplace(key, std::move(schema));
  return ins.first->second;
}

}} // namespace pc::reg
