#include "io/json_config.hpp"
#include <cstdint>
#include <fstream>
#include <limits>
#include <initializer_list>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include "common/hw_defs.hpp"
#include "common/reg_error.hpp"
#include "reg/reg_types.hpp"

using nlohmann::json;

namespace pc { namespace io {

namespace {

const char* const kMetaKeys[] = {"kind", "name", "neuron_group_size"};

bool IsMetaKey(const std::string& key) {
  for (const char* k : kMetaKeys) {
    if (key == k) return true;
  }
  return false;
}

// One JSON scalar -> field value. nullopt (with `why` set) if unusable.
std::optional<std::int64_t> ScalarValue(const json& v, const reg::FieldDescriptor& f,
                                        std::string& why) {
  if (v.is_boolean()) return v.get<bool>() ? 1 : 0;
  if (v.is_number_unsigned()) {
    const std::uint64_t u = v.get<std::uint64_t>();
    if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      why = "value " + v.dump() + " exceeds the signed 64-bit range";
      return std::nullopt;
    }
    return static_cast<std::int64_t>(u);
  }
  if (v.is_number_integer()) return v.get<std::int64_t>();
  if (v.is_string()) {
    const std::string label = v.get<std::string>();
    if (auto x = f.ValueOfLabel(label)) return x;
    why = "unknown label '" + label + "'";
    return std::nullopt;
  }
  why = "expects an integer or a label, got " + v.dump();
  return std::nullopt;
}

reg::WeightWidth ParseWeightWidth(const json& v, const std::string& key) {
  if (v.is_string()) {
    const std::string label = v.get<std::string>();
    for (reg::WeightWidth w : reg::kAllWeightWidths) {
      if (label == reg::ToString(w)) return w;
    }
  } else if (v.is_number_integer()) {
    if (auto w = reg::WeightWidthFromBits(v.get<std::int64_t>())) return *w;
  }
  throw RegisterError(ErrorKind::kUnknownKind,
                      "no online neuron layout for '" + key + "' = " + v.dump());
}

std::size_t ParseGroupSize(const json& block) {
  if (!block.contains("neuron_group_size")) return 1;
  const json& v = block.at("neuron_group_size");
  std::uint64_t n = 0;
  if (v.is_number_unsigned()) {
    n = v.get<std::uint64_t>();
  } else if (v.is_number_integer() && v.get<std::int64_t>() > 0) {
    n = static_cast<std::uint64_t>(v.get<std::int64_t>());
  }
  if (n >= 1 && n <= kNumNeuronMaxAnn) return static_cast<std::size_t>(n);
  throw RegisterError(ErrorKind::kArityMismatch,
                      "neuron_group_size must be an integer in 1.." +
                          std::to_string(kNumNeuronMaxAnn) + ", got " + v.dump());
}

// Unusable values become violations instead of entries of the result.
reg::NamedValues CollectNamedValues(const json& block, const reg::RegisterSchema& schema,
                                    std::vector<Violation>& violations) {
  reg::NamedValues out;
  for (auto it = block.begin(); it != block.end(); ++it) {
    const std::string& key = it.key();
    if (IsMetaKey(key)) continue;

    // Unknown names are structural.
    const reg::FieldDescriptor& f = schema.Field(key);
    const json& v = it.value();
    std::string why;

    if (v.is_array()) {
      std::vector<std::int64_t> elems;
      bool ok = true;
      for (const auto& e : v) {
        auto x = ScalarValue(e, f, why);
        if (!x) { ok = false; break; }
        elems.push_back(*x);
      }
      if (ok) out.emplace(key, reg::FieldInput(std::move(elems)));
      else    violations.push_back({f.model_name(), ErrorKind::kOutOfRange, why});
      continue;
    }

    if (auto x = ScalarValue(v, f, why)) out.emplace(key, reg::FieldInput(*x));
    else                                 violations.push_back({f.model_name(), ErrorKind::kOutOfRange, why});
  }
  return out;
}

} // namespace

json ReadJsonFile(const std::string& path) {
  std::ifstream ifs(path);
  if (!ifs) throw std::runtime_error("ReadJsonFile: cannot open " + path);
  json j;
  try {
    ifs >> j;
  } catch (const json::parse_error& e) {
    throw std::runtime_error("ReadJsonFile: " + path + ": " + e.what());
  }
  return j;
}

void WriteJsonFile(const std::string& path, const json& j) {
  std::ofstream ofs(path);
  if (!ofs) throw std::runtime_error("WriteJsonFile: cannot open " + path);
  ofs << j.dump(2) << "\n";
  if (!ofs) throw std::runtime_error("WriteJsonFile: write failed for " + path);
}

reg::NamedValues ToNamedValues(const json& block, const reg::RegisterSchema& schema) {
  if (!block.is_object()) {
    throw std::invalid_argument("ToNamedValues: register block must be a JSON object");
  }

  std::vector<Violation> violations;
  reg::NamedValues out = CollectNamedValues(block, schema, violations);
  if (!violations.empty()) throw RegisterError(std::move(violations));
  return out;
}

reg::ParameterModel LoadModel(const json& block, const reg::SchemaRegistry& registry) {
  if (!block.is_object()) {
    throw std::invalid_argument("LoadModel: register block must be a JSON object");
  }

  reg::RegisterKind kind = reg::RegisterKind::kOfflineCore;
  if (block.contains("kind")) {
    const json& k_json = block.at("kind");
    if (!k_json.is_string()) {
      throw RegisterError(ErrorKind::kUnknownKind, "register kind must be a name, got " + k_json.dump());
    }
    const std::string name = k_json.get<std::string>();
    auto k = reg::ParseRegisterKind(name);
    if (!k) throw RegisterError(ErrorKind::kUnknownKind, "unknown register kind '" + name + "'");
    kind = *k;
  }

  reg::ModeFlags flags;
  flags.neuron_group_size = ParseGroupSize(block);

  // Online neurons take the core's weight precision from the block; it is not
  // one of their fields.
  json values = block;
  if (kind == reg::RegisterKind::kOnlineNeuron || kind == reg::RegisterKind::kOnlineNeuron1Bit) {
    if (kind == reg::RegisterKind::kOnlineNeuron1Bit) {
      flags.weight_width = reg::WeightWidth::kWidth1Bit;
    }
    for (const char* key : {"weight_width", "bit_select"}) {
      if (!values.contains(key)) continue;
      flags.weight_width = ParseWeightWidth(values.at(key), key);
      values.erase(std::string(key));
    }
  }

  auto schema = registry.Resolve(kind, flags);
  // Unusable values are reported together with the model's own checks.
  std::vector<Violation> violations;
  reg::NamedValues named = CollectNamedValues(values, *schema, violations);
  return reg::ParameterModel::FromNamedValues(std::move(schema), named, std::move(violations));
}

std::map<std::string, reg::ParameterModel> LoadModels(const std::string& path,
                                                      const reg::SchemaRegistry& registry) {
  const json j = ReadJsonFile(path);
  if (!j.is_object()) {
    throw std::runtime_error("LoadModels: " + path + " must hold a JSON object");
  }

  // A map of named blocks has only object values; a single block has none.
  bool all_objects = !j.empty();
  for (const auto& v : j) all_objects = all_objects && v.is_object();

  std::map<std::string, reg::ParameterModel> out;
  if (all_objects) {
    for (auto it = j.begin(); it != j.end(); ++it) {
      out.emplace(it.key(), LoadModel(it.value(), registry));
    }
  } else {
    out.emplace(j.value("name", std::string("default")), LoadModel(j, registry));
  }

  std::cout << "[JsonConfig] loaded " << out.size() << " register block(s) from " << path << "\n";
  return out;
}

void SaveExport(const std::string& path,
                const std::map<std::string, reg::ParameterModel>& models) {
  json j = json::object();
  for (const auto& kv : models) j[kv.first] = kv.second.Export();
  WriteJsonFile(path, j);
  std::cout << "[JsonConfig] export of " << models.size() << " register block(s) written to "
            << path << "\n";
}

}} // namespace pc::io
