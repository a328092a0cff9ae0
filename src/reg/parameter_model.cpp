#include "reg/parameter_model.hpp"
#include <initializer_list>
#include <iostream>
#include <stdexcept>

#include "common/hw_defs.hpp"
#include "common/reg_error.hpp"

namespace pc { namespace reg {

namespace {

bool HasFields(const RegisterSchema& s, std::initializer_list<const char*> names) {
  for (const char* n : names) {
    if (!s.names().Contains(n)) return false;
  }
  return true;
}

std::size_t IndexByName(const RegisterSchema& s, const std::string& name) {
  return s.IndexOf(s.names().ToModelName(name));
}

std::uint64_t CodeOf(const RegisterSchema& s, const std::vector<FieldValues>& v,
                     const std::string& model) {
  const std::size_t i = s.IndexOf(model);
  return s.fields()[i].Encode(v[i].front());
}

bool Flagged(const std::vector<Violation>& prior, const std::string& field) {
  for (const auto& v : prior) {
    if (v.field == field) return true;
  }
  return false;
}

std::int64_t ValueOf(const RegisterSchema& s, const std::vector<FieldValues>& v,
                     const std::string& model) {
  return v[s.IndexOf(model)].front();
}

} // namespace

ParameterModel ParameterModel::FromNamedValues(std::shared_ptr<const RegisterSchema> schema,
                                               const NamedValues& values,
                                               std::vector<Violation> prior) {
  if (!schema) throw std::invalid_argument("ParameterModel: null schema");
  const RegisterSchema& s = *schema;
  const auto& fields = s.fields();
  const std::size_t group = s.neuron_group_size();

  // Name resolution first: an unknown name aborts the whole pass.
  std::vector<const FieldInput*> given(fields.size(), nullptr);
  std::vector<std::string>       given_as(fields.size());
  std::vector<Violation>         violations = prior;
  for (const auto& kv : values) {
    const std::size_t i = IndexByName(s, kv.first);
    if (given[i]) {
      violations.push_back({fields[i].model_name(), ErrorKind::kValidationError,
                            "given as both '" + given_as[i] + "' and '" + kv.first + "'"});
      continue;
    }
    given[i]    = &kv.second;
    given_as[i] = kv.first;
  }

  std::vector<FieldValues> stored(fields.size());
  for (std::size_t i = 0; i < fields.size(); ++i) {
    const FieldDescriptor& f = fields[i];
    if (f.reserved()) {
      stored[i] = {0};
      continue;
    }
    if (Flagged(prior, f.model_name())) continue;
    if (!given[i]) {
      if (f.has_default()) {
        stored[i] = f.Expand(FieldInput(f.default_value()), group);
      } else {
        violations.push_back({f.model_name(), ErrorKind::kMissingField,
                              "required field '" + f.manual_name() + "' not supplied"});
      }
      continue;
    }

    if (auto v = f.Validate(*given[i], group)) {
      violations.push_back(*v);
      continue;
    }
    FieldValues expanded = f.Expand(*given[i], group);
    if (f.read_only()) {
      bool at_default = true;
      for (std::int64_t x : expanded) at_default = at_default && (x == f.default_value());
      if (!at_default) {
        violations.push_back(*f.CheckWritable());
        continue;
      }
    }
    stored[i] = std::move(expanded);
  }

  if (violations.empty()) CheckCrossField(s, stored, /*coerce=*/true, violations);
  if (!violations.empty()) throw RegisterError(std::move(violations));
  return ParameterModel(std::move(schema), std::move(stored));
}

ParameterModel ParameterModel::FromNamedValues(RegisterKind kind,
                                               const NamedValues& values,
                                               const ModeFlags& flags,
                                               const SchemaRegistry& registry) {
  ModeFlags eff = flags;
  NamedValues rest = values;

  if (kind == RegisterKind::kOnlineNeuron || kind == RegisterKind::kOnlineNeuron1Bit) {
    if (kind == RegisterKind::kOnlineNeuron1Bit) eff.weight_width = WeightWidth::kWidth1Bit;
    for (const char* key : {"weight_width", "bit_select"}) {
      auto it = rest.find(key);
      if (it == rest.end()) continue;
      std::optional<WeightWidth> w;
      if (!it->second.is_array()) w = WeightWidthFromBits(it->second.values().front());
      if (!w) {
        throw RegisterError(ErrorKind::kUnknownKind,
                            std::string("no online neuron layout for '") + key +
                                "': expected a weight width of 1, 2, 4 or 8 bits");
      }
      eff.weight_width = *w;
      rest.erase(it);
    }
  }
  return FromNamedValues(registry.Resolve(kind, eff), rest);
}

ParameterModel ParameterModel::FromFieldValues(std::shared_ptr<const RegisterSchema> schema,
                                               std::vector<FieldValues> values,
                                               std::vector<Violation> prior) {
  if (!schema) throw std::invalid_argument("ParameterModel: null schema");
  const RegisterSchema& s = *schema;
  const auto& fields = s.fields();
  const std::size_t group = s.neuron_group_size();

  if (values.size() != fields.size()) {
    throw RegisterError(ErrorKind::kLengthMismatch,
                        "expected " + std::to_string(fields.size()) + " field values, got " +
                            std::to_string(values.size()));
  }

  std::vector<Violation> violations = prior;
  for (std::size_t i = 0; i < fields.size(); ++i) {
    const FieldDescriptor& f = fields[i];
    if (f.reserved()) {
      values[i] = {0};
      continue;
    }
    if (Flagged(prior, f.model_name())) continue;
    const std::size_t want = f.array_valued() ? group : 1;
    if (values[i].size() != want) {
      violations.push_back({f.model_name(), ErrorKind::kArityMismatch,
                            "expected " + std::to_string(want) + " elements, got " +
                                std::to_string(values[i].size())});
      continue;
    }
    FieldInput in = f.array_valued() ? FieldInput(values[i]) : FieldInput(values[i].front());
    if (auto v = f.Validate(in, group)) violations.push_back(*v);
  }

  if (violations.empty()) CheckCrossField(s, values, /*coerce=*/false, violations);
  if (!violations.empty()) throw RegisterError(std::move(violations));
  return ParameterModel(std::move(schema), std::move(values));
}

void ParameterModel::CheckCrossField(const RegisterSchema& s,
                                     std::vector<FieldValues>& v,
                                     bool coerce,
                                     std::vector<Violation>& out) {
  switch (s.kind()) {
    case RegisterKind::kOfflineCore: {
      if (!HasFields(s, {"input_width_format", "spike_width_format", "snn_mode_en",
                         "num_dendrite", "max_pooling_en"})) {
        return;
      }
      const auto iw  = static_cast<InputWidthFormat>(CodeOf(s, v, "input_width_format"));
      const auto sw  = static_cast<SpikeWidthFormat>(CodeOf(s, v, "spike_width_format"));
      const auto snn = static_cast<SnnModeEnable>(CodeOf(s, v, "snn_mode_en"));

      if (!GetCoreMode(iw, sw, snn)) {
        out.push_back({"snn_mode_en", ErrorKind::kValidationError,
                       "SNN mode cannot take 8-bit input"});
        return;
      }

      const bool ann = (iw == InputWidthFormat::kWidth8Bit) || (snn == EnableFlag::kDisable);
      const std::int64_t limit = ann ? kNumDendriteMaxAnn : kNumDendriteMaxSnn;
      const std::int64_t nd = ValueOf(s, v, "num_dendrite");
      if (nd > limit) {
        out.push_back({"num_dendrite", ErrorKind::kOutOfRange,
                       "value " + std::to_string(nd) + " exceeds " + std::to_string(limit) +
                           " dendrites in " + (ann ? "ANN" : "SNN") + " mode"});
      }

      // Max pooling only exists for 8-bit input.
      const std::size_t pool = s.IndexOf("max_pooling_en");
      if (coerce && iw == InputWidthFormat::kWidth1Bit &&
          v[pool].front() == static_cast<std::int64_t>(EnableFlag::kEnable)) {
        std::cerr << "[ParameterModel][Warn] max_pooling_en forced to DISABLE with 1-bit input\n";
        v[pool].front() = static_cast<std::int64_t>(EnableFlag::kDisable);
      }
      return;
    }

    case RegisterKind::kOnlineCore: {
      if (HasFields(s, {"lower_weight", "upper_weight"}) &&
          ValueOf(s, v, "lower_weight") > ValueOf(s, v, "upper_weight")) {
        out.push_back({"lower_weight", ErrorKind::kValidationError,
                       "lower_weight " + std::to_string(ValueOf(s, v, "lower_weight")) +
                           " above upper_weight " +
                           std::to_string(ValueOf(s, v, "upper_weight"))});
      }
      if (HasFields(s, {"neuron_start", "neuron_end"}) &&
          ValueOf(s, v, "neuron_start") > ValueOf(s, v, "neuron_end")) {
        out.push_back({"neuron_start", ErrorKind::kValidationError,
                       "neuron_start " + std::to_string(ValueOf(s, v, "neuron_start")) +
                           " after neuron_end " + std::to_string(ValueOf(s, v, "neuron_end"))});
      }
      return;
    }

    case RegisterKind::kOnlineNeuron:
      if (HasFields(s, {"plasticity_start", "plasticity_end"}) &&
          ValueOf(s, v, "plasticity_start") > ValueOf(s, v, "plasticity_end")) {
        out.push_back({"plasticity_start", ErrorKind::kValidationError,
                       "plasticity window starts after it ends"});
      }
      return;

    // addr_axon is bounded by its domain.
    case RegisterKind::kOfflineNeuron:
    case RegisterKind::kOnlineNeuron1Bit:
      return;
  }
}

const FieldValues& ParameterModel::GetArray(const std::string& name) const {
  return values_[IndexByName(*schema_, name)];
}

std::int64_t ParameterModel::Get(const std::string& name) const {
  const FieldValues& v = GetArray(name);
  if (v.size() != 1) {
    throw RegisterError(ErrorKind::kArityMismatch,
                        "'" + name + "' holds " + std::to_string(v.size()) +
                            " values; use GetArray");
  }
  return v.front();
}

void ParameterModel::Set(const std::string& name, const FieldInput& value) {
  const std::size_t i = IndexByName(*schema_, name);
  const FieldDescriptor& f = schema_->fields()[i];

  if (auto v = f.CheckWritable()) {
    throw RegisterError(v->kind, v->field + ": " + v->message);
  }
  if (auto v = f.Validate(value, schema_->neuron_group_size())) {
    throw RegisterError(v->kind, v->field + ": " + v->message);
  }

  std::vector<FieldValues> next = values_;
  next[i] = f.Expand(value, schema_->neuron_group_size());

  std::vector<Violation> violations;
  CheckCrossField(*schema_, next, /*coerce=*/true, violations);
  if (!violations.empty()) throw RegisterError(std::move(violations));
  values_ = std::move(next);
}

nlohmann::json ParameterModel::Export() const {
  nlohmann::json out = nlohmann::json::object();
  const bool grouped = schema_->neuron_group_size() > 1;
  const auto& fields = schema_->fields();
  for (std::size_t i = 0; i < fields.size(); ++i) {
    const FieldDescriptor& f = fields[i];
    if (f.reserved()) continue;
    if (f.array_valued() && grouped) out[f.export_key()] = values_[i];
    else                             out[f.export_key()] = values_[i].front();
  }
  return out;
}

NamedValues ParameterModel::ToNamedValues() const {
  NamedValues out;
  const bool grouped = schema_->neuron_group_size() > 1;
  const auto& fields = schema_->fields();
  for (std::size_t i = 0; i < fields.size(); ++i) {
    const FieldDescriptor& f = fields[i];
    if (f.reserved()) continue;
    if (f.array_valued() && grouped) out.emplace(f.model_name(), FieldInput(values_[i]));
    else                             out.emplace(f.model_name(), FieldInput(values_[i].front()));
  }
  return out;
}

std::optional<CoreMode> ParameterModel::core_mode() const {
  if (schema_->kind() != RegisterKind::kOfflineCore) return std::nullopt;
  return GetCoreMode(GetAs<InputWidthFormat>("input_width_format"),
                     GetAs<SpikeWidthFormat>("spike_width_format"),
                     GetAs<SnnModeEnable>("snn_mode_en"));
}

bool ParameterModel::operator==(const ParameterModel& o) const {
  if (schema_ != o.schema_) {
    const RegisterSchema& a = *schema_;
    const RegisterSchema& b = *o.schema_;
    if (a.kind() != b.kind() || a.variant() != b.variant() || a.version() != b.version() ||
        a.neuron_group_size() != b.neuron_group_size()) {
      return false;
    }
  }
  return values_ == o.values_;
}

}} // namespace pc::reg
