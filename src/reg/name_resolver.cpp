#include "reg/name_resolver.hpp"
#include <stdexcept>

#include "common/reg_error.hpp"

namespace pc { namespace reg {

NameResolver::NameResolver(const std::vector<FieldDescriptor>& fields) {
  for (const auto& f : fields) Add(f);
}

void NameResolver::Bind(const std::string& alias, const std::string& model_name) {
  auto it = any_to_model_.find(alias);
  if (it != any_to_model_.end()) {
    if (it->second != model_name) {
      throw std::invalid_argument("NameResolver: '" + alias + "' maps to both '" +
                                  it->second + "' and '" + model_name + "'");
    }
    return;
  }
  any_to_model_.emplace(alias, model_name);
}

void NameResolver::Add(const FieldDescriptor& f) {
  if (f.reserved()) return;
  const std::string& model = f.model_name();
  if (model_to_export_.count(model)) {
    throw std::invalid_argument("NameResolver: duplicate model name '" + model + "'");
  }

  Bind(model, model);
  Bind(f.manual_name(), model);
  for (const auto& legacy : f.legacy_names()) Bind(legacy, model);
  Bind(f.export_key(), model);

  if (export_to_model_.count(f.export_key())) {
    throw std::invalid_argument("NameResolver: duplicate export key '" + f.export_key() + "'");
  }
  model_to_export_.emplace(model, f.export_key());
  export_to_model_.emplace(f.export_key(), model);
  model_to_manual_.emplace(model, f.manual_name());
}

const std::string& NameResolver::ToModelName(const std::string& name) const {
  auto it = any_to_model_.find(name);
  if (it == any_to_model_.end()) {
    throw RegisterError(ErrorKind::kUnknownName, "no field named '" + name + "'");
  }
  return it->second;
}

std::optional<std::string> NameResolver::TryModelName(const std::string& name) const {
  auto it = any_to_model_.find(name);
  if (it == any_to_model_.end()) return std::nullopt;
  return it->second;
}

const std::string& NameResolver::ToExportKey(const std::string& model_name) const {
  auto it = model_to_export_.find(model_name);
  if (it == model_to_export_.end()) {
    throw RegisterError(ErrorKind::kUnknownName, "no model name '" + model_name + "'");
  }
  return it->second;
}

const std::string& NameResolver::FromExportKey(const std::string& export_key) const {
  auto it = export_to_model_.find(export_key);
  if (it == export_to_model_.end()) {
    throw RegisterError(ErrorKind::kUnknownName, "no export key '" + export_key + "'");
  }
  return it->second;
}

const std::string& NameResolver::ToManualName(const std::string& model_name) const {
  auto it = model_to_manual_.find(model_name);
  if (it == model_to_manual_.end()) {
    throw RegisterError(ErrorKind::kUnknownName, "no model name '" + model_name + "'");
  }
  return it->second;
}

}} // namespace pc::reg
