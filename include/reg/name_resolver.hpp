// reg/name_resolver.hpp
#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "reg/field_descriptor.hpp"

namespace pc { namespace reg {

/**
 * NameResolver
 * Translates between the three vocabularies of a schema:
 *   - manual names (canonical and legacy, e.g. "bit_select" / "weight_width")
 *   - model names (one canonical identity per field)
 *   - export keys (dictionary keys of Export())
 *
 * Built once per schema; read-only afterwards.
 */
class NameResolver {
public:
  NameResolver() = default;
  explicit NameResolver(const std::vector<FieldDescriptor>& fields);

  // Registers every name of `f`. Reserved fields are skipped. Throws
  // std::invalid_argument if a name already maps to another field.
  void Add(const FieldDescriptor& f);

  // Manual (canonical or legacy), model or export name -> model name.
  // Throws RegisterError(kUnknownName).
  const std::string& ToModelName(const std::string& name) const;
  std::optional<std::string> TryModelName(const std::string& name) const;

  const std::string& ToExportKey(const std::string& model_name) const;
  const std::string& FromExportKey(const std::string& export_key) const;

  // Always the canonical manual name.
  const std::string& ToManualName(const std::string& model_name) const;

  bool Contains(const std::string& name) const { return any_to_model_.count(name) != 0; }
  std::size_t size() const { return model_to_export_.size(); }

private:
  void Bind(const std::string& alias, const std::string& model_name);

  std::unordered_map<std::string, std::string> any_to_model_;
  std::unordered_map<std::string, std::string> model_to_export_;
  std::unordered_map<std::string, std::string> export_to_model_;
  std::unordered_map<std::string, std::string> model_to_manual_;
};

}} // namespace pc::reg
