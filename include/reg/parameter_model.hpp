// reg/parameter_model.hpp
#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

#include "reg/field_descriptor.hpp"
#include "reg/register_schema.hpp"
#include "reg/reg_types.hpp"
#include "reg/schema_registry.hpp"

namespace pc { namespace reg {

// Named values as supplied by callers: manual, legacy, model or export names.
using NamedValues = std::map<std::string, FieldInput>;

// Stored value of one field: one element, or one per neuron of the group.
using FieldValues = std::vector<std::int64_t>;

/**
 * ParameterModel
 * Validated values of one register, bound to its schema.
 *
 * Construction validates every field and collects all per-field problems into
 * a single RegisterError; unknown names throw immediately. Read-only fields
 * may only be supplied at their default. After construction the model only
 * changes through Set(), which validates first and commits on success.
 */
class ParameterModel {
public:
  // `prior` holds problems found before construction (unparsable input).
  // Fields named there are not checked again; all problems throw together.
  static ParameterModel FromNamedValues(std::shared_ptr<const RegisterSchema> schema,
                                        const NamedValues& values,
                                        std::vector<Violation> prior = {});

  // Resolves the schema through `registry`. For online neurons a
  // "weight_width" (or "bit_select") entry holds the owning core's weight
  // precision in bits and picks the layout; it is not a field of the neuron.
  static ParameterModel FromNamedValues(RegisterKind kind,
                                        const NamedValues& values,
                                        const ModeFlags& flags = ModeFlags{},
                                        const SchemaRegistry& registry = SchemaRegistry::Default());

  // Values in schema field order, as decoded from an image. Read-only fields
  // accept any value of their domain here. Fields named in `prior` (codes
  // that did not decode) hold placeholders and are not checked again.
  static ParameterModel FromFieldValues(std::shared_ptr<const RegisterSchema> schema,
                                        std::vector<FieldValues> values,
                                        std::vector<Violation> prior = {});

  // Scalar value. Throws kArityMismatch for an array field holding more than
  // one element.
  std::int64_t Get(const std::string& name) const;
  const FieldValues& GetArray(const std::string& name) const;

  // Enumerated field as its enum class (register code cast to E).
  template <typename E>
  E GetAs(const std::string& name) const {
    const FieldDescriptor& f = schema_->Field(name);
    return static_cast<E>(f.Encode(Get(name)));
  }

  void Set(const std::string& name, const FieldInput& value);

  // Keyed by export keys; reserved fields are skipped. Array fields are
  // exported as arrays when the group holds more than one neuron.
  nlohmann::json Export() const;

  // Keyed by model names.
  NamedValues ToNamedValues() const;

  // Working mode of an offline core; nullopt for other kinds.
  std::optional<CoreMode> core_mode() const;

  const RegisterSchema& schema() const { return *schema_; }
  const std::shared_ptr<const RegisterSchema>& schema_ptr() const { return schema_; }
  const std::vector<FieldValues>& values() const { return values_; }

  bool operator==(const ParameterModel& o) const;
  bool operator!=(const ParameterModel& o) const { return !(*this == o); }

private:
  ParameterModel(std::shared_ptr<const RegisterSchema> schema, std::vector<FieldValues> values)
    : schema_(std::move(schema)), values_(std::move(values)) {}

  // Rules spanning several fields. With `coerce`, fixable settings are
  // rewritten (and logged) instead of reported.
  static void CheckCrossField(const RegisterSchema& schema,
                              std::vector<FieldValues>& values,
                              bool coerce,
                              std::vector<Violation>& out);

  std::shared_ptr<const RegisterSchema> schema_;
  std::vector<FieldValues>              values_;
};

}} // namespace pc::reg
