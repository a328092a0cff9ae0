// reg/register_schema.hpp
#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "reg/field_descriptor.hpp"
#include "reg/name_resolver.hpp"
#include "reg/reg_types.hpp"

namespace pc { namespace reg {

/**
 * RegisterSchema
 * Ordered field list of one register layout, most-significant field first.
 * The order and widths are the wire contract; `version` changes whenever
 * either does.
 *
 * The constructor checks that the field widths sum to total_bit_width and
 * builds the name resolver; both throw std::invalid_argument on failure.
 */
class RegisterSchema {
public:
  RegisterSchema(RegisterKind kind,
                 std::string variant,
                 unsigned version,
                 std::size_t total_bit_width,
                 std::vector<FieldDescriptor> fields,
                 std::size_t neuron_group_size = 1);

  RegisterKind       kind()              const { return kind_; }
  const std::string& variant()           const { return variant_; }
  unsigned           version()           const { return version_; }
  std::size_t        total_bit_width()   const { return total_bit_width_; }
  std::size_t        neuron_group_size() const { return group_size_; }

  const std::vector<FieldDescriptor>& fields() const { return fields_; }
  const NameResolver&                 names()  const { return resolver_; }

  // Index of a field by model name; throws RegisterError(kUnknownName).
  std::size_t IndexOf(const std::string& model_name) const;

  // Any accepted name (manual, legacy, model, export key).
  const FieldDescriptor& Field(const std::string& name) const;

  // Bit position of the LSB of field i inside the image.
  std::size_t LsbOf(std::size_t i) const { return lsb_.at(i); }

  std::string ToString() const;

private:
  RegisterKind                 kind_;
  std::string                  variant_;
  unsigned                     version_;
  std::size_t                  total_bit_width_;
  std::vector<FieldDescriptor> fields_;
  std::size_t                  group_size_;

  std::vector<std::size_t>                     lsb_;
  std::unordered_map<std::string, std::size_t> index_;
  NameResolver                                 resolver_;
};

}} // namespace pc::reg
