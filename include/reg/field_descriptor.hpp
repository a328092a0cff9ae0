// reg/field_descriptor.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/reg_error.hpp"

namespace pc { namespace reg {

/**
 * FieldInput
 * One named value handed to the model: a scalar or an explicit array.
 * A scalar given to an array-valued field is broadcast over the neuron group.
 */
class FieldInput {
public:
  FieldInput(std::int64_t v) : values_{v}, is_array_(false) {}
  FieldInput(std::vector<std::int64_t> v) : values_(std::move(v)), is_array_(true) {}

  bool is_array() const { return is_array_; }
  const std::vector<std::int64_t>& values() const { return values_; }

private:
  std::vector<std::int64_t> values_;
  bool is_array_;
};

// One element of a closed enumeration domain.
struct EnumEntry {
  std::int64_t  value;   // value carried by models and exports
  std::uint64_t code;    // value written into the register
  std::string   label;   // accepted on import, e.g. "MODE_NORMAL"
};

/**
 * FieldDescriptor
 * Declares one register parameter: its three names, bit width, value domain
 * (integer range or enumeration), default and access flags.
 *
 * Reserved fields are explicit zero padding. They have no name in the
 * resolver, never appear in exports, and may be wider than 64 bits.
 */
class FieldDescriptor {
public:
  struct Params {
    std::string              model_name;
    std::string              manual_name;     // canonical manual name
    std::vector<std::string> legacy_names;    // older manual names of the same field
    std::string              export_key;      // empty -> model_name

    std::size_t bit_width = 0;
    bool        is_signed = false;

    // Range domain; unset bounds span the whole bit width.
    std::optional<std::int64_t> min_value;
    std::optional<std::int64_t> max_value;

    // Enumeration domain; when non-empty it replaces the range.
    std::vector<EnumEntry> enumeration;

    std::optional<std::int64_t> default_value;
    bool read_only    = false;
    bool array_valued = false;
    bool reserved     = false;
  };

  // Throws std::invalid_argument if the declaration is inconsistent.
  explicit FieldDescriptor(Params p);

  static FieldDescriptor Reserved(const std::string& name, std::size_t bit_width);

  const std::string& model_name()  const { return p_.model_name; }
  const std::string& manual_name() const { return p_.manual_name; }
  const std::string& export_key()  const { return p_.export_key; }
  const std::vector<std::string>& legacy_names() const { return p_.legacy_names; }

  std::size_t bit_width()    const { return p_.bit_width; }
  bool        is_signed()    const { return p_.is_signed; }
  bool        read_only()    const { return p_.read_only; }
  bool        array_valued() const { return p_.array_valued; }
  bool        reserved()     const { return p_.reserved; }
  bool        is_enum()      const { return !p_.enumeration.empty(); }
  bool        has_default()  const { return p_.default_value.has_value(); }

  std::int64_t default_value() const;
  std::int64_t min_value() const { return min_; }
  std::int64_t max_value() const { return max_; }
  const std::vector<EnumEntry>& enumeration() const { return p_.enumeration; }

  bool InDomain(std::int64_t v) const;

  // Checks arity and every element against the domain. Does not look at
  // read_only; callers decide whether a write is allowed.
  std::optional<Violation> Validate(const FieldInput& in, std::size_t group_size) const;

  // kReadOnlyViolation for read-only fields.
  std::optional<Violation> CheckWritable() const;

  // Expands an already validated input to its stored form
  // (group_size elements for array-valued fields, one otherwise).
  std::vector<std::int64_t> Expand(const FieldInput& in, std::size_t group_size) const;

  // Value -> register bits (two's complement or enumeration code).
  std::uint64_t Encode(std::int64_t v) const;

  // Register bits -> value. nullopt for codes outside the enumeration.
  std::optional<std::int64_t> Decode(std::uint64_t raw) const;

  std::optional<std::int64_t> ValueOfLabel(const std::string& label) const;
  std::optional<std::string>  LabelOf(std::int64_t v) const;

  std::string ToString() const;

private:
  std::string DomainString() const;

  Params       p_;
  std::int64_t min_ = 0;
  std::int64_t max_ = 0;
};

}} // namespace pc::reg
