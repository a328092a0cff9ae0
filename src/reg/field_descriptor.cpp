#include "reg/field_descriptor.hpp"
#include <sstream>
#include <stdexcept>

namespace pc { namespace reg {

namespace {

inline std::uint64_t MaskOf(std::size_t width) {
  return (width >= 64) ? ~std::uint64_t{0} : ((std::uint64_t{1} << width) - 1);
}

// Widest representable range for a field of `width` bits.
inline std::int64_t FullMin(std::size_t width, bool is_signed) {
  return is_signed ? -(std::int64_t{1} << (width - 1)) : 0;
}
inline std::int64_t FullMax(std::size_t width, bool is_signed) {
  return is_signed ? (std::int64_t{1} << (width - 1)) - 1
                   : static_cast<std::int64_t>(MaskOf(width));
}

} // namespace

FieldDescriptor::FieldDescriptor(Params p) : p_(std::move(p)) {
  if (p_.model_name.empty()) {
    throw std::invalid_argument("FieldDescriptor: empty model name");
  }
  if (p_.bit_width == 0) {
    throw std::invalid_argument("FieldDescriptor(" + p_.model_name + "): bit_width must be > 0");
  }
  if (p_.manual_name.empty()) p_.manual_name = p_.model_name;
  if (p_.export_key.empty())  p_.export_key  = p_.model_name;

  if (p_.reserved) {
    // Padding holds zero only, whatever its width.
    p_.enumeration.clear();
    p_.default_value = 0;
    p_.array_valued  = false;
    p_.read_only     = false;
    min_ = 0;
    max_ = 0;
    return;
  }

  if (p_.bit_width > 63) {
    throw std::invalid_argument("FieldDescriptor(" + p_.model_name + "): bit_width must be <= 63");
  }

  if (!p_.enumeration.empty()) {
    const std::uint64_t mask = MaskOf(p_.bit_width);
    min_ = p_.enumeration.front().value;
    max_ = p_.enumeration.front().value;
    for (std::size_t i = 0; i < p_.enumeration.size(); ++i) {
      const EnumEntry& e = p_.enumeration[i];
      if ((e.code & ~mask) != 0) {
        throw std::invalid_argument("FieldDescriptor(" + p_.model_name + "): enum code of " +
                                    e.label + " does not fit in bit_width");
      }
      for (std::size_t j = 0; j < i; ++j) {
        const EnumEntry& prev = p_.enumeration[j];
        if (prev.value == e.value || prev.code == e.code || prev.label == e.label) {
          throw std::invalid_argument("FieldDescriptor(" + p_.model_name + "): duplicate enum entry " +
                                      e.label);
        }
      }
      if (e.value < min_) min_ = e.value;
      if (e.value > max_) max_ = e.value;
    }
  } else {
    const std::int64_t lo = FullMin(p_.bit_width, p_.is_signed);
    const std::int64_t hi = FullMax(p_.bit_width, p_.is_signed);
    min_ = p_.min_value.value_or(lo);
    max_ = p_.max_value.value_or(hi);
    if (min_ < lo || max_ > hi || min_ > max_) {
      throw std::invalid_argument("FieldDescriptor(" + p_.model_name +
                                  "): range does not fit in bit_width");
    }
  }

  if (p_.default_value && !InDomain(*p_.default_value)) {
    throw std::invalid_argument("FieldDescriptor(" + p_.model_name + "): default outside domain");
  }
  if (p_.read_only && !p_.default_value) {
    throw std::invalid_argument("FieldDescriptor(" + p_.model_name +
                                "): read-only field needs a default");
  }
}

FieldDescriptor FieldDescriptor::Reserved(const std::string& name, std::size_t bit_width) {
  Params p;
  p.model_name = name;
  p.bit_width  = bit_width;
  p.reserved   = true;
  return FieldDescriptor(std::move(p));
}

std::int64_t FieldDescriptor::default_value() const {
  if (!p_.default_value) {
    throw std::logic_error("FieldDescriptor(" + p_.model_name + "): no default value");
  }
  return *p_.default_value;
}

bool FieldDescriptor::InDomain(std::int64_t v) const {
  if (p_.reserved) return v == 0;
  if (!p_.enumeration.empty()) {
    for (const auto& e : p_.enumeration) {
      if (e.value == v) return true;
    }
    return false;
  }
  return v >= min_ && v <= max_;
}

std::optional<Violation> FieldDescriptor::Validate(const FieldInput& in,
                                                   std::size_t group_size) const {
  const auto& vals = in.values();
  if (in.is_array()) {
    if (!p_.array_valued) {
      return Violation{p_.model_name, ErrorKind::kArityMismatch,
                       "scalar field given an array of " + std::to_string(vals.size())};
    }
    if (vals.size() != group_size) {
      return Violation{p_.model_name, ErrorKind::kArityMismatch,
                       "expected " + std::to_string(group_size) + " elements, got " +
                           std::to_string(vals.size())};
    }
  }
  for (std::size_t i = 0; i < vals.size(); ++i) {
    if (!InDomain(vals[i])) {
      std::ostringstream oss;
      oss << "value " << vals[i];
      if (in.is_array()) oss << " at index " << i;
      oss << " outside " << DomainString();
      return Violation{p_.model_name, ErrorKind::kOutOfRange, oss.str()};
    }
  }
  return std::nullopt;
}

std::optional<Violation> FieldDescriptor::CheckWritable() const {
  if (p_.read_only) {
    return Violation{p_.model_name, ErrorKind::kReadOnlyViolation,
                     "field is reported by hardware and cannot be written"};
  }
  return std::nullopt;
}

std::vector<std::int64_t> FieldDescriptor::Expand(const FieldInput& in,
                                                  std::size_t group_size) const {
  if (!p_.array_valued) return {in.values().front()};
  if (in.is_array()) return in.values();
  return std::vector<std::int64_t>(group_size, in.values().front());
}

std::uint64_t FieldDescriptor::Encode(std::int64_t v) const {
  if (p_.reserved) return 0;
  if (!p_.enumeration.empty()) {
    for (const auto& e : p_.enumeration) {
      if (e.value == v) return e.code;
    }
    throw RegisterError(ErrorKind::kOutOfRange,
                        p_.model_name + ": no register code for value " + std::to_string(v));
  }
  return static_cast<std::uint64_t>(v) & MaskOf(p_.bit_width);
}

std::optional<std::int64_t> FieldDescriptor::Decode(std::uint64_t raw) const {
  if (p_.reserved) return static_cast<std::int64_t>(raw);
  raw &= MaskOf(p_.bit_width);
  if (!p_.enumeration.empty()) {
    for (const auto& e : p_.enumeration) {
      if (e.code == raw) return e.value;
    }
    return std::nullopt;
  }
  if (p_.is_signed) {
    const std::uint64_t sign = std::uint64_t{1} << (p_.bit_width - 1);
    if (raw & sign) {
      return static_cast<std::int64_t>(raw | ~MaskOf(p_.bit_width));
    }
  }
  return static_cast<std::int64_t>(raw);
}

std::optional<std::int64_t> FieldDescriptor::ValueOfLabel(const std::string& label) const {
  for (const auto& e : p_.enumeration) {
    if (e.label == label) return e.value;
  }
  return std::nullopt;
}

std::optional<std::string> FieldDescriptor::LabelOf(std::int64_t v) const {
  for (const auto& e : p_.enumeration) {
    if (e.value == v) return e.label;
  }
  return std::nullopt;
}

std::string FieldDescriptor::DomainString() const {
  std::ostringstream oss;
  if (!p_.enumeration.empty()) {
    oss << "{";
    for (std::size_t i = 0; i < p_.enumeration.size(); ++i) {
      if (i) oss << ", ";
      oss << p_.enumeration[i].value;
    }
    oss << "}";
  } else {
    oss << "[" << min_ << ", " << max_ << "]";
  }
  return oss.str();
}

std::string FieldDescriptor::ToString() const {
  std::ostringstream oss;
  if (p_.reserved) {
    oss << "Field{" << p_.model_name << ", reserved, bits=" << p_.bit_width << "}";
    return oss.str();
  }
  oss << "Field{" << p_.model_name
      << ", manual=" << p_.manual_name
      << ", export=" << p_.export_key
      << ", bits=" << p_.bit_width
      << (p_.is_signed ? ", signed" : "")
      << ", domain=" << DomainString();
  if (p_.default_value) oss << ", default=" << *p_.default_value;
  if (p_.read_only)     oss << ", RO";
  if (p_.array_valued)  oss << ", array";
  oss << "}";
  return oss.str();
}

}} // namespace pc::reg
