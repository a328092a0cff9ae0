#include "reg/register_schema.hpp"
#include <sstream>
#include <stdexcept>
#include <utility>

#include "common/reg_error.hpp"

namespace pc { namespace reg {

RegisterSchema::RegisterSchema(RegisterKind kind,
                               std::string variant,
                               unsigned version,
                               std::size_t total_bit_width,
                               std::vector<FieldDescriptor> fields,
                               std::size_t neuron_group_size)
  : kind_(kind),
    variant_(std::move(variant)),
    version_(version),
    total_bit_width_(total_bit_width),
    fields_(std::move(fields)),
    group_size_(neuron_group_size),
    resolver_(fields_) {
  if (group_size_ == 0) {
    throw std::invalid_argument("RegisterSchema: neuron_group_size must be > 0");
  }
  if (!IsNeuronKind(kind_) && group_size_ != 1) {
    throw std::invalid_argument("RegisterSchema: core registers have a group size of 1");
  }

  std::size_t sum = 0;
  for (const auto& f : fields_) sum += f.bit_width();
  if (sum != total_bit_width_) {
    throw std::invalid_argument("RegisterSchema(" + std::string(reg::ToString(kind_)) +
                                "): field widths sum to " + std::to_string(sum) +
                                ", expected " + std::to_string(total_bit_width_));
  }

  // First field sits at the top of the image.
  lsb_.resize(fields_.size());
  std::size_t top = total_bit_width_;
  for (std::size_t i = 0; i < fields_.size(); ++i) {
    top -= fields_[i].bit_width();
    lsb_[i] = top;
    if (!fields_[i].reserved()) index_.emplace(fields_[i].model_name(), i);
  }
}

std::size_t RegisterSchema::IndexOf(const std::string& model_name) const {
  auto it = index_.find(model_name);
  if (it == index_.end()) {
    throw RegisterError(ErrorKind::kUnknownName,
                        std::string(reg::ToString(kind_)) + " has no field '" + model_name + "'");
  }
  return it->second;
}

const FieldDescriptor& RegisterSchema::Field(const std::string& name) const {
  return fields_[IndexOf(resolver_.ToModelName(name))];
}

std::string RegisterSchema::ToString() const {
  std::ostringstream oss;
  oss << "RegisterSchema{kind=" << reg::ToString(kind_)
      << ", variant=" << variant_
      << ", v" << version_
      << ", bits=" << total_bit_width_
      << ", group=" << group_size_
      << ", fields=" << fields_.size() << "}";
  for (std::size_t i = 0; i < fields_.size(); ++i) {
    const auto& f = fields_[i];
    oss << "\n  [" << (lsb_[i] + f.bit_width() - 1) << ":" << lsb_[i] << "] " << f.ToString();
  }
  return oss.str();
}

}} // namespace pc::reg
