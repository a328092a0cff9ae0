#include "reg/codec.hpp"
#include <sstream>
#include <stdexcept>
#include <utility>

#include "common/reg_error.hpp"

namespace pc { namespace reg {

namespace {

void CheckWidth(const RegisterImage& image, const RegisterSchema& schema) {
  if (image.bit_width() != schema.total_bit_width()) {
    throw RegisterError(ErrorKind::kLengthMismatch,
                        std::string(ToString(schema.kind())) + " expects " +
                            std::to_string(schema.total_bit_width()) + " bits, image has " +
                            std::to_string(image.bit_width()));
  }
}

} // namespace

void Codec::PackOne(const ParameterModel& model, std::size_t neuron, RegisterImage& out) {
  const RegisterSchema& s = model.schema();
  const auto& fields = s.fields();
  const auto& values = model.values();
  for (std::size_t i = 0; i < fields.size(); ++i) {
    const FieldDescriptor& f = fields[i];
    if (f.reserved()) {
      out.ClearBits(s.LsbOf(i), f.bit_width());
      continue;
    }
    const std::int64_t v = f.array_valued() ? values[i].at(neuron) : values[i].front();
    out.SetBits(s.LsbOf(i), f.bit_width(), f.Encode(v));
  }
}

RegisterImage Codec::Pack(const ParameterModel& model) {
  const RegisterSchema& s = model.schema();
  if (s.neuron_group_size() != 1) {
    throw RegisterError(ErrorKind::kArityMismatch,
                        "Pack needs a group of 1, model holds " +
                            std::to_string(s.neuron_group_size()) + " neurons; use PackGroup");
  }
  RegisterImage img(s.total_bit_width());
  PackOne(model, 0, img);
  return img;
}

std::vector<RegisterImage> Codec::PackGroup(const ParameterModel& model) {
  const RegisterSchema& s = model.schema();
  std::vector<RegisterImage> out;
  out.reserve(s.neuron_group_size());
  for (std::size_t n = 0; n < s.neuron_group_size(); ++n) {
    RegisterImage img(s.total_bit_width());
    PackOne(model, n, img);
    out.push_back(std::move(img));
  }
  return out;
}

std::vector<FieldValues> Codec::DecodeOne(const RegisterImage& image,
                                          const RegisterSchema& schema,
                                          std::vector<Violation>& out) {
  const auto& fields = schema.fields();
  std::vector<FieldValues> values(fields.size());
  for (std::size_t i = 0; i < fields.size(); ++i) {
    const FieldDescriptor& f = fields[i];
    if (f.reserved()) {
      if (!image.AllZero(schema.LsbOf(i), f.bit_width())) {
        out.push_back({f.model_name(), ErrorKind::kOutOfRange, "reserved bits are not zero"});
      }
      values[i] = {0};
      continue;
    }
    const std::uint64_t raw = image.GetBits(schema.LsbOf(i), f.bit_width());
    auto v = f.Decode(raw);
    if (!v) {
      std::ostringstream oss;
      oss << "unknown register code 0x" << std::hex << raw;
      out.push_back({f.model_name(), ErrorKind::kOutOfRange, oss.str()});
      values[i] = {0};
      continue;
    }
    values[i] = {*v};
  }
  return values;
}

ParameterModel Codec::Unpack(const RegisterImage& image,
                             std::shared_ptr<const RegisterSchema> schema) {
  if (!schema) throw std::invalid_argument("Codec::Unpack: null schema");
  CheckWidth(image, *schema);
  if (schema->neuron_group_size() != 1) {
    throw RegisterError(ErrorKind::kArityMismatch,
                        "Unpack needs a schema with a group of 1; use UnpackGroup");
  }

  std::vector<Violation> violations;
  std::vector<FieldValues> values = DecodeOne(image, *schema, violations);
  return ParameterModel::FromFieldValues(std::move(schema), std::move(values), std::move(violations));
}

ParameterModel Codec::UnpackGroup(const std::vector<RegisterImage>& images,
                                  std::shared_ptr<const RegisterSchema> schema) {
  if (!schema) throw std::invalid_argument("Codec::UnpackGroup: null schema");
  const RegisterSchema& s = *schema;
  if (images.size() != s.neuron_group_size()) {
    throw RegisterError(ErrorKind::kLengthMismatch,
                        "expected " + std::to_string(s.neuron_group_size()) + " images, got " +
                            std::to_string(images.size()));
  }
  for (const auto& img : images) CheckWidth(img, s);

  const auto& fields = s.fields();
  std::vector<Violation>   violations;
  std::vector<FieldValues> merged(fields.size());
  for (std::size_t n = 0; n < images.size(); ++n) {
    std::vector<FieldValues> one = DecodeOne(images[n], s, violations);
    for (std::size_t i = 0; i < fields.size(); ++i) {
      const FieldDescriptor& f = fields[i];
      if (f.reserved()) {
        merged[i] = {0};
      } else if (f.array_valued()) {
        merged[i].push_back(one[i].front());
      } else if (n == 0) {
        merged[i] = one[i];
      } else if (merged[i] != one[i]) {
        violations.push_back({f.model_name(), ErrorKind::kValidationError,
                              "neuron " + std::to_string(n) + " holds " +
                                  std::to_string(one[i].front()) + ", neuron 0 holds " +
                                  std::to_string(merged[i].front())});
      }
    }
  }
  return ParameterModel::FromFieldValues(std::move(schema), std::move(merged), std::move(violations));
}

}} // namespace pc::reg
