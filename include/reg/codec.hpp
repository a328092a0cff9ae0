// reg/codec.hpp
#pragma once
#include <memory>
#include <vector>

#include "reg/parameter_model.hpp"
#include "reg/register_image.hpp"
#include "reg/register_schema.hpp"

namespace pc { namespace reg {

/**
 * Codec
 * Converts between ParameterModel and RegisterImage. Fields are laid out in
 * schema order from the top bit down; reserved fields are written as zero and
 * must read back as zero.
 */
class Codec {
public:
  // Group size must be 1; throws kArityMismatch otherwise.
  static RegisterImage Pack(const ParameterModel& model);

  // One image per neuron; element i of every array field goes into image i.
  static std::vector<RegisterImage> PackGroup(const ParameterModel& model);

  // kLengthMismatch if the width differs from the schema; field problems
  // (unknown codes, non-zero reserved bits, domain) are aggregated.
  static ParameterModel Unpack(const RegisterImage& image,
                               std::shared_ptr<const RegisterSchema> schema);

  // Inverse of PackGroup. The image count must equal the group size, and
  // scalar fields must agree across images.
  static ParameterModel UnpackGroup(const std::vector<RegisterImage>& images,
                                    std::shared_ptr<const RegisterSchema> schema);

private:
  static void PackOne(const ParameterModel& model, std::size_t neuron, RegisterImage& out);

  // Decodes every field of one image; appends failures to `out`.
  static std::vector<FieldValues> DecodeOne(const RegisterImage& image,
                                            const RegisterSchema& schema,
                                            std::vector<Violation>& out);
};

}} // namespace pc::reg
