// reg/register_image.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/* All comments are in English.
 * Fixed-width bit sequence holding one packed register or neuron RAM entry.
 * Bit 0 is the LSB of words()[0]; bits at and above bit_width() stay zero.
 */

namespace pc { namespace reg {

enum class PayloadOrder : std::uint8_t {
  kMsbFirst,   // chunk 0 holds the most-significant bits (frame order)
  kLsbFirst    // chunk 0 holds the least-significant bits (RAM package order)
};

class RegisterImage {
public:
  explicit RegisterImage(std::size_t bit_width);

  // Throws kLengthMismatch if the word count is wrong or bits above
  // bit_width are set.
  static RegisterImage FromWords(std::size_t bit_width, std::vector<std::uint64_t> words);

  std::size_t bit_width() const { return bit_width_; }
  const std::vector<std::uint64_t>& words() const { return words_; }

  // [lsb, lsb + width) with width <= 64. Bits outside the image throw
  // std::out_of_range.
  void          SetBits(std::size_t lsb, std::size_t width, std::uint64_t value);
  std::uint64_t GetBits(std::size_t lsb, std::size_t width) const;

  // Any width.
  void ClearBits(std::size_t lsb, std::size_t width);
  bool AllZero(std::size_t lsb, std::size_t width) const;

  // Splits the image into chunk_bits-wide words (0 < chunk_bits <= 64). The
  // most-significant chunk is zero-extended when bit_width is not a multiple
  // of chunk_bits.
  std::vector<std::uint64_t> Payloads(std::size_t chunk_bits,
                                      PayloadOrder order = PayloadOrder::kMsbFirst) const;
  static RegisterImage FromPayloads(std::size_t bit_width, std::size_t chunk_bits,
                                    const std::vector<std::uint64_t>& payloads,
                                    PayloadOrder order = PayloadOrder::kMsbFirst);

  // MSB-first hex, ceil(bit_width / 4) digits, no prefix.
  std::string ToHex() const;
  static RegisterImage FromHex(std::size_t bit_width, const std::string& hex);

  bool operator==(const RegisterImage& o) const {
    return bit_width_ == o.bit_width_ && words_ == o.words_;
  }
  bool operator!=(const RegisterImage& o) const { return !(*this == o); }

private:
  void CheckSpan(std::size_t lsb, std::size_t width) const;

  std::size_t                bit_width_;
  std::vector<std::uint64_t> words_;
};

}} // namespace pc::reg
