#include "reg/register_image.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

#include "common/reg_error.hpp"

namespace pc { namespace reg {

namespace {

inline std::size_t WordsFor(std::size_t bits) { return (bits + 63) / 64; }

inline std::uint64_t LowMask(std::size_t width) {
  return (width >= 64) ? ~std::uint64_t{0} : ((std::uint64_t{1} << width) - 1);
}

inline std::size_t ChunksFor(std::size_t bits, std::size_t chunk_bits) {
  return (bits + chunk_bits - 1) / chunk_bits;
}

void CheckChunkBits(std::size_t chunk_bits) {
  if (chunk_bits == 0 || chunk_bits > 64) {
    throw std::invalid_argument("RegisterImage: chunk_bits must be in [1, 64], got " +
                                std::to_string(chunk_bits));
  }
}

int HexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

RegisterImage::RegisterImage(std::size_t bit_width)
  : bit_width_(bit_width), words_(WordsFor(bit_width), 0) {
  if (bit_width == 0) {
    throw std::invalid_argument("RegisterImage: bit_width must be > 0");
  }
}

RegisterImage RegisterImage::FromWords(std::size_t bit_width, std::vector<std::uint64_t> words) {
  RegisterImage img(bit_width);
  if (words.size() != img.words_.size()) {
    throw RegisterError(ErrorKind::kLengthMismatch,
                        "expected " + std::to_string(img.words_.size()) + " words for " +
                            std::to_string(bit_width) + " bits, got " +
                            std::to_string(words.size()));
  }
  const std::size_t tail = bit_width % 64;
  if (tail != 0 && (words.back() & ~LowMask(tail)) != 0) {
    throw RegisterError(ErrorKind::kLengthMismatch,
                        "bits set above bit_width " + std::to_string(bit_width));
  }
  img.words_ = std::move(words);
  return img;
}

void RegisterImage::CheckSpan(std::size_t lsb, std::size_t width) const {
  if (width == 0 || lsb + width > bit_width_ || lsb + width < lsb) {
    throw std::out_of_range("RegisterImage: span [" + std::to_string(lsb) + ", +" +
                            std::to_string(width) + ") outside " +
                            std::to_string(bit_width_) + " bits");
  }
}

void RegisterImage::SetBits(std::size_t lsb, std::size_t width, std::uint64_t value) {
  CheckSpan(lsb, width);
  if (width > 64) throw std::out_of_range("RegisterImage::SetBits: width > 64");
  value &= LowMask(width);

  const std::size_t w   = lsb / 64;
  const std::size_t off = lsb % 64;
  const std::uint64_t lo_mask = LowMask(width) << off;
  words_[w] = (words_[w] & ~lo_mask) | (value << off);

  // Spills into the next word.
  if (off + width > 64) {
    const std::size_t hi_bits = off + width - 64;
    const std::uint64_t hi_mask = LowMask(hi_bits);
    words_[w + 1] = (words_[w + 1] & ~hi_mask) | (value >> (64 - off));
  }
}

std::uint64_t RegisterImage::GetBits(std::size_t lsb, std::size_t width) const {
  CheckSpan(lsb, width);
  if (width > 64) throw std::out_of_range("RegisterImage::GetBits: width > 64");

  const std::size_t w   = lsb / 64;
  const std::size_t off = lsb % 64;
  std::uint64_t v = words_[w] >> off;
  if (off + width > 64) {
    v |= words_[w + 1] << (64 - off);
  }
  return v & LowMask(width);
}

void RegisterImage::ClearBits(std::size_t lsb, std::size_t width) {
  CheckSpan(lsb, width);
  std::size_t pos = lsb;
  std::size_t left = width;
  while (left > 0) {
    const std::size_t n = std::min<std::size_t>(left, 64 - (pos % 64));
    SetBits(pos, n, 0);
    pos += n;
    left -= n;
  }
}

bool RegisterImage::AllZero(std::size_t lsb, std::size_t width) const {
  CheckSpan(lsb, width);
  std::size_t pos = lsb;
  std::size_t left = width;
  while (left > 0) {
    const std::size_t n = std::min<std::size_t>(left, 64 - (pos % 64));
    if (GetBits(pos, n) != 0) return false;
    pos += n;
    left -= n;
  }
  return true;
}

std::vector<std::uint64_t> RegisterImage::Payloads(std::size_t chunk_bits,
                                                   PayloadOrder order) const {
  CheckChunkBits(chunk_bits);
  const std::size_t n = ChunksFor(bit_width_, chunk_bits);
  std::vector<std::uint64_t> out(n, 0);

  // Chunk k (LSB-first numbering) covers bits [k*chunk_bits, (k+1)*chunk_bits).
  for (std::size_t k = 0; k < n; ++k) {
    const std::size_t lsb   = k * chunk_bits;
    const std::size_t width = std::min(chunk_bits, bit_width_ - lsb);
    const std::uint64_t v = GetBits(lsb, width);
    if (order == PayloadOrder::kLsbFirst) out[k] = v;
    else                                  out[n - 1 - k] = v;
  }
  return out;
}

RegisterImage RegisterImage::FromPayloads(std::size_t bit_width, std::size_t chunk_bits,
                                          const std::vector<std::uint64_t>& payloads,
                                          PayloadOrder order) {
  CheckChunkBits(chunk_bits);
  RegisterImage img(bit_width);
  const std::size_t n = ChunksFor(bit_width, chunk_bits);
  if (payloads.size() != n) {
    throw RegisterError(ErrorKind::kLengthMismatch,
                        "expected " + std::to_string(n) + " payloads of " +
                            std::to_string(chunk_bits) + " bits, got " +
                            std::to_string(payloads.size()));
  }

  for (std::size_t k = 0; k < n; ++k) {
    const std::uint64_t v = (order == PayloadOrder::kLsbFirst) ? payloads[k]
                                                                : payloads[n - 1 - k];
    const std::size_t lsb   = k * chunk_bits;
    const std::size_t width = std::min(chunk_bits, bit_width - lsb);
    if ((v & ~LowMask(width)) != 0) {
      throw RegisterError(ErrorKind::kLengthMismatch,
                          "payload " + std::to_string(k) + " exceeds " +
                              std::to_string(width) + " bits");
    }
    img.SetBits(lsb, width, v);
  }
  return img;
}

std::string RegisterImage::ToHex() const {
  static const char* kDigits = "0123456789abcdef";
  const std::size_t n = (bit_width_ + 3) / 4;
  std::string s(n, '0');
  for (std::size_t k = 0; k < n; ++k) {
    const std::size_t lsb   = k * 4;
    const std::size_t width = std::min<std::size_t>(4, bit_width_ - lsb);
    s[n - 1 - k] = kDigits[GetBits(lsb, width)];
  }
  return s;
}

RegisterImage RegisterImage::FromHex(std::size_t bit_width, const std::string& hex) {
  RegisterImage img(bit_width);
  const std::size_t n = (bit_width + 3) / 4;
  if (hex.size() != n) {
    throw RegisterError(ErrorKind::kLengthMismatch,
                        "expected " + std::to_string(n) + " hex digits for " +
                            std::to_string(bit_width) + " bits, got " +
                            std::to_string(hex.size()));
  }
  for (std::size_t k = 0; k < n; ++k) {
    const int d = HexDigit(hex[n - 1 - k]);
    if (d < 0) {
      throw std::invalid_argument("RegisterImage::FromHex: bad digit '" +
                                  std::string(1, hex[n - 1 - k]) + "'");
    }
    const std::size_t lsb   = k * 4;
    const std::size_t width = std::min<std::size_t>(4, bit_width - lsb);
    if ((static_cast<std::uint64_t>(d) & ~LowMask(width)) != 0) {
      throw RegisterError(ErrorKind::kLengthMismatch,
                          "hex value exceeds " + std::to_string(bit_width) + " bits");
    }
    img.SetBits(lsb, width, static_cast<std::uint64_t>(d));
  }
  return img;
}

}} // namespace pc::reg
