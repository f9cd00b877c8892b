#pragma once
#include "result.hpp"
#include "types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace idelens {

inline constexpr std::size_t kBmpHeaderBytes = 14 + 40;

// Uncompressed 32-bit top-down BMP. Malformed when the buffer does not hold
// width * height * 4 bytes.
Result<std::vector<std::uint8_t>> encode_bmp(const PixelBuffer &px);

struct BmpInfo {
  int width{};
  int height{};
  int bits_per_pixel{};
  bool top_down{};
};

std::optional<BmpInfo> read_bmp_header(const std::vector<std::uint8_t> &bytes);

std::string base64_encode(const std::vector<std::uint8_t> &in);

} // namespace idelens
