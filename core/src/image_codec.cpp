#include "idelens/image_codec.hpp"
#include <limits>

namespace idelens {

static void put_u16(std::vector<std::uint8_t> &out, std::uint16_t v) {
  out.push_back(std::uint8_t(v & 0xFF));
  out.push_back(std::uint8_t((v >> 8) & 0xFF));
}

static void put_u32(std::vector<std::uint8_t> &out, std::uint32_t v) {
  for (int i = 0; i < 4; ++i)
    out.push_back(std::uint8_t((v >> (8 * i)) & 0xFF));
}

static std::uint32_t get_u32(const std::vector<std::uint8_t> &in,
                             std::size_t off) {
  return std::uint32_t(in[off]) | (std::uint32_t(in[off + 1]) << 8) |
         (std::uint32_t(in[off + 2]) << 16) | (std::uint32_t(in[off + 3]) << 24);
}

Result<std::vector<std::uint8_t>> encode_bmp(const PixelBuffer &px) {
  if (px.width <= 0 || px.height <= 0)
    return make_error(ErrorKind::Malformed, "encode_bmp",
                      "invalid dimensions " + std::to_string(px.width) + "x" +
                          std::to_string(px.height));
  std::uint64_t pixel_bytes = std::uint64_t(px.width) * px.height * 4;
  if (px.bgra.size() != pixel_bytes)
    return make_error(ErrorKind::Malformed, "encode_bmp",
                      "pixel buffer holds " + std::to_string(px.bgra.size()) +
                          " bytes, expected " + std::to_string(pixel_bytes));
  if (pixel_bytes + kBmpHeaderBytes > 0xFFFFFFFFull)
    return make_error(ErrorKind::ResourceExhausted, "encode_bmp",
                      "image too large for BMP");

  std::vector<std::uint8_t> out;
  out.reserve(kBmpHeaderBytes + px.bgra.size());

  // BITMAPFILEHEADER
  out.push_back('B');
  out.push_back('M');
  put_u32(out, std::uint32_t(kBmpHeaderBytes + pixel_bytes));
  put_u16(out, 0);
  put_u16(out, 0);
  put_u32(out, std::uint32_t(kBmpHeaderBytes));

  // BITMAPINFOHEADER, negative height = top-down rows
  put_u32(out, 40);
  put_u32(out, std::uint32_t(px.width));
  put_u32(out, std::uint32_t(-px.height));
  put_u16(out, 1);
  put_u16(out, 32);
  put_u32(out, 0); // BI_RGB
  put_u32(out, std::uint32_t(pixel_bytes));
  put_u32(out, 2835); // 72 DPI
  put_u32(out, 2835);
  put_u32(out, 0);
  put_u32(out, 0);

  out.insert(out.end(), px.bgra.begin(), px.bgra.end());
  return out;
}

std::optional<BmpInfo> read_bmp_header(const std::vector<std::uint8_t> &bytes) {
  if (bytes.size() < kBmpHeaderBytes || bytes[0] != 'B' || bytes[1] != 'M')
    return std::nullopt;
  BmpInfo info;
  info.width = static_cast<std::int32_t>(get_u32(bytes, 18));
  auto h = static_cast<std::int32_t>(get_u32(bytes, 22));
  if (h == std::numeric_limits<std::int32_t>::min())
    return std::nullopt;
  info.top_down = h < 0;
  info.height = h < 0 ? -h : h;
  info.bits_per_pixel = bytes[28] | (bytes[29] << 8);
  return info;
}

std::string base64_encode(const std::vector<std::uint8_t> &in) {
  static const char b64[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string out;
  out.reserve(((in.size() + 2) / 3) * 4);
  std::uint32_t val = 0;
  int valb = -6;
  for (std::uint8_t c : in) {
    val = ((val << 8) + c) & 0xFFFFFF;
    valb += 8;
    while (valb >= 0) {
      out.push_back(b64[(val >> valb) & 0x3F]);
      valb -= 6;
    }
  }
  if (valb > -6)
    out.push_back(b64[((val << 8) >> (valb + 8)) & 0x3F]);
  while (out.size() % 4)
    out.push_back('=');
  return out;
}

} // namespace idelens
