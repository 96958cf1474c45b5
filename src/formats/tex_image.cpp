#include "formats/tex_image.h"

#include <cstring>
#include <limits>

#include "formats/byte_cursor.h"

namespace {
// Words the game engine only fills in at runtime; never meaningful on disk.
constexpr int kRuntimeWord = 4;

// 0x00..0x2B: identical in both layouts.
bool read_leading_fields(ByteCursor& cur, TexHeader* h) {
  return cur.read_u32(&h->version) &&
         cur.read_u32(&h->unknown_04) &&
         cur.read_u32(&h->color_key_flag) &&
         cur.read_u32(&h->unknown_0c) &&
         cur.read_u32(&h->unknown_10) &&
         cur.read_u32(&h->min_bits_per_color) &&
         cur.read_u32(&h->max_bits_per_color) &&
         cur.read_u32(&h->min_alpha_bits) &&
         cur.read_u32(&h->max_alpha_bits) &&
         cur.read_u32(&h->min_bits_per_pixel) &&
         cur.read_u32(&h->max_bits_per_pixel);
}

bool read_pixel_format(ByteCursor& cur, TexPixelFormat* f) {
  return cur.read_u32(&f->red_bits) &&
         cur.read_u32(&f->green_bits) &&
         cur.read_u32(&f->blue_bits) &&
         cur.read_u32(&f->alpha_bits) &&
         cur.read_u32(&f->red_mask) &&
         cur.read_u32(&f->green_mask) &&
         cur.read_u32(&f->blue_mask) &&
         cur.read_u32(&f->alpha_mask) &&
         cur.read_u32(&f->red_shift) &&
         cur.read_u32(&f->green_shift) &&
         cur.read_u32(&f->blue_shift) &&
         cur.read_u32(&f->alpha_shift) &&
         cur.read_u32(&f->red_loss) &&
         cur.read_u32(&f->green_loss) &&
         cur.read_u32(&f->blue_loss) &&
         cur.read_u32(&f->alpha_loss) &&
         cur.read_u32(&f->red_max) &&
         cur.read_u32(&f->green_max) &&
         cur.read_u32(&f->blue_max) &&
         cur.read_u32(&f->alpha_max);
}

// Palette count through the end of the header (0x30.. standard, 0x2C.. alternative).
bool read_trailing_fields(ByteCursor& cur, TexHeader* h) {
  if (!(cur.read_u32(&h->palette_count) &&
        cur.read_u32(&h->colors_per_palette) &&
        cur.read_u32(&h->bit_depth) &&
        cur.read_u32(&h->width) &&
        cur.read_u32(&h->height) &&
        cur.read_u32(&h->bytes_per_row) &&
        cur.read_u32(&h->unknown_48) &&
        cur.read_u32(&h->palette_flag) &&
        cur.read_u32(&h->bits_per_index) &&
        cur.read_u32(&h->indexed_to_8bit) &&
        cur.read_u32(&h->palette_size) &&
        cur.read_u32(&h->colors_per_palette_again) &&
        cur.skip(kRuntimeWord) &&
        cur.read_u32(&h->bits_per_pixel) &&
        cur.read_u32(&h->bytes_per_pixel))) {
    return false;
  }
  if (!read_pixel_format(cur, &h->pixel_format)) {
    return false;
  }
  if (!(cur.read_u32(&h->color_key_array_flag) &&
        cur.skip(kRuntimeWord) &&
        cur.read_u32(&h->reference_alpha) &&
        cur.skip(kRuntimeWord) &&
        cur.read_u32(&h->unknown_cc) &&
        cur.read_u32(&h->palette_index) &&
        cur.skip(kRuntimeWord) &&
        cur.skip(kRuntimeWord))) {
    return false;
  }
  for (quint32& w : h->unknown_dc) {
    if (!cur.read_u32(&w)) {
      return false;
    }
  }
  return true;
}

bool check_header_size(const QByteArray& bytes, TexHeaderVariant variant, FormatError* error) {
  const int needed = tex_header_size(variant);
  if (bytes.size() < needed) {
    return set_format_error(error,
                            FormatErrorKind::Truncated,
                            QString("TEX header is too small for the %1 layout.")
                              .arg(variant == TexHeaderVariant::Standard ? "standard" : "alternative"),
                            0,
                            needed,
                            bytes.size());
  }
  return true;
}

[[nodiscard]] quint8 expand_channel(quint32 value, quint32 mask, quint32 shift, quint32 bits) {
  if (bits == 0 || shift > 31) {
    return 0;
  }
  quint32 c = (value & mask) >> shift;
  if (bits < 8) {
    c <<= (8 - bits);
  } else if (bits > 8) {
    c >>= (bits - 8);
  }
  return static_cast<quint8>(c & 0xFF);
}

[[nodiscard]] quint32 read_packed_le(const uchar* p, int n) {
  quint32 v = 0;
  for (int i = 0; i < n; ++i) {
    v |= static_cast<quint32>(p[i]) << (8 * i);
  }
  return v;
}

void write_pixel_format(ByteWriter& w, const TexPixelFormat& f) {
  w.write_u32(f.red_bits);
  w.write_u32(f.green_bits);
  w.write_u32(f.blue_bits);
  w.write_u32(f.alpha_bits);
  w.write_u32(f.red_mask);
  w.write_u32(f.green_mask);
  w.write_u32(f.blue_mask);
  w.write_u32(f.alpha_mask);
  w.write_u32(f.red_shift);
  w.write_u32(f.green_shift);
  w.write_u32(f.blue_shift);
  w.write_u32(f.alpha_shift);
  w.write_u32(f.red_loss);
  w.write_u32(f.green_loss);
  w.write_u32(f.blue_loss);
  w.write_u32(f.alpha_loss);
  w.write_u32(f.red_max);
  w.write_u32(f.green_max);
  w.write_u32(f.blue_max);
  w.write_u32(f.alpha_max);
}

[[nodiscard]] qint64 palette_byte_size(const TexHeader& h) {
  return h.palette_flag != 0 ? static_cast<qint64>(h.palette_size) * 4 : 0;
}

[[nodiscard]] qint64 pixel_byte_size(const TexHeader& h) {
  return static_cast<qint64>(h.width) * static_cast<qint64>(h.height) * static_cast<qint64>(h.bytes_per_pixel);
}
}  // namespace

int tex_header_size(TexHeaderVariant variant) {
  return variant == TexHeaderVariant::Standard ? kTexStandardHeaderSize : kTexAlternativeHeaderSize;
}

std::optional<TexHeaderVariant> detect_tex_header_variant(const QByteArray& bytes, FormatError* error) {
  if (error) {
    error->clear();
  }

  ByteCursor cur(bytes, kTexVariantProbeOffset);
  quint32 probe = 0;
  if (!cur.read_u32(&probe)) {
    set_format_error(error,
                     FormatErrorKind::Truncated,
                     "TEX header is too small to hold the layout probe.",
                     kTexVariantProbeOffset,
                     kTexVariantProbeOffset + 4,
                     bytes.size());
    return std::nullopt;
  }
  return probe == 0 ? TexHeaderVariant::Standard : TexHeaderVariant::Alternative;
}

std::optional<TexHeader> read_tex_header_standard(const QByteArray& bytes, FormatError* error) {
  if (error) {
    error->clear();
  }
  if (!check_header_size(bytes, TexHeaderVariant::Standard, error)) {
    return std::nullopt;
  }

  TexHeader h;
  h.variant = TexHeaderVariant::Standard;
  ByteCursor cur(bytes);
  // The padding word is implied zero and regenerated on encode.
  if (!read_leading_fields(cur, &h) || !cur.skip(4) || !read_trailing_fields(cur, &h)) {
    set_format_error(error, FormatErrorKind::Truncated, "Unable to read TEX header.", cur.pos);
    return std::nullopt;
  }
  return h;
}

std::optional<TexHeader> read_tex_header_alternative(const QByteArray& bytes, FormatError* error) {
  if (error) {
    error->clear();
  }
  if (!check_header_size(bytes, TexHeaderVariant::Alternative, error)) {
    return std::nullopt;
  }

  TexHeader h;
  h.variant = TexHeaderVariant::Alternative;
  ByteCursor cur(bytes);
  if (!read_leading_fields(cur, &h) || !read_trailing_fields(cur, &h)) {
    set_format_error(error, FormatErrorKind::Truncated, "Unable to read TEX header.", cur.pos);
    return std::nullopt;
  }
  return h;
}

bool validate_tex_header(const TexHeader& header, FormatError* error) {
  if (error) {
    error->clear();
  }
  const bool width_ok = header.width > 0 && header.width <= kTexMaxDimension;
  const bool height_ok = header.height > 0 && header.height <= kTexMaxDimension;
  const bool depth_ok = header.bit_depth > 0 && header.bit_depth <= kTexMaxBitDepth;
  const bool bpp_ok = header.bytes_per_pixel > 0 && header.bytes_per_pixel <= kTexMaxBytesPerPixel;
  if (width_ok && height_ok && depth_ok && bpp_ok) {
    return true;
  }
  return set_format_error(error,
                          FormatErrorKind::MalformedHeader,
                          QString("Invalid TEX header: %1x%2, bitDepth=%3, bytesPerPixel=%4.")
                            .arg(header.width)
                            .arg(header.height)
                            .arg(header.bit_depth)
                            .arg(header.bytes_per_pixel));
}

std::optional<TexImage> parse_tex_image(const QByteArray& bytes, FormatError* error) {
  if (error) {
    error->clear();
  }

  const std::optional<TexHeaderVariant> variant = detect_tex_header_variant(bytes, error);
  if (!variant) {
    return std::nullopt;
  }

  const std::optional<TexHeader> header = (*variant == TexHeaderVariant::Standard)
                                            ? read_tex_header_standard(bytes, error)
                                            : read_tex_header_alternative(bytes, error);
  if (!header) {
    return std::nullopt;
  }
  if (!validate_tex_header(*header, error)) {
    return std::nullopt;
  }

  TexImage image;
  image.header = *header;
  const qint64 size = bytes.size();
  qint64 offset = tex_header_size(*variant);

  const qint64 palette_bytes = palette_byte_size(image.header);
  if (palette_bytes > 0) {
    if (offset + palette_bytes > size) {
      set_format_error(error,
                       FormatErrorKind::Truncated,
                       "TEX palette exceeds file size.",
                       offset,
                       palette_bytes,
                       size - offset);
      return std::nullopt;
    }
    image.palette = bytes.mid(offset, palette_bytes);
    offset += palette_bytes;
  }

  const qint64 pixel_bytes = pixel_byte_size(image.header);
  if (offset + pixel_bytes > size) {
    set_format_error(error,
                     FormatErrorKind::Truncated,
                     "TEX pixel data exceeds file size.",
                     offset,
                     pixel_bytes,
                     size - offset);
    return std::nullopt;
  }
  image.pixels = bytes.mid(offset, pixel_bytes);
  offset += pixel_bytes;

  // Some producers omit the color-key array; keep what is there or nothing.
  if (image.header.color_key_array_flag != 0) {
    const qint64 key_bytes = image.header.palette_count;
    if (key_bytes > 0 && offset + key_bytes <= size) {
      image.color_key_array = bytes.mid(offset, key_bytes);
    }
  }

  return image;
}

quint32 tex_effective_colors_per_palette(const TexHeader& header) {
  if (header.palette_count > 0) {
    return header.palette_size / header.palette_count;
  }
  return header.colors_per_palette;
}

QByteArray expand_tex_pixels(const TexImage& image, int palette_selector) {
  const TexHeader& h = image.header;
  const qint64 pixel_count = static_cast<qint64>(h.width) * static_cast<qint64>(h.height);
  if (pixel_count <= 0 || pixel_count * 4 > std::numeric_limits<int>::max()) {
    return {};
  }

  QByteArray out(static_cast<int>(pixel_count * 4), '\0');
  auto* dst = reinterpret_cast<uchar*>(out.data());
  const auto* src = reinterpret_cast<const uchar*>(image.pixels.constData());
  const qint64 src_size = image.pixels.size();
  const int stride = static_cast<int>(qBound<quint32>(1, h.bytes_per_pixel, kTexMaxBytesPerPixel));

  if (h.palette_flag != 0) {
    // Palette entries are stored B,G,R,A. Indices past the palette stay transparent black.
    const auto* pal = reinterpret_cast<const uchar*>(image.palette.constData());
    const qint64 pal_size = image.palette.size();
    const qint64 base = palette_selector >= 0
                          ? static_cast<qint64>(palette_selector) * tex_effective_colors_per_palette(h)
                          : -1;
    for (qint64 i = 0; i < pixel_count; ++i) {
      const qint64 src_off = i * stride;
      if (base < 0 || src_off >= src_size) {
        continue;
      }
      const qint64 entry = (base + src[src_off]) * 4;
      if (entry + 4 > pal_size) {
        continue;
      }
      uchar* d = dst + i * 4;
      d[0] = pal[entry + 2];
      d[1] = pal[entry + 1];
      d[2] = pal[entry + 0];
      d[3] = pal[entry + 3];
    }
    return out;
  }

  const TexPixelFormat& f = h.pixel_format;
  for (qint64 i = 0; i < pixel_count; ++i) {
    const qint64 src_off = i * stride;
    if (src_off + stride > src_size) {
      break;
    }
    const quint32 value = read_packed_le(src + src_off, stride);
    uchar* d = dst + i * 4;
    d[0] = expand_channel(value, f.red_mask, f.red_shift, f.red_bits);
    d[1] = expand_channel(value, f.green_mask, f.green_shift, f.green_bits);
    d[2] = expand_channel(value, f.blue_mask, f.blue_shift, f.blue_bits);
    d[3] = f.alpha_bits > 0 ? expand_channel(value, f.alpha_mask, f.alpha_shift, f.alpha_bits) : 255;
  }
  return out;
}

QImage tex_image_to_qimage(const TexImage& image, int palette_selector) {
  const QByteArray rgba = expand_tex_pixels(image, palette_selector);
  if (rgba.isEmpty()) {
    return {};
  }

  const int width = static_cast<int>(image.header.width);
  const int height = static_cast<int>(image.header.height);
  QImage img(width, height, QImage::Format_RGBA8888);
  if (img.isNull()) {
    return {};
  }

  const auto* src = reinterpret_cast<const uchar*>(rgba.constData());
  for (int y = 0; y < height; ++y) {
    std::memcpy(img.scanLine(y), src + static_cast<qint64>(y) * width * 4, static_cast<size_t>(width) * 4);
  }
  return img;
}

QByteArray encode_tex_image(const TexImage& image, FormatError* error) {
  if (error) {
    error->clear();
  }
  const TexHeader& h = image.header;
  if (!validate_tex_header(h, error)) {
    return {};
  }

  const qint64 palette_bytes = palette_byte_size(h);
  const qint64 pixel_bytes = pixel_byte_size(h);
  const qint64 key_bytes = h.color_key_array_flag != 0 ? static_cast<qint64>(h.palette_count) : 0;
  const qint64 total = kTexStandardHeaderSize + palette_bytes + pixel_bytes + key_bytes;
  if (total > std::numeric_limits<int>::max()) {
    set_format_error(error, FormatErrorKind::MalformedHeader, "TEX payload is too large to encode.", -1, -1, total);
    return {};
  }

  QByteArray out(static_cast<int>(total), '\0');
  ByteWriter w(out);

  w.write_u32(h.version);
  w.write_u32(h.unknown_04);
  w.write_u32(h.color_key_flag);
  w.write_u32(h.unknown_0c);
  w.write_u32(h.unknown_10);
  w.write_u32(h.min_bits_per_color);
  w.write_u32(h.max_bits_per_color);
  w.write_u32(h.min_alpha_bits);
  w.write_u32(h.max_alpha_bits);
  w.write_u32(h.min_bits_per_pixel);
  w.write_u32(h.max_bits_per_pixel);
  w.skip(4);  // Padding (standard layout).
  w.write_u32(h.palette_count);
  w.write_u32(h.colors_per_palette);
  w.write_u32(h.bit_depth);
  w.write_u32(h.width);
  w.write_u32(h.height);
  w.write_u32(h.bytes_per_row);
  w.write_u32(h.unknown_48);
  w.write_u32(h.palette_flag);
  w.write_u32(h.bits_per_index);
  w.write_u32(h.indexed_to_8bit);
  w.write_u32(h.palette_size);
  w.write_u32(h.colors_per_palette_again);
  w.skip(kRuntimeWord);
  w.write_u32(h.bits_per_pixel);
  w.write_u32(h.bytes_per_pixel);
  write_pixel_format(w, h.pixel_format);
  w.write_u32(h.color_key_array_flag);
  w.skip(kRuntimeWord);
  w.write_u32(h.reference_alpha);
  w.skip(kRuntimeWord);
  w.write_u32(h.unknown_cc);
  w.write_u32(h.palette_index);
  w.skip(kRuntimeWord);
  w.skip(kRuntimeWord);
  for (const quint32 word : h.unknown_dc) {
    w.write_u32(word);
  }

  if (w.pos != kTexStandardHeaderSize) {
    set_format_error(error, FormatErrorKind::MalformedHeader, "TEX header layout mismatch.", w.pos, kTexStandardHeaderSize, w.pos);
    return {};
  }

  if (!w.write_bytes(image.palette, static_cast<int>(palette_bytes)) ||
      !w.write_bytes(image.pixels, static_cast<int>(pixel_bytes)) ||
      !w.write_bytes(image.color_key_array, static_cast<int>(key_bytes))) {
    set_format_error(error, FormatErrorKind::Truncated, "TEX payload does not fit the output buffer.", w.pos);
    return {};
  }

  return out;
}
