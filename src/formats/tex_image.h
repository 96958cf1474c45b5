#pragma once

#include <optional>

#include <QByteArray>
#include <QImage>
#include <QString>
#include <QtGlobal>

#include "formats/format_error.h"

// TEX header sizes. The alternative layout lacks the padding word at 0x2C.
constexpr int kTexStandardHeaderSize = 0xEC;
constexpr int kTexAlternativeHeaderSize = 0xE8;
// Offset of the word that tells the two layouts apart.
constexpr int kTexVariantProbeOffset = 0x2C;

constexpr quint32 kTexMaxDimension = 4096;
constexpr quint32 kTexMaxBitDepth = 32;
constexpr quint32 kTexMaxBytesPerPixel = 4;

enum class TexHeaderVariant {
  Standard = 0,  // 0xEC bytes, zero padding at 0x2C.
  Alternative,   // 0xE8 bytes, palette count at 0x2C.
};

struct TexPixelFormat {
  quint32 red_bits = 0;
  quint32 green_bits = 0;
  quint32 blue_bits = 0;
  quint32 alpha_bits = 0;
  quint32 red_mask = 0;
  quint32 green_mask = 0;
  quint32 blue_mask = 0;
  quint32 alpha_mask = 0;
  quint32 red_shift = 0;
  quint32 green_shift = 0;
  quint32 blue_shift = 0;
  quint32 alpha_shift = 0;
  quint32 red_loss = 0;
  quint32 green_loss = 0;
  quint32 blue_loss = 0;
  quint32 alpha_loss = 0;
  quint32 red_max = 0;
  quint32 green_max = 0;
  quint32 blue_max = 0;
  quint32 alpha_max = 0;
};

struct TexHeader {
  TexHeaderVariant variant = TexHeaderVariant::Standard;

  quint32 version = 0;
  quint32 color_key_flag = 0;
  quint32 min_bits_per_color = 0;
  quint32 max_bits_per_color = 0;
  quint32 min_alpha_bits = 0;
  quint32 max_alpha_bits = 0;
  quint32 min_bits_per_pixel = 0;
  quint32 max_bits_per_pixel = 0;
  quint32 palette_count = 0;
  // Written back as stored. Not trusted by pixel expansion (often wrong on disk).
  quint32 colors_per_palette = 0;
  quint32 bit_depth = 0;
  quint32 width = 0;
  quint32 height = 0;
  quint32 bytes_per_row = 0;
  quint32 palette_flag = 0;
  quint32 bits_per_index = 0;
  quint32 indexed_to_8bit = 0;
  // Number of palette entries (4 bytes each) across all sub-palettes.
  quint32 palette_size = 0;
  quint32 colors_per_palette_again = 0;
  quint32 bits_per_pixel = 0;
  quint32 bytes_per_pixel = 0;
  TexPixelFormat pixel_format;
  quint32 color_key_array_flag = 0;
  quint32 reference_alpha = 0;
  quint32 palette_index = 0;

  // Undocumented words that are meaningful on disk; preserved as read.
  quint32 unknown_04 = 0;
  quint32 unknown_0c = 0;
  quint32 unknown_10 = 0;
  quint32 unknown_48 = 0;
  quint32 unknown_cc = 0;
  quint32 unknown_dc[4] = {};
};

struct TexImage {
  TexHeader header;
  QByteArray palette;          // palette_size * 4 bytes (B,G,R,A) when palette_flag != 0.
  QByteArray pixels;           // width * height * bytes_per_pixel bytes.
  QByteArray color_key_array;  // palette_count bytes when present on disk.

  [[nodiscard]] bool has_palette() const { return header.palette_flag != 0; }
  [[nodiscard]] bool has_color_key_array() const { return !color_key_array.isEmpty(); }
};

// Reads the probe word and decides which header layout the buffer uses.
// A non-zero word can only be a palette count, so it selects the alternative layout.
[[nodiscard]] std::optional<TexHeaderVariant> detect_tex_header_variant(const QByteArray& bytes,
                                                                        FormatError* error = nullptr);

// Field readers for each layout. Neither validates field ranges.
[[nodiscard]] std::optional<TexHeader> read_tex_header_standard(const QByteArray& bytes, FormatError* error = nullptr);
[[nodiscard]] std::optional<TexHeader> read_tex_header_alternative(const QByteArray& bytes, FormatError* error = nullptr);

[[nodiscard]] int tex_header_size(TexHeaderVariant variant);

// Fails with MalformedHeader when width/height/bit depth/bytes per pixel are out of range.
[[nodiscard]] bool validate_tex_header(const TexHeader& header, FormatError* error = nullptr);

// Full decode: probe, header, validation, palette, pixels, optional color keys.
// A short color-key array is dropped silently; any other short section is Truncated.
[[nodiscard]] std::optional<TexImage> parse_tex_image(const QByteArray& bytes, FormatError* error = nullptr);

// Colors per sub-palette used for pixel expansion: palette_size / palette_count,
// falling back to the header's colors_per_palette when there are no palettes.
[[nodiscard]] quint32 tex_effective_colors_per_palette(const TexHeader& header);

// RGBA8, row-major, width * height * 4 bytes. Does not modify the image.
[[nodiscard]] QByteArray expand_tex_pixels(const TexImage& image, int palette_selector = 0);

[[nodiscard]] QImage tex_image_to_qimage(const TexImage& image, int palette_selector = 0);

// Serializes to the standard 0xEC layout. Runtime-only words are written as zero.
// Images decoded from the alternative layout come back in the standard layout.
// Returns an empty array (MalformedHeader) when the header fails validation.
[[nodiscard]] QByteArray encode_tex_image(const TexImage& image, FormatError* error = nullptr);
