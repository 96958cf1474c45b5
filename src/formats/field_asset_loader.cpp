#include "formats/field_asset_loader.h"

#include <QStringList>
#include <QTextStream>

#include "formats/field_animation.h"
#include "formats/field_asset_kind.h"
#include "formats/hrc_skeleton.h"
#include "formats/rsd_resource.h"
#include "formats/tex_image.h"

namespace {
constexpr int kPreviewCount = 16;

FieldAssetDecodeResult failure(const QString& type, const FormatError& err) {
  return FieldAssetDecodeResult{type, {}, describe_format_error(err), err.kind};
}

FieldAssetDecodeResult decode_tex(const QByteArray& bytes, int palette_selector) {
  const QString type = field_asset_kind_display_name(FieldAssetKind::Texture);
  FormatError err;
  const std::optional<TexImage> tex = parse_tex_image(bytes, &err);
  if (!tex) {
    return failure(type, err);
  }

  const TexHeader& h = tex->header;
  QString summary;
  QTextStream s(&summary);
  s << "Type: " << type << "\n";
  s << "Header layout: " << (h.variant == TexHeaderVariant::Standard ? "standard" : "alternative")
    << " (" << tex_header_size(h.variant) << " bytes)\n";
  s << "Version: " << h.version << "\n";
  s << "Size: " << h.width << "x" << h.height << "\n";
  s << "Bit depth: " << h.bit_depth << " (" << h.bytes_per_pixel << " bytes per pixel)\n";
  if (tex->has_palette()) {
    s << "Palettes: " << h.palette_count << " x " << tex_effective_colors_per_palette(h) << " colors"
      << " (header says " << h.colors_per_palette << ")\n";
    s << "Palette entries: " << h.palette_size << "\n";
    s << "Preview palette: " << palette_selector << "\n";
  } else {
    const TexPixelFormat& f = h.pixel_format;
    s << "Pixel format: R" << f.red_bits << " G" << f.green_bits << " B" << f.blue_bits << " A" << f.alpha_bits << "\n";
  }
  s << "Color key: " << (h.color_key_flag != 0 ? "yes" : "no");
  if (h.color_key_array_flag != 0) {
    s << " (array " << (tex->has_color_key_array() ? "present" : "missing") << ")";
  }
  s << "\n";
  return FieldAssetDecodeResult{type, summary, {}, FormatErrorKind::None};
}

FieldAssetDecodeResult decode_rsd(const QByteArray& bytes) {
  const QString type = field_asset_kind_display_name(FieldAssetKind::ResourceDescriptor);
  const RsdResource rsd = parse_rsd_bytes(bytes);
  const RsdSummary stats = summarize_rsd(rsd);

  QString summary;
  QTextStream s(&summary);
  s << "Type: " << type << "\n";
  s << "Id: " << (rsd.id.isEmpty() ? QString("<none>") : rsd.id) << "\n";
  s << "P model: " << (stats.p_model.isEmpty() ? QString("<none>") : stats.p_model) << "\n";
  s << "Material: " << rsd.mat_file << "\n";
  s << "Groups: " << rsd.grp_file << "\n";
  s << "Textures: " << stats.textures.size() << " (declared " << stats.declared_texture_count << ")\n";
  for (const QString& tex : stats.textures) {
    s << "  " << tex << "\n";
  }
  return FieldAssetDecodeResult{type, summary, {}, FormatErrorKind::None};
}

FieldAssetDecodeResult decode_hrc(const QByteArray& bytes) {
  const QString type = field_asset_kind_display_name(FieldAssetKind::Skeleton);
  FormatError err;
  const std::optional<HrcSkeleton> hrc = parse_hrc_bytes(bytes, &err);
  if (!hrc) {
    return failure(type, err);
  }

  const HrcSummary stats = summarize_hrc(*hrc);
  const QVector<int> parents = hrc_parent_indices(*hrc);
  QString summary;
  QTextStream s(&summary);
  s << "Type: " << type << "\n";
  s << "Name: " << (stats.name.isEmpty() ? QString("<unnamed>") : stats.name) << "\n";
  s << "Header block: " << hrc->header_block << "\n";
  s << "Bones: " << stats.bone_count << " (" << stats.bones_with_models << " with models)\n";
  for (int i = 0; i < hrc->bones.size() && i < kPreviewCount; ++i) {
    const HrcBone& bone = hrc->bones[i];
    s << "  [" << i << "] " << bone.name << "  (parent " << parents[i] << ", length " << bone.length
      << ", resources " << bone.resources.join(' ') << ")\n";
  }
  if (hrc->bones.size() > kPreviewCount) {
    s << "  ...\n";
  }
  const QVector<HrcRelatedFile> related = hrc_related_files(*hrc);
  if (!related.isEmpty()) {
    s << "Related files:\n";
    for (const HrcRelatedFile& f : related) {
      s << "  " << f.name << " (" << f.type << ")\n";
    }
  }
  return FieldAssetDecodeResult{type, summary, {}, FormatErrorKind::None};
}

FieldAssetDecodeResult decode_animation(const QByteArray& bytes) {
  const QString type = field_asset_kind_display_name(FieldAssetKind::Animation);
  FormatError err;
  const std::optional<FieldAnimation> anim = parse_field_animation(bytes, &err);
  if (!anim) {
    return failure(type, err);
  }

  QString summary;
  QTextStream s(&summary);
  s << "Type: " << type << "\n";
  s << "Version: " << anim->version << "\n";
  s << "Frames: " << anim->frame_count << "\n";
  if (anim->trailing_bytes > 0) {
    s << "Trailing bytes: " << anim->trailing_bytes << "\n";
  }
  s << "Bones: " << anim->bone_count << " (" << field_animation_rotation_slots(anim->bone_count)
    << " rotation slots per frame)\n";
  s << "Rotation order: " << static_cast<int>(anim->rotation_order[0]) << " "
    << static_cast<int>(anim->rotation_order[1]) << " " << static_cast<int>(anim->rotation_order[2]) << "\n";
  if (const FieldFrame* first = field_animation_first_frame(*anim)) {
    s << "Frame 0 root translation: (" << first->root_translation.x() << ", " << first->root_translation.y()
      << ", " << first->root_translation.z() << ")\n";
    s << "Frame 0 root rotation: (" << first->root_rotation.alpha << ", " << first->root_rotation.beta << ", "
      << first->root_rotation.gamma << ")\n";
  }
  return FieldAssetDecodeResult{type, summary, {}, FormatErrorKind::None};
}
}  // namespace

bool is_supported_field_asset_file(const QString& file_name) {
  const FieldAssetKind kind = field_asset_kind_for_name(file_name);
  return kind == FieldAssetKind::Texture || kind == FieldAssetKind::ResourceDescriptor ||
         kind == FieldAssetKind::Skeleton || kind == FieldAssetKind::Animation;
}

FieldAssetDecodeResult decode_field_asset_bytes(const QByteArray& bytes, const QString& file_name, int palette_selector) {
  switch (field_asset_kind_for_name(file_name)) {
    case FieldAssetKind::Texture:
      return decode_tex(bytes, palette_selector);
    case FieldAssetKind::ResourceDescriptor:
      return decode_rsd(bytes);
    case FieldAssetKind::Skeleton:
      return decode_hrc(bytes);
    case FieldAssetKind::Animation:
      return decode_animation(bytes);
    case FieldAssetKind::PolygonModel:
    case FieldAssetKind::Unknown:
      break;
  }
  return FieldAssetDecodeResult{{}, {}, "Unsupported field asset type.", FormatErrorKind::None};
}
