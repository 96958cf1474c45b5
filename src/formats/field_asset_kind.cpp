#include "formats/field_asset_kind.h"

namespace {
QString file_ext_lower(const QString& name) {
  const QString lower = name.toLower();
  const int dot = lower.lastIndexOf('.');
  return dot >= 0 ? lower.mid(dot + 1) : QString();
}
}  // namespace

FieldAssetKind field_asset_kind_for_name(const QString& file_name) {
  const QString ext = file_ext_lower(file_name);
  if (ext == "tex") {
    return FieldAssetKind::Texture;
  }
  if (ext == "rsd") {
    return FieldAssetKind::ResourceDescriptor;
  }
  if (ext == "hrc") {
    return FieldAssetKind::Skeleton;
  }
  if (ext == "a") {
    return FieldAssetKind::Animation;
  }
  if (ext == "p") {
    return FieldAssetKind::PolygonModel;
  }
  return FieldAssetKind::Unknown;
}

QString field_asset_kind_display_name(FieldAssetKind kind) {
  switch (kind) {
    case FieldAssetKind::Unknown:
      return "Hex View";
    case FieldAssetKind::Texture:
      return "TEX Image";
    case FieldAssetKind::ResourceDescriptor:
      return "Resource Definition";
    case FieldAssetKind::Skeleton:
      return "Field Skeleton";
    case FieldAssetKind::Animation:
      return "Field Animation";
    case FieldAssetKind::PolygonModel:
      return "P Model";
  }
  return "Hex View";
}
