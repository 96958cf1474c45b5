#pragma once

#include <QString>

enum class FieldAssetKind {
  Unknown = 0,
  Texture,             // .tex
  ResourceDescriptor,  // .rsd
  Skeleton,            // .hrc
  Animation,           // .a
  PolygonModel,        // .p (not decoded here)
};

[[nodiscard]] FieldAssetKind field_asset_kind_for_name(const QString& file_name);
[[nodiscard]] QString field_asset_kind_display_name(FieldAssetKind kind);
