#pragma once

#include <functional>
#include <optional>

#include <QByteArray>
#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>

#include "formats/hrc_skeleton.h"
#include "formats/rsd_resource.h"
#include "formats/tex_image.h"

// Supplied by the caller (archive browser, CLI) to turn an entry name into its bytes.
// Returns std::nullopt when the entry does not exist.
using FieldAssetResolver = std::function<std::optional<QByteArray>(const QString& name)>;

struct FieldModelAssetOptions {
  bool decode_textures = true;
};

struct LinkedResource {
  QString rsd_name;        // As referenced by the bone, e.g. "AAAB".
  QString rsd_file;        // "AAAB.rsd"
  bool found = false;
  RsdResource rsd;
  QString p_model;         // "AAAC.P"
  QStringList textures;    // "AABB.TEX", ...
};

struct LinkedBone {
  int bone_index = -1;
  QString bone_name;
  int parent_index = -1;
  QVector<LinkedResource> resources;
};

struct FieldModelAssets {
  QVector<LinkedBone> bones;
  // Decoded textures keyed by file name as requested from the resolver.
  QHash<QString, TexImage> textures;
  QStringList missing;  // Names the resolver could not supply.
  QStringList log;

  [[nodiscard]] int resolved_resource_count() const;
};

// Walks skeleton -> RSD -> TEX through the resolver. Never aborts: missing or
// undecodable entries are recorded in missing/log and the walk continues.
[[nodiscard]] FieldModelAssets resolve_field_model_assets(const HrcSkeleton& skeleton,
                                                          const FieldAssetResolver& resolver,
                                                          const FieldModelAssetOptions& options = {});
