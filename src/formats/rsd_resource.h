#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>

// Field resource definition (.rsd): plain text naming the model's geometry,
// material, polygon groups and textures.
struct RsdResource {
  QString id;              // "@RSD940102" line, verbatim.
  QString ply_file;        // e.g. "AAAC.PLY"
  QString mat_file;
  QString grp_file;
  int declared_texture_count = 0;  // NTEX; informational only.
  QStringList textures;    // TEX[n] values in line order, e.g. "AABB.TIM".
};

struct RsdSummary {
  QString p_model;
  QStringList textures;
  int declared_texture_count = 0;
};

// Never fails: unknown or malformed lines are skipped, missing keys stay empty.
[[nodiscard]] RsdResource parse_rsd_text(const QString& text);
[[nodiscard]] RsdResource parse_rsd_bytes(const QByteArray& bytes);

// Descriptors record ".PLY"; the geometry ships as ".P".
[[nodiscard]] QString rsd_p_model_filename(const RsdResource& rsd);
// Descriptors record ".TIM"; the textures ship as ".TEX".
[[nodiscard]] QStringList rsd_texture_filenames(const RsdResource& rsd);

[[nodiscard]] RsdSummary summarize_rsd(const RsdResource& rsd);
