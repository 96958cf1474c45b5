#pragma once

#include <optional>

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QVector>

#include "formats/format_error.h"

struct HrcBone {
  QString name;
  QString parent_name;  // "root" (any case) for the hierarchy root.
  double length = 0.0;
  int resource_count = 0;  // As declared; not checked against resources.size().
  QStringList resources;   // RSD names without extension, e.g. "AAAB".
};

struct HrcSkeleton {
  int header_block = 0;
  QString skeleton_name;
  int bone_count = 0;
  QVector<HrcBone> bones;
};

struct HrcSummary {
  QString name;
  int bone_count = 0;
  int bones_with_models = 0;
};

struct HrcRelatedFile {
  QString name;  // "<rsd>.rsd"
  QString type;  // "Resource Definition"
};

// Field skeleton (.hrc). Blank lines are ignored everywhere.
// InvalidFormat when a header marker is missing, MalformedHeader for non-numeric
// counts or bone lengths, Truncated when the text ends inside the bone list.
[[nodiscard]] std::optional<HrcSkeleton> parse_hrc_text(const QString& text, FormatError* error = nullptr);
[[nodiscard]] std::optional<HrcSkeleton> parse_hrc_bytes(const QByteArray& bytes, FormatError* error = nullptr);

// -1 for an out-of-range index, a "root" parent, or a parent name that matches no bone.
[[nodiscard]] int hrc_bone_parent_index(const HrcSkeleton& skeleton, int bone_index);
[[nodiscard]] QVector<int> hrc_parent_indices(const HrcSkeleton& skeleton);

[[nodiscard]] HrcSummary summarize_hrc(const HrcSkeleton& skeleton);
[[nodiscard]] QVector<HrcRelatedFile> hrc_related_files(const HrcSkeleton& skeleton);
