#pragma once

#include <optional>

#include <QByteArray>
#include <QVector>
#include <QVector3D>
#include <QtGlobal>

#include "formats/format_error.h"

// version, frame count, bone count, rotation order + unused byte, 5 runtime words.
constexpr int kFieldAnimationHeaderSize = 36;

struct FieldRotation {
  float alpha = 0.0f;
  float beta = 0.0f;
  float gamma = 0.0f;
};

struct FieldFrame {
  FieldRotation root_rotation;
  QVector3D root_translation;
  QVector<FieldRotation> bone_rotations;  // max(bone_count, 1) entries.
};

struct FieldAnimation {
  qint32 version = 0;
  qint32 frame_count = 0;
  qint32 bone_count = 0;
  quint8 rotation_order[3] = {};
  quint8 unused = 0;
  QVector<FieldFrame> frames;
  qint64 trailing_bytes = 0;  // Bytes after the last frame; well-formed files have none.
};

// Rotation slots per frame. Skeleton-less animations still carry one slot.
[[nodiscard]] int field_animation_rotation_slots(qint32 bone_count);
[[nodiscard]] qint64 field_animation_frame_size(qint32 bone_count);

// Field animation (.a). Fails with Truncated when the buffer is shorter than the header
// plus the declared frames, MalformedHeader for negative counts. Trailing bytes are counted, not decoded.
[[nodiscard]] std::optional<FieldAnimation> parse_field_animation(const QByteArray& bytes, FormatError* error = nullptr);

// nullptr when index is out of range.
[[nodiscard]] const FieldFrame* field_animation_frame(const FieldAnimation& animation, int index);
[[nodiscard]] const FieldFrame* field_animation_first_frame(const FieldAnimation& animation);
