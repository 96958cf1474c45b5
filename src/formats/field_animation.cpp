#include "formats/field_animation.h"

#include "formats/byte_cursor.h"

namespace {
bool read_rotation(ByteCursor& cur, FieldRotation* out) {
  return cur.read_f32(&out->alpha) && cur.read_f32(&out->beta) && cur.read_f32(&out->gamma);
}

bool read_vec3(ByteCursor& cur, QVector3D* out) {
  float x = 0.0f;
  float y = 0.0f;
  float z = 0.0f;
  if (!cur.read_f32(&x) || !cur.read_f32(&y) || !cur.read_f32(&z)) {
    return false;
  }
  *out = QVector3D(x, y, z);
  return true;
}
}  // namespace

int field_animation_rotation_slots(qint32 bone_count) {
  return bone_count > 0 ? bone_count : 1;
}

qint64 field_animation_frame_size(qint32 bone_count) {
  return 24 + 12 * static_cast<qint64>(field_animation_rotation_slots(bone_count));
}

std::optional<FieldAnimation> parse_field_animation(const QByteArray& bytes, FormatError* error) {
  if (error) {
    error->clear();
  }

  if (bytes.size() < kFieldAnimationHeaderSize) {
    set_format_error(error,
                     FormatErrorKind::Truncated,
                     "Field animation header is too small.",
                     0,
                     kFieldAnimationHeaderSize,
                     bytes.size());
    return std::nullopt;
  }

  FieldAnimation anim;
  ByteCursor cur(bytes);
  if (!cur.read_i32(&anim.version) ||
      !cur.read_i32(&anim.frame_count) ||
      !cur.read_i32(&anim.bone_count) ||
      !cur.read_u8(&anim.rotation_order[0]) ||
      !cur.read_u8(&anim.rotation_order[1]) ||
      !cur.read_u8(&anim.rotation_order[2]) ||
      !cur.read_u8(&anim.unused) ||
      !cur.skip(20)) {
    set_format_error(error, FormatErrorKind::Truncated, "Unable to read field animation header.", cur.pos);
    return std::nullopt;
  }

  if (anim.frame_count < 0 || anim.bone_count < 0) {
    set_format_error(error,
                     FormatErrorKind::MalformedHeader,
                     QString("Invalid field animation header: frames=%1, bones=%2.")
                       .arg(anim.frame_count)
                       .arg(anim.bone_count),
                     4);
    return std::nullopt;
  }

  const qint64 frame_size = field_animation_frame_size(anim.bone_count);
  const qint64 available = bytes.size() - kFieldAnimationHeaderSize;
  if (anim.frame_count > available / frame_size) {
    const qint64 needed = kFieldAnimationHeaderSize + static_cast<qint64>(anim.frame_count) * frame_size;
    set_format_error(error,
                     FormatErrorKind::Truncated,
                     QString("Field animation declares %1 frames of %2 bytes but the file is too short.")
                       .arg(anim.frame_count)
                       .arg(frame_size),
                     kFieldAnimationHeaderSize,
                     needed,
                     bytes.size());
    return std::nullopt;
  }

  const int slots = field_animation_rotation_slots(anim.bone_count);
  anim.frames.reserve(anim.frame_count);
  for (int fi = 0; fi < anim.frame_count; ++fi) {
    FieldFrame frame;
    if (!read_rotation(cur, &frame.root_rotation) || !read_vec3(cur, &frame.root_translation)) {
      set_format_error(error, FormatErrorKind::Truncated, QString("Field animation frame %1 is truncated.").arg(fi), cur.pos);
      return std::nullopt;
    }
    frame.bone_rotations.resize(slots);
    for (FieldRotation& rot : frame.bone_rotations) {
      if (!read_rotation(cur, &rot)) {
        set_format_error(error, FormatErrorKind::Truncated, QString("Field animation frame %1 is truncated.").arg(fi), cur.pos);
        return std::nullopt;
      }
    }
    anim.frames.push_back(std::move(frame));
  }

  anim.trailing_bytes = bytes.size() - cur.pos;
  return anim;
}

const FieldFrame* field_animation_frame(const FieldAnimation& animation, int index) {
  if (index < 0 || index >= animation.frames.size()) {
    return nullptr;
  }
  return &animation.frames[index];
}

const FieldFrame* field_animation_first_frame(const FieldAnimation& animation) {
  return field_animation_frame(animation, 0);
}
