#include <catch2/catch.hpp>

#include <cstring>

#include "formats/field_animation.h"

namespace {
void append_i32(QByteArray& out, qint32 v) {
  const quint32 u = static_cast<quint32>(v);
  for (int i = 0; i < 4; ++i) {
    out.append(static_cast<char>((u >> (8 * i)) & 0xFF));
  }
}

void append_f32(QByteArray& out, float f) {
  quint32 u = 0;
  std::memcpy(&u, &f, sizeof(u));
  append_i32(out, static_cast<qint32>(u));
}

QByteArray animation_header(qint32 frames, qint32 bones) {
  QByteArray out;
  append_i32(out, 1);
  append_i32(out, frames);
  append_i32(out, bones);
  out.append('\x01');
  out.append('\x00');
  out.append('\x02');
  out.append('\x00');
  out.append(QByteArray(20, '\x5A'));  // runtime words, ignored
  return out;
}

// Frame values are derived from the frame index so each frame is distinguishable.
void append_frame(QByteArray& out, int frame, int rotation_slots) {
  append_f32(out, 10.0f * frame + 1.0f);
  append_f32(out, 10.0f * frame + 2.0f);
  append_f32(out, 10.0f * frame + 3.0f);
  append_f32(out, -1.0f * frame);
  append_f32(out, 0.5f);
  append_f32(out, 100.0f);
  for (int b = 0; b < rotation_slots; ++b) {
    append_f32(out, static_cast<float>(b));
    append_f32(out, 90.0f);
    append_f32(out, 180.0f + frame);
  }
}
}  // namespace

TEST_CASE("Field animation parsing", "[formats][animation]") {
  SECTION("Header and frames") {
    QByteArray bytes = animation_header(2, 3);
    append_frame(bytes, 0, 3);
    append_frame(bytes, 1, 3);
    REQUIRE(bytes.size() == kFieldAnimationHeaderSize + 2 * field_animation_frame_size(3));

    FormatError err;
    const auto anim = parse_field_animation(bytes, &err);
    REQUIRE(anim.has_value());
    REQUIRE(err.ok());
    REQUIRE(anim->version == 1);
    REQUIRE(anim->frame_count == 2);
    REQUIRE(anim->bone_count == 3);
    REQUIRE(anim->rotation_order[0] == 1);
    REQUIRE(anim->rotation_order[1] == 0);
    REQUIRE(anim->rotation_order[2] == 2);
    REQUIRE(anim->frames.size() == 2);

    const FieldFrame& f1 = anim->frames[1];
    REQUIRE(f1.root_rotation.alpha == Approx(11.0f));
    REQUIRE(f1.root_rotation.gamma == Approx(13.0f));
    REQUIRE(f1.root_translation.x() == Approx(-1.0f));
    REQUIRE(f1.root_translation.z() == Approx(100.0f));
    REQUIRE(f1.bone_rotations.size() == 3);
    REQUIRE(f1.bone_rotations[2].alpha == Approx(2.0f));
    REQUIRE(f1.bone_rotations[2].gamma == Approx(181.0f));
  }

  SECTION("Zero bones still carry one rotation slot per frame") {
    QByteArray bytes = animation_header(2, 0);
    append_frame(bytes, 0, 1);
    append_frame(bytes, 1, 1);
    REQUIRE(field_animation_frame_size(0) == 36);

    const auto anim = parse_field_animation(bytes);
    REQUIRE(anim.has_value());
    REQUIRE(anim->frames.size() == 2);
    REQUIRE(anim->frames[0].bone_rotations.size() == 1);
    REQUIRE(anim->frames[1].bone_rotations.size() == 1);
    // Second frame stays aligned only if the dummy slot was consumed.
    REQUIRE(anim->frames[1].root_rotation.alpha == Approx(11.0f));
    REQUIRE(anim->frames[1].bone_rotations[0].gamma == Approx(181.0f));
  }

  SECTION("Short buffers are truncated") {
    FormatError err;
    REQUIRE_FALSE(parse_field_animation(QByteArray(20, '\0'), &err).has_value());
    REQUIRE(err.kind == FormatErrorKind::Truncated);

    QByteArray bytes = animation_header(2, 1);
    append_frame(bytes, 0, 1);
    REQUIRE_FALSE(parse_field_animation(bytes, &err).has_value());
    REQUIRE(err.kind == FormatErrorKind::Truncated);
    REQUIRE(err.expected == kFieldAnimationHeaderSize + 2 * 36);
    REQUIRE(err.actual == bytes.size());
  }

  SECTION("Huge declared frame counts fail without reading") {
    FormatError err;
    REQUIRE_FALSE(parse_field_animation(animation_header(0x7FFFFFFF, 100000), &err).has_value());
    REQUIRE(err.kind == FormatErrorKind::Truncated);
  }

  SECTION("Negative counts are malformed") {
    FormatError err;
    REQUIRE_FALSE(parse_field_animation(animation_header(-1, 0), &err).has_value());
    REQUIRE(err.kind == FormatErrorKind::MalformedHeader);
  }

  SECTION("Trailing bytes are counted but not decoded") {
    QByteArray bytes = animation_header(1, 1);
    append_frame(bytes, 0, 1);
    const auto exact = parse_field_animation(bytes);
    REQUIRE(exact.has_value());
    REQUIRE(exact->trailing_bytes == 0);

    bytes.append(QByteArray(7, '\x01'));
    const auto anim = parse_field_animation(bytes);
    REQUIRE(anim.has_value());
    REQUIRE(anim->frames.size() == 1);
    REQUIRE(anim->trailing_bytes == 7);
  }
}

TEST_CASE("Field animation frame lookup", "[formats][animation]") {
  QByteArray bytes = animation_header(2, 1);
  append_frame(bytes, 0, 1);
  append_frame(bytes, 1, 1);
  const auto anim = parse_field_animation(bytes);
  REQUIRE(anim.has_value());

  REQUIRE(field_animation_first_frame(*anim) == &anim->frames[0]);
  REQUIRE(field_animation_frame(*anim, 1) == &anim->frames[1]);
  REQUIRE(field_animation_frame(*anim, 2) == nullptr);
  REQUIRE(field_animation_frame(*anim, -1) == nullptr);

  const FieldAnimation empty;
  REQUIRE(field_animation_first_frame(empty) == nullptr);
}
