#include <catch2/catch.hpp>

#include "formats/field_animation.h"
#include "formats/field_asset_kind.h"
#include "formats/field_asset_loader.h"
#include "formats/tex_test_data.h"

using namespace tex_test;

TEST_CASE("Field asset kind detection", "[formats][loader]") {
  REQUIRE(field_asset_kind_for_name("AAAA.TEX") == FieldAssetKind::Texture);
  REQUIRE(field_asset_kind_for_name("field/aaab.rsd") == FieldAssetKind::ResourceDescriptor);
  REQUIRE(field_asset_kind_for_name("AAAA.HRC") == FieldAssetKind::Skeleton);
  REQUIRE(field_asset_kind_for_name("AAFE.a") == FieldAssetKind::Animation);
  REQUIRE(field_asset_kind_for_name("AAAC.P") == FieldAssetKind::PolygonModel);
  REQUIRE(field_asset_kind_for_name("readme.txt") == FieldAssetKind::Unknown);
  REQUIRE(field_asset_kind_for_name("noext") == FieldAssetKind::Unknown);

  REQUIRE(field_asset_kind_display_name(FieldAssetKind::Texture) == "TEX Image");
  REQUIRE(field_asset_kind_display_name(FieldAssetKind::ResourceDescriptor) == "Resource Definition");
  REQUIRE(field_asset_kind_display_name(FieldAssetKind::Skeleton) == "Field Skeleton");
  REQUIRE(field_asset_kind_display_name(FieldAssetKind::Animation) == "Field Animation");
  REQUIRE(field_asset_kind_display_name(FieldAssetKind::PolygonModel) == "P Model");
  REQUIRE(field_asset_kind_display_name(FieldAssetKind::Unknown) == "Hex View");

  REQUIRE(is_supported_field_asset_file("x.tex"));
  REQUIRE(is_supported_field_asset_file("x.a"));
  REQUIRE_FALSE(is_supported_field_asset_file("x.p"));
  REQUIRE_FALSE(is_supported_field_asset_file("x.bin"));
}

TEST_CASE("Field asset summaries", "[formats][loader]") {
  SECTION("TEX") {
    QByteArray bytes = paletted_header(4, 2, 1, 2);
    bytes.append(QByteArray(8, '\x11'));
    bytes.append(QByteArray(8, '\x00'));
    const FieldAssetDecodeResult r = decode_field_asset_bytes(bytes, "AABB.TEX");
    REQUIRE(r.ok());
    REQUIRE(r.type == "TEX Image");
    REQUIRE(r.summary.contains("Size: 4x2"));
    REQUIRE(r.summary.contains("Header layout: standard"));
    REQUIRE(r.summary.contains("Palettes: 1 x 2 colors"));
  }

  SECTION("Broken TEX reports the decoder error") {
    QByteArray bytes = paletted_header(4, 2, 1, 2);
    bytes.append(QByteArray(8, '\x11'));  // pixels missing
    const FieldAssetDecodeResult r = decode_field_asset_bytes(bytes, "AABB.TEX");
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.type == "TEX Image");
    REQUIRE(r.error_kind == FormatErrorKind::Truncated);
    REQUIRE(r.error.contains("pixel data"));
  }

  SECTION("RSD") {
    const FieldAssetDecodeResult r =
      decode_field_asset_bytes("@RSD940102\nPLY=AAAC.PLY\nNTEX=1\nTEX[0]=AABB.TIM\n", "aaab.rsd");
    REQUIRE(r.ok());
    REQUIRE(r.type == "Resource Definition");
    REQUIRE(r.summary.contains("P model: AAAC.P"));
    REQUIRE(r.summary.contains("AABB.TEX"));
  }

  SECTION("HRC") {
    const FieldAssetDecodeResult r = decode_field_asset_bytes(
      ":HEADER_BLOCK 2\n:SKELETON aaaa\n:BONES 1\nHip\nroot\n3.5\n1 AAAB\n", "AAAA.HRC");
    REQUIRE(r.ok());
    REQUIRE(r.summary.contains("Name: aaaa"));
    REQUIRE(r.summary.contains("Bones: 1 (1 with models)"));
    REQUIRE(r.summary.contains("AAAB.rsd (Resource Definition)"));
  }

  SECTION("HRC without markers") {
    const FieldAssetDecodeResult r = decode_field_asset_bytes("not a skeleton\n", "AAAA.HRC");
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.error_kind == FormatErrorKind::InvalidFormat);
  }

  SECTION("Animation") {
    QByteArray bytes(kFieldAnimationHeaderSize, '\0');
    put_u32(bytes, 0, 1);
    const FieldAssetDecodeResult r = decode_field_asset_bytes(bytes, "AAFE.A");
    REQUIRE(r.ok());
    REQUIRE(r.summary.contains("Frames: 0"));
    REQUIRE(r.summary.contains("1 rotation slots per frame"));
    REQUIRE_FALSE(r.summary.contains("Trailing bytes"));

    bytes.append(QByteArray(5, '\x00'));
    const FieldAssetDecodeResult padded = decode_field_asset_bytes(bytes, "AAFE.A");
    REQUIRE(padded.ok());
    REQUIRE(padded.summary.contains("Trailing bytes: 5"));
  }

  SECTION("Unsupported types") {
    const FieldAssetDecodeResult r = decode_field_asset_bytes("x", "AAAC.P");
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.error == "Unsupported field asset type.");
  }
}
