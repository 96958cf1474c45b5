#include <catch2/catch.hpp>

#include "formats/hrc_skeleton.h"

namespace {
const char kSkeleton[] =
  ":HEADER_BLOCK 2\r\n"
  ":SKELETON aaaa\r\n"
  ":BONES 3\r\n"
  "\r\n"
  "Hip\r\n"
  "root\r\n"
  "3.5\r\n"
  "1 AAAB\r\n"
  "\r\n"
  "Knee\r\n"
  "HIP\r\n"
  "2.25\r\n"
  "2 AAAC AAAD\r\n"
  "\r\n"
  "Tail\r\n"
  "Missing\r\n"
  "1\r\n"
  "0\r\n";
}  // namespace

TEST_CASE("HRC parsing", "[formats][hrc]") {
  SECTION("Header and bones") {
    FormatError err;
    const auto hrc = parse_hrc_bytes(QByteArray(kSkeleton), &err);
    REQUIRE(hrc.has_value());
    REQUIRE(err.ok());
    REQUIRE(hrc->header_block == 2);
    REQUIRE(hrc->skeleton_name == "aaaa");
    REQUIRE(hrc->bone_count == 3);
    REQUIRE(hrc->bones.size() == 3);

    const HrcBone& knee = hrc->bones[1];
    REQUIRE(knee.name == "Knee");
    REQUIRE(knee.parent_name == "HIP");
    REQUIRE(knee.length == Approx(2.25));
    REQUIRE(knee.resource_count == 2);
    REQUIRE(knee.resources == QStringList({"AAAC", "AAAD"}));

    REQUIRE(hrc->bones[2].resource_count == 0);
    REQUIRE(hrc->bones[2].resources.isEmpty());
  }

  SECTION("Parent resolution is case-insensitive and root means no parent") {
    const auto hrc = parse_hrc_text(QString::fromLatin1(kSkeleton));
    REQUIRE(hrc.has_value());
    REQUIRE(hrc_bone_parent_index(*hrc, 0) == -1);
    REQUIRE(hrc_bone_parent_index(*hrc, 1) == 0);
    REQUIRE(hrc_bone_parent_index(*hrc, 2) == -1);  // dangling
    REQUIRE(hrc_bone_parent_index(*hrc, 3) == -1);
    REQUIRE(hrc_bone_parent_index(*hrc, -1) == -1);
    REQUIRE(hrc_parent_indices(*hrc) == QVector<int>({-1, 0, -1}));
  }

  SECTION("ROOT in any case") {
    const auto hrc = parse_hrc_text(":HEADER_BLOCK 2\n:SKELETON x\n:BONES 1\nroot\nROOT\n1\n0\n");
    REQUIRE(hrc.has_value());
    REQUIRE(hrc_bone_parent_index(*hrc, 0) == -1);
  }

  SECTION("Resource count mismatches are tolerated") {
    const auto hrc = parse_hrc_text(":HEADER_BLOCK 2\n:SKELETON x\n:BONES 2\nA\nroot\n1\n3 R1\nB\nA\n1\nx R2 R3\n");
    REQUIRE(hrc.has_value());
    REQUIRE(hrc->bones[0].resource_count == 3);
    REQUIRE(hrc->bones[0].resources == QStringList({"R1"}));
    REQUIRE(hrc->bones[1].resource_count == 0);
    REQUIRE(hrc->bones[1].resources == QStringList({"R2", "R3"}));
  }

  SECTION("Missing markers name the expected marker") {
    FormatError err;
    REQUIRE_FALSE(parse_hrc_text("hello\n", &err).has_value());
    REQUIRE(err.kind == FormatErrorKind::InvalidFormat);
    REQUIRE(err.message.contains(":HEADER_BLOCK"));

    REQUIRE_FALSE(parse_hrc_text(":HEADER_BLOCK 2\n:BONES 1\n", &err).has_value());
    REQUIRE(err.kind == FormatErrorKind::InvalidFormat);
    REQUIRE(err.message.contains(":SKELETON"));

    REQUIRE_FALSE(parse_hrc_text(":HEADER_BLOCK 2\n\n\n:SKELETON x\n", &err).has_value());
    REQUIRE(err.kind == FormatErrorKind::InvalidFormat);
    REQUIRE(err.message.contains(":BONES"));

    REQUIRE_FALSE(parse_hrc_text(QString(), &err).has_value());
    REQUIRE(err.kind == FormatErrorKind::InvalidFormat);
  }

  SECTION("Non-numeric header values are malformed") {
    FormatError err;
    REQUIRE_FALSE(parse_hrc_text(":HEADER_BLOCK 2\n:SKELETON x\n:BONES many\n", &err).has_value());
    REQUIRE(err.kind == FormatErrorKind::MalformedHeader);

    REQUIRE_FALSE(parse_hrc_text(":HEADER_BLOCK\n:SKELETON x\n:BONES 0\n", &err).has_value());
    REQUIRE(err.kind == FormatErrorKind::MalformedHeader);

    REQUIRE_FALSE(parse_hrc_text(":HEADER_BLOCK 2\n:SKELETON x\n:BONES -1\n", &err).has_value());
    REQUIRE(err.kind == FormatErrorKind::MalformedHeader);
  }

  SECTION("Non-numeric bone length is malformed") {
    FormatError err;
    REQUIRE_FALSE(parse_hrc_text(":HEADER_BLOCK 2\n:SKELETON x\n:BONES 1\nA\nroot\nlong\n0\n", &err).has_value());
    REQUIRE(err.kind == FormatErrorKind::MalformedHeader);
  }

  SECTION("Text ending inside the bone list is truncated") {
    FormatError err;
    REQUIRE_FALSE(parse_hrc_text(":HEADER_BLOCK 2\n:SKELETON x\n:BONES 2\nA\nroot\n1\n0\nB\n", &err).has_value());
    REQUIRE(err.kind == FormatErrorKind::Truncated);
  }

  SECTION("Bone names keep interior carriage returns") {
    const auto hrc = parse_hrc_text(":HEADER_BLOCK 2\r\n:SKELETON x\r\n:BONES 1\r\nLeft\rHand\r\nroot\r\n1\r\n0\r\n");
    REQUIRE(hrc.has_value());
    REQUIRE(hrc->bones[0].name == "Left\rHand");
    REQUIRE(hrc->bones[0].parent_name == "root");
  }

  SECTION("Zero bones") {
    const auto hrc = parse_hrc_text(":HEADER_BLOCK 2\n:SKELETON empty\n:BONES 0\n");
    REQUIRE(hrc.has_value());
    REQUIRE(hrc->bones.isEmpty());
  }
}

TEST_CASE("HRC summary and related files", "[formats][hrc]") {
  const auto hrc = parse_hrc_bytes(QByteArray(kSkeleton));
  REQUIRE(hrc.has_value());

  const HrcSummary s = summarize_hrc(*hrc);
  REQUIRE(s.name == "aaaa");
  REQUIRE(s.bone_count == 3);
  REQUIRE(s.bones_with_models == 2);

  const QVector<HrcRelatedFile> files = hrc_related_files(*hrc);
  REQUIRE(files.size() == 3);
  REQUIRE(files[0].name == "AAAB.rsd");
  REQUIRE(files[0].type == "Resource Definition");
  REQUIRE(files[2].name == "AAAD.rsd");
}
