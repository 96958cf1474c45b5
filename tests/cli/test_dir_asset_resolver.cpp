#include <catch2/catch.hpp>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "cli/dir_asset_resolver.h"

namespace {
void write_file(const QString& path, const QByteArray& bytes) {
  QFile f(path);
  REQUIRE(f.open(QIODevice::WriteOnly));
  REQUIRE(f.write(bytes) == bytes.size());
}
}  // namespace

TEST_CASE("Asset name safety", "[cli][resolver]") {
  REQUIRE(is_safe_asset_name("AAAB.rsd"));
  REQUIRE(is_safe_asset_name("field/AAAB.rsd"));
  REQUIRE_FALSE(is_safe_asset_name(""));
  REQUIRE_FALSE(is_safe_asset_name("/etc/passwd"));
  REQUIRE_FALSE(is_safe_asset_name("../AAAB.rsd"));
  REQUIRE_FALSE(is_safe_asset_name("field/../../AAAB.rsd"));
  REQUIRE_FALSE(is_safe_asset_name("C:AAAB.rsd"));
  REQUIRE_FALSE(is_safe_asset_name("field\\AAAB.rsd"));
}

TEST_CASE("Directory asset resolver", "[cli][resolver]") {
  QTemporaryDir tmp;
  REQUIRE(tmp.isValid());
  write_file(QDir(tmp.path()).filePath("aaab.rsd"), "PLY=AAAB.PLY\n");
  write_file(QDir(tmp.path()).filePath("AABB.TEX"), "tex");

  SECTION("Exact names") {
    const auto bytes = read_asset_from_dir(tmp.path(), "AABB.TEX");
    REQUIRE(bytes.has_value());
    REQUIRE(*bytes == "tex");
  }

  SECTION("File names match regardless of case") {
    const FieldAssetResolver resolver = make_dir_asset_resolver(tmp.path());
    const auto bytes = resolver("AAAB.rsd");
    REQUIRE(bytes.has_value());
    REQUIRE(*bytes == "PLY=AAAB.PLY\n");
  }

  SECTION("Absent and unsafe names resolve to nothing") {
    REQUIRE_FALSE(read_asset_from_dir(tmp.path(), "AAAZ.rsd").has_value());
    REQUIRE_FALSE(read_asset_from_dir(tmp.path(), "../aaab.rsd").has_value());
  }
}
