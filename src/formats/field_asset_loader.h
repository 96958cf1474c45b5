#pragma once

#include <QByteArray>
#include <QString>

#include "formats/format_error.h"

struct FieldAssetDecodeResult {
  QString type;
  QString summary;
  QString error;
  FormatErrorKind error_kind = FormatErrorKind::None;

  [[nodiscard]] bool ok() const { return error.isEmpty() && !summary.isEmpty(); }
};

[[nodiscard]] bool is_supported_field_asset_file(const QString& file_name);

// Human-readable summary of a TEX/RSD/HRC/animation buffer for previews and the CLI.
// Decode failures come back in error/error_kind so callers can show a fallback.
[[nodiscard]] FieldAssetDecodeResult decode_field_asset_bytes(const QByteArray& bytes,
                                                              const QString& file_name,
                                                              int palette_selector = 0);
