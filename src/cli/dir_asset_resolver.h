#pragma once

#include <QByteArray>
#include <QString>

#include "formats/field_model_assets.h"

// Entry names from skeletons and descriptors must stay inside the search directory:
// relative, forward slashes, no drive letters and no "." or ".." segments.
[[nodiscard]] bool is_safe_asset_name(const QString& name);

// Looks name up in dir_path, matching file names case-insensitively (the game's
// references mix "AAAB.RSD" and "aaab.rsd"). Empty optional when absent or unsafe.
[[nodiscard]] std::optional<QByteArray> read_asset_from_dir(const QString& dir_path, const QString& name);

[[nodiscard]] FieldAssetResolver make_dir_asset_resolver(const QString& dir_path);
