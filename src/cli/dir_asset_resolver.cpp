#include "cli/dir_asset_resolver.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>

bool is_safe_asset_name(const QString& name) {
  if (name.isEmpty()) {
    return false;
  }
  if (name.contains('\\') || name.contains(':')) {
    return false;
  }
  if (name.startsWith('/') || name.startsWith("./") || name.startsWith("../")) {
    return false;
  }
  const QStringList parts = name.split('/', Qt::SkipEmptyParts);
  for (const QString& p : parts) {
    if (p == "." || p == "..") {
      return false;
    }
  }
  return true;
}

std::optional<QByteArray> read_asset_from_dir(const QString& dir_path, const QString& name) {
  if (!is_safe_asset_name(name)) {
    qWarning() << "DirAssetResolver: rejected unsafe name" << name;
    return std::nullopt;
  }

  const QDir dir(dir_path);
  QString path = dir.filePath(name);
  if (!QFileInfo::exists(path)) {
    // Only the file name is matched loosely; sub-directories must match exactly.
    const QFileInfo wanted(path);
    const QDir parent = wanted.dir();
    const QStringList candidates = parent.entryList(QDir::Files);
    path.clear();
    for (const QString& candidate : candidates) {
      if (candidate.compare(wanted.fileName(), Qt::CaseInsensitive) == 0) {
        path = parent.filePath(candidate);
        break;
      }
    }
    if (path.isEmpty()) {
      return std::nullopt;
    }
  }

  QFile f(path);
  if (!f.open(QIODevice::ReadOnly)) {
    qWarning() << "DirAssetResolver: unable to open" << path << "-" << f.errorString();
    return std::nullopt;
  }
  return f.readAll();
}

FieldAssetResolver make_dir_asset_resolver(const QString& dir_path) {
  return [dir_path](const QString& name) { return read_asset_from_dir(dir_path, name); };
}
