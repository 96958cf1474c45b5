#include "formats/rsd_resource.h"

#include <QRegularExpression>

namespace {
// parseInt-style: optional sign then leading digits; 0 when there are none.
int leading_int(const QString& text) {
  const QString s = text.trimmed();
  int end = 0;
  if (end < s.size() && (s[end] == '-' || s[end] == '+')) {
    ++end;
  }
  const int digits_start = end;
  while (end < s.size() && s[end].isDigit()) {
    ++end;
  }
  if (end == digits_start) {
    return 0;
  }
  bool ok = false;
  const int v = s.left(end).toInt(&ok, 10);
  return ok ? v : 0;
}

QString replace_suffix_ci(const QString& name, const QString& from, const QString& to) {
  if (name.endsWith(from, Qt::CaseInsensitive)) {
    return name.left(name.size() - from.size()) + to;
  }
  return name;
}
}  // namespace

RsdResource parse_rsd_text(const QString& text) {
  static const QRegularExpression kTexLine(QStringLiteral("^TEX\\[\\d+\\]=(.+)$"));

  RsdResource out;
  const QStringList lines = text.split('\n');
  for (const QString& raw : lines) {
    const QString line = raw.trimmed();
    if (line.isEmpty()) {
      continue;
    }

    if (line.startsWith("@RSD")) {
      out.id = line;
    } else if (line.startsWith("PLY=")) {
      out.ply_file = line.mid(4);
    } else if (line.startsWith("MAT=")) {
      out.mat_file = line.mid(4);
    } else if (line.startsWith("GRP=")) {
      out.grp_file = line.mid(4);
    } else if (line.startsWith("NTEX=")) {
      out.declared_texture_count = leading_int(line.mid(5));
    } else if (line.startsWith("TEX[")) {
      const QRegularExpressionMatch m = kTexLine.match(line);
      if (m.hasMatch()) {
        out.textures.push_back(m.captured(1));
      }
    }
  }
  return out;
}

RsdResource parse_rsd_bytes(const QByteArray& bytes) {
  return parse_rsd_text(QString::fromLatin1(bytes));
}

QString rsd_p_model_filename(const RsdResource& rsd) {
  if (rsd.ply_file.isEmpty()) {
    return {};
  }
  return replace_suffix_ci(rsd.ply_file, ".PLY", ".P");
}

QStringList rsd_texture_filenames(const RsdResource& rsd) {
  QStringList out;
  out.reserve(rsd.textures.size());
  for (const QString& tex : rsd.textures) {
    out.push_back(replace_suffix_ci(tex, ".TIM", ".TEX"));
  }
  return out;
}

RsdSummary summarize_rsd(const RsdResource& rsd) {
  RsdSummary s;
  s.p_model = rsd_p_model_filename(rsd);
  s.textures = rsd_texture_filenames(rsd);
  s.declared_texture_count = rsd.declared_texture_count;
  return s;
}
