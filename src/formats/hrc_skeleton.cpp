#include "formats/hrc_skeleton.h"

#include <QRegularExpression>

namespace {
struct LineCursor {
  QStringList lines;
  int pos = 0;
  int line_number = 0;  // 1-based number of the last line returned.

  // Next trimmed, non-blank line; empty at end of text.
  QString next() {
    while (pos < lines.size()) {
      const QString line = lines[pos++].trimmed();
      if (!line.isEmpty()) {
        line_number = pos;
        return line;
      }
    }
    line_number = pos + 1;
    return {};
  }
};

QStringList split_ws(const QString& line) {
  static const QRegularExpression kWs(QStringLiteral("\\s+"));
  return line.split(kWs, Qt::SkipEmptyParts);
}

// Leading decimal integer of a token ("12abc" -> 12). Fails when there are no digits.
bool parse_leading_int(const QString& token, int* out) {
  int end = 0;
  if (end < token.size() && (token[end] == '-' || token[end] == '+')) {
    ++end;
  }
  const int digits_start = end;
  while (end < token.size() && token[end].isDigit()) {
    ++end;
  }
  if (end == digits_start) {
    return false;
  }
  bool ok = false;
  const int v = token.left(end).toInt(&ok, 10);
  if (!ok) {
    return false;
  }
  if (out) {
    *out = v;
  }
  return true;
}

bool expect_marker(LineCursor& cur, const char* marker, QString* line, FormatError* error) {
  *line = cur.next();
  if (line->startsWith(QLatin1String(marker))) {
    return true;
  }
  return set_format_error(error,
                          FormatErrorKind::InvalidFormat,
                          QString("Invalid HRC file: missing %1.").arg(QLatin1String(marker)),
                          cur.line_number);
}

bool parse_header_number(LineCursor& cur, const char* marker, int* out, FormatError* error) {
  QString line;
  if (!expect_marker(cur, marker, &line, error)) {
    return false;
  }
  const QStringList tokens = split_ws(line);
  if (tokens.size() < 2 || !parse_leading_int(tokens[1], out)) {
    return set_format_error(error,
                            FormatErrorKind::MalformedHeader,
                            QString("HRC %1 value is not a number: \"%2\".").arg(QLatin1String(marker), line),
                            cur.line_number);
  }
  return true;
}

bool read_bone(LineCursor& cur, int index, HrcBone* bone, FormatError* error) {
  const QString name = cur.next();
  const QString parent = cur.next();
  const QString length_line = cur.next();
  const QString resource_line = cur.next();
  if (name.isEmpty() || parent.isEmpty() || length_line.isEmpty() || resource_line.isEmpty()) {
    return set_format_error(error,
                            FormatErrorKind::Truncated,
                            QString("HRC text ends inside bone %1.").arg(index),
                            cur.line_number);
  }

  const QStringList length_tokens = split_ws(length_line);
  bool ok = false;
  const double length = length_tokens.isEmpty() ? 0.0 : length_tokens.first().toDouble(&ok);
  if (!ok) {
    return set_format_error(error,
                            FormatErrorKind::MalformedHeader,
                            QString("HRC bone \"%1\" length is not a number: \"%2\".").arg(name, length_line),
                            cur.line_number);
  }

  bone->name = name;
  bone->parent_name = parent;
  bone->length = length;

  QStringList parts = split_ws(resource_line);
  int count = 0;
  if (!parts.isEmpty() && !parse_leading_int(parts.first(), &count)) {
    count = 0;
  }
  bone->resource_count = count;
  if (!parts.isEmpty()) {
    parts.removeFirst();
  }
  bone->resources = parts;
  return true;
}
}  // namespace

std::optional<HrcSkeleton> parse_hrc_text(const QString& text, FormatError* error) {
  if (error) {
    error->clear();
  }

  LineCursor cur;
  cur.lines = text.split('\n');

  HrcSkeleton out;
  if (!parse_header_number(cur, ":HEADER_BLOCK", &out.header_block, error)) {
    return std::nullopt;
  }

  QString skeleton_line;
  if (!expect_marker(cur, ":SKELETON", &skeleton_line, error)) {
    return std::nullopt;
  }
  const QStringList skeleton_tokens = split_ws(skeleton_line);
  out.skeleton_name = skeleton_tokens.size() >= 2 ? skeleton_tokens[1] : QString();

  if (!parse_header_number(cur, ":BONES", &out.bone_count, error)) {
    return std::nullopt;
  }
  if (out.header_block < 0 || out.bone_count < 0) {
    set_format_error(error,
                     FormatErrorKind::MalformedHeader,
                     QString("HRC header values are negative (block %1, bones %2).")
                       .arg(out.header_block)
                       .arg(out.bone_count),
                     cur.line_number);
    return std::nullopt;
  }

  // Each bone takes at least four lines.
  out.bones.reserve(qMin(out.bone_count, static_cast<int>(cur.lines.size() / 4) + 1));
  for (int i = 0; i < out.bone_count; ++i) {
    HrcBone bone;
    if (!read_bone(cur, i, &bone, error)) {
      return std::nullopt;
    }
    out.bones.push_back(std::move(bone));
  }

  return out;
}

std::optional<HrcSkeleton> parse_hrc_bytes(const QByteArray& bytes, FormatError* error) {
  return parse_hrc_text(QString::fromLatin1(bytes), error);
}

int hrc_bone_parent_index(const HrcSkeleton& skeleton, int bone_index) {
  if (bone_index < 0 || bone_index >= skeleton.bones.size()) {
    return -1;
  }
  const QString& parent = skeleton.bones[bone_index].parent_name;
  if (parent.compare("root", Qt::CaseInsensitive) == 0) {
    return -1;
  }
  for (int i = 0; i < skeleton.bones.size(); ++i) {
    if (skeleton.bones[i].name.compare(parent, Qt::CaseInsensitive) == 0) {
      return i;
    }
  }
  return -1;
}

QVector<int> hrc_parent_indices(const HrcSkeleton& skeleton) {
  QVector<int> out;
  out.reserve(skeleton.bones.size());
  for (int i = 0; i < skeleton.bones.size(); ++i) {
    out.push_back(hrc_bone_parent_index(skeleton, i));
  }
  return out;
}

HrcSummary summarize_hrc(const HrcSkeleton& skeleton) {
  HrcSummary s;
  s.name = skeleton.skeleton_name;
  s.bone_count = skeleton.bone_count;
  for (const HrcBone& bone : skeleton.bones) {
    if (bone.resource_count > 0) {
      ++s.bones_with_models;
    }
  }
  return s;
}

QVector<HrcRelatedFile> hrc_related_files(const HrcSkeleton& skeleton) {
  QVector<HrcRelatedFile> files;
  for (const HrcBone& bone : skeleton.bones) {
    for (const QString& rsd : bone.resources) {
      files.push_back(HrcRelatedFile{rsd + ".rsd", "Resource Definition"});
    }
  }
  return files;
}
