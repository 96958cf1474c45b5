#include "formats/format_error.h"

#include <QStringList>

QString format_error_kind_name(FormatErrorKind kind) {
  switch (kind) {
    case FormatErrorKind::None:
      return "None";
    case FormatErrorKind::MalformedHeader:
      return "MalformedHeader";
    case FormatErrorKind::Truncated:
      return "Truncated";
    case FormatErrorKind::InvalidFormat:
      return "InvalidFormat";
  }
  return "None";
}

QString describe_format_error(const FormatError& error) {
  if (error.ok()) {
    return {};
  }

  QString text = format_error_kind_name(error.kind) + ": " + error.message;
  QStringList details;
  if (error.offset >= 0) {
    details << QString("offset=%1").arg(error.offset);
  }
  if (error.expected >= 0) {
    details << QString("expected=%1").arg(error.expected);
  }
  if (error.actual >= 0) {
    details << QString("actual=%1").arg(error.actual);
  }
  if (!details.isEmpty()) {
    text += " (" + details.join(' ') + ")";
  }
  return text;
}

bool set_format_error(FormatError* out,
                      FormatErrorKind kind,
                      const QString& message,
                      qint64 offset,
                      qint64 expected,
                      qint64 actual) {
  if (out) {
    out->kind = kind;
    out->message = message;
    out->offset = offset;
    out->expected = expected;
    out->actual = actual;
  }
  return false;
}
