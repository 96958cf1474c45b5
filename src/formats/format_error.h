#pragma once

#include <QString>
#include <QtGlobal>

enum class FormatErrorKind {
  None = 0,
  MalformedHeader,  // Header present but its values are out of range.
  Truncated,        // Buffer ends before a mandatory section.
  InvalidFormat,    // Expected line marker not found (HRC only).
};

struct FormatError {
  FormatErrorKind kind = FormatErrorKind::None;
  QString message;
  // Byte offset (binary formats) or line number (text formats); -1 when not applicable.
  qint64 offset = -1;
  qint64 expected = -1;
  qint64 actual = -1;

  [[nodiscard]] bool ok() const { return kind == FormatErrorKind::None; }
  void clear() { *this = {}; }
};

[[nodiscard]] QString format_error_kind_name(FormatErrorKind kind);

// "Truncated: TEX pixel data exceeds file size. (offset=236 expected=16 actual=4)"
[[nodiscard]] QString describe_format_error(const FormatError& error);

// Fills *out (when non-null) and returns false, so parsers can `return fail(...)`.
bool set_format_error(FormatError* out,
                      FormatErrorKind kind,
                      const QString& message,
                      qint64 offset = -1,
                      qint64 expected = -1,
                      qint64 actual = -1);
