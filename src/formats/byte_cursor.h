#pragma once

#include <cstring>

#include <QByteArray>
#include <QtGlobal>

// Bounds-checked little-endian reader over a borrowed QByteArray.
// Every read fails (returns false, position unchanged) instead of running past the end.
struct ByteCursor {
  const QByteArray* bytes = nullptr;
  int pos = 0;

  ByteCursor() = default;
  explicit ByteCursor(const QByteArray& data, int start = 0) : bytes(&data), pos(start) {}

  bool seek(int p) {
    if (!bytes) {
      return false;
    }
    if (p < 0 || p > bytes->size()) {
      return false;
    }
    pos = p;
    return true;
  }

  bool skip(int n) { return seek(pos + n); }

  bool can_read(qint64 n) const {
    if (!bytes) {
      return false;
    }
    if (n < 0) {
      return false;
    }
    return pos >= 0 && static_cast<qint64>(pos) + n <= bytes->size();
  }

  bool read_u8(quint8* out) {
    if (!can_read(1) || !out) {
      return false;
    }
    *out = static_cast<quint8>((*bytes)[pos]);
    ++pos;
    return true;
  }

  bool read_u32(quint32* out) {
    if (!can_read(4) || !out) {
      return false;
    }
    const quint32 b0 = static_cast<quint8>((*bytes)[pos + 0]);
    const quint32 b1 = static_cast<quint8>((*bytes)[pos + 1]);
    const quint32 b2 = static_cast<quint8>((*bytes)[pos + 2]);
    const quint32 b3 = static_cast<quint8>((*bytes)[pos + 3]);
    *out = b0 | (b1 << 8) | (b2 << 16) | (b3 << 24);
    pos += 4;
    return true;
  }

  bool read_i32(qint32* out) {
    quint32 u = 0;
    if (!out || !read_u32(&u)) {
      return false;
    }
    *out = static_cast<qint32>(u);
    return true;
  }

  bool read_f32(float* out) {
    quint32 u = 0;
    if (!out || !read_u32(&u)) {
      return false;
    }
    static_assert(sizeof(float) == sizeof(quint32));
    float f = 0.0f;
    std::memcpy(&f, &u, sizeof(float));
    *out = f;
    return true;
  }
};

// Little-endian writer into a pre-sized buffer. Writes past the end are dropped and reported.
struct ByteWriter {
  QByteArray* bytes = nullptr;
  int pos = 0;

  ByteWriter() = default;
  explicit ByteWriter(QByteArray& data, int start = 0) : bytes(&data), pos(start) {}

  bool can_write(qint64 n) const {
    if (!bytes || n < 0) {
      return false;
    }
    return pos >= 0 && static_cast<qint64>(pos) + n <= bytes->size();
  }

  bool skip(int n) {
    if (!can_write(n)) {
      return false;
    }
    pos += n;
    return true;
  }

  bool write_u32(quint32 v) {
    if (!can_write(4)) {
      return false;
    }
    char* dst = bytes->data() + pos;
    dst[0] = static_cast<char>(v & 0xFF);
    dst[1] = static_cast<char>((v >> 8) & 0xFF);
    dst[2] = static_cast<char>((v >> 16) & 0xFF);
    dst[3] = static_cast<char>((v >> 24) & 0xFF);
    pos += 4;
    return true;
  }

  // Copies up to n bytes of src; any shortfall stays zero-filled.
  bool write_bytes(const QByteArray& src, int n) {
    if (!can_write(n)) {
      return false;
    }
    const int copy = qMin(n, static_cast<int>(src.size()));
    if (copy > 0) {
      std::memcpy(bytes->data() + pos, src.constData(), static_cast<size_t>(copy));
    }
    pos += n;
    return true;
  }
};
