#include "ZmodemReader.hpp"

#include "SessionError.hpp"

namespace wt {
namespace {
bool startsSubpackets(uint8_t type) {
  return type == ZFILE || type == ZDATA || type == ZSINIT || type == ZCOMMAND;
}

bool isFrameEnd(uint8_t c) { return c >= ZCRCE && c <= ZCRCW; }
}  // namespace

ZmodemReader::ZmodemReader()
    : pos(0),
      subpacketMode(false),
      subpacketCrc32(false),
      awaitingOverAndOut(false) {}

void ZmodemReader::push(const string& bytes) {
  compact();
  buffer.append(bytes);
}

void ZmodemReader::compact() {
  if (pos > 0 && (pos == buffer.size() || pos > 64 * 1024)) {
    buffer.erase(0, pos);
    pos = 0;
  }
}

string ZmodemReader::takeRemaining() {
  string rest = buffer.substr(std::min(pos, buffer.size()));
  buffer.clear();
  pos = 0;
  return rest;
}

size_t ZmodemReader::canRunLength(size_t start) const {
  size_t i = start;
  while (i < buffer.size() && uint8_t(buffer[i]) == CAN) {
    i++;
  }
  return i - start;
}

size_t ZmodemReader::findAbortRun(size_t start, size_t limit) const {
  size_t i = buffer.find(char(CAN), start);
  while (i != string::npos && i < limit) {
    size_t run = canRunLength(i);
    if (run >= 5) {
      return i;
    }
    i = buffer.find(char(CAN), i + run);
  }
  return string::npos;
}

bool ZmodemReader::next(ZmodemEvent* event) {
  while (pos < buffer.size()) {
    if (uint8_t(buffer[pos]) == CAN) {
      size_t run = canRunLength(pos);
      if (run >= 5) {
        pos += run;
        subpacketMode = false;
        event->type = ZmodemEvent::ABORT;
        return true;
      }
      if (pos + run == buffer.size()) {
        return false;
      }
    }

    if (awaitingOverAndOut && !subpacketMode) {
      // Line ending and XON left over from the previous hex header
      while (pos < buffer.size() &&
             (buffer[pos] == '\r' || buffer[pos] == '\n' ||
              uint8_t(buffer[pos]) == 0x8a || uint8_t(buffer[pos]) == XON)) {
        pos++;
      }
      if (pos >= buffer.size()) {
        return false;
      }
      if (buffer[pos] == 'O') {
        if (pos + 1 >= buffer.size()) {
          return false;
        }
        if (buffer[pos + 1] == 'O') {
          pos += 2;
        }
      }
      awaitingOverAndOut = false;
      event->type = ZmodemEvent::OVER_AND_OUT;
      return true;
    }

    if (subpacketMode) {
      return parseSubpacket(event);
    }
    if (parseHeader(event)) {
      return true;
    }
    if (pos < buffer.size() && uint8_t(buffer[pos]) != CAN) {
      // parseHeader stopped on an incomplete header
      return false;
    }
  }
  return false;
}

bool ZmodemReader::decodeEscaped(size_t start, int count, uint8_t* out,
                                 size_t* end) {
  size_t i = start;
  for (int n = 0; n < count; n++) {
    if (i >= buffer.size()) {
      return false;
    }
    uint8_t c = buffer[i];
    if (c != ZDLE) {
      out[n] = c;
      i++;
      continue;
    }
    if (i + 1 >= buffer.size()) {
      return false;
    }
    uint8_t d = buffer[i + 1];
    if (d == ZRUB0) {
      out[n] = 0x7f;
    } else if (d == ZRUB1) {
      out[n] = 0xff;
    } else if ((d & 0x60) == 0x40) {
      out[n] = d ^ 0x40;
    } else {
      pos = i + 2;
      subpacketMode = false;
      throw SessionError(SessionErrorKind::PROTOCOL,
                         "Invalid zmodem escape sequence");
    }
    i += 2;
  }
  *end = i;
  return true;
}

bool ZmodemReader::parseHeader(ZmodemEvent* event) {
  while (pos < buffer.size()) {
    size_t pad = buffer.find(char(ZPAD), pos);
    size_t abortRun = findAbortRun(pos, pad);
    if (abortRun != string::npos) {
      pos = abortRun;
      return false;
    }
    if (pad == string::npos) {
      // Keep a trailing CAN run, it may grow into an abort
      size_t tail = buffer.size();
      while (tail > pos && uint8_t(buffer[tail - 1]) == CAN) {
        tail--;
      }
      pos = tail;
      return false;
    }
    pos = pad;
    size_t i = pad;
    while (i < buffer.size() && uint8_t(buffer[i]) == ZPAD) {
      i++;
    }
    if (i + 1 >= buffer.size()) {
      return false;
    }
    if (uint8_t(buffer[i]) != ZDLE) {
      pos = i;
      continue;
    }
    uint8_t format = buffer[i + 1];
    if (format == ZHEX) {
      size_t digits = i + 2;
      if (digits + 14 > buffer.size()) {
        return false;
      }
      ZmodemHeader header;
      size_t start = 0;
      size_t end = 0;
      string candidate = buffer.substr(pad, digits + 14 - pad);
      pos = digits + 14;
      if (!findHexHeader(candidate, &header, &start, &end)) {
        throw SessionError(SessionErrorKind::PROTOCOL,
                           "Bad zmodem hex header");
      }
      event->type = ZmodemEvent::HEADER;
      event->header = header;
    } else if (format == ZBIN || format == ZBIN32) {
      bool crc32 = (format == ZBIN32);
      uint8_t raw[9];
      size_t end = 0;
      if (!decodeEscaped(i + 2, crc32 ? 9 : 7, raw, &end)) {
        return false;
      }
      pos = end;
      if (crc32) {
        uint32_t crc = uint32_t(raw[5]) | (uint32_t(raw[6]) << 8) |
                       (uint32_t(raw[7]) << 16) | (uint32_t(raw[8]) << 24);
        if (crc != zmodemCrc32(raw, 5)) {
          throw SessionError(SessionErrorKind::PROTOCOL,
                             "Bad zmodem binary header crc32");
        }
      } else {
        uint16_t crc = (uint16_t(raw[5]) << 8) | raw[6];
        if (crc != zmodemCrc16(raw, 5)) {
          throw SessionError(SessionErrorKind::PROTOCOL,
                             "Bad zmodem binary header crc16");
        }
      }
      event->type = ZmodemEvent::HEADER;
      event->header.type = raw[0];
      for (int n = 0; n < 4; n++) {
        event->header.data[n] = raw[n + 1];
      }
      event->header.format =
          crc32 ? ZmodemHeaderFormat::BIN32 : ZmodemHeaderFormat::BIN16;
    } else {
      pos = i + 1;
      continue;
    }

    VLOG(3) << "Zmodem header " << zmodemFrameTypeName(event->header.type)
            << " pos " << event->header.position();
    if (startsSubpackets(event->header.type)) {
      subpacketMode = true;
      subpacketCrc32 = (event->header.format == ZmodemHeaderFormat::BIN32);
    }
    return true;
  }
  return false;
}

bool ZmodemReader::parseSubpacket(ZmodemEvent* event) {
  string data;
  size_t i = pos;
  while (true) {
    if (i >= buffer.size()) {
      return false;
    }
    uint8_t c = buffer[i];
    if (c != ZDLE) {
      data.push_back(char(c));
      i++;
    } else {
      if (i + 1 >= buffer.size()) {
        return false;
      }
      uint8_t d = buffer[i + 1];
      if (isFrameEnd(d)) {
        uint8_t crcBytes[4];
        size_t end = 0;
        if (!decodeEscaped(i + 2, subpacketCrc32 ? 4 : 2, crcBytes, &end)) {
          return false;
        }
        pos = end;
        string covered = data;
        covered.push_back(char(d));
        const uint8_t* bytes =
            reinterpret_cast<const uint8_t*>(covered.data());
        bool valid;
        if (subpacketCrc32) {
          uint32_t crc = uint32_t(crcBytes[0]) |
                         (uint32_t(crcBytes[1]) << 8) |
                         (uint32_t(crcBytes[2]) << 16) |
                         (uint32_t(crcBytes[3]) << 24);
          valid = (crc == zmodemCrc32(bytes, covered.size()));
        } else {
          uint16_t crc = (uint16_t(crcBytes[0]) << 8) | crcBytes[1];
          valid = (crc == zmodemCrc16(bytes, covered.size()));
        }
        if (!valid) {
          subpacketMode = false;
          throw SessionError(SessionErrorKind::PROTOCOL,
                             "Bad zmodem subpacket crc");
        }
        if (d == ZCRCE || d == ZCRCW) {
          subpacketMode = false;
        }
        event->type = ZmodemEvent::SUBPACKET;
        event->data.swap(data);
        event->frameEnd = d;
        VLOG(4) << "Zmodem subpacket of " << event->data.size() << " bytes";
        return true;
      }
      if (d == CAN) {
        size_t run = canRunLength(i);
        if (run >= 5) {
          pos = i;
          subpacketMode = false;
          return next(event);
        }
        if (i + run == buffer.size()) {
          return false;
        }
      }
      if (d == ZRUB0) {
        data.push_back(char(0x7f));
      } else if (d == ZRUB1) {
        data.push_back(char(0xff));
      } else if ((d & 0x60) == 0x40) {
        data.push_back(char(d ^ 0x40));
      } else {
        pos = i + 2;
        subpacketMode = false;
        throw SessionError(SessionErrorKind::PROTOCOL,
                           "Invalid zmodem escape in subpacket");
      }
      i += 2;
    }
    if (data.size() > MAX_SUBPACKET_SIZE) {
      pos = i;
      subpacketMode = false;
      throw SessionError(SessionErrorKind::PROTOCOL,
                         "Zmodem subpacket too long");
    }
  }
}
}  // namespace wt
