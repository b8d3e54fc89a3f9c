#include "ZmodemCodec.hpp"

namespace wt {
namespace {
const char HEX_DIGITS[] = "0123456789abcdef";

void appendHex(uint8_t c, string* out) {
  out->push_back(HEX_DIGITS[c >> 4]);
  out->push_back(HEX_DIGITS[c & 0x0f]);
}

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool decodeHexByte(const string& s, size_t offset, uint8_t* out) {
  int hi = hexValue(s[offset]);
  int lo = hexValue(s[offset + 1]);
  if (hi < 0 || lo < 0) {
    return false;
  }
  *out = uint8_t((hi << 4) | lo);
  return true;
}

std::array<uint32_t, 256> buildCrc32Table() {
  std::array<uint32_t, 256> table;
  for (uint32_t i = 0; i < 256; i++) {
    uint32_t c = i;
    for (int k = 0; k < 8; k++) {
      c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
    }
    table[i] = c;
  }
  return table;
}

void appendEscaped(uint8_t c, string* out) {
  if (zmodemNeedsEscape(c)) {
    out->push_back(char(ZDLE));
    out->push_back(char(c ^ 0x40));
  } else {
    out->push_back(char(c));
  }
}
}  // namespace

const char* zmodemFrameTypeName(uint8_t type) {
  static const char* NAMES[] = {
      "ZRQINIT", "ZRINIT",     "ZSINIT", "ZACK",     "ZFILE",
      "ZSKIP",   "ZNAK",       "ZABORT", "ZFIN",     "ZRPOS",
      "ZDATA",   "ZEOF",       "ZFERR",  "ZCRC",     "ZCHALLENGE",
      "ZCOMPL",  "ZCAN",       "ZFREECNT", "ZCOMMAND", "ZSTDERR"};
  if (type <= ZSTDERR) {
    return NAMES[type];
  }
  return "UNKNOWN";
}

int64_t ZmodemHeader::position() const {
  return int64_t(data[0]) | (int64_t(data[1]) << 8) |
         (int64_t(data[2]) << 16) | (int64_t(data[3]) << 24);
}

ZmodemHeader ZmodemHeader::withPosition(uint8_t type, int64_t position) {
  ZmodemHeader header;
  header.type = type;
  header.data[0] = uint8_t(position & 0xff);
  header.data[1] = uint8_t((position >> 8) & 0xff);
  header.data[2] = uint8_t((position >> 16) & 0xff);
  header.data[3] = uint8_t((position >> 24) & 0xff);
  return header;
}

ZmodemHeader ZmodemHeader::withFlags(uint8_t type, uint8_t zf0, uint8_t zf1,
                                     uint8_t zf2, uint8_t zf3) {
  ZmodemHeader header;
  header.type = type;
  header.data[0] = zf3;
  header.data[1] = zf2;
  header.data[2] = zf1;
  header.data[3] = zf0;
  return header;
}

uint16_t zmodemCrc16(const uint8_t* data, size_t length, uint16_t crc) {
  for (size_t i = 0; i < length; i++) {
    crc ^= uint16_t(data[i]) << 8;
    for (int k = 0; k < 8; k++) {
      crc = (crc & 0x8000) ? uint16_t((crc << 1) ^ 0x1021) : uint16_t(crc << 1);
    }
  }
  return crc;
}

uint32_t zmodemCrc32(const uint8_t* data, size_t length) {
  static const std::array<uint32_t, 256> TABLE = buildCrc32Table();
  uint32_t crc = 0xFFFFFFFFu;
  for (size_t i = 0; i < length; i++) {
    crc = TABLE[(crc ^ data[i]) & 0xff] ^ (crc >> 8);
  }
  return crc ^ 0xFFFFFFFFu;
}

bool zmodemNeedsEscape(uint8_t c) {
  switch (c) {
    case ZDLE:
    case 0x10:
    case 0x90:
    case 0x11:
    case 0x91:
    case 0x13:
    case 0x93:
    case 0x0d:
    case 0x8d:
      return true;
    default:
      return false;
  }
}

void zmodemEscape(const string& data, string* out) {
  out->reserve(out->size() + data.size() + data.size() / 16);
  for (char c : data) {
    appendEscaped(uint8_t(c), out);
  }
}

string encodeHexHeader(const ZmodemHeader& header) {
  uint8_t raw[5] = {header.type, header.data[0], header.data[1],
                    header.data[2], header.data[3]};
  uint16_t crc = zmodemCrc16(raw, 5);

  string out;
  out.push_back(char(ZPAD));
  out.push_back(char(ZPAD));
  out.push_back(char(ZDLE));
  out.push_back(char(ZHEX));
  for (int i = 0; i < 5; i++) {
    appendHex(raw[i], &out);
  }
  appendHex(uint8_t(crc >> 8), &out);
  appendHex(uint8_t(crc & 0xff), &out);
  out.push_back('\r');
  out.push_back(char(0x8a));
  if (header.type != ZACK && header.type != ZFIN) {
    out.push_back(char(XON));
  }
  return out;
}

string encodeBinaryHeader(const ZmodemHeader& header, bool useCrc32) {
  uint8_t raw[5] = {header.type, header.data[0], header.data[1],
                    header.data[2], header.data[3]};
  string out;
  out.push_back(char(ZPAD));
  out.push_back(char(ZDLE));
  out.push_back(char(useCrc32 ? ZBIN32 : ZBIN));
  for (int i = 0; i < 5; i++) {
    appendEscaped(raw[i], &out);
  }
  if (useCrc32) {
    uint32_t crc = zmodemCrc32(raw, 5);
    for (int i = 0; i < 4; i++) {
      appendEscaped(uint8_t((crc >> (8 * i)) & 0xff), &out);
    }
  } else {
    uint16_t crc = zmodemCrc16(raw, 5);
    appendEscaped(uint8_t(crc >> 8), &out);
    appendEscaped(uint8_t(crc & 0xff), &out);
  }
  return out;
}

string encodeSubpacket(const string& data, uint8_t frameEnd, bool useCrc32) {
  string out;
  zmodemEscape(data, &out);
  out.push_back(char(ZDLE));
  out.push_back(char(frameEnd));

  string covered = data;
  covered.push_back(char(frameEnd));
  const uint8_t* bytes = reinterpret_cast<const uint8_t*>(covered.data());
  if (useCrc32) {
    uint32_t crc = zmodemCrc32(bytes, covered.size());
    for (int i = 0; i < 4; i++) {
      appendEscaped(uint8_t((crc >> (8 * i)) & 0xff), &out);
    }
  } else {
    uint16_t crc = zmodemCrc16(bytes, covered.size());
    appendEscaped(uint8_t(crc >> 8), &out);
    appendEscaped(uint8_t(crc & 0xff), &out);
  }
  // ZCRCW asks the receiver to acknowledge before anything else is sent
  if (frameEnd == ZCRCW) {
    out.push_back(char(XON));
  }
  return out;
}

string zmodemAbortSequence() {
  return string(8, char(CAN)) + string(8, '\b');
}

bool findHexHeader(const string& frame, ZmodemHeader* header, size_t* start,
                   size_t* end) {
  static const string MARKER = {char(ZPAD), char(ZDLE), char(ZHEX)};
  size_t searchFrom = 0;
  while (true) {
    size_t marker = frame.find(MARKER, searchFrom);
    if (marker == string::npos) {
      return false;
    }
    searchFrom = marker + 1;
    size_t digits = marker + MARKER.size();
    if (digits + 14 > frame.size()) {
      return false;
    }
    uint8_t raw[7];
    bool valid = true;
    for (int i = 0; i < 7 && valid; i++) {
      valid = decodeHexByte(frame, digits + 2 * i, &raw[i]);
    }
    if (!valid) {
      continue;
    }
    uint16_t crc = zmodemCrc16(raw, 5);
    if (crc != ((uint16_t(raw[5]) << 8) | raw[6])) {
      VLOG(2) << "Hex header candidate with bad crc at " << marker;
      continue;
    }
    header->type = raw[0];
    for (int i = 0; i < 4; i++) {
      header->data[i] = raw[i + 1];
    }
    header->format = ZmodemHeaderFormat::HEX;
    size_t first = marker;
    while (first > 0 && uint8_t(frame[first - 1]) == ZPAD) {
      first--;
    }
    *start = first;
    *end = digits + 14;
    return true;
  }
}
}  // namespace wt
