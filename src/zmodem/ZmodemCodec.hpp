#ifndef __WT_ZMODEM_CODEC__
#define __WT_ZMODEM_CODEC__

#include "Headers.hpp"

namespace wt {
// Framing bytes
static const uint8_t ZPAD = '*';
static const uint8_t ZDLE = 0x18;
static const uint8_t ZBIN = 'A';
static const uint8_t ZHEX = 'B';
static const uint8_t ZBIN32 = 'C';
static const uint8_t XON = 0x11;
static const uint8_t CAN = 0x18;

// Subpacket terminators
static const uint8_t ZCRCE = 'h';
static const uint8_t ZCRCG = 'i';
static const uint8_t ZCRCQ = 'j';
static const uint8_t ZCRCW = 'k';
static const uint8_t ZRUB0 = 'l';
static const uint8_t ZRUB1 = 'm';

// ZRINIT capability flags (ZF0)
static const uint8_t CANFDX = 0x01;
static const uint8_t CANOVIO = 0x02;
static const uint8_t CANFC32 = 0x20;

// ZFILE conversion option (ZF0)
static const uint8_t ZCBIN = 1;

enum ZmodemFrameType : uint8_t {
  ZRQINIT = 0,
  ZRINIT = 1,
  ZSINIT = 2,
  ZACK = 3,
  ZFILE = 4,
  ZSKIP = 5,
  ZNAK = 6,
  ZABORT = 7,
  ZFIN = 8,
  ZRPOS = 9,
  ZDATA = 10,
  ZEOF = 11,
  ZFERR = 12,
  ZCRC = 13,
  ZCHALLENGE = 14,
  ZCOMPL = 15,
  ZCAN = 16,
  ZFREECNT = 17,
  ZCOMMAND = 18,
  ZSTDERR = 19,
};

const char* zmodemFrameTypeName(uint8_t type);

enum class ZmodemHeaderFormat { HEX, BIN16, BIN32 };

/**
 * @brief A decoded frame header: the type plus four data bytes.  Positions
 * are stored little-endian in data[0..3]; flag ZF0 lives in data[3].
 */
struct ZmodemHeader {
  uint8_t type;
  std::array<uint8_t, 4> data;
  ZmodemHeaderFormat format;

  ZmodemHeader() : type(0), format(ZmodemHeaderFormat::HEX) { data.fill(0); }

  int64_t position() const;
  uint8_t flags() const { return data[3]; }

  static ZmodemHeader withPosition(uint8_t type, int64_t position);
  static ZmodemHeader withFlags(uint8_t type, uint8_t zf0, uint8_t zf1 = 0,
                                uint8_t zf2 = 0, uint8_t zf3 = 0);
};

/** @brief CRC-16/XMODEM (poly 0x1021, init 0) continued from `crc`. */
uint16_t zmodemCrc16(const uint8_t* data, size_t length, uint16_t crc = 0);

/** @brief CRC-32 (IEEE 802.3) of `data`. */
uint32_t zmodemCrc32(const uint8_t* data, size_t length);

/** @brief True if `c` must be sent as ZDLE + (c ^ 0x40). */
bool zmodemNeedsEscape(uint8_t c);

/** @brief Appends `data` to `out` with ZDLE escaping applied. */
void zmodemEscape(const string& data, string* out);

/** @brief "**" ZDLE 'B', hex type/data/crc16, CR LF (and XON). */
string encodeHexHeader(const ZmodemHeader& header);

/** @brief ZPAD ZDLE 'A' or 'C', escaped type/data and crc16 or crc32. */
string encodeBinaryHeader(const ZmodemHeader& header, bool useCrc32);

/**
 * @brief Escaped data followed by ZDLE `frameEnd` and the escaped CRC over
 * the data and terminator.
 */
string encodeSubpacket(const string& data, uint8_t frameEnd, bool useCrc32);

/** @brief Eight CAN followed by eight backspaces. */
string zmodemAbortSequence();

/**
 * @brief Looks for a hex header with a valid CRC in `frame`.  On success
 * `start` is the offset of its first ZPAD and `end` the offset just past the
 * header's hex digits.
 */
bool findHexHeader(const string& frame, ZmodemHeader* header, size_t* start,
                   size_t* end);
}  // namespace wt

#endif  // __WT_ZMODEM_CODEC__
