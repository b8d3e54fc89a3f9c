#ifndef __WT_ZMODEM_READER__
#define __WT_ZMODEM_READER__

#include "Headers.hpp"
#include "ZmodemCodec.hpp"

namespace wt {
struct ZmodemEvent {
  enum Type {
    HEADER,
    SUBPACKET,
    /** A run of five or more CAN bytes */
    ABORT,
    /** The "OO" trailer, or the first byte that shows there is none */
    OVER_AND_OUT,
  };

  Type type;
  ZmodemHeader header;
  string data;
  uint8_t frameEnd;
};

/**
 * @brief Incremental parser turning received bytes into headers and data
 * subpackets.  Input may be split at any byte; incomplete elements stay
 * buffered until the rest arrives.
 *
 * Garbage between headers is skipped.  After a ZFILE, ZDATA, ZSINIT or
 * ZCOMMAND header the reader expects subpackets until one ends with ZCRCE or
 * ZCRCW.
 */
class ZmodemReader {
 public:
  /** Longest subpacket accepted before the stream is considered corrupt */
  static const size_t MAX_SUBPACKET_SIZE = 64 * 1024;

  ZmodemReader();

  void push(const string& bytes);

  /**
   * @brief Fills `event` with the next complete element.  Returns false when
   * more input is needed.  Throws SessionError(PROTOCOL) on a CRC mismatch or
   * an invalid escape; the bad element is consumed first so parsing can
   * continue with the next header.
   */
  bool next(ZmodemEvent* event);

  /** @brief The next bytes should be the "OO" sent after ZFIN. */
  void expectOverAndOut() { awaitingOverAndOut = true; }

  /**
   * @brief Drops out of a data subpacket run.  Used after asking the sender
   * to reposition, when only a new header is of interest.
   */
  void expectHeader() { subpacketMode = false; }

  /** @brief Returns and drops all unparsed input. */
  string takeRemaining();

  bool inSubpacket() const { return subpacketMode; }

 protected:
  bool parseHeader(ZmodemEvent* event);
  bool parseSubpacket(ZmodemEvent* event);
  bool decodeEscaped(size_t start, int count, uint8_t* out, size_t* end);
  size_t canRunLength(size_t start) const;
  size_t findAbortRun(size_t start, size_t limit) const;
  void compact();

  string buffer;
  size_t pos;
  bool subpacketMode;
  bool subpacketCrc32;
  bool awaitingOverAndOut;
};
}  // namespace wt

#endif  // __WT_ZMODEM_READER__
