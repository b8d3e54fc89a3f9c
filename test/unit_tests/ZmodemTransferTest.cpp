#include "ManualClock.hpp"
#include "MemoryFileSinkProvider.hpp"
#include "TestHeaders.hpp"
#include "ZmodemReceiveSession.hpp"
#include "ZmodemSendSession.hpp"

using namespace wt;

namespace {
/** Plays the far side of a zmodem exchange and decodes what we send. */
class ZmodemPeer {
 public:
  ZmodemSender sender() {
    return [this](const string& bytes) {
      sent.push_back(bytes);
      reader.push(bytes);
      ZmodemEvent event;
      while (reader.next(&event)) {
        events.push_back(event);
      }
    };
  }

  vector<uint8_t> headerTypes() const {
    vector<uint8_t> types;
    for (const auto& event : events) {
      if (event.type == ZmodemEvent::HEADER) {
        types.push_back(event.header.type);
      }
    }
    return types;
  }

  const ZmodemEvent& lastHeader() const {
    for (auto it = events.rbegin(); it != events.rend(); ++it) {
      if (it->type == ZmodemEvent::HEADER) {
        return *it;
      }
    }
    FAIL("no header sent");
    return events.back();
  }

  vector<ZmodemEvent> subpackets() const {
    vector<ZmodemEvent> result;
    for (const auto& event : events) {
      if (event.type == ZmodemEvent::SUBPACKET) {
        result.push_back(event);
      }
    }
    return result;
  }

  ZmodemReader reader;
  vector<string> sent;
  vector<ZmodemEvent> events;
};

string hexHeader(uint8_t type, int64_t position = 0) {
  return encodeHexHeader(ZmodemHeader::withPosition(type, position));
}

string fileOffer(const string& name, const string& contents) {
  MemoryFileSource source(name, contents, 0, 0644);
  return encodeBinaryHeader(ZmodemHeader::withFlags(ZFILE, ZCBIN), true) +
         encodeSubpacket(ZmodemSendSession::buildFileOffer(&source, 1,
                                                           contents.size()),
                         ZCRCW, true);
}

string dataFrames(int64_t position, const vector<string>& chunks) {
  string out =
      encodeBinaryHeader(ZmodemHeader::withPosition(ZDATA, position), true);
  for (size_t i = 0; i < chunks.size(); i++) {
    out += encodeSubpacket(chunks[i], i + 1 == chunks.size() ? ZCRCE : ZCRCG,
                           true);
  }
  return out;
}
}  // namespace

TEST_CASE("File offers parse name, size, mtime and mode", "[Zmodem]") {
  ZmodemReceiveSession::FileOffer offer =
      ZmodemReceiveSession::parseFileOffer(
          string("logs/app.log\0" "2048 14537331500 100644 0 1 2048\0", 46));
  REQUIRE(offer.name == "logs/app.log");
  REQUIRE(offer.size == 2048);
  REQUIRE(offer.modifiedTime == 014537331500);
  REQUIRE(offer.mode == 0100644);

  offer = ZmodemReceiveSession::parseFileOffer(string("bare\0", 5));
  REQUIRE(offer.name == "bare");
  REQUIRE(offer.size == -1);

  REQUIRE_THROWS_AS(ZmodemReceiveSession::parseFileOffer(string("\0\0", 2)),
                    SessionError);
}

TEST_CASE("Receiving a file streams it to a sink", "[Zmodem]") {
  shared_ptr<ManualClock> clock(new ManualClock());
  shared_ptr<MemoryFileSinkProvider> sinks(new MemoryFileSinkProvider());
  ZmodemPeer peer;
  EngineConfig config;
  ZmodemReceiveSession session(peer.sender(), clock, config, sinks);
  vector<TransferProgress> reports;
  session.setProgressHandler(
      [&](const TransferProgress& p) { reports.push_back(p); });

  session.consume(hexHeader(ZRQINIT));
  REQUIRE(peer.lastHeader().header.type == ZRINIT);
  REQUIRE(peer.lastHeader().header.flags() == (CANFDX | CANOVIO | CANFC32));

  session.consume(fileOffer("hello.txt", "hello world"));
  REQUIRE(peer.lastHeader().header.type == ZRPOS);
  REQUIRE(peer.lastHeader().header.position() == 0);
  REQUIRE(sinks->get("hello.txt").get() != NULL);

  // Split the data at an awkward place
  string data = dataFrames(0, {"hello ", "world"});
  session.consume(data.substr(0, 7));
  session.consume(data.substr(7));
  REQUIRE(session.getTransfer()->getTransferredBytes() == 11);

  session.consume(encodeBinaryHeader(ZmodemHeader::withPosition(ZEOF, 11),
                                     true));
  REQUIRE(sinks->get("hello.txt")->contents == "hello world");
  REQUIRE(sinks->get("hello.txt")->closed);
  REQUIRE(session.getCompletedCount() == 1);
  REQUIRE(peer.lastHeader().header.type == ZRINIT);
  REQUIRE(reports.back().state == TransferState::COMPLETED);
  REQUIRE(reports.back().percent == 100);

  session.consume(hexHeader(ZFIN));
  REQUIRE(peer.lastHeader().header.type == ZFIN);
  REQUIRE_FALSE(session.isFinished());

  session.consume("OO$ ");
  REQUIRE(session.isFinished());
  REQUIRE(session.takeTrailingBytes() == "$ ");
  REQUIRE(peer.headerTypes() ==
          vector<uint8_t>({ZRINIT, ZRPOS, ZRINIT, ZFIN}));
}

TEST_CASE("A blob consumer gets the received bytes instead of a sink",
          "[Zmodem]") {
  shared_ptr<ManualClock> clock(new ManualClock());
  shared_ptr<MemoryFileSinkProvider> sinks(new MemoryFileSinkProvider());
  ZmodemPeer peer;
  ZmodemReceiveSession session(peer.sender(), clock, EngineConfig(), sinks);
  int blobs = 0;
  string blobName;
  string blobData;
  bool claimed = false;
  session.setBlobConsumerSource([&]() {
    if (claimed) {
      return BlobHandler();
    }
    claimed = true;
    return BlobHandler([&](const string& name, const string& data) {
      blobs++;
      blobName = name;
      blobData = data;
    });
  });

  session.consume(hexHeader(ZRQINIT) + fileOffer("a.bin", "abcdef"));
  session.consume(dataFrames(0, {"abc", "def"}) +
                  encodeBinaryHeader(ZmodemHeader::withPosition(ZEOF, 6),
                                     true));
  REQUIRE(blobs == 1);
  REQUIRE(blobName == "a.bin");
  REQUIRE(blobData == "abcdef");
  REQUIRE(sinks->sinks.empty());

  // The consumer was one-shot, the next file goes to disk
  session.consume(fileOffer("b.bin", "xy") + dataFrames(0, {"xy"}) +
                  encodeBinaryHeader(ZmodemHeader::withPosition(ZEOF, 2),
                                     true));
  REQUIRE(blobs == 1);
  REQUIRE(sinks->get("b.bin")->contents == "xy");
}

TEST_CASE("Data at the wrong offset triggers a resync", "[Zmodem]") {
  shared_ptr<ManualClock> clock(new ManualClock());
  shared_ptr<MemoryFileSinkProvider> sinks(new MemoryFileSinkProvider());
  ZmodemPeer peer;
  ZmodemReceiveSession session(peer.sender(), clock, EngineConfig(), sinks);

  session.consume(hexHeader(ZRQINIT) + fileOffer("r.txt", "0123456789"));
  session.consume(dataFrames(5, {"56789"}));
  REQUIRE(peer.lastHeader().header.type == ZRPOS);
  REQUIRE(peer.lastHeader().header.position() == 0);
  REQUIRE(sinks->get("r.txt")->contents.empty());

  session.consume(dataFrames(0, {"01234", "56789"}) +
                  encodeBinaryHeader(ZmodemHeader::withPosition(ZEOF, 10),
                                     true));
  REQUIRE(sinks->get("r.txt")->contents == "0123456789");
}

TEST_CASE("Files without a destination are skipped", "[Zmodem]") {
  shared_ptr<ManualClock> clock(new ManualClock());
  shared_ptr<MemoryFileSinkProvider> sinks(new MemoryFileSinkProvider());
  sinks->failCreate = true;
  ZmodemPeer peer;
  ZmodemReceiveSession session(peer.sender(), clock, EngineConfig(), sinks);

  session.consume(hexHeader(ZRQINIT) + fileOffer("locked.txt", "data"));
  REQUIRE(peer.lastHeader().header.type == ZSKIP);
  REQUIRE(session.getTransfer().get() == NULL);
  REQUIRE_FALSE(session.isFinished());
}

TEST_CASE("A remote cancel fails the transfer in progress", "[Zmodem]") {
  shared_ptr<ManualClock> clock(new ManualClock());
  shared_ptr<MemoryFileSinkProvider> sinks(new MemoryFileSinkProvider());
  ZmodemPeer peer;
  ZmodemReceiveSession session(peer.sender(), clock, EngineConfig(), sinks);

  session.consume(hexHeader(ZRQINIT) + fileOffer("big.iso", "0123456789"));
  session.consume(encodeBinaryHeader(ZmodemHeader::withPosition(ZDATA, 0),
                                     true) +
                  encodeSubpacket("0123", ZCRCG, true));
  shared_ptr<Transfer> transfer = session.getTransfer();
  REQUIRE(transfer->getTransferredBytes() == 4);

  session.consume(zmodemAbortSequence() + "\r\n$ ");
  REQUIRE(session.isFinished());
  REQUIRE(transfer->getState() == TransferState::FAILED);
  REQUIRE(sinks->get("big.iso")->closed);
}

TEST_CASE("Local abort tells the remote to stop", "[Zmodem]") {
  shared_ptr<ManualClock> clock(new ManualClock());
  shared_ptr<MemoryFileSinkProvider> sinks(new MemoryFileSinkProvider());
  ZmodemPeer peer;
  ZmodemReceiveSession session(peer.sender(), clock, EngineConfig(), sinks);

  session.consume(hexHeader(ZRQINIT) + fileOffer("big.iso", "0123456789"));
  shared_ptr<Transfer> transfer = session.getTransfer();
  session.abort("user pressed ctrl-c");
  REQUIRE(session.isFinished());
  REQUIRE(transfer->getState() == TransferState::CANCELLED);
  REQUIRE(peer.sent.back() == zmodemAbortSequence());
}

TEST_CASE("Sending a file walks through offer, data and fin", "[Zmodem]") {
  shared_ptr<ManualClock> clock(new ManualClock());
  ZmodemPeer peer;
  EngineConfig config;
  config.zmodemChunkSize = 4;
  config.zmodemSubpacketSize = 2;
  shared_ptr<FileSource> file(new MemoryFileSource("a.txt", "0123456789"));
  ZmodemSendSession session(peer.sender(), clock, config, {file});

  session.consume(
      encodeHexHeader(ZmodemHeader::withFlags(ZRINIT, CANFDX | CANFC32)));
  REQUIRE(peer.lastHeader().header.type == ZFILE);
  REQUIRE(peer.lastHeader().header.format == ZmodemHeaderFormat::BIN32);
  REQUIRE(peer.subpackets().size() == 1);
  REQUIRE(peer.subpackets()[0].data ==
          ZmodemSendSession::buildFileOffer(file.get(), 1, 10));

  // Nothing is sent until the receiver picks a position
  session.update();
  REQUIRE(peer.subpackets().size() == 1);

  session.consume(hexHeader(ZRPOS, 0));
  REQUIRE(peer.lastHeader().header.type == ZDATA);
  shared_ptr<Transfer> transfer = session.getTransfer();

  session.update();
  REQUIRE(transfer->getTransferredBytes() == 4);
  session.update();
  session.update();
  REQUIRE(transfer->getTransferredBytes() == 10);
  REQUIRE(peer.lastHeader().header.type == ZEOF);
  REQUIRE(peer.lastHeader().header.position() == 10);

  string received;
  vector<ZmodemEvent> subpackets = peer.subpackets();
  for (size_t i = 1; i < subpackets.size(); i++) {
    received += subpackets[i].data;
  }
  REQUIRE(received == "0123456789");
  REQUIRE(subpackets.back().frameEnd == ZCRCE);
  REQUIRE(subpackets[1].frameEnd == ZCRCG);

  session.consume(
      encodeHexHeader(ZmodemHeader::withFlags(ZRINIT, CANFDX | CANFC32)));
  REQUIRE(transfer->getState() == TransferState::COMPLETED);
  REQUIRE(session.getCompletedCount() == 1);
  REQUIRE(peer.lastHeader().header.type == ZFIN);

  session.consume(hexHeader(ZFIN));
  REQUIRE(peer.sent.back() == "OO");
  REQUIRE(session.isFinished());
}

TEST_CASE("A resend request rewinds the sender", "[Zmodem]") {
  shared_ptr<ManualClock> clock(new ManualClock());
  ZmodemPeer peer;
  EngineConfig config;
  config.zmodemChunkSize = 4;
  shared_ptr<FileSource> file(new MemoryFileSource("a.txt", "0123456789"));
  ZmodemSendSession session(peer.sender(), clock, config, {file});

  session.consume(encodeHexHeader(ZmodemHeader::withFlags(ZRINIT, 0)));
  session.consume(hexHeader(ZRPOS, 0));
  session.update();
  session.update();
  REQUIRE(session.getTransfer()->getTransferredBytes() == 8);

  // A receiver asking for a resend stops reading the current data run.
  peer.reader.expectHeader();
  session.consume(hexHeader(ZRPOS, 4));
  REQUIRE(peer.lastHeader().header.type == ZDATA);
  REQUIRE(peer.lastHeader().header.position() == 4);
  REQUIRE(peer.lastHeader().header.format == ZmodemHeaderFormat::BIN16);
  REQUIRE(session.getTransfer()->getTransferredBytes() == 4);
  session.update();
  REQUIRE(peer.subpackets().back().data == "4567");
}

TEST_CASE("Skipped files move on to the next offer", "[Zmodem]") {
  shared_ptr<ManualClock> clock(new ManualClock());
  ZmodemPeer peer;
  vector<shared_ptr<FileSource>> files = {
      shared_ptr<FileSource>(new MemoryFileSource("a.txt", "aaa")),
      shared_ptr<FileSource>(new MemoryFileSource("b.txt", "bbbb"))};
  ZmodemSendSession session(peer.sender(), clock, EngineConfig(), files);

  session.consume(encodeHexHeader(ZmodemHeader::withFlags(ZRINIT, CANFC32)));
  REQUIRE(startsWith(peer.subpackets().back().data, "a.txt"));
  session.consume(hexHeader(ZSKIP));
  REQUIRE(session.getSkippedCount() == 1);
  REQUIRE(startsWith(peer.subpackets().back().data, "b.txt"));
  REQUIRE(peer.subpackets().back().data ==
          ZmodemSendSession::buildFileOffer(files[1].get(), 1, 4));
}

TEST_CASE("A file error from the receiver ends the batch", "[Zmodem]") {
  shared_ptr<ManualClock> clock(new ManualClock());
  ZmodemPeer peer;
  shared_ptr<FileSource> file(new MemoryFileSource("a.txt", "0123456789"));
  ZmodemSendSession session(peer.sender(), clock, EngineConfig(), {file});

  session.consume(encodeHexHeader(ZmodemHeader::withFlags(ZRINIT, CANFC32)));
  session.consume(hexHeader(ZRPOS, 0));
  shared_ptr<Transfer> transfer = session.getTransfer();
  session.consume(hexHeader(ZFERR));
  REQUIRE(session.isFinished());
  REQUIRE(transfer->getState() == TransferState::FAILED);
}
