#include "ManualClock.hpp"
#include "MemoryFileSinkProvider.hpp"
#include "TestHeaders.hpp"
#include "ZmodemReceiveSession.hpp"
#include "ZmodemSentry.hpp"

using namespace wt;

namespace {
class ThrowingZmodemSession : public ZmodemSession {
 public:
  ThrowingZmodemSession(ZmodemSender _sender, shared_ptr<Clock> _clock)
      : ZmodemSession(_sender, _clock, EngineConfig()) {}

  virtual ZmodemRole getRole() const { return ZmodemRole::RECEIVE; }

 protected:
  virtual void handleHeader(const ZmodemHeader& header) {
    throw std::runtime_error("cannot handle header");
  }
  virtual void handleSubpacket(const string& data, uint8_t frameEnd) {}
};

struct SentryFixture {
  SentryFixture()
      : clock(new ManualClock()),
        sinks(new MemoryFileSinkProvider()),
        sentry([this](const string& s) { terminal += s; },
               [this](const string& s) { sent.push_back(s); }) {}

  shared_ptr<ZmodemReceiveSession> receiveSession() {
    return shared_ptr<ZmodemReceiveSession>(new ZmodemReceiveSession(
        [this](const string& s) { sent.push_back(s); }, clock,
        EngineConfig(), sinks));
  }

  shared_ptr<ManualClock> clock;
  shared_ptr<MemoryFileSinkProvider> sinks;
  string terminal;
  vector<string> sent;
  ZmodemSentry sentry;
};

string hexHeader(uint8_t type, int64_t position = 0) {
  return encodeHexHeader(ZmodemHeader::withPosition(type, position));
}
}  // namespace

TEST_CASE("Ordinary output goes to the terminal", "[ZmodemSentry]") {
  SentryFixture f;
  f.sentry.consume("hello ** world\r\n");
  f.sentry.consume(hexHeader(ZRPOS, 12));
  REQUIRE(f.terminal == "hello ** world\r\n" + hexHeader(ZRPOS, 12));
  REQUIRE(f.sent.empty());
  REQUIRE(f.sentry.getState() == ZmodemSentry::IDLE);
}

TEST_CASE("A detection nobody answers is denied", "[ZmodemSentry]") {
  SentryFixture f;
  vector<ZmodemRole> roles;
  f.sentry.setDetectionHandler(
      [&roles](const ZmodemDetection& detection) {
        roles.push_back(detection.getRole());
      });

  f.sentry.consume("$ sz log.txt\r\n" + hexHeader(ZRQINIT));
  REQUIRE(roles == vector<ZmodemRole>({ZmodemRole::RECEIVE}));
  REQUIRE(f.terminal == "$ sz log.txt\r\n");
  REQUIRE(f.sent == vector<string>({zmodemAbortSequence()}));
  REQUIRE(f.sentry.getState() == ZmodemSentry::IDLE);

  f.sentry.consume("$ ");
  REQUIRE(f.terminal == "$ sz log.txt\r\n$ ");
}

TEST_CASE("A ZRINIT is detected as an upload request", "[ZmodemSentry]") {
  SentryFixture f;
  bool denied = false;
  f.sentry.setDetectionHandler(
      [&f, &denied](const ZmodemDetection& detection) {
        REQUIRE(detection.getRole() == ZmodemRole::SEND);
        REQUIRE(detection.getHeader().type == ZRINIT);
        f.sentry.deny();
        denied = true;
      });
  f.sentry.consume(
      encodeHexHeader(ZmodemHeader::withFlags(ZRINIT, CANFDX | CANFC32)));
  REQUIRE(denied);
  REQUIRE(f.sent.size() == 1);
  REQUIRE(f.terminal.empty());
}

TEST_CASE("A confirmed session receives frames until it ends",
          "[ZmodemSentry]") {
  SentryFixture f;
  int ended = 0;
  f.sentry.setDetectionHandler([&f](const ZmodemDetection& detection) {
    f.sentry.confirm(f.receiveSession());
  });
  f.sentry.setSessionEndHandler(
      [&ended](shared_ptr<ZmodemSession> session) {
        REQUIRE(session->isFinished());
        ended++;
      });

  f.sentry.consume(hexHeader(ZRQINIT));
  REQUIRE(f.sentry.isActive());
  REQUIRE(f.sent.size() == 1);
  REQUIRE(startsWith(f.sent[0], encodeHexHeader(ZmodemHeader::withFlags(
                                    ZRINIT, CANFDX | CANOVIO | CANFC32))));

  f.sentry.consume(hexHeader(ZFIN));
  REQUIRE(f.sentry.isActive());
  REQUIRE(f.sent.back() == hexHeader(ZFIN));

  f.sentry.consume("OO$ ");
  REQUIRE_FALSE(f.sentry.isActive());
  REQUIRE(ended == 1);
  REQUIRE(f.terminal == "$ ");
}

TEST_CASE("A failing session hands the frame back to the terminal",
          "[ZmodemSentry]") {
  SentryFixture f;
  vector<string> sessionSent;
  f.sentry.setDetectionHandler(
      [&f, &sessionSent](const ZmodemDetection& detection) {
        f.sentry.confirm(
            shared_ptr<ZmodemSession>(new ThrowingZmodemSession(
                [&sessionSent](const string& s) { sessionSent.push_back(s); },
                f.clock)));
      });

  string frame = hexHeader(ZRQINIT);
  f.sentry.consume(frame);
  REQUIRE_FALSE(f.sentry.isActive());
  REQUIRE(f.terminal == frame);
  REQUIRE(sessionSent == vector<string>({zmodemAbortSequence()}));
}

TEST_CASE("Aborting the sentry ends the active session", "[ZmodemSentry]") {
  SentryFixture f;
  f.sentry.setDetectionHandler([&f](const ZmodemDetection& detection) {
    f.sentry.confirm(f.receiveSession());
  });
  f.sentry.consume(hexHeader(ZRQINIT));
  REQUIRE(f.sentry.isActive());

  f.sentry.abort("user cancelled");
  REQUIRE_FALSE(f.sentry.isActive());
  REQUIRE(f.sent.back() == zmodemAbortSequence());

  f.sentry.abort("again");
  f.sentry.consume("plain");
  REQUIRE(f.terminal == "plain");
}
