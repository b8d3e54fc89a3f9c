#include "FakeTerminalEmulator.hpp"
#include "FakeTransport.hpp"
#include "ManualClock.hpp"
#include "MemoryFileSinkProvider.hpp"
#include "TerminalSession.hpp"
#include "TestHeaders.hpp"

using namespace wt;

namespace {
struct TerminalFixture {
  TerminalFixture()
      : clock(new ManualClock()),
        correlator(new PendingRequestCorrelator(clock)),
        transport(new FakeTransport()),
        emulator(new FakeTerminalEmulator()),
        sinks(new MemoryFileSinkProvider()) {
    server.set_id(7);
    server.set_name("web-1");
    server.set_host("10.0.0.7");
    session.reset(new TerminalSession("ssh-7-abcdefgh", server, transport,
                                      correlator, clock, config, emulator,
                                      sinks));
    session->setErrorHandler(
        [this](const SessionError& error) { errors.push_back(error); });
  }

  void open() {
    session->connect("ws://localhost:3000/ssh");
    transport->simulateOpen();
  }

  shared_ptr<ManualClock> clock;
  shared_ptr<PendingRequestCorrelator> correlator;
  shared_ptr<FakeTransport> transport;
  shared_ptr<FakeTerminalEmulator> emulator;
  shared_ptr<MemoryFileSinkProvider> sinks;
  EngineConfig config;
  ServerRef server;
  shared_ptr<TerminalSession> session;
  vector<SessionError> errors;
};

string hexHeader(uint8_t type, int64_t position = 0) {
  return encodeHexHeader(ZmodemHeader::withPosition(type, position));
}

string fileOffer(const string& name, const string& contents) {
  MemoryFileSource source(name, contents);
  return encodeBinaryHeader(ZmodemHeader::withFlags(ZFILE, ZCBIN), true) +
         encodeSubpacket(ZmodemSendSession::buildFileOffer(&source, 1,
                                                           contents.size()),
                         ZCRCW, true);
}

string fileData(const string& contents) {
  return encodeBinaryHeader(ZmodemHeader::withPosition(ZDATA, 0), true) +
         encodeSubpacket(contents, ZCRCE, true) +
         encodeBinaryHeader(
             ZmodemHeader::withPosition(ZEOF, (int64_t)contents.size()), true);
}

bool contains(const string& haystack, const string& needle) {
  return haystack.find(needle) != string::npos;
}
}  // namespace

TEST_CASE("Opening a terminal sends the connect payload", "[TerminalSession]") {
  TerminalFixture f;
  REQUIRE(f.session->getStatus() == SessionStatus::CONNECTING);
  f.open();
  REQUIRE(f.transport->url == "ws://localhost:3000/ssh");
  REQUIRE(f.session->getStatus() == SessionStatus::CONNECTED);
  REQUIRE(f.transport->texts.size() == 1);

  json expected = {
      {"server_id", 7},
      {"mode", "shell"},
      {"term", "xterm-256color"},
      {"cols", 120},
      {"rows", 40},
      {"env", {{"LANG", "zh_CN.UTF-8"}, {"LC_ALL", "zh_CN.UTF-8"}}},
  };
  REQUIRE(f.transport->lastJson() == expected);
  REQUIRE(contains(f.emulator->output, "Connecting to web-1 (10.0.0.7)"));
  REQUIRE(contains(f.emulator->output, "Connected successfully."));
  REQUIRE(f.emulator->focused);
}

TEST_CASE("Keystrokes and resizes are forwarded once connected",
          "[TerminalSession]") {
  TerminalFixture f;
  f.emulator->type("early");
  REQUIRE(f.transport->texts.empty());

  f.open();
  f.emulator->type("ls -l\r");
  f.emulator->resize(100, 30);

  vector<json> inputs = f.transport->jsonOfType("Input");
  REQUIRE(inputs.size() == 1);
  REQUIRE(inputs[0]["data"] == "ls -l\r");
  vector<json> resizes = f.transport->jsonOfType("Resize");
  REQUIRE(resizes.size() == 1);
  REQUIRE(resizes[0]["cols"] == 100);
  REQUIRE(resizes[0]["rows"] == 30);
}

TEST_CASE("Text that is not a control message is rendered",
          "[TerminalSession]") {
  TerminalFixture f;
  f.open();
  f.emulator->output.clear();
  f.transport->simulateText("total 0\r\n\x1b[0m");
  f.transport->simulateText("{\"type\":\"Output\"}");
  f.transport->simulateText("[1, 2");
  REQUIRE(f.emulator->output ==
          "total 0\r\n\x1b[0m{\"type\":\"Output\"}[1, 2");
  REQUIRE(f.session->isConnected());
}

TEST_CASE("Binary output without a transfer header is rendered",
          "[TerminalSession]") {
  TerminalFixture f;
  f.open();
  f.emulator->output.clear();
  f.transport->simulateBinary("plain");
  f.transport->simulateBinary(string("\x1b[1mbold\x1b[0m\r\n"));
  REQUIRE(f.emulator->output == "plain\x1b[1mbold\x1b[0m\r\n");
  REQUIRE(f.transport->binaries.empty());
  REQUIRE_FALSE(f.session->isTransferActive());
}

TEST_CASE("A backend error ends the session", "[TerminalSession]") {
  TerminalFixture f;
  f.open();
  f.transport->simulateJson({{"type", "Error"}, {"message", "auth failed"}});

  REQUIRE(f.session->getStatus() == SessionStatus::DISCONNECTED);
  REQUIRE(f.errors.size() == 1);
  REQUIRE(f.errors[0].getKind() == SessionErrorKind::BACKEND);
  REQUIRE(string(f.errors[0].what()) == "auth failed");
  REQUIRE(contains(f.emulator->output, "\x1b[31mError: auth failed"));
  REQUIRE(f.transport->closed);

  // Nothing is rendered or sent after the teardown
  size_t rendered = f.emulator->output.size();
  f.transport->simulateText("late output");
  f.emulator->type("x");
  REQUIRE(f.emulator->output.size() == rendered);
  REQUIRE(f.transport->jsonOfType("Input").empty());
}

TEST_CASE("A Closed message disconnects without an error",
          "[TerminalSession]") {
  TerminalFixture f;
  f.open();
  f.transport->simulateJson({{"type", "Closed"}});
  REQUIRE(f.session->getStatus() == SessionStatus::DISCONNECTED);
  REQUIRE(f.errors.empty());
  REQUIRE(contains(f.emulator->output, "Connection closed by server."));
}

TEST_CASE("Losing the transport reports a transport error",
          "[TerminalSession]") {
  TerminalFixture f;
  f.open();
  f.transport->simulateClose();
  REQUIRE(f.session->getStatus() == SessionStatus::DISCONNECTED);
  REQUIRE(f.errors.size() == 1);
  REQUIRE(f.errors[0].getKind() == SessionErrorKind::TRANSPORT);

  TerminalFixture refused;
  refused.session->connect("ws://localhost:3000/ssh");
  refused.transport->simulateError("connection refused");
  REQUIRE(refused.session->getStatus() == SessionStatus::DISCONNECTED);
  REQUIRE(refused.errors.size() == 1);
  REQUIRE(refused.errors[0].getKind() == SessionErrorKind::TRANSPORT);
}

TEST_CASE("Disconnect is idempotent and disposes the emulator once",
          "[TerminalSession]") {
  TerminalFixture f;
  f.open();
  f.session->disconnect();
  f.session->disconnect();
  REQUIRE(f.emulator->disposeCount == 1);
  REQUIRE(f.session->getStatus() == SessionStatus::DISCONNECTED);
  REQUIRE(f.transport->closed);
  REQUIRE(f.errors.empty());
  REQUIRE_THROWS_AS(f.session->fetchNextReceiveAsBlob(BlobHandler()),
                    SessionError);
  REQUIRE_THROWS_AS(f.session->connect("ws://localhost:3000/ssh"),
                    SessionError);
}

TEST_CASE("An sz in the terminal downloads into a sink", "[TerminalSession]") {
  TerminalFixture f;
  f.open();
  vector<TransferProgress> reports;
  f.session->setTransferProgressHandler(
      [&reports](const TransferProgress& p) { reports.push_back(p); });

  f.transport->simulateBinary("$ sz notes.txt\r\n" + hexHeader(ZRQINIT));
  REQUIRE(f.session->isTransferActive());
  REQUIRE(contains(f.emulator->output, "$ sz notes.txt\r\n"));
  REQUIRE(f.transport->binaries.size() == 1);

  // Input and resizes are held back while the exchange runs
  f.emulator->type("q");
  f.emulator->resize(90, 20);
  REQUIRE(f.transport->jsonOfType("Input").empty());
  REQUIRE(f.transport->jsonOfType("Resize").empty());

  f.transport->simulateBinary(fileOffer("notes.txt", "remember"));
  REQUIRE(f.session->getActiveTransfer().get() != NULL);
  REQUIRE(f.session->getActiveTransfer()->getFileName() == "notes.txt");
  f.transport->simulateBinary(fileData("remember"));
  REQUIRE(f.sinks->get("notes.txt")->contents == "remember");
  REQUIRE(reports.back().state == TransferState::COMPLETED);

  f.transport->simulateBinary(hexHeader(ZFIN));
  f.transport->simulateBinary("OO$ ");
  REQUIRE_FALSE(f.session->isTransferActive());
  REQUIRE(contains(f.emulator->output, "Transfer finished (1 files)"));
  REQUIRE(f.emulator->output.substr(f.emulator->output.size() - 2) == "$ ");

  f.emulator->type("q");
  REQUIRE(f.transport->jsonOfType("Input").size() == 1);
}

TEST_CASE("The next received file can be fetched into memory",
          "[TerminalSession]") {
  TerminalFixture f;
  REQUIRE_THROWS_AS(f.session->fetchNextReceiveAsBlob(BlobHandler()),
                    SessionError);
  f.open();
  string name;
  string data;
  f.session->fetchNextReceiveAsBlob(
      [&name, &data](const string& n, const string& d) {
        name = n;
        data = d;
      });

  f.transport->simulateBinary(hexHeader(ZRQINIT));
  f.transport->simulateBinary(fileOffer("config.ini", "[a]\nb=1\n"));
  f.transport->simulateBinary(fileData("[a]\nb=1\n"));
  REQUIRE(name == "config.ini");
  REQUIRE(data == "[a]\nb=1\n");
  REQUIRE(f.sinks->sinks.empty());
}

TEST_CASE("An rz without files to send is refused", "[TerminalSession]") {
  TerminalFixture f;
  f.open();
  f.transport->simulateBinary(
      encodeHexHeader(ZmodemHeader::withFlags(ZRINIT, CANFDX | CANFC32)));
  REQUIRE_FALSE(f.session->isTransferActive());
  REQUIRE(f.transport->binaries == vector<string>({zmodemAbortSequence()}));

  f.session->setSendFileProvider([]() -> vector<shared_ptr<FileSource>> {
    throw std::runtime_error("No such file: missing.txt");
  });
  f.transport->simulateBinary(
      encodeHexHeader(ZmodemHeader::withFlags(ZRINIT, CANFDX | CANFC32)));
  REQUIRE_FALSE(f.session->isTransferActive());
  REQUIRE(contains(f.emulator->output, "No such file: missing.txt"));
  REQUIRE(f.transport->binaries.size() == 2);
}

TEST_CASE("An rz in the terminal uploads the provided files",
          "[TerminalSession]") {
  TerminalFixture f;
  f.open();
  f.session->setSendFileProvider([]() {
    return vector<shared_ptr<FileSource>>(
        {shared_ptr<FileSource>(new MemoryFileSource("up.txt", "abc"))});
  });

  f.transport->simulateBinary(
      encodeHexHeader(ZmodemHeader::withFlags(ZRINIT, CANFDX | CANFC32)));
  REQUIRE(f.session->isTransferActive());
  REQUIRE(f.transport->binaries.size() == 1);

  f.transport->simulateBinary(hexHeader(ZRPOS, 0));
  REQUIRE(f.transport->binaries.size() == 2);

  // A full outbound queue holds the data back
  f.transport->setPendingBytes(f.config.maxOutboundBacklog);
  f.session->update();
  REQUIRE(f.transport->binaries.size() == 2);

  f.transport->setPendingBytes(0);
  f.session->update();
  REQUIRE(f.transport->binaries.size() == 3);
  REQUIRE(contains(f.transport->binaries.back(), "abc"));
  REQUIRE(f.session->getActiveTransfer()->getTransferredBytes() == 3);
}

TEST_CASE("Disconnecting aborts a running exchange", "[TerminalSession]") {
  TerminalFixture f;
  f.open();
  f.transport->simulateBinary(hexHeader(ZRQINIT));
  f.transport->simulateBinary(fileOffer("big.bin", "0123456789"));
  shared_ptr<Transfer> transfer = f.session->getActiveTransfer();
  REQUIRE(transfer.get() != NULL);

  f.session->disconnect();
  REQUIRE_FALSE(f.session->isTransferActive());
  REQUIRE(transfer->getState() == TransferState::CANCELLED);
  REQUIRE(f.transport->binaries.back() == zmodemAbortSequence());
  REQUIRE(f.sinks->get("big.bin")->closed);
}
