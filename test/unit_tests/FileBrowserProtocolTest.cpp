#include "FileBrowserProtocol.hpp"
#include "SessionError.hpp"
#include "TestHeaders.hpp"

using namespace wt;

TEST_CASE("Directory entries convert from backend json", "[FileBrowserProtocol]") {
  json j = json::parse(R"({
    "name": "app.log",
    "is_dir": false,
    "size": 10,
    "modified": 1700000000,
    "permissions": 420,
    "is_content_editable": true
  })");
  FileEntry entry = fileEntryFromJson(j);
  REQUIRE(entry.name() == "app.log");
  REQUIRE_FALSE(entry.is_dir());
  REQUIRE(entry.size() == 10);
  REQUIRE(entry.modified() == 1700000000);
  REQUIRE(entry.permissions() == 0644);
  REQUIRE(entry.is_content_editable());
  REQUIRE(fileEntryToJson(entry) == j);
}

TEST_CASE("Null and missing fields stay unset", "[FileBrowserProtocol]") {
  json j = {{"name", "etc"},
            {"is_dir", true},
            {"size", nullptr},
            {"modified", nullptr},
            {"permissions", nullptr}};
  FileEntry entry = fileEntryFromJson(j);
  REQUIRE(entry.is_dir());
  REQUIRE(entry.size() == 0);
  REQUIRE_FALSE(entry.has_modified());
  REQUIRE_FALSE(entry.has_permissions());
  REQUIRE_FALSE(entry.is_content_editable());

  json back = fileEntryToJson(entry);
  REQUIRE(back["modified"].is_null());
  REQUIRE(back["permissions"].is_null());
  REQUIRE(back["size"] == 0);
}

TEST_CASE("Entries without a name are protocol errors",
          "[FileBrowserProtocol]") {
  REQUIRE_THROWS_AS(fileEntryFromJson(json::array()), SessionError);
  REQUIRE_THROWS_AS(fileEntryFromJson(json({{"size", 3}})), SessionError);
  try {
    fileEntryFromJson(json({{"name", 3}}));
    FAIL("accepted a numeric name");
  } catch (const SessionError& e) {
    REQUIRE(e.getKind() == SessionErrorKind::PROTOCOL);
  }
}

TEST_CASE("Remote paths join and climb", "[FileBrowserProtocol]") {
  REQUIRE(joinRemotePath(".", "a.txt") == "a.txt");
  REQUIRE(joinRemotePath("", "a.txt") == "a.txt");
  REQUIRE(joinRemotePath("/", "etc") == "/etc");
  REQUIRE(joinRemotePath("/var/log", "syslog") == "/var/log/syslog");
  REQUIRE(joinRemotePath("logs", "app.log") == "logs/app.log");

  REQUIRE(parentRemotePath("/var/log") == "/var");
  REQUIRE(parentRemotePath("/var/log/") == "/var");
  REQUIRE(parentRemotePath("/var") == "/");
  REQUIRE(parentRemotePath("/") == "/");
  REQUIRE(parentRemotePath(".") == ".");
  REQUIRE(parentRemotePath("") == ".");
  REQUIRE(parentRemotePath("logs") == ".");
  REQUIRE(parentRemotePath("logs/2024") == "logs");
}

TEST_CASE("Permissions render like ls", "[FileBrowserProtocol]") {
  FileEntry entry;
  entry.set_name("x");
  REQUIRE(formatPermissions(entry) == "-");
  entry.set_permissions(0755);
  REQUIRE(formatPermissions(entry) == "-rwxr-xr-x");
  entry.set_is_dir(true);
  entry.set_permissions(040700);
  REQUIRE(formatPermissions(entry) == "drwx------");
}
