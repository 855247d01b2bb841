/***
 * Name: test_bridge_config
 * Purpose: Verify JSON configuration parsing and mount application.
 */
#include <gtest/gtest.h>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "BridgeConfig.hpp"
#include "BridgeState.hpp"
#include "TclFilesystem.hpp"

namespace {

bool mounted(const std::string& point) {
  auto points = BridgeState::get().mountPoints();
  return std::find(points.begin(), points.end(), point) != points.end();
}

}  // namespace

TEST(BridgeConfig, ParsesFullDocument) {
  std::string err;
  auto cfg = BridgeConfig::parse(R"({
    "logging": { "level": "debug", "file": "bridge.log" },
    "library": { "point": "/tclbridge/library", "type": "directory", "source": "/usr/share/tcltk/tcl8.6" },
    "mounts": [
      { "point": "/data", "type": "directory", "source": "./data" },
      { "point": "/pkg", "type": "archive", "source": "pkg.zip" },
      { "point": "/vault", "type": "sqlite", "source": "vault.db" },
      { "point": "/scratch", "type": "memory" }
    ]
  })", &err);
  ASSERT_TRUE(cfg) << err;
  EXPECT_EQ(cfg->logging.level, plog::debug);
  EXPECT_EQ(cfg->logging.file, "bridge.log");
  ASSERT_TRUE(cfg->library);
  EXPECT_EQ(cfg->library->point, "/tclbridge/library");
  ASSERT_EQ(cfg->mounts.size(), 4u);
  EXPECT_EQ(cfg->mounts[1].type, "archive");
  EXPECT_EQ(cfg->mounts[2].source, "vault.db");
  EXPECT_EQ(cfg->mounts[3].source, "");
  EXPECT_EQ(cfg->mounts[0].toJSON()["point"], "/data");
}

TEST(BridgeConfig, DefaultsWhenEmpty) {
  auto cfg = BridgeConfig::parse("{}");
  ASSERT_TRUE(cfg);
  EXPECT_EQ(cfg->logging.level, plog::info);
  EXPECT_TRUE(cfg->logging.file.empty());
  EXPECT_FALSE(cfg->library);
  EXPECT_TRUE(cfg->mounts.empty());
}

TEST(BridgeConfig, RejectsBadDocuments) {
  struct Case {
    const char* text;
    const char* needle;
  } cases[] = {
      {"{not json", "parse"},
      {"[]", "object"},
      {R"({"mounts": {}})", "array"},
      {R"({"mounts": [{"type": "memory"}]})", "point"},
      {R"({"mounts": [{"point": "/x", "type": "ftp", "source": "s"}]})", "unknown provider type"},
      {R"({"mounts": [{"point": "/x", "type": "directory"}]})", "source"},
      {R"({"logging": {"level": "loud"}})", "log level"},
      {R"({"mounts": [{"point": 5}]})", "type"},
  };
  for (const auto& c : cases) {
    std::string err;
    EXPECT_FALSE(BridgeConfig::parse(c.text, &err)) << c.text;
    EXPECT_NE(err.find(c.needle), std::string::npos) << c.text << " -> " << err;
  }
}

TEST(BridgeConfig, LoadReportsMissingFile) {
  std::string err;
  EXPECT_FALSE(BridgeConfig::load("/no/such/config.json", &err));
  EXPECT_NE(err.find("/no/such/config.json"), std::string::npos);
}

TEST(BridgeConfig, LoadsFromEnvironment) {
  auto path = std::filesystem::temp_directory_path() / "tclbridge-config-test.json";
  std::ofstream(path) << R"({"mounts": [{"point": "/env-scratch", "type": "memory"}]})";
  setenv("TCLBRIDGE_CONFIG", path.c_str(), 1);
  auto cfg = BridgeConfig::fromEnvironment();
  unsetenv("TCLBRIDGE_CONFIG");
  std::filesystem::remove(path);
  ASSERT_TRUE(cfg);
  ASSERT_EQ(cfg->mounts.size(), 1u);
  EXPECT_EQ(cfg->mounts[0].point, "/env-scratch");

  cfg = BridgeConfig::fromEnvironment();
  ASSERT_TRUE(cfg);
  EXPECT_TRUE(cfg->mounts.empty());
}

TEST(BridgeConfig, ParseSeverityNames) {
  plog::Severity s = plog::none;
  EXPECT_TRUE(parseSeverity("warning", s));
  EXPECT_EQ(s, plog::warning);
  EXPECT_TRUE(parseSeverity("verbose", s));
  EXPECT_EQ(s, plog::verbose);
  EXPECT_FALSE(parseSeverity("WARN", s));
}

TEST(ApplyMounts, MountsEntriesAndExportsLibrary) {
  unsetenv("TCL_LIBRARY");
  auto cfg = BridgeConfig::parse(R"({
    "library": { "point": "/cfg-lib/", "type": "memory" },
    "mounts": [ { "point": "/cfg-a", "type": "memory" }, { "point": "/cfg-b", "type": "memory" } ]
  })");
  ASSERT_TRUE(cfg);
  std::string err;
  ASSERT_TRUE(applyMounts(*cfg, &err)) << err;
  EXPECT_TRUE(mounted("/cfg-lib/"));
  EXPECT_TRUE(mounted("/cfg-a/"));
  EXPECT_TRUE(mounted("/cfg-b/"));
  ASSERT_NE(std::getenv("TCL_LIBRARY"), nullptr);
  EXPECT_STREQ(std::getenv("TCL_LIBRARY"), "/cfg-lib");

  for (const char* p : {"/cfg-lib", "/cfg-a", "/cfg-b"}) EXPECT_TRUE(unmountFileSystem(p).ok);
  unsetenv("TCL_LIBRARY");
}

TEST(ApplyMounts, StopsAtFirstFailure) {
  auto cfg = BridgeConfig::parse(R"({
    "mounts": [
      { "point": "/cfg-ok", "type": "memory" },
      { "point": "/cfg-broken", "type": "directory", "source": "/definitely/not/a/dir" },
      { "point": "/cfg-never", "type": "memory" }
    ]
  })");
  ASSERT_TRUE(cfg);
  std::string err;
  EXPECT_FALSE(applyMounts(*cfg, &err));
  EXPECT_NE(err.find("/cfg-broken"), std::string::npos);
  EXPECT_TRUE(mounted("/cfg-ok/"));
  EXPECT_FALSE(mounted("/cfg-broken/"));
  EXPECT_FALSE(mounted("/cfg-never/"));
  unmountFileSystem("/cfg-ok");
}

TEST(ApplyMounts, InvalidPointIsReported) {
  auto cfg = BridgeConfig::parse(R"({ "mounts": [ { "point": "relative/dir", "type": "memory" } ] })");
  ASSERT_TRUE(cfg);
  std::string err;
  EXPECT_FALSE(applyMounts(*cfg, &err));
  EXPECT_NE(err.find("absolute"), std::string::npos);
}
