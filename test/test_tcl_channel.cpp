/***
 * Name: test_tcl_channel
 * Purpose: Verify the channel type hooks against registry-held streams.
 */
#include <gtest/gtest.h>
#include <cerrno>
#include <random>
#include "BridgeState.hpp"
#include "TclChannel.hpp"
#include "TclInterp.hpp"

namespace {

std::shared_ptr<FileStream> streamOf(const std::string& s) {
  auto data = std::make_shared<const std::vector<uint8_t>>(s.begin(), s.end());
  return std::make_shared<MemoryStream>(data, FileInfo{});
}

struct FailingStream : FileStream {
  ReadResult read(char*, size_t) override {
    ReadResult r;
    r.error = "device on fire";
    return r;
  }
  StatResult stat() override { return StatResult{}; }
  void close() override {}
};

class TclChannelTest : public ::testing::Test {
 protected:
  void SetUp() override { initializeTcl(); }

  Tcl_Channel open(std::shared_ptr<FileStream> s) {
    Tcl_Channel chan = createStreamChannel(std::move(s), "/test");
    EXPECT_NE(chan, nullptr);
    return chan;
  }

  int input(Tcl_Channel chan, char* buf, int n, int* err) {
    return bridgeChannelType()->inputProc(Tcl_GetChannelInstanceData(chan), buf, n, err);
  }
};

}  // namespace

TEST_F(TclChannelTest, ChunkedReadsThenEof) {
  Tcl_Channel chan = open(streamOf("hello world!"));
  char buf[5];
  int err = 0;
  EXPECT_EQ(input(chan, buf, 5, &err), 5);
  EXPECT_EQ(std::string(buf, 5), "hello");
  EXPECT_EQ(input(chan, buf, 5, &err), 5);
  EXPECT_EQ(std::string(buf, 5), " worl");
  EXPECT_EQ(input(chan, buf, 5, &err), 2);
  EXPECT_EQ(std::string(buf, 2), "d!");
  EXPECT_EQ(input(chan, buf, 5, &err), 0);
  EXPECT_EQ(input(chan, buf, 5, &err), 0);
  EXPECT_EQ(Tcl_Close(nullptr, chan), TCL_OK);
}

TEST_F(TclChannelTest, EmptyRequestsAreNoOps) {
  Tcl_Channel chan = open(streamOf("abc"));
  char buf[4];
  int err = 0;
  EXPECT_EQ(input(chan, buf, 0, &err), 0);
  EXPECT_EQ(input(chan, nullptr, 4, &err), 0);
  EXPECT_EQ(err, 0);
  EXPECT_EQ(input(chan, buf, 4, &err), 3);
  EXPECT_EQ(Tcl_Close(nullptr, chan), TCL_OK);
}

TEST_F(TclChannelTest, RoundTripPreservesBytes) {
  std::mt19937 rng(99);
  std::string payload(10007, '\0');
  for (char& c : payload) c = static_cast<char>(rng() & 0xff);
  Tcl_Channel chan = open(streamOf(payload));

  std::string got;
  char buf[333];
  int err = 0;
  for (;;) {
    int n = input(chan, buf, sizeof(buf), &err);
    ASSERT_GE(n, 0);
    if (n == 0) break;
    got.append(buf, static_cast<size_t>(n));
  }
  EXPECT_EQ(got, payload);
  EXPECT_EQ(Tcl_Close(nullptr, chan), TCL_OK);
}

TEST_F(TclChannelTest, ReadFailureIsReported) {
  Tcl_Channel chan = open(std::make_shared<FailingStream>());
  char buf[8];
  int err = 0;
  EXPECT_EQ(input(chan, buf, 8, &err), -1);
  EXPECT_EQ(err, EIO);
  Tcl_Close(nullptr, chan);
}

TEST_F(TclChannelTest, CloseIsIdempotent) {
  size_t before = BridgeState::get().liveHandles();
  Tcl_Channel chan = open(streamOf("abc"));
  ClientData inst = Tcl_GetChannelInstanceData(chan);
  EXPECT_EQ(BridgeState::get().liveHandles(), before + 1);

  EXPECT_EQ(bridgeChannelType()->closeProc(inst, nullptr), 0);
  EXPECT_EQ(BridgeState::get().liveHandles(), before);

  char buf[4];
  int err = 0;
  EXPECT_EQ(input(chan, buf, 4, &err), -1);
  EXPECT_EQ(err, EBADF);

  // Tcl's own close runs the hook a second time
  EXPECT_EQ(Tcl_Close(nullptr, chan), TCL_OK);
  EXPECT_EQ(BridgeState::get().liveHandles(), before);
}

TEST_F(TclChannelTest, SeekAndWriteFail) {
  Tcl_Channel chan = open(streamOf("abc"));
  ClientData inst = Tcl_GetChannelInstanceData(chan);
  int err = 0;
  EXPECT_EQ(bridgeChannelType()->seekProc(inst, 1, SEEK_SET, &err), -1);
  EXPECT_EQ(err, ESPIPE);
  err = 0;
  EXPECT_EQ(bridgeChannelType()->outputProc(inst, "x", 1, &err), -1);
  EXPECT_EQ(err, EBADF);
  ClientData handle = nullptr;
  EXPECT_EQ(bridgeChannelType()->getHandleProc(inst, TCL_READABLE, &handle), TCL_ERROR);
  EXPECT_EQ(Tcl_Seek(chan, 0, SEEK_SET), -1);
  Tcl_Close(nullptr, chan);
}

TEST_F(TclChannelTest, WatchNoneIsAccepted) {
  Tcl_Channel chan = open(streamOf("abc"));
  bridgeChannelType()->watchProc(Tcl_GetChannelInstanceData(chan), 0);
  Tcl_Close(nullptr, chan);
}

TEST_F(TclChannelTest, WatchForEventsPanics) {
  Tcl_Channel chan = open(streamOf("abc"));
  ClientData inst = Tcl_GetChannelInstanceData(chan);
  EXPECT_DEATH(bridgeChannelType()->watchProc(inst, TCL_READABLE), "watch mask");
  Tcl_Close(nullptr, chan);
}

TEST_F(TclChannelTest, ChannelTypeIdentity) {
  EXPECT_STREQ(bridgeChannelType()->typeName, "tclbridge");
  Tcl_Channel chan = open(streamOf("abc"));
  EXPECT_EQ(Tcl_GetChannelType(chan), bridgeChannelType());
  EXPECT_EQ(std::string(Tcl_GetChannelName(chan)).rfind("vfs", 0), 0u);
  EXPECT_EQ(Tcl_GetChannelMode(chan), TCL_READABLE);
  Tcl_Close(nullptr, chan);
}
