/***
 * Name: test_concurrency
 * Purpose: Verify interpreters on separate threads sharing the bridge state.
 */
#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include "BridgeState.hpp"
#include "FileSystems/MemoryFileSystem.hpp"
#include "TclFilesystem.hpp"
#include "TclInterp.hpp"

namespace {

struct Token : HostObject {
  std::atomic<int>* released;
  explicit Token(std::atomic<int>* r) : released(r) {}
  void release() override { released->fetch_add(1); }
};

}  // namespace

TEST(Concurrency, RegistryUnderContention) {
  BridgeState& state = BridgeState::get();
  size_t before = state.liveHandles();
  std::atomic<int> released{0};
  std::atomic<bool> mismatch{false};
  const int kThreads = 8;
  const int kRounds = 2000;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < kRounds; ++i) {
        auto obj = std::make_shared<Token>(&released);
        Handle h = state.storeObject(obj);
        if (state.loadObject(h) != obj) mismatch = true;
        state.releaseObject(h);
        if (state.loadObject(h) != nullptr) mismatch = true;
        state.releaseObject(h);
      }
    });
  }
  for (auto& th : threads) th.join();
  EXPECT_FALSE(mismatch);
  EXPECT_EQ(released.load(), kThreads * kRounds);
  EXPECT_EQ(state.liveHandles(), before);
}

TEST(Concurrency, InterpretersReadWhileMountsChange) {
  auto shared = std::make_shared<MemoryFileSystem>();
  shared->addFile("/file.txt", "shared content");
  ASSERT_TRUE(mountFileSystem("/conc", shared).ok);
  size_t before = BridgeState::get().liveHandles();

  const int kThreads = 4;
  const int kReads = 200;
  std::atomic<int> failures{0};
  std::atomic<int> deletes{0};
  std::atomic<bool> done{false};

  std::thread churn([&]() {
    int n = 0;
    while (!done) {
      std::string point = "/conc-churn/" + std::to_string(n++ % 5);
      auto fs = std::make_shared<MemoryFileSystem>();
      fs->addFile("/x", "x");
      if (!mountFileSystem(point, fs).ok) failures++;
      if (!unmountFileSystem(point).ok) failures++;
    }
  });

  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&, t]() {
      TclInterp interp;
      bool ok = interp.newCommand(
          "tag", [t](const std::any&, TclInterp& in, const std::vector<std::string>&) {
            in.setResult(std::to_string(t));
            return TCL_OK;
          },
          t, [&deletes](const std::any&) { deletes++; });
      if (!ok) failures++;
      for (int i = 0; i < kReads; ++i) {
        if (!interp.eval("set f [open /conc/file.txt]; set s [read $f]; close $f; set s") || interp.result() != "shared content")
          failures++;
        if (!interp.eval("tag") || interp.result() != std::to_string(t)) failures++;
      }
      interp.close();
    });
  }
  for (auto& w : workers) w.join();
  done = true;
  churn.join();

  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(deletes.load(), kThreads);
  EXPECT_EQ(BridgeState::get().liveHandles(), before);
  EXPECT_TRUE(unmountFileSystem("/conc").ok);
}
