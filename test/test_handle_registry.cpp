/***
 * Name: test_handle_registry
 * Purpose: Verify handle issue, lookup, release and slot reuse.
 */
#include <gtest/gtest.h>
#include <memory>
#include "BridgeState.hpp"
#include "HandleRegistry.hpp"

namespace {

struct Counter : HostObject {
  int value = 0;
  int released = 0;
  explicit Counter(int v) : value(v) {}
  void release() override { ++released; }
};

struct Other : HostObject {};

// Calls back into BridgeState from its release hook; deadlocks if the hook
// ran while the bridge lock was held.
struct Reentrant : HostObject {
  size_t seen = 0;
  bool ran = false;
  void release() override {
    seen = BridgeState::get().liveHandles();
    ran = true;
  }
};

}  // namespace

TEST(HandleRegistry, StoreThenLoad) {
  HandleRegistry reg;
  auto a = std::make_shared<Counter>(7);
  Handle h = reg.store(a);
  EXPECT_NE(h, kInvalidHandle);
  EXPECT_EQ(reg.load(h), a);
  EXPECT_EQ(reg.size(), 1u);
}

TEST(HandleRegistry, UnknownHandlesAreNotFound) {
  HandleRegistry reg;
  EXPECT_EQ(reg.load(kInvalidHandle), nullptr);
  EXPECT_EQ(reg.load(12345), nullptr);
  EXPECT_EQ(reg.release(12345), nullptr);
}

TEST(HandleRegistry, ReleaseIsIdempotent) {
  HandleRegistry reg;
  auto a = std::make_shared<Counter>(1);
  Handle h = reg.store(a);
  EXPECT_EQ(reg.release(h), a);
  EXPECT_EQ(reg.load(h), nullptr);
  EXPECT_EQ(reg.release(h), nullptr);
  EXPECT_EQ(reg.size(), 0u);
}

TEST(HandleRegistry, StaleHandleNeverFindsReusedSlot) {
  HandleRegistry reg;
  Handle first = reg.store(std::make_shared<Counter>(1));
  reg.release(first);
  auto b = std::make_shared<Counter>(2);
  Handle second = reg.store(b);
  EXPECT_NE(first, second);
  EXPECT_EQ(reg.load(first), nullptr);
  EXPECT_EQ(reg.release(first), nullptr);
  EXPECT_EQ(reg.load(second), b);
}

TEST(HandleRegistry, ManyHandlesStayDistinct) {
  HandleRegistry reg;
  std::vector<Handle> handles;
  for (int i = 0; i < 100; ++i) handles.push_back(reg.store(std::make_shared<Counter>(i)));
  for (int i = 0; i < 100; i += 2) reg.release(handles[i]);
  EXPECT_EQ(reg.size(), 50u);
  for (int i = 1; i < 100; i += 2) {
    auto c = std::dynamic_pointer_cast<Counter>(reg.load(handles[i]));
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->value, i);
  }
}

TEST(HandleRegistry, FullRegistryRefusesUntilASlotFrees) {
  HandleRegistry reg(2);
  Handle a = reg.store(std::make_shared<Counter>(1));
  Handle b = reg.store(std::make_shared<Counter>(2));
  ASSERT_NE(a, kInvalidHandle);
  ASSERT_NE(b, kInvalidHandle);
  EXPECT_EQ(reg.store(std::make_shared<Counter>(3)), kInvalidHandle);
  EXPECT_EQ(reg.size(), 2u);

  ASSERT_NE(reg.release(a), nullptr);
  Handle c = reg.store(std::make_shared<Counter>(4));
  ASSERT_NE(c, kInvalidHandle);
  EXPECT_NE(c, a);
  EXPECT_EQ(reg.load(a), nullptr);
  EXPECT_EQ(std::static_pointer_cast<Counter>(reg.load(c))->value, 4);
}

TEST(HandleRegistry, IndexFieldFitsTheToken) {
  EXPECT_LT(HandleRegistry::kIndexBits, sizeof(Handle) * 8);
  EXPECT_GE(HandleRegistry::kMaxSlots, size_t(0xFFFFFF));
}

TEST(HandleRegistry, ClientDataRoundTrip) {
  Handle h = 0x1234;
  EXPECT_EQ(HandleRegistry::fromClientData(HandleRegistry::toClientData(h)), h);
}

TEST(BridgeStateHandles, ReleaseRunsHookOnce) {
  BridgeState& state = BridgeState::get();
  auto c = std::make_shared<Counter>(3);
  Handle h = state.storeObject(c);
  state.releaseObject(h);
  state.releaseObject(h);
  EXPECT_EQ(c->released, 1);
  EXPECT_EQ(state.loadObject(h), nullptr);
}

TEST(BridgeStateHandles, ReleaseHookRunsOutsideLock) {
  BridgeState& state = BridgeState::get();
  size_t before = state.liveHandles();
  auto r = std::make_shared<Reentrant>();
  Handle h = state.storeObject(r);
  state.releaseObject(h);
  EXPECT_TRUE(r->ran);
  EXPECT_EQ(r->seen, before);
}

TEST(BridgeStateHandles, LoadAsChecksType) {
  BridgeState& state = BridgeState::get();
  Handle h = state.storeObject(std::make_shared<Other>());
  EXPECT_EQ(state.loadAs<Counter>(h), nullptr);
  EXPECT_NE(state.loadAs<Other>(h), nullptr);
  state.releaseObject(h);
}
