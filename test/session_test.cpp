#include <gtest/gtest.h>
#include <future>
#include <thread>

#include "session.hpp"

// NOLINTNEXTLINE
TEST(session_registry, get_or_create_returns_same_session) {
  SessionRegistry r;
  Session a = r.get_or_create("a");
  EXPECT_EQ(r.get_or_create("a"), a);
  EXPECT_NE(r.get_or_create("b"), a);
  EXPECT_EQ(r.size(), 2u);
  EXPECT_EQ(a->id, "a");
}

// NOLINTNEXTLINE
TEST(session_registry, find_and_ids) {
  SessionRegistry r;
  EXPECT_EQ(r.find("missing"), nullptr);
  r.get_or_create("zeta");
  r.get_or_create("alpha");
  EXPECT_NE(r.find("zeta"), nullptr);
  EXPECT_EQ(r.ids(), (std::vector<std::string>{"alpha", "zeta"}));
}

// NOLINTNEXTLINE
TEST(session_registry, concurrent_creation_yields_one_session) {
  SessionRegistry r;
  std::vector<std::future<Session>> futures;
  for (size_t i = 0; i < 8; ++i) {
    futures.push_back(std::async(std::launch::async, [&r]() { return r.get_or_create("shared"); }));
  }
  Session first = futures[0].get();
  for (size_t i = 1; i < futures.size(); ++i) {
    EXPECT_EQ(futures[i].get(), first);
  }
  EXPECT_EQ(r.size(), 1u);
}

// NOLINTNEXTLINE
TEST(session_lock, excludes_other_holders) {
  SessionRegistry r;
  Session s = r.get_or_create("s");
  {
    SessionNode::Lock l = s->lock();
    auto other = std::async(std::launch::async, [&s]() { return s->try_lock() != nullptr; });
    EXPECT_FALSE(other.get());
  }
  auto again = std::async(std::launch::async, [&s]() { return s->try_lock() != nullptr; });
  EXPECT_TRUE(again.get());
}

// NOLINTNEXTLINE
TEST(session_registry, evict_idle_skips_busy_sessions) {
  SessionRegistry r;
  Session idle = r.get_or_create("idle");
  Session busy = r.get_or_create("busy");
  SessionNode::Lock l = busy->lock();
  std::this_thread::sleep_for(milliseconds(20));
  // evict from another thread, this one hold busy.
  EXPECT_EQ(std::async(std::launch::async, [&r]() { return r.evict_idle(milliseconds(5)); }).get(), 1u);
  EXPECT_EQ(r.find("idle"), nullptr);
  EXPECT_EQ(r.find("busy"), busy);
  // a fresh session is not idle yet.
  r.get_or_create("fresh");
  EXPECT_EQ(std::async(std::launch::async, [&r]() { return r.evict_idle(seconds(60)); }).get(), 0u);
  EXPECT_EQ(r.size(), 2u);
}

// NOLINTNEXTLINE
TEST(session_node, discard_then_start_again) {
  Limits limits;
  limits.memory_limit = 64 * bytes_in_mb;
  SessionNode s("s");
  SessionNode::Lock l = s.lock();
  s.start(limits, l);
  ASSERT_NE(s.isolate, nullptr);
  EXPECT_FALSE(s.context.IsEmpty());
  s.discard(l);
  EXPECT_EQ(s.isolate, nullptr);
  EXPECT_TRUE(s.context.IsEmpty());
  EXPECT_EQ(s.allocator, nullptr);
  // a discarded session is started over, not left without a context.
  s.start(limits, l);
  EXPECT_NE(s.isolate, nullptr);
  EXPECT_FALSE(s.context.IsEmpty());
}
