#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "capability.hpp"
#include "config.hpp"
#include "util.hpp"
#include "v8_util.hpp"

// hand out ArrayBuffer backing stores until limit bytes are live, then refuse.
struct BoundedAllocator : v8::ArrayBuffer::Allocator {
  std::unique_ptr<v8::ArrayBuffer::Allocator> base;
  size_t limit;
  std::atomic<size_t> used {0};
  // set whenever an allocation is refused. cleared by the executor before each run.
  std::atomic<bool> exceeded {false};
  explicit BoundedAllocator(size_t limit) :
    base(v8::ArrayBuffer::Allocator::NewDefaultAllocator()), limit(limit) { }
  void* Allocate(size_t length) override;
  void* AllocateUninitialized(size_t length) override;
  void Free(void* data, size_t length) override;
private:
  bool reserve(size_t length);
};

// one client session: an isolate with a persistent context, created on first execution.
// every field besides id and last_used is only touched while holding the lock.
struct SessionNode {
  struct LockNode {
    SessionNode& session;
    LockNode() = delete;
    LockNode(const LockNode&) = delete;
    LockNode(SessionNode& session) : session(session) {
      session.m.lock();
    }
    // adopt a mutex that is already locked.
    LockNode(SessionNode& session, std::adopt_lock_t) : session(session) { }
    ~LockNode() {
      session.touch();
      session.m.unlock();
    }
  };
  using Lock = std::shared_ptr<LockNode>;

  const std::string id;
  v8::Isolate* isolate = nullptr;
  std::unique_ptr<BoundedAllocator> allocator;
  v8::Global<v8::Context> context;
  HostEnv env;
  // set by the near heap limit callback.
  std::atomic<bool> heap_exceeded {false};
  // the old generation limit v8 started with, as last reported to the callback.
  size_t initial_heap_limit = 0;
  size_t executions = 0;

  explicit SessionNode(const std::string& id) : id(id) {
    touch();
  }
  SessionNode(const SessionNode&) = delete;
  ~SessionNode();

  Lock lock() {
    return std::make_shared<LockNode>(*this);
  }
  // nullptr when someone else hold the session.
  Lock try_lock() {
    if (!m.try_lock()) {
      return nullptr;
    }
    return std::make_shared<LockNode>(*this, std::adopt_lock);
  }
  // create the isolate and context if this is the first execution. throw std::runtime_error on failure.
  void start(const Limits& limits, const Lock&);
  // undo the room lent by the near heap limit callback. v8 keep the limit above the live heap.
  // the caller hold the v8::Locker too.
  void restore_heap_limit(const Lock&);
  // throw away the isolate with all state in it. the next start begin from a fresh context.
  void discard(const Lock&) {
    dispose();
  }
  steady_clock::duration idle() const {
    return steady_clock::now() - time_point(steady_clock::duration(last_used.load()));
  }
private:
  std::mutex m;
  std::atomic<steady_clock::rep> last_used {0};
  void dispose();
  void touch() {
    last_used = steady_clock::now().time_since_epoch().count();
  }
};

using Session = std::shared_ptr<SessionNode>;

// every session of the process, by id.
struct SessionRegistry {
  Session get_or_create(const std::string& id);
  Session find(const std::string& id) const;
  size_t size() const;
  std::vector<std::string> ids() const;
  // drop sessions idle for longer than ttl that nobody is using. return how many were dropped.
  // a worker still holding a dropped Session finish with it undisturbed.
  size_t evict_idle(steady_clock::duration ttl);
private:
  mutable std::shared_mutex m;
  std::unordered_map<std::string, Session> sessions;
};
