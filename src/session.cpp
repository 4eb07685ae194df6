#include "session.hpp"

#include <algorithm>

bool BoundedAllocator::reserve(size_t length) {
  size_t current = used.load();
  do {
    if (length > limit || current > limit - length) {
      exceeded = true;
      return false;
    }
  } while (!used.compare_exchange_weak(current, current + length));
  return true;
}

void* BoundedAllocator::Allocate(size_t length) {
  if (!reserve(length)) {
    return nullptr;
  }
  void* ret = base->Allocate(length);
  if (ret == nullptr) {
    used -= length;
  }
  return ret;
}

void* BoundedAllocator::AllocateUninitialized(size_t length) {
  if (!reserve(length)) {
    return nullptr;
  }
  void* ret = base->AllocateUninitialized(length);
  if (ret == nullptr) {
    used -= length;
  }
  return ret;
}

void BoundedAllocator::Free(void* data, size_t length) {
  base->Free(data, length);
  used -= length;
}

namespace {

// the heap is about to run out: stop the script, and lend it enough room to unwind.
size_t near_heap_limit(void* data, size_t current_heap_limit, size_t initial_heap_limit) {
  SessionNode* session = static_cast<SessionNode*>(data);
  session->heap_exceeded = true;
  session->initial_heap_limit = initial_heap_limit;
  session->isolate->TerminateExecution();
  return current_heap_limit + std::max<size_t>(initial_heap_limit, 64 * bytes_in_mb);
}

} // namespace

void SessionNode::start(const Limits& limits, const Lock&) {
  if (isolate != nullptr) {
    return;
  }
  allocator = std::make_unique<BoundedAllocator>(limits.memory_limit);
  v8::Isolate::CreateParams create_params;
  create_params.constraints.ConfigureDefaultsFromHeapSize(std::min<size_t>(limits.memory_limit / 4, 16 * bytes_in_mb), limits.memory_limit);
  create_params.array_buffer_allocator = allocator.get();
  isolate = v8::Isolate::New(create_params);
  if (isolate == nullptr) {
    allocator.reset();
    throw std::runtime_error("cannot create an isolate for session " + id);
  }
  bool ok;
  {
    v8::Locker locker(isolate);
    v8::Isolate::Scope isolate_scope(isolate);
    isolate->SetMicrotasksPolicy(v8::MicrotasksPolicy::kExplicit);
    isolate->AddNearHeapLimitCallback(near_heap_limit, this);
    isolate->AutomaticallyRestoreInitialHeapLimit(0.5);
    v8::HandleScope handle_scope(isolate);
    v8::Local<v8::Context> ctx = v8::Context::New(isolate, nullptr, make_global_template(isolate, &env));
    ok = !ctx.IsEmpty();
    if (ok) {
      context.Reset(isolate, ctx);
    }
  }
  if (!ok) {
    // the next execution try again with a new isolate.
    dispose();
    throw std::runtime_error("cannot create a context for session " + id);
  }
}

void SessionNode::restore_heap_limit(const Lock&) {
  if (initial_heap_limit == 0) {
    return;
  }
  isolate->RemoveNearHeapLimitCallback(near_heap_limit, initial_heap_limit);
  isolate->AddNearHeapLimitCallback(near_heap_limit, this);
}

void SessionNode::dispose() {
  if (isolate == nullptr) {
    return;
  }
  {
    v8::Locker locker(isolate);
    v8::Isolate::Scope isolate_scope(isolate);
    context.Reset();
  }
  isolate->Dispose();
  isolate = nullptr;
  // the allocator must outlive the isolate.
  allocator.reset();
}

SessionNode::~SessionNode() {
  dispose();
}

Session SessionRegistry::get_or_create(const std::string& id) {
  {
    std::shared_lock<std::shared_mutex> guard(m);
    auto it = sessions.find(id);
    if (it != sessions.end()) {
      return it->second;
    }
  }
  std::unique_lock<std::shared_mutex> guard(m);
  // another worker may have created it in between.
  auto it = sessions.find(id);
  if (it != sessions.end()) {
    return it->second;
  }
  Session s = std::make_shared<SessionNode>(id);
  sessions.insert({id, s});
  return s;
}

Session SessionRegistry::find(const std::string& id) const {
  std::shared_lock<std::shared_mutex> guard(m);
  auto it = sessions.find(id);
  return it == sessions.end() ? nullptr : it->second;
}

size_t SessionRegistry::size() const {
  std::shared_lock<std::shared_mutex> guard(m);
  return sessions.size();
}

std::vector<std::string> SessionRegistry::ids() const {
  std::vector<std::string> ret;
  {
    std::shared_lock<std::shared_mutex> guard(m);
    for (const auto& p : sessions) {
      ret.push_back(p.first);
    }
  }
  std::sort(ret.begin(), ret.end());
  return ret;
}

size_t SessionRegistry::evict_idle(steady_clock::duration ttl) {
  std::vector<Session> evicted;
  {
    std::unique_lock<std::shared_mutex> guard(m);
    for (auto it = sessions.begin(); it != sessions.end();) {
      const Session& s = it->second;
      SessionNode::Lock l = s->idle() > ttl ? s->try_lock() : nullptr;
      if (l) {
        evicted.push_back(s);
        it = sessions.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (const Session& s : evicted) {
    log_line("evicted idle session " + s->id);
    json j;
    j["session"] = s->id;
    log_json(j, "evict");
  }
  // the isolates are disposed here, outside of the registry lock, unless a worker still hold one.
  return evicted.size();
}
