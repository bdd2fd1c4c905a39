#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/audit/store_initializer.hpp"
#include "internal/db/memory/memory_event_store.hpp"
#include "internal/db/sqlite/sqlite_event_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using auditgate::audit::StoreInitializer;
using auditgate::db::EventStore;
using auditgate::db::memory::MemoryEventStore;

auditgate::db::model::InvocationEvent MakeEvent(const std::string& operation) {
  auditgate::db::model::InvocationEvent event;
  event.timestamp_ms   = 1'700'000'000'000;
  event.operation_name = operation;
  event.duration_ms    = 1.0;
  return event;
}

void TestConcurrentCallersShareOneStore() {
  std::atomic<int> factory_calls{0};
  StoreInitializer initializer([&] {
    ++factory_calls;
    // widen the race window
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    return std::make_shared<MemoryEventStore>();
  });

  assert(!initializer.IsReady());

  constexpr int                                kThreads = 16;
  std::vector<std::shared_ptr<EventStore>> handles(kThreads);
  std::vector<std::thread>                     threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      auto store = initializer.EnsureReady();
      // a write and a read race on the very first use
      if (i % 2 == 0) {
        auto event = MakeEvent("first-use");
        assert(store->Append(event));
      } else {
        (void)store->Scan(auditgate::db::EventFilter{}, 10);
      }
      handles[i] = store;
    });
  }
  for (auto& t : threads) t.join();

  assert(factory_calls.load() == 1);
  assert(initializer.IsReady());
  for (const auto& handle : handles) {
    assert(handle == handles[0]);
  }
  assert(handles[0]->Count() == kThreads / 2);
}

void TestSteadyStateCallersRaceReset() {
  std::atomic<int> factory_calls{0};
  StoreInitializer initializer([&] {
    ++factory_calls;
    return std::make_shared<MemoryEventStore>();
  });
  (void)initializer.EnsureReady();

  constexpr int     kReaders = 8;
  constexpr int     kResets  = 50;
  std::atomic<bool> done{false};
  std::atomic<int>  null_handles{0};

  std::vector<std::thread> readers;
  for (int i = 0; i < kReaders; ++i) {
    readers.emplace_back([&] {
      while (!done.load()) {
        if (!initializer.EnsureReady()) ++null_handles;
      }
    });
  }
  for (int i = 0; i < kResets; ++i) {
    initializer.Reset();
    std::this_thread::sleep_for(std::chrono::microseconds(200));
  }
  done = true;
  for (auto& t : readers) t.join();

  assert(null_handles.load() == 0);
  // one store per generation at most: the initial one plus one after each reset
  assert(factory_calls.load() <= kResets + 1);
  assert(initializer.EnsureReady() == initializer.EnsureReady());
  assert(initializer.IsReady());
}

void TestFailureIsReportedAndRetried() {
  int              attempts = 0;
  StoreInitializer initializer([&]() -> std::shared_ptr<EventStore> {
    if (++attempts == 1) {
      throw std::runtime_error("disk not mounted");
    }
    return std::make_shared<MemoryEventStore>();
  });

  bool threw = false;
  try {
    (void)initializer.EnsureReady();
  } catch (const auditgate::util::InitializationError& e) {
    threw = std::string(e.what()).find("disk not mounted") != std::string::npos;
  }
  assert(threw && "factory failure must surface as InitializationError");
  assert(!initializer.IsReady());

  auto store = initializer.EnsureReady();
  assert(store != nullptr);
  assert(initializer.IsReady());
  assert(attempts == 2);
}

void TestNullStoreIsAnInitializationError() {
  StoreInitializer initializer([]() -> std::shared_ptr<EventStore> { return nullptr; });

  bool threw = false;
  try {
    (void)initializer.EnsureReady();
  } catch (const auditgate::util::InitializationError&) {
    threw = true;
  }
  assert(threw);
  assert(!initializer.IsReady());
}

void TestResetRecreatesDeletedSqliteStore() {
  const auto dir = std::filesystem::temp_directory_path() / "auditgate_store_initializer_tests";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  const auto path = (dir / "audit.db").string();

  auditgate::db::sqlite::SqliteStoreOptions options;
  options.path = path;

  int              opens = 0;
  StoreInitializer initializer([&] {
    ++opens;
    return std::static_pointer_cast<EventStore>(auditgate::db::sqlite::OpenSqliteEventStore(options));
  });

  // a read alone creates the store and its schema
  assert(initializer.EnsureReady()->Scan(auditgate::db::EventFilter{}, std::nullopt).empty());
  assert(std::filesystem::exists(path));

  auto event = MakeEvent("before-delete");
  assert(initializer.EnsureReady()->Append(event));
  assert(event.id == 1);

  initializer.Reset();
  assert(!initializer.IsReady());
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);

  auto store = initializer.EnsureReady();
  assert(opens == 2);
  assert(std::filesystem::exists(path));
  assert(store->Count() == 0);

  auto fresh = MakeEvent("after-delete");
  assert(store->Append(fresh));
  assert(fresh.id == 1);

  store.reset();
  initializer.Reset();
  std::filesystem::remove_all(dir);
}

void TestUnopenableStoreFailsWithoutCaching() {
  auditgate::db::sqlite::SqliteStoreOptions options;
  options.path = (std::filesystem::temp_directory_path() / "auditgate_no_such_dir" / "nested" / "audit.db").string();
  std::filesystem::remove_all(std::filesystem::temp_directory_path() / "auditgate_no_such_dir");

  StoreInitializer initializer([&] { return std::static_pointer_cast<EventStore>(auditgate::db::sqlite::OpenSqliteEventStore(options)); });

  for (int i = 0; i < 2; ++i) {
    bool threw = false;
    try {
      (void)initializer.EnsureReady();
    } catch (const auditgate::util::InitializationError&) {
      threw = true;
    }
    assert(threw);
    assert(!initializer.IsReady());
  }
}

} // namespace

int main() {
  TestConcurrentCallersShareOneStore();
  TestSteadyStateCallersRaceReset();
  TestFailureIsReportedAndRetried();
  TestNullStoreIsAnInitializationError();
  TestResetRecreatesDeletedSqliteStore();
  TestUnopenableStoreFailsWithoutCaching();

  std::cout << "auditgate_unit_store_initializer: pass\n";
  return 0;
}
