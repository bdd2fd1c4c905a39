#include "store_initializer.hpp"

#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace auditgate::audit {

StoreInitializer::StoreInitializer(StoreFactory factory) : factory_(std::move(factory)) {
  if (!factory_) {
    throw std::invalid_argument("StoreInitializer: factory is required");
  }
}

std::shared_ptr<db::EventStore> StoreInitializer::LoadHandle() const {
  std::shared_lock lock(handle_mutex_);
  return store_;
}

std::shared_ptr<db::EventStore> StoreInitializer::EnsureReady() {
  if (ready_.load(std::memory_order_acquire)) {
    if (auto store = LoadHandle()) {
      return store;
    }
  }

  std::lock_guard lock(init_mutex_);
  if (auto store = LoadHandle()) {
    return store;
  }

  std::shared_ptr<db::EventStore> store;
  try {
    store = factory_();
  } catch (const util::InitializationError& e) {
    AUDITGATE_LOG_ERROR("audit store initialization failed", {observability::StringField("error", e.what())});
    throw;
  } catch (const std::exception& e) {
    AUDITGATE_LOG_ERROR("audit store initialization failed", {observability::StringField("error", e.what())});
    throw util::InitializationError(std::string("audit store initialization failed: ") + e.what());
  }

  if (!store) {
    throw util::InitializationError("audit store factory returned no store");
  }

  {
    std::unique_lock handle_lock(handle_mutex_);
    store_ = store;
  }
  ready_.store(true, std::memory_order_release);
  AUDITGATE_LOG_INFO("audit store ready");
  return store;
}

bool StoreInitializer::IsReady() const noexcept {
  return ready_.load(std::memory_order_acquire);
}

void StoreInitializer::Reset() {
  std::lock_guard lock(init_mutex_);
  ready_.store(false, std::memory_order_release);
  std::unique_lock handle_lock(handle_mutex_);
  store_.reset();
}

} // namespace auditgate::audit
