/**
 * @file kv_store.hpp
 * @brief Key-value interface consumed by the stateful token store and
 *        namespace aliasing
 */

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace tessera {

/**
 * @brief Injected persistence backend
 *
 * Implementations report failures by throwing; callers in this library let
 * those exceptions propagate unchanged and never retry.
 */
class KeyValueStore {
 public:
  virtual ~KeyValueStore() = default;

  virtual std::optional<std::string> get(std::string_view key) = 0;
  virtual void put(std::string_view key, std::string_view value) = 0;
};

/**
 * @brief Mutex-guarded std::map backend for embedding and tests
 */
class InMemoryKeyValueStore : public KeyValueStore {
 public:
  std::optional<std::string> get(std::string_view key) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  void put(std::string_view key, std::string_view value) override {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.insert_or_assign(std::string(key), std::string(value));
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::string, std::less<>> entries_;
};

}  // namespace tessera
