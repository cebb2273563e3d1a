#pragma once

#include "keepsake/core/Types.hh"
#include "keepsake/utils/ErrorHandling.hh"
#include <cstdint>
#include <functional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace keepsake {

// A named signal with keyed Variant payload. Events are created, dispatched
// and consumed on the engine's cooperative context; they are not shared
// across threads.
class Event {
public:
  Event(const std::string& type, const std::string& source);
  virtual ~Event() = default;

  const std::string& getType() const;
  const std::string& getSource() const;

  template <typename T>
  void setData(const std::string& key, const T& value) {
    static_assert(isSupported<T>(), "Data type not supported. Must be one of the types in Variant.");
    data[key] = value;
  }

  template <typename T>
  T getData(const std::string& key) const {
    static_assert(isSupported<T>(), "Data type not supported. Must be one of the types in Variant.");
    auto it = data.find(key);
    if (it == data.end()) {
      throwError("Event data key '" + key + "' not found");
    }
    if (const auto* value = std::get_if<T>(&it->second)) {
      return *value;
    }
    throwError("Event data key '" + key + "' has incorrect type");
  }

  // Returns `fallback` when the key is absent or holds another type.
  template <typename T>
  T getDataOr(const std::string& key, T fallback) const {
    auto it = data.find(key);
    if (it == data.end()) {
      return fallback;
    }
    if (const auto* value = std::get_if<T>(&it->second)) {
      return *value;
    }
    return fallback;
  }

  bool hasData(const std::string& key) const;

  bool isHandled() const;
  void setHandled(bool handled = true);

  bool isCancelled() const;
  void setCancelled(bool cancelled = true);

private:
  template <typename T>
  static constexpr bool isSupported() {
    return std::is_same_v<T, bool> || std::is_same_v<T, int> || std::is_same_v<T, double> ||
           std::is_same_v<T, std::string>;
  }

  std::string type;
  std::string source;
  std::unordered_map<std::string, Variant> data;
  bool handled = false;
  bool cancelled = false;
};

using EventHandler = std::function<void(Event&)>;

class EventDispatcher {
public:
  EventDispatcher() = default;

  // Subscribe with optional priority (lower runs first, default 0)
  std::string addEventListener(const std::string& eventType,
                               const EventHandler& handler,
                               int32_t priority = 0);

  bool removeEventListener(const std::string& eventType, const std::string& handlerId);

  // Returns true when a listener marked the event handled or cancelled.
  bool dispatchEvent(Event& event);

  size_t listenerCount(const std::string& eventType) const;

private:
  struct HandlerEntry {
    std::string id;
    EventHandler handler;
    int32_t priority = 0;
  };

  std::unordered_map<std::string, std::vector<HandlerEntry>> listeners;
};

} // namespace keepsake
