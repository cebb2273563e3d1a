#include "keepsake/core/Event.hh"
#include "keepsake/core/Log.hh"
#include "keepsake/utils/Utils.hh"
#include <algorithm>

namespace keepsake {

Event::Event(const std::string& type, const std::string& source) : type(type), source(source) {
    if (type.empty()) {
        throwError("Event type cannot be empty");
    }
}

const std::string& Event::getType() const {
    return type;
}

const std::string& Event::getSource() const {
    return source;
}

bool Event::hasData(const std::string& key) const {
    return data.find(key) != data.end();
}

bool Event::isHandled() const {
    return handled;
}

void Event::setHandled(bool handled) {
    this->handled = handled;
}

bool Event::isCancelled() const {
    return cancelled;
}

void Event::setCancelled(bool cancelled) {
    this->cancelled = cancelled;
}

std::string EventDispatcher::addEventListener(const std::string& eventType, const EventHandler& handler,
                                              int32_t priority) {
    if (eventType.empty()) {
        throwError("Event type cannot be empty");
    }

    if (!handler) {
        throwError("Event handler cannot be null");
    }

    HandlerEntry entry;
    entry.id = Utils::generateUniqueId("h_");
    entry.handler = handler;
    entry.priority = priority;

    // upper_bound keeps subscription order among equal priorities.
    auto& vec = listeners[eventType];
    auto pos = std::upper_bound(vec.begin(), vec.end(), entry,
                                [](const HandlerEntry& a, const HandlerEntry& b) { return a.priority < b.priority; });
    vec.insert(pos, entry);

    KEEPSAKE_LOG_DEBUG("Added listener for '{}' with ID '{}' (priority {})", eventType, entry.id, priority);

    return entry.id;
}

bool EventDispatcher::removeEventListener(const std::string& eventType, const std::string& handlerId) {
    auto it = listeners.find(eventType);
    if (it == listeners.end()) {
        return false;
    }

    auto& handlers = it->second;
    auto handlerIt = std::find_if(handlers.begin(), handlers.end(),
                                  [&handlerId](const HandlerEntry& entry) { return entry.id == handlerId; });

    if (handlerIt != handlers.end()) {
        handlers.erase(handlerIt);
        KEEPSAKE_LOG_DEBUG("Removed listener for '{}' with ID '{}'", eventType, handlerId);
        return true;
    }

    return false;
}

bool EventDispatcher::dispatchEvent(Event& event) {
    auto it = listeners.find(event.getType());
    if (it == listeners.end()) {
        return false;
    }

    // Copy: a handler may subscribe or unsubscribe while we iterate.
    std::vector<HandlerEntry> handlersToInvoke = it->second;

    for (const auto& entry : handlersToInvoke) {
        try {
            entry.handler(event);
        } catch (const std::exception& e) {
            KEEPSAKE_LOG_ERROR("Exception in '{}' handler: {}", event.getType(), e.what());
        }
        if (event.isCancelled() || event.isHandled()) {
            return true;
        }
    }

    return false;
}

size_t EventDispatcher::listenerCount(const std::string& eventType) const {
    auto it = listeners.find(eventType);
    return it == listeners.end() ? 0 : it->second.size();
}

} // namespace keepsake
