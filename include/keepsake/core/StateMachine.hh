#pragma once

#include "keepsake/core/Log.hh"
#include "keepsake/utils/ErrorHandling.hh"
#include "keepsake/utils/Utils.hh"
#include <algorithm>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace keepsake {

// Generic state machine with an explicit transition table and entry/transition
// hooks. Self-transitions are no-ops; anything not in the table throws.
// Not thread-safe: owned and driven by one cooperative context.
template <typename StateEnum> class StateMachine {
  public:
    using Hook = std::function<void()>;
    using ToStringFn = std::function<std::string(StateEnum)>;

    StateMachine(StateEnum initialState, ToStringFn toStringFn)
        : currentState_(initialState), toStringFn_(std::move(toStringFn)) {}

    void addTransition(StateEnum from, StateEnum to) { transitions_.insert({from, to}); }

    void setState(StateEnum state) {
        if (currentState_ == state) {
            return;
        }

        if (transitions_.count({currentState_, state}) == 0) {
            throwError("Invalid state transition from " + toStringFn_(currentState_) + " to " + toStringFn_(state));
        }

        StateEnum oldState = currentState_;
        currentState_ = state;

        KEEPSAKE_SYNC_LOG_DEBUG("State transition: {} -> {}", toStringFn_(oldState), toStringFn_(state));

        // Copy before invoking: a hook may register further hooks.
        std::vector<Hook> toInvoke;
        if (auto it = stateHooks_.find(state); it != stateHooks_.end()) {
            for (const auto& entry : it->second) {
                toInvoke.push_back(entry.hook);
            }
        }
        if (auto it = transitionHooks_.find({oldState, state}); it != transitionHooks_.end()) {
            for (const auto& entry : it->second) {
                toInvoke.push_back(entry.hook);
            }
        }

        for (const auto& hook : toInvoke) {
            try {
                hook();
            } catch (const std::exception& e) {
                KEEPSAKE_LOG_ERROR("Exception in state hook for '{}': {}", toStringFn_(state), e.what());
            }
        }
    }

    StateEnum getState() const { return currentState_; }

    bool isValidTransition(StateEnum from, StateEnum to) const {
        if (from == to)
            return true;
        return transitions_.count({from, to}) > 0;
    }

    // True when the table allows leaving the current state for `to`.
    bool canTransitionTo(StateEnum to) const { return currentState_ != to && transitions_.count({currentState_, to}) > 0; }

    std::string stateName() const { return toStringFn_(currentState_); }

    std::string addHook(StateEnum state, const Hook& hook) {
        if (!hook) {
            throwError("State hook cannot be null");
        }

        auto id = Utils::generateUniqueId("hook_");
        stateHooks_[state].push_back(HookEntry{id, hook});
        return id;
    }

    std::string addTransitionHook(StateEnum from, StateEnum to, const Hook& hook) {
        if (!hook) {
            throwError("Transition hook cannot be null");
        }

        auto id = Utils::generateUniqueId("transition_");
        transitionHooks_[{from, to}].push_back(HookEntry{id, hook});
        return id;
    }

    bool removeHook(const std::string& hookId) {
        auto matches = [&hookId](const HookEntry& e) { return e.id == hookId; };

        for (auto& [state, hooks] : stateHooks_) {
            auto it = std::find_if(hooks.begin(), hooks.end(), matches);
            if (it != hooks.end()) {
                hooks.erase(it);
                return true;
            }
        }

        for (auto& [key, hooks] : transitionHooks_) {
            auto it = std::find_if(hooks.begin(), hooks.end(), matches);
            if (it != hooks.end()) {
                hooks.erase(it);
                return true;
            }
        }

        return false;
    }

  private:
    struct HookEntry {
        std::string id;
        Hook hook;
    };

    StateEnum currentState_;
    ToStringFn toStringFn_;
    std::set<std::pair<StateEnum, StateEnum>> transitions_;

    std::map<StateEnum, std::vector<HookEntry>> stateHooks_;
    std::map<std::pair<StateEnum, StateEnum>, std::vector<HookEntry>> transitionHooks_;
};

} // namespace keepsake
