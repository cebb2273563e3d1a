#include "keepsake/core/StoreAdapter.hh"
#include "keepsake/core/Log.hh"

namespace keepsake {

const char* storeActionToString(StoreAction action) {
    switch (action) {
        case StoreAction::List:
            return "List";
        case StoreAction::Save:
            return "Save";
        case StoreAction::Load:
            return "Load";
        case StoreAction::Delete:
            return "Delete";
    }
    return "Unknown";
}

void StoreAdapter::setCompletionHandler(CompletionHandler handler) {
    handler_ = std::move(handler);
}

void StoreAdapter::complete(const RequestOutcome& outcome) {
    if (!handler_) {
        KEEPSAKE_SYNC_LOG_DEBUG("{} store: dropping {} outcome, no consumer attached", name(),
                                storeActionToString(outcome.action));
        return;
    }
    handler_(outcome);
}

} // namespace keepsake
