#pragma once

#include "keepsake/core/Types.hh"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace keepsake {

enum class StoreAction : uint8_t {
    List,
    Save,
    Load,
    Delete
};

const char* storeActionToString(StoreAction action);

/// Result of one adapter operation, delivered once through the adapter's
/// completion handler.
struct RequestOutcome {
    StoreAction action = StoreAction::List;
    bool success = false;
    std::optional<BinaryData> data;
};

/// Blob store capability consumed by the engine (remote service or local
/// fallback). Every operation is asynchronous: it returns immediately and
/// later reports exactly one RequestOutcome through the single completion
/// handler shared by all four operations.
class StoreAdapter {
  public:
    using CompletionHandler = std::function<void(const RequestOutcome&)>;

    virtual ~StoreAdapter() = default;

    virtual void list() = 0;
    virtual void save(const std::string& key, BinaryData bytes) = 0;
    virtual void load(const std::string& key) = 0;
    virtual void remove(const std::string& key) = 0;

    /// Short name used in logs ("remote", "local").
    virtual std::string name() const = 0;

    /// Replace the completion handler. Passing nullptr detaches the consumer;
    /// outcomes reported while detached are dropped.
    void setCompletionHandler(CompletionHandler handler);

  protected:
    void complete(const RequestOutcome& outcome);

  private:
    CompletionHandler handler_;
};

} // namespace keepsake
