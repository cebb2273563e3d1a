#pragma once

#include "keepsake/core/StoreAdapter.hh"

#include <asio/io_context.hpp>

#include <string>
#include <vector>

namespace keepsake {

/// Filesystem-backed store used as the local-storage fallback. Each key is
/// one file <directory>/<key>.json written through a temporary file and a
/// rename, so a reader never observes a partial payload.
///
/// Operations run synchronously on the calling context but report their
/// outcome through the io_context, keeping the adapter contract of an
/// out-of-band completion.
class LocalStore : public StoreAdapter {
  public:
    LocalStore(asio::io_context& io, const std::string& directory);

    void list() override;
    void save(const std::string& key, BinaryData bytes) override;
    void load(const std::string& key) override;
    void remove(const std::string& key) override;
    std::string name() const override;

    /// Keys currently on disk, sorted.
    std::vector<std::string> listKeys() const;

    bool contains(const std::string& key) const;

    const std::string& directory() const { return directory_; }

  private:
    std::string keyPath(const std::string& key) const;
    void post(RequestOutcome outcome);

    asio::io_context& io_;
    std::string directory_;
};

} // namespace keepsake
