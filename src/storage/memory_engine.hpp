#pragma once

#include "storage/storage_engine.hpp"

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace rkv {

// Ordered in-memory storage engine backed by std::map.
//
// Concurrency model:
//   - transaction reads acquire a shared (read) lock on the committed map;
//   - commit() / clear() acquire an exclusive (write) lock.
// A transaction buffers its writes in an overlay (std::nullopt marks a
// deletion) and merges overlay and committed map on every read.  Concurrent
// transactions writing the same key resolve last-commit-wins; the
// TransactionCoordinator never runs two scopes over the same store at once.
class MemoryEngine final : public StorageEngine {
public:
    using Map = std::map<std::string, std::string, std::less<>>;

    MemoryEngine() = default;

    // Not copyable – copies of a live store would silently race.
    MemoryEngine(const MemoryEngine&)            = delete;
    MemoryEngine& operator=(const MemoryEngine&) = delete;

    [[nodiscard]] std::unique_ptr<EngineTransaction> begin() override;
    void clear() override;

    // Number of committed entries (tests, diagnostics).
    [[nodiscard]] std::size_t size() const;

private:
    friend class MemoryTransaction;

    mutable std::shared_mutex mutex_;
    Map map_;
};

class MemoryTransaction final : public EngineTransaction {
public:
    explicit MemoryTransaction(MemoryEngine& engine) : engine_(engine) {}

    [[nodiscard]] std::optional<std::string> get(std::string_view key) override;
    void put(std::string key, std::string value) override;
    void del(std::string_view key) override;
    [[nodiscard]] std::optional<Entry> seek(std::string_view target, SeekMode mode) override;
    void commit() override;
    void rollback() override;

private:
    using Overlay = std::map<std::string, std::optional<std::string>, std::less<>>;

    void ensure_active() const;

    MemoryEngine& engine_;
    Overlay writes_;
    bool finished_ = false;
};

} // namespace rkv
