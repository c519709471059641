#include "storage/memory_engine.hpp"
#include "core/error.hpp"

#include <iterator>
#include <mutex>
#include <shared_mutex>

namespace rkv {

namespace {

// Positions `m` relative to `target` according to `mode`; returns m.end()
// when no such key exists.
template <typename M>
typename M::const_iterator locate(const M& m, std::string_view target, SeekMode mode) {
    switch (mode) {
        case SeekMode::AtOrAfter:
            return m.lower_bound(target);
        case SeekMode::After:
            return m.upper_bound(target);
        case SeekMode::AtOrBefore: {
            auto it = m.upper_bound(target);
            return it == m.begin() ? m.end() : std::prev(it);
        }
        case SeekMode::Before: {
            auto it = m.lower_bound(target);
            return it == m.begin() ? m.end() : std::prev(it);
        }
    }
    return m.end();
}

bool is_forward(SeekMode mode) {
    return mode == SeekMode::AtOrAfter || mode == SeekMode::After;
}

} // anonymous namespace

// ── MemoryEngine ─────────────────────────────────────────────────────────────

std::unique_ptr<EngineTransaction> MemoryEngine::begin() {
    return std::make_unique<MemoryTransaction>(*this);
}

void MemoryEngine::clear() {
    std::unique_lock lock(mutex_);
    map_.clear();
}

std::size_t MemoryEngine::size() const {
    std::shared_lock lock(mutex_);
    return map_.size();
}

// ── MemoryTransaction ────────────────────────────────────────────────────────

void MemoryTransaction::ensure_active() const {
    if (finished_) {
        throw EngineError(Errc::storage_failure, "memory transaction already finished");
    }
}

std::optional<std::string> MemoryTransaction::get(std::string_view key) {
    ensure_active();

    if (auto it = writes_.find(key); it != writes_.end()) {
        return it->second;
    }

    std::shared_lock lock(engine_.mutex_);
    auto it = engine_.map_.find(key);
    if (it == engine_.map_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryTransaction::put(std::string key, std::string value) {
    ensure_active();
    writes_.insert_or_assign(std::move(key), std::move(value));
}

void MemoryTransaction::del(std::string_view key) {
    ensure_active();
    writes_.insert_or_assign(std::string(key), std::nullopt);
}

std::optional<Entry> MemoryTransaction::seek(std::string_view target, SeekMode mode) {
    ensure_active();
    std::shared_lock lock(engine_.mutex_);

    const bool forward = is_forward(mode);
    std::string position(target);

    // Merge the committed map with the overlay.  The overlay shadows equal
    // keys; a deletion marker moves the search strictly past that key.
    for (;;) {
        auto base = locate(engine_.map_, position, mode);
        auto own  = locate(writes_, position, mode);
        const bool has_base = base != engine_.map_.end();
        const bool has_own  = own != writes_.end();

        if (!has_base && !has_own) {
            return std::nullopt;
        }

        bool from_overlay = has_own;
        if (has_base && has_own) {
            const int cmp = own->first.compare(base->first);
            from_overlay = cmp == 0 || (forward ? cmp < 0 : cmp > 0);
        }

        if (!from_overlay) {
            return Entry{base->first, base->second};
        }
        if (own->second) {
            return Entry{own->first, *own->second};
        }

        position = own->first;
        mode = forward ? SeekMode::After : SeekMode::Before;
    }
}

void MemoryTransaction::commit() {
    ensure_active();
    {
        std::unique_lock lock(engine_.mutex_);
        for (auto& [key, value] : writes_) {
            if (value) {
                engine_.map_.insert_or_assign(key, std::move(*value));
            } else {
                engine_.map_.erase(key);
            }
        }
    }
    writes_.clear();
    finished_ = true;
}

void MemoryTransaction::rollback() {
    writes_.clear();
    finished_ = true;
}

} // namespace rkv
