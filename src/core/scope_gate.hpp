#pragma once

#include <list>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

namespace rkv {

// ── ScopeGate ────────────────────────────────────────────────────────────────
//
// Orders read-write scopes by the stores they cover.  A scope is admitted
// once every scope that entered the gate before it and shares a store with it
// has released; scopes over disjoint stores run side by side.  Admission is
// FIFO among overlapping scopes.
//
// NOT thread-safe: every acquire and release runs on one executor.

class ScopeGate {
    struct Entry;

public:
    // Held for the lifetime of a scope; releasing admits the next waiters.
    class Lease {
    public:
        Lease() = default;
        Lease(ScopeGate& gate, std::shared_ptr<Entry> entry) noexcept
            : gate_(&gate), entry_(std::move(entry)) {}
        ~Lease() { release(); }

        Lease(Lease&& other) noexcept
            : gate_(std::exchange(other.gate_, nullptr))
            , entry_(std::move(other.entry_)) {}
        Lease& operator=(Lease&& other) noexcept {
            if (this != &other) {
                release();
                gate_  = std::exchange(other.gate_, nullptr);
                entry_ = std::move(other.entry_);
            }
            return *this;
        }
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        void release() noexcept;

    private:
        ScopeGate* gate_ = nullptr;
        std::shared_ptr<Entry> entry_;
    };

    explicit ScopeGate(boost::asio::any_io_executor executor)
        : executor_(std::move(executor)) {}

    ScopeGate(const ScopeGate&) = delete;
    ScopeGate& operator=(const ScopeGate&) = delete;

    // Suspends until the scope over `stores` may start.
    [[nodiscard]] boost::asio::awaitable<Lease> acquire(std::vector<std::string> stores);

    // Scopes admitted or waiting.
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

private:
    struct Entry {
        std::vector<std::string> stores;  // sorted
        bool admitted = false;
        boost::asio::steady_timer* signal = nullptr;
    };

    [[nodiscard]] bool admissible(const Entry& entry) const;
    void release(const std::shared_ptr<Entry>& entry) noexcept;

    boost::asio::any_io_executor executor_;
    std::list<std::shared_ptr<Entry>> entries_;  // arrival order
};

} // namespace rkv
