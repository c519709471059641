#include "core/scope_gate.hpp"

#include <algorithm>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace rkv {

using boost::asio::awaitable;
using boost::asio::redirect_error;
using boost::asio::steady_timer;
using boost::asio::use_awaitable;

namespace {

// Both ranges are sorted.
bool overlaps(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    auto i = a.begin();
    auto j = b.begin();
    while (i != a.end() && j != b.end()) {
        if (*i < *j) {
            ++i;
        } else if (*j < *i) {
            ++j;
        } else {
            return true;
        }
    }
    return false;
}

} // anonymous namespace

void ScopeGate::Lease::release() noexcept {
    if (gate_ && entry_) {
        gate_->release(entry_);
    }
    gate_ = nullptr;
    entry_.reset();
}

awaitable<ScopeGate::Lease> ScopeGate::acquire(std::vector<std::string> stores) {
    std::sort(stores.begin(), stores.end());
    stores.erase(std::unique(stores.begin(), stores.end()), stores.end());

    auto entry = std::make_shared<Entry>();
    entry->stores = std::move(stores);
    entries_.push_back(entry);

    // Owning the lease before suspending releases the entry if this
    // coroutine is destroyed while it waits.
    Lease lease(*this, entry);

    entry->admitted = admissible(*entry);
    while (!entry->admitted) {
        steady_timer signal(executor_, steady_timer::time_point::max());
        entry->signal = &signal;

        // Cancelled by release() once the entry is admitted.
        boost::system::error_code ec;
        co_await signal.async_wait(redirect_error(use_awaitable, ec));
        entry->signal = nullptr;
    }
    co_return std::move(lease);
}

bool ScopeGate::admissible(const Entry& entry) const {
    for (const auto& earlier : entries_) {
        if (earlier.get() == &entry) return true;
        if (overlaps(earlier->stores, entry.stores)) return false;
    }
    return true;
}

void ScopeGate::release(const std::shared_ptr<Entry>& entry) noexcept {
    entries_.remove(entry);

    for (const auto& waiting : entries_) {
        if (waiting->admitted || !admissible(*waiting)) continue;
        waiting->admitted = true;
        if (waiting->signal) {
            waiting->signal->cancel();
        }
    }
}

} // namespace rkv
