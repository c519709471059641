// Transaction benchmark for rkv on the in-memory engine.
//
// Opens a database with one "todos" store (auto-increment key "id", index
// "userId") and runs N transactions of each workload:
//
//   upsert        one direct write
//   fetch key     one point lookup
//   fetch index   one index range read, up to 10 records
//   cursor walk   one predicate walk over a 100-key range
//   cursor update one predicate walk that rewrites every third record
//
// Each workload reports transactions/s, records/s and latency percentiles.
// Usage: rkv-bench [transactions-per-workload]

#include "core/transaction_scope.hpp"
#include "schema/database.hpp"
#include "storage/memory_engine.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <fmt/format.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace {

namespace asio = boost::asio;
using clock = std::chrono::steady_clock;

using rkv::Result;
using rkv::TransactionScope;

constexpr const char* kStore = "todos";
constexpr int kUsers = 100;

// ── Workload statistics ──────────────────────────────────────────────────────

struct WorkloadStats {
    std::string name;
    std::size_t transactions = 0;
    std::size_t records = 0;          // records read or written
    std::vector<double> latency_us;   // per transaction, sorted once finished

    [[nodiscard]] double elapsed_sec() const {
        double total = 0;
        for (double us : latency_us) total += us;
        return total / 1e6;
    }

    [[nodiscard]] double percentile(double p) const {
        if (latency_us.empty()) return 0;
        const auto idx = static_cast<std::size_t>(p * static_cast<double>(latency_us.size() - 1));
        return latency_us[idx];
    }
};

// Records a result carries; a single key or record counts as one.
std::size_t records_in(const Result& result) {
    return std::visit([](const auto& r) -> std::size_t {
        using R = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<R, rkv::RecordsResult>) {
            return r.records.size();
        } else if constexpr (std::is_same_v<R, rkv::KeysResult>) {
            return r.keys.size();
        } else if constexpr (std::is_same_v<R, rkv::RecordResult> ||
                             std::is_same_v<R, rkv::KeyResult>) {
            return 1;
        } else {
            return 0;
        }
    }, result);
}

void print_header() {
    fmt::print("\n{:<14} {:>8} {:>10} {:>12} {:>9} {:>9} {:>9} {:>9}\n",
               "workload", "tx", "tx/s", "records/s", "p50 µs", "p90 µs", "p99 µs", "max µs");
    fmt::print("{}\n", std::string(86, '-'));
}

void print_row(const WorkloadStats& s) {
    const double secs = s.elapsed_sec();
    const double tx_rate  = secs > 0 ? static_cast<double>(s.transactions) / secs : 0;
    const double rec_rate = secs > 0 ? static_cast<double>(s.records) / secs : 0;
    fmt::print("{:<14} {:>8} {:>10.0f} {:>12.0f} {:>9.1f} {:>9.1f} {:>9.1f} {:>9.1f}\n",
               s.name, s.transactions, tx_rate, rec_rate,
               s.percentile(0.50), s.percentile(0.90), s.percentile(0.99), s.percentile(1.0));
}

// Runs `n` transactions; transaction i awaits the one request `op(todos, i)`.
template <typename Op>
asio::awaitable<WorkloadStats> run_workload(rkv::Database& db, std::string name,
                                            std::size_t n, Op op) {
    WorkloadStats stats;
    stats.name = std::move(name);
    stats.latency_us.reserve(n);

    for (std::size_t i = 0; i < n; ++i) {
        const auto t0 = clock::now();
        auto result = co_await db.with_transaction(
            {kStore}, [&op, i](TransactionScope& tx) -> asio::awaitable<Result> {
                co_return co_await op(tx[kStore], i);
            });
        const auto t1 = clock::now();

        stats.latency_us.push_back(
            std::chrono::duration<double, std::micro>(t1 - t0).count());
        ++stats.transactions;
        stats.records += records_in(result);
    }
    std::sort(stats.latency_us.begin(), stats.latency_us.end());
    co_return stats;
}

// ── Workloads ────────────────────────────────────────────────────────────────

asio::awaitable<void> run_benchmarks(rkv::Database& db, std::size_t n) {
    using rkv::Collection;

    std::vector<WorkloadStats> results;

    results.push_back(co_await run_workload(db, "upsert", n,
        [](Collection& todos, std::size_t i) {
            return todos.upsert({.value = rkv::Record{
                {"title",  "todo " + std::to_string(i)},
                {"userId", static_cast<int>(i % kUsers)},
                {"done",   i % 3 == 0},
            }});
        }));

    results.push_back(co_await run_workload(db, "fetch key", n,
        [n](Collection& todos, std::size_t i) {
            return todos.fetch({.key = static_cast<int64_t>(i % n + 1)});
        }));

    results.push_back(co_await run_workload(db, "fetch index", n,
        [](Collection& todos, std::size_t i) {
            return todos.fetch({
                .index = "userId",
                .query = rkv::Query{.only = static_cast<int>(i % kUsers)},
                .count = 10,
            });
        }));

    results.push_back(co_await run_workload(db, "cursor walk", n,
        [n](Collection& todos, std::size_t i) {
            const auto start = static_cast<int64_t>(i % n + 1);
            return todos.fetch({
                .where = [](const rkv::Record& r) -> nlohmann::json {
                    return r.value("done", false) ? r : nlohmann::json(nullptr);
                },
                .query = rkv::Query{.start = start, .end = start + 99},
            });
        }));

    results.push_back(co_await run_workload(db, "cursor update", n / 10 + 1,
        [n](Collection& todos, std::size_t i) {
            const auto start = static_cast<int64_t>((i * 100) % n + 1);
            return todos.upsert({
                .where = [](const rkv::Record& r) -> nlohmann::json {
                    if (r["id"].get<int64_t>() % 3 != 0) return nullptr;
                    auto next = r;
                    next["done"] = !r.value("done", false);
                    return next;
                },
                .query = rkv::Query{.start = start, .end = start + 99},
            });
        }));

    print_header();
    for (const auto& stats : results) print_row(stats);
    fmt::print("\n");
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);

    std::size_t transactions = 10'000;
    if (argc > 1) {
        const long requested = std::atol(argv[1]);
        if (requested > 0) transactions = static_cast<std::size_t>(requested);
    }

    fmt::print("rkv benchmark: {} transactions per workload, memory engine\n", transactions);

    rkv::StoreDef todos;
    todos.name = kStore;
    todos.indexes.push_back(rkv::IndexDef{"userId", "userId"});

    rkv::MemoryEngine engine;
    asio::io_context ioc;
    auto db = rkv::Database::open(engine, ioc.get_executor(),
                                  rkv::DatabaseConfig("bench", 1, {todos}));

    int exit_code = 0;
    asio::co_spawn(ioc, run_benchmarks(*db, transactions),
        [&](std::exception_ptr ep) {
            if (!ep) return;
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                fmt::print(stderr, "benchmark failed: {}\n", e.what());
                exit_code = 1;
            }
        });
    ioc.run();

    return exit_code;
}
