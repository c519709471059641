#pragma once

#include "core/key.hpp"

#include <variant>
#include <vector>

namespace rkv {

// ── Results ──────────────────────────────────────────────────────────────────
//
// Normalized outcome of one fetch/upsert/remove call.  Plain structs wrapped
// in a std::variant so callers can std::visit or std::get without inheritance.

struct NoResult {};        // remove: nothing to report
struct NotFoundResult {};  // point lookup found nothing

struct RecordResult {
    Record record;
};

struct RecordsResult {
    std::vector<Record> records;
};

struct KeyResult {
    Key key;
};

struct KeysResult {
    std::vector<Key> keys;
};

using Result = std::variant<NoResult, NotFoundResult, RecordResult, RecordsResult,
                            KeyResult, KeysResult>;

} // namespace rkv
