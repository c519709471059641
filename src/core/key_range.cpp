#include "core/key_range.hpp"

#include <utility>

namespace rkv {

KeyRange KeyRange::only(Key key) {
    KeyRange range;
    range.lower = key;
    range.upper = std::move(key);
    return range;
}

KeyRange KeyRange::bound(Key lower, Key upper, bool lower_open, bool upper_open) {
    KeyRange range;
    range.lower      = std::move(lower);
    range.upper      = std::move(upper);
    range.lower_open = lower_open;
    range.upper_open = upper_open;
    return range;
}

KeyRange KeyRange::lower_bound(Key lower, bool open) {
    KeyRange range;
    range.lower      = std::move(lower);
    range.lower_open = open;
    return range;
}

KeyRange KeyRange::upper_bound(Key upper, bool open) {
    KeyRange range;
    range.upper      = std::move(upper);
    range.upper_open = open;
    return range;
}

bool KeyRange::includes(const Key& key) const {
    if (lower) {
        const int cmp = compare_keys(key, *lower);
        if (cmp < 0 || (cmp == 0 && lower_open)) {
            return false;
        }
    }
    if (upper) {
        const int cmp = compare_keys(key, *upper);
        if (cmp > 0 || (cmp == 0 && upper_open)) {
            return false;
        }
    }
    return true;
}

KeyRange build_range(const std::optional<Query>& query) {
    if (!query) {
        return KeyRange::unbounded();
    }

    if (query->only) {
        validate_key(*query->only, "query.only");
        return KeyRange::only(*query->only);
    }

    if (query->start && query->end) {
        validate_key(*query->start, "query.start");
        validate_key(*query->end, "query.end");
        return KeyRange::bound(*query->start, *query->end);
    }

    if (query->start) {
        validate_key(*query->start, "query.start");
        return KeyRange::lower_bound(*query->start);
    }

    if (query->end) {
        validate_key(*query->end, "query.end");
        return KeyRange::upper_bound(*query->end);
    }

    return KeyRange::unbounded();
}

} // namespace rkv
