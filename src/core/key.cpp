#include "core/key.hpp"
#include "core/error.hpp"

#include <cmath>
#include <cstdint>
#include <cstring>
#include <string>

namespace rkv {

namespace {

constexpr char kTagNumber = '\x10';
constexpr char kTagString = '\x20';
constexpr char kTagArray  = '\x30';
constexpr char kEnd       = '\x00';
constexpr char kEscaped   = '\xFF';

// Largest integer magnitude a double represents exactly.
constexpr double kMaxSafeInteger = 9007199254740991.0;

void append_double(std::string& out, double value) {
    if (value == 0.0) {
        value = 0.0; // fold -0.0 into +0.0
    }
    uint64_t bits = 0;
    std::memcpy(&bits, &value, sizeof(double));

    // Positive: flip the sign bit so they sort after negatives.
    // Negative: flip every bit so larger magnitudes sort first.
    if ((bits >> 63) == 0) {
        bits |= (1ULL << 63);
    } else {
        bits = ~bits;
    }

    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<char>((bits >> (56 - i * 8)) & 0xFF));
    }
}

double read_double(std::string_view& in) {
    if (in.size() < 8) {
        throw EngineError(Errc::storage_failure, "truncated number key");
    }
    uint64_t bits = 0;
    for (int i = 0; i < 8; ++i) {
        bits = (bits << 8) | static_cast<uint8_t>(in[i]);
    }
    in.remove_prefix(8);

    if ((bits >> 63) != 0) {
        bits &= ~(1ULL << 63);
    } else {
        bits = ~bits;
    }
    double value = 0.0;
    std::memcpy(&value, &bits, sizeof(double));
    return value;
}

void append_escaped(std::string& out, std::string_view bytes) {
    for (char c : bytes) {
        out.push_back(c);
        if (c == kEnd) {
            out.push_back(kEscaped);
        }
    }
    out.push_back(kEnd);
    out.push_back(kEnd);
}

std::string read_escaped(std::string_view& in) {
    std::string result;
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] != kEnd) {
            result.push_back(in[i]);
            continue;
        }
        if (i + 1 >= in.size()) {
            break;
        }
        if (in[i + 1] == kEnd) {
            in.remove_prefix(i + 2);
            return result;
        }
        if (in[i + 1] != kEscaped) {
            throw EngineError(Errc::storage_failure, "malformed string key");
        }
        result.push_back(kEnd);
        ++i;
    }
    throw EngineError(Errc::storage_failure, "unterminated string key");
}

Key number_to_key(double value) {
    if (std::trunc(value) == value && std::fabs(value) <= kMaxSafeInteger) {
        return Key(static_cast<int64_t>(value));
    }
    return Key(value);
}

} // anonymous namespace

bool is_valid_key(const Key& key) {
    if (key.is_number()) {
        return std::isfinite(key.get<double>());
    }
    if (key.is_string()) {
        return true;
    }
    if (key.is_array()) {
        for (const auto& element : key) {
            if (!is_valid_key(element)) {
                return false;
            }
        }
        return true;
    }
    return false;
}

void validate_key(const Key& key, std::string_view what) {
    if (!is_valid_key(key)) {
        throw EngineError(Errc::invalid_key,
                          std::string(what) + " is not a valid key: " + key.dump());
    }
}

int compare_keys(const Key& a, const Key& b) {
    const int cmp = codec::encode_key(a).compare(codec::encode_key(b));
    return (cmp > 0) - (cmp < 0);
}

const nlohmann::json* evaluate_key_path(const Record& record, std::string_view path) {
    const nlohmann::json* current = &record;
    while (!path.empty()) {
        const auto dot = path.find('.');
        const std::string_view segment = path.substr(0, dot);
        path = (dot == std::string_view::npos) ? std::string_view{} : path.substr(dot + 1);

        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(std::string(segment));
        if (it == current->end()) {
            return nullptr;
        }
        current = &*it;
    }
    return current;
}

void inject_key(Record& record, std::string_view path, const Key& key) {
    if (path.empty()) {
        throw EngineError(Errc::invalid_key, "cannot inject a key at the empty key path");
    }

    nlohmann::json* current = &record;
    while (true) {
        if (current->is_null()) {
            *current = nlohmann::json::object();
        }
        if (!current->is_object()) {
            throw EngineError(Errc::invalid_key,
                              "key path '" + std::string(path) + "' crosses a non-object value");
        }

        const auto dot = path.find('.');
        const std::string segment(path.substr(0, dot));
        if (dot == std::string_view::npos) {
            (*current)[segment] = key;
            return;
        }
        current = &(*current)[segment];
        path = path.substr(dot + 1);
    }
}

namespace codec {

void append_key(std::string& out, const Key& key) {
    if (key.is_number()) {
        const double value = key.get<double>();
        if (!std::isfinite(value)) {
            throw EngineError(Errc::invalid_key, "number keys must be finite");
        }
        out.push_back(kTagNumber);
        append_double(out, value);
    } else if (key.is_string()) {
        out.push_back(kTagString);
        append_escaped(out, key.get_ref<const std::string&>());
    } else if (key.is_array()) {
        out.push_back(kTagArray);
        for (const auto& element : key) {
            append_key(out, element);
        }
        out.push_back(kEnd);
    } else {
        throw EngineError(Errc::invalid_key, "not a valid key: " + key.dump());
    }
}

std::string encode_key(const Key& key) {
    std::string out;
    append_key(out, key);
    return out;
}

Key decode_key(std::string_view& in) {
    if (in.empty()) {
        throw EngineError(Errc::storage_failure, "empty encoded key");
    }
    const char tag = in.front();
    in.remove_prefix(1);

    switch (tag) {
        case kTagNumber:
            return number_to_key(read_double(in));

        case kTagString:
            return Key(read_escaped(in));

        case kTagArray: {
            Key array = Key::array();
            while (!in.empty() && in.front() != kEnd) {
                array.push_back(decode_key(in));
            }
            if (in.empty()) {
                throw EngineError(Errc::storage_failure, "unterminated array key");
            }
            in.remove_prefix(1);
            return array;
        }

        default:
            throw EngineError(Errc::storage_failure, "unknown key tag");
    }
}

void append_name(std::string& out, std::string_view name) {
    append_escaped(out, name);
}

} // namespace codec

} // namespace rkv
