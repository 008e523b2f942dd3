#include "safeprint/value.hpp"

#include <algorithm>

namespace safeprint {

const char* to_string(Kind k) noexcept
{
    switch (k) {
    case Kind::Null:     return "null";
    case Kind::Boolean:  return "boolean";
    case Kind::Integer:  return "integer";
    case Kind::Real:     return "real";
    case Kind::Text:     return "text";
    case Kind::Bytes:    return "bytes";
    case Kind::Sequence: return "sequence";
    case Kind::Set:      return "set";
    case Kind::Mapping:  return "mapping";
    case Kind::Opaque:   return "opaque";
    }
    return "unknown";
}

ValueSet::ValueSet(std::initializer_list<Value> items)
{
    for (const auto& v : items) insert(v);
}

bool ValueSet::insert(Value v)
{
    if (contains(v)) return false;
    items_.push_back(std::move(v));
    return true;
}

bool ValueSet::contains(const Value& v) const
{
    return std::find(items_.begin(), items_.end(), v) != items_.end();
}

bool operator==(const ValueSet& a, const ValueSet& b)
{
    if (a.items_.size() != b.items_.size()) return false;
    // 양쪽 모두 중복이 없으므로 포함 관계 한 방향이면 충분하다
    for (const auto& v : a.items_) {
        if (!b.contains(v)) return false;
    }
    return true;
}

void ValueMap::set(std::string key, Value v)
{
    auto it = std::find(keys_.begin(), keys_.end(), key);
    if (it != keys_.end()) {
        values_[static_cast<std::size_t>(it - keys_.begin())] = std::move(v);
        return;
    }
    keys_.push_back(std::move(key));
    values_.push_back(std::move(v));
}

const Value* ValueMap::find(const std::string& key) const
{
    auto it = std::find(keys_.begin(), keys_.end(), key);
    if (it == keys_.end()) return nullptr;
    return &values_[static_cast<std::size_t>(it - keys_.begin())];
}

bool operator==(const ValueMap& a, const ValueMap& b)
{
    if (a.keys_.size() != b.keys_.size()) return false;
    for (std::size_t i = 0; i < a.keys_.size(); ++i) {
        const Value* other = b.find(a.keys_[i]);
        if (!other || !(*other == a.values_[i])) return false;
    }
    return true;
}

} // namespace safeprint
