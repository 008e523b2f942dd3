#pragma once
/**
 * @file value.hpp
 * @brief 출력 파이프라인이 받는 범용 값 타입(닫힌 tagged union)
 *
 * null / bool / 정수 / 실수 / 텍스트 / 바이트열 / 시퀀스 / 집합 / 매핑 / opaque 를 표현한다.
 * 텍스트(std::string)는 임의의 바이트를 담을 수 있으며 UTF-8 유효성은 sanitize() 이후에만 보장된다.
 *
 * 연관 파일:
 *   - sanitizer.hpp (구조적 재귀 정리)
 *   - value_format.hpp (텍스트/JSON 직렬화)
 */
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace safeprint {

class Value;

using Bytes = std::vector<std::uint8_t>;
using Sequence = std::vector<Value>;

/**
 * @class ValueSet
 * @brief 중복 없는 값 집합. 동등성 비교는 순서 무관, 표시 순서는 삽입 순서.
 */
class ValueSet {
public:
    ValueSet() = default;
    ValueSet(std::initializer_list<Value> items);

    // 이미 같은 값이 있으면 false
    bool insert(Value v);
    bool contains(const Value& v) const;

    std::size_t size() const;
    bool empty() const;

    std::vector<Value>::const_iterator begin() const;
    std::vector<Value>::const_iterator end() const;

    friend bool operator==(const ValueSet& a, const ValueSet& b);
    friend bool operator!=(const ValueSet& a, const ValueSet& b) { return !(a == b); }

private:
    std::vector<Value> items_;
};

/**
 * @class ValueMap
 * @brief 텍스트 키 -> 값 매핑 (삽입 순서 유지)
 *
 * 이미 존재하는 키에 set() 하면 위치는 유지하고 값만 교체한다.
 */
class ValueMap {
public:
    ValueMap() = default;

    void set(std::string key, Value v);
    const Value* find(const std::string& key) const;

    std::size_t size() const { return keys_.size(); }
    bool empty() const { return keys_.empty(); }

    const std::string& key_at(std::size_t i) const { return keys_[i]; }
    const Value& value_at(std::size_t i) const;

    friend bool operator==(const ValueMap& a, const ValueMap& b);
    friend bool operator!=(const ValueMap& a, const ValueMap& b) { return !(a == b); }

private:
    std::vector<std::string> keys_;
    std::vector<Value> values_;
};

/**
 * @brief 내부를 들여다볼 수 없는 객체 값
 * @details type_name 과 호출부가 미리 렌더링한 repr 만 보관한다. sanitize() 는 이 값을 그대로 통과시킨다.
 */
struct Opaque {
    std::string type_name;
    std::string repr;
};

inline bool operator==(const Opaque& a, const Opaque& b) { return a.type_name == b.type_name && a.repr == b.repr; }
inline bool operator!=(const Opaque& a, const Opaque& b) { return !(a == b); }

enum class Kind { Null, Boolean, Integer, Real, Text, Bytes, Sequence, Set, Mapping, Opaque };

const char* to_string(Kind k) noexcept;

class Value {
public:
    using Storage = std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Bytes,
                                 Sequence, ValueSet, ValueMap, Opaque>;

    Value() : storage_(nullptr) {}
    Value(std::nullptr_t) : storage_(nullptr) {}
    Value(bool b) : storage_(b) {}
    template <typename T,
              typename std::enable_if<std::is_integral<T>::value && !std::is_same<T, bool>::value, int>::type = 0>
    Value(T n) : storage_(static_cast<std::int64_t>(n)) {}
    Value(double d) : storage_(d) {}
    Value(const char* s) : storage_(std::string(s ? s : "")) {}
    Value(std::string s) : storage_(std::move(s)) {}
    Value(Bytes b) : storage_(std::move(b)) {}
    Value(Sequence seq) : storage_(std::move(seq)) {}
    Value(ValueSet set) : storage_(std::move(set)) {}
    Value(ValueMap map) : storage_(std::move(map)) {}
    Value(Opaque o) : storage_(std::move(o)) {}

    Kind kind() const { return static_cast<Kind>(storage_.index()); }

    bool is_null() const { return kind() == Kind::Null; }
    bool is_text() const { return kind() == Kind::Text; }
    bool is_structured() const { return kind() == Kind::Sequence || kind() == Kind::Mapping; }

    // 타입이 맞지 않으면 std::bad_variant_access
    bool as_bool() const { return std::get<bool>(storage_); }
    std::int64_t as_integer() const { return std::get<std::int64_t>(storage_); }
    double as_real() const { return std::get<double>(storage_); }
    const std::string& as_text() const { return std::get<std::string>(storage_); }
    const Bytes& as_bytes() const { return std::get<Bytes>(storage_); }
    const Sequence& as_sequence() const { return std::get<Sequence>(storage_); }
    const ValueSet& as_set() const { return std::get<ValueSet>(storage_); }
    const ValueMap& as_map() const { return std::get<ValueMap>(storage_); }
    const Opaque& as_opaque() const { return std::get<Opaque>(storage_); }

    const Storage& storage() const { return storage_; }

    friend bool operator==(const Value& a, const Value& b) { return a.storage_ == b.storage_; }
    friend bool operator!=(const Value& a, const Value& b) { return !(a == b); }

private:
    Storage storage_;
};

// ValueSet 의 원소 접근은 Value 가 완전한 타입이 된 뒤에 정의한다.
inline std::size_t ValueSet::size() const { return items_.size(); }
inline bool ValueSet::empty() const { return items_.empty(); }
inline std::vector<Value>::const_iterator ValueSet::begin() const { return items_.begin(); }
inline std::vector<Value>::const_iterator ValueSet::end() const { return items_.end(); }
inline const Value& ValueMap::value_at(std::size_t i) const { return values_[i]; }

} // namespace safeprint
