/**
 * @file value_format.cpp
 * @brief Value 직렬화 구현 (nlohmann::ordered_json 기반)
 */
#include "safeprint/value_format.hpp"

#include <cmath>
#include <limits>
#include <variant>

namespace safeprint {

namespace {

using ordered_json = nlohmann::ordered_json;

std::string dump_compact(const ordered_json& j)
{
    // 잘못된 UTF-8 은 dump 시 U+FFFD 로 치환 (예외 없음)
    return j.dump(-1, ' ', false, ordered_json::error_handler_t::replace);
}

// JSON 에 없는 NaN/Infinity 는 null 대신 텍스트로 표현
const char* non_finite_text(double d)
{
    if (std::isnan(d)) return "nan";
    return d > 0 ? "inf" : "-inf";
}

struct JsonVisitor {
    ordered_json operator()(std::nullptr_t) const { return nullptr; }
    ordered_json operator()(bool b) const { return b; }
    ordered_json operator()(std::int64_t n) const { return n; }
    ordered_json operator()(double d) const
    {
        if (!std::isfinite(d)) return non_finite_text(d);
        return d;
    }
    ordered_json operator()(const std::string& s) const { return s; }
    ordered_json operator()(const Bytes& b) const { return std::string(b.begin(), b.end()); }

    ordered_json operator()(const Sequence& seq) const
    {
        ordered_json arr = ordered_json::array();
        for (const auto& item : seq) arr.push_back(to_json(item));
        return arr;
    }

    ordered_json operator()(const ValueSet& set) const
    {
        ordered_json arr = ordered_json::array();
        for (const auto& item : set) arr.push_back(to_json(item));
        return arr;
    }

    ordered_json operator()(const ValueMap& map) const
    {
        ordered_json obj = ordered_json::object();
        for (std::size_t i = 0; i < map.size(); ++i) {
            obj[map.key_at(i)] = to_json(map.value_at(i));
        }
        return obj;
    }

    ordered_json operator()(const Opaque& o) const { return o.repr; }
};

} // namespace

ordered_json to_json(const Value& v)
{
    return std::visit(JsonVisitor{}, v.storage());
}

Value from_json(const ordered_json& j)
{
    switch (j.type()) {
    case ordered_json::value_t::null:
    case ordered_json::value_t::discarded:
        return Value();
    case ordered_json::value_t::boolean:
        return Value(j.get<bool>());
    case ordered_json::value_t::number_integer:
        return Value(j.get<std::int64_t>());
    case ordered_json::value_t::number_unsigned: {
        auto u = j.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return Value(static_cast<double>(u));
        }
        return Value(static_cast<std::int64_t>(u));
    }
    case ordered_json::value_t::number_float:
        return Value(j.get<double>());
    case ordered_json::value_t::string:
        return Value(j.get<std::string>());
    case ordered_json::value_t::binary: {
        const auto& bin = j.get_binary();
        return Value(Bytes(bin.begin(), bin.end()));
    }
    case ordered_json::value_t::array: {
        Sequence seq;
        seq.reserve(j.size());
        for (const auto& item : j) seq.push_back(from_json(item));
        return Value(std::move(seq));
    }
    case ordered_json::value_t::object: {
        ValueMap map;
        for (auto it = j.begin(); it != j.end(); ++it) {
            map.set(it.key(), from_json(it.value()));
        }
        return Value(std::move(map));
    }
    }
    return Value();
}

std::string render_text(const Value& v)
{
    switch (v.kind()) {
    case Kind::Sequence:
    case Kind::Mapping:
        return to_json(v).dump(kPrettyIndent, ' ', false, ordered_json::error_handler_t::replace);
    case Kind::Null:
        return "null";
    case Kind::Boolean:
        return v.as_bool() ? "true" : "false";
    case Kind::Integer:
        return std::to_string(v.as_integer());
    case Kind::Real:
        if (!std::isfinite(v.as_real())) return non_finite_text(v.as_real());
        return dump_compact(ordered_json(v.as_real()));
    case Kind::Text:
        return v.as_text();
    case Kind::Bytes:
        return std::string(v.as_bytes().begin(), v.as_bytes().end());
    case Kind::Set: {
        std::string out = "{";
        bool first = true;
        for (const auto& item : v.as_set()) {
            if (!first) out += ", ";
            out += dump_compact(to_json(item));
            first = false;
        }
        out += "}";
        return out;
    }
    case Kind::Opaque:
        return v.as_opaque().repr;
    }
    return {};
}

} // namespace safeprint
