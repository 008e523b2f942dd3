#include "safeprint/ansi_style.hpp"

#include <algorithm>
#include <array>
#include <cctype>

#include "safeprint/errors.hpp"

namespace safeprint {

namespace {

struct ColorEntry {
    const char* name;
    int fore;
    int back;
};

// colorama Fore/Back 와 같은 이름 체계
constexpr std::array<ColorEntry, 17> kColors{{
    {"BLACK", 30, 40},
    {"RED", 31, 41},
    {"GREEN", 32, 42},
    {"YELLOW", 33, 43},
    {"BLUE", 34, 44},
    {"MAGENTA", 35, 45},
    {"CYAN", 36, 46},
    {"WHITE", 37, 47},
    {"RESET", 39, 49},
    {"LIGHTBLACK_EX", 90, 100},
    {"LIGHTRED_EX", 91, 101},
    {"LIGHTGREEN_EX", 92, 102},
    {"LIGHTYELLOW_EX", 93, 103},
    {"LIGHTBLUE_EX", 94, 104},
    {"LIGHTMAGENTA_EX", 95, 105},
    {"LIGHTCYAN_EX", 96, 106},
    {"LIGHTWHITE_EX", 97, 107},
}};

bool iequals(std::string_view a, const char* b)
{
    std::size_t i = 0;
    for (; i < a.size(); ++i) {
        if (b[i] == '\0') return false;
        if (std::toupper(static_cast<unsigned char>(a[i])) != static_cast<unsigned char>(b[i])) return false;
    }
    return b[i] == '\0';
}

const ColorEntry* find_entry(std::string_view name)
{
    auto it = std::find_if(kColors.begin(), kColors.end(),
                           [&](const ColorEntry& e) { return iequals(name, e.name); });
    return it == kColors.end() ? nullptr : &*it;
}

std::string sgr(int code)
{
    return "\x1b[" + std::to_string(code) + "m";
}

inline bool in_range(unsigned char c, unsigned char lo, unsigned char hi)
{
    return c >= lo && c <= hi;
}

} // namespace

const std::vector<std::string>& color_names()
{
    static const std::vector<std::string> names = [] {
        std::vector<std::string> v;
        for (const auto& e : kColors) v.emplace_back(e.name);
        return v;
    }();
    return names;
}

std::optional<int> find_fore_code(std::string_view name)
{
    const ColorEntry* e = find_entry(name);
    if (!e) return std::nullopt;
    return e->fore;
}

std::optional<int> find_back_code(std::string_view name)
{
    const ColorEntry* e = find_entry(name);
    if (!e) return std::nullopt;
    return e->back;
}

std::string fore(std::string_view name)
{
    auto code = find_fore_code(name);
    if (!code) {
        throw ConfigError("unknown color name: '" + std::string(name) + "'");
    }
    return sgr(*code);
}

std::string back(std::string_view name)
{
    auto code = find_back_code(name);
    if (!code) {
        throw ConfigError("unknown background color name: '" + std::string(name) + "'");
    }
    return sgr(*code);
}

std::string wrap_style(std::string_view text, std::string_view open)
{
    std::string out;
    out.reserve(open.size() + text.size() + kStyleReset.size());
    out.append(open);
    out.append(text);
    out.append(kStyleReset);
    return out;
}

std::string strip_ansi(std::string_view text)
{
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    const std::size_t n = text.size();
    while (i < n) {
        if (text[i] == '\x1b' && i + 1 < n && in_range(static_cast<unsigned char>(text[i + 1]), 0x40, 0x5F)) {
            std::size_t j = i + 2;
            while (j < n && in_range(static_cast<unsigned char>(text[j]), 0x30, 0x3F)) ++j;  // parameter
            while (j < n && in_range(static_cast<unsigned char>(text[j]), 0x20, 0x2F)) ++j;  // intermediate
            if (j < n && in_range(static_cast<unsigned char>(text[j]), 0x40, 0x7E)) {        // final
                i = j + 1;
                continue;
            }
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

} // namespace safeprint
