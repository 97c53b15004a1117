#pragma once

#include <string>
#include <string_view>

namespace sqlsh {

// Only folds ASCII letters, other bytes are returned unchanged
inline char tolower_ascii(char c) { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c; }

inline bool alllower_ascii(std::string_view s) {
    for (char c : s) {
        if (c < 'a' || c > 'z') return false;
    }
    return true;
}

inline std::string tolower_ascii(std::string_view s) {
    std::string out{s};
    for (auto& c : out) c = tolower_ascii(c);
    return out;
}

inline int memicmp_ascii(const void *_s1, const void *_s2, size_t len) {
    auto *s1 = static_cast<const unsigned char *>(_s1);
    auto *s2 = static_cast<const unsigned char *>(_s2);
    for (; len > 0; --len, ++s1, ++s2) {
        auto c1 = static_cast<unsigned char>(tolower_ascii(static_cast<char>(*s1)));
        auto c2 = static_cast<unsigned char>(tolower_ascii(static_cast<char>(*s2)));
        if (c1 != c2) return c1 - c2;
    }
    return 0;
}

struct ci_char_traits : public std::char_traits<char> {
    static bool eq(char c1, char c2) { return tolower_ascii(c1) == tolower_ascii(c2); }
    static bool ne(char c1, char c2) { return tolower_ascii(c1) != tolower_ascii(c2); }
    static bool lt(char c1, char c2) {
        return static_cast<unsigned char>(tolower_ascii(c1)) < static_cast<unsigned char>(tolower_ascii(c2));
    }
    static int compare(const char *s1, const char *s2, size_t n) { return memicmp_ascii(s1, s2, n); }
    static const char *find(const char *s, int n, char a) {
        for (; n-- > 0; ++s) {
            if (tolower_ascii(*s) == tolower_ascii(a)) {
                return s;
            }
        }
        return nullptr;
    }
};
using ci_string_view = std::basic_string_view<char, ci_char_traits>;

/// Is the input a case-insensitive prefix of the item?
inline bool starts_with_ci(std::string_view item, std::string_view input) {
    return input.size() <= item.size() && ci_string_view{item.data(), input.size()} == ci_string_view{input.data(), input.size()};
}

}  // namespace sqlsh
