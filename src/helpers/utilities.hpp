#pragma once

#include <string_view>
#include <string>
#include <cstdlib>
#include <cctype>
#include <charconv>
#include <vector>
#include <algorithm>
#include <system_error>
#include <type_traits>

namespace util
{
    static inline bool is_integer(const std::string_view& str)
    {
        if (str.empty() || ((!std::isdigit(static_cast<unsigned char>(str[0]))) && (str[0] != '-') && (str[0] != '+'))) return false;

        std::string copy{str};
        char* p;
        strtol(copy.c_str(), &p, 10);

        return (*p == 0);
    }

    inline bool is_blank(const std::string_view& str)
    {
        return std::all_of(str.begin(), str.end(), [](unsigned char c) { return std::isspace(c); });
    }

    inline std::string to_lower(std::string str)
    {
        std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return str;
    }

    std::string trim(const std::string_view& str);
    std::string read_file(const std::string_view& filename);

    /**
     * Splits `s` on every occurrence of `delimiter`. Empty pieces are kept, so
     * "a||b" gives three pieces and a string with no delimiter gives one.
     */
    std::vector<std::string_view> split_string(const std::string_view& s, char delimiter);

    template<typename T>
    struct parse_result
    {
        std::errc ec;
        T value;
    };

    /**
     * Parses the whole of `str` as a number. Leading '+' and surrounding
     * whitespace are not accepted, and neither is trailing garbage.
     */
    template<typename T>
    auto parse(const std::string_view& str) -> parse_result<T>
    {
        static_assert(std::is_arithmetic_v<T>);
        if constexpr(std::is_same_v<bool, T>)
        {
            parse_result<T> ret{std::errc{}, false};
            if (str == "true" || str == "on" || str == "1")
                ret.value = true;
            else if (str == "false" || str == "off" || str == "0")
                ret.value = false;
            else ret.ec = std::errc::invalid_argument;
            return ret;
        }
        else
        {
            parse_result<T> ret{std::errc{}, T{}};
            auto [ptr, ec] { std::from_chars(str.data(), str.data() + str.size(), ret.value) };
            ret.ec = ec;
            if (ec == std::errc{} && ptr != str.data() + str.size())
                ret.ec = std::errc::invalid_argument;
            return ret;
        }
    }

    template<typename T1, typename Func>
    auto vector_map(const std::vector<T1>& vec, Func func) -> std::vector<decltype(func(vec[0]))>
    {
        std::vector<decltype(func(vec[0]))> new_vec;
        new_vec.reserve(vec.size());
        for (const auto& v : vec)
            new_vec.emplace_back(func(v));
        return new_vec;
    }
}
