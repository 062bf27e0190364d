#ifndef UTILITY_H
#define UTILITY_H

#include <string>
#include <string_view>
#include <vector>
#include <numeric>
#include <ranges>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace utility
{
    namespace ranges = std::ranges;
    namespace views = std::views;

    auto join_non_empty_strings(auto&& container, std::string_view delim) -> std::string
    {
        return fmt::format("{}", fmt::join(
                container | views::filter([](std::string_view s){ return !s.empty(); }), //filter the length zero elements
                delim
            )
        );
    }

    inline auto trim(std::string_view str) -> std::string_view
    {
        constexpr std::string_view whitespace{" \t\r\n"};
        const auto first = str.find_first_not_of(whitespace);
        if (first == std::string_view::npos)
        {
            return {};
        }
        const auto last = str.find_last_not_of(whitespace);
        return str.substr(first, last - first + 1);
    }

    // splits on the delimiter and trims every piece, empty pieces are kept
    inline auto split_trimmed(std::string_view str, char delim) -> std::vector<std::string>
    {
        std::vector<std::string> pieces;
        for (auto r : str | views::split(delim))
        {
            pieces.emplace_back(trim(std::string_view(r.begin(), r.end())));
        }
        return pieces;
    }
}

#endif
