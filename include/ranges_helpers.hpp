#ifndef RANGES_HELPERS_H
#define RANGES_HELPERS_H

#include <ranges>
#include <vector>
#include <numeric>
#include <algorithm>

#include "tl/expected.hpp"

// from: https://stackoverflow.com/questions/58808030/range-view-to-stdvector
namespace utility
{
    namespace ranges = std::ranges;
    namespace views = std::views;

    namespace detail
    {
        // Type acts as a tag to find the correct operator| overload
        template <typename C>
        struct to_helper {};

        template <typename Container, std::ranges::range R>
            requires std::convertible_to<std::ranges::range_value_t<R>, typename Container::value_type>
        Container operator|(R &&r, to_helper<Container>)
        {
            Container c;
            for (auto&& e : r)
            {
                c.push_back(e);
            }
            return c;
        }
    }

    // a container is a range, but not a view
    template <std::ranges::range Container>
        requires(!std::ranges::view<Container>)
    auto to()
    {
        return detail::to_helper<Container>{};
    }

    template<class>
    constexpr bool is_expected = false;

    template<class T, class E>
    constexpr bool is_expected<tl::expected<T, E>> = true;

    // collects a range of expected values, stopping at (and returning) the first error
    template<ranges::input_range R>
    requires is_expected<ranges::range_value_t<R>>
    auto to_expected(R&& r) {
        using expected_type = ranges::range_value_t<R>;
        using value_type = typename expected_type::value_type;
        using error_type = typename expected_type::error_type;
        using return_type = tl::expected<std::vector<value_type>, error_type>;

        std::vector<value_type> v;
        for (auto&& e : r)
        {
            if (!e.has_value())
            {
                return return_type(tl::unexpect, e.error());
            }
            v.push_back(e.value());
        }
        return return_type(std::move(v));
    };
}

#endif
