#ifndef CONNECTIVITY_H
#define CONNECTIVITY_H

#include "transition_table.hpp"

#include <string_view>
#include <optional>
#include <vector>

namespace model
{
    enum class Connection
    {
        None,
        OneWay,
        Mutual
    };

    // sorted, de-duplicated symbols labelling a -> b, nullopt when there is no such transition;
    // a record without symbols still counts, giving an empty list
    [[nodiscard]]
    auto symbols_between(
        const TransitionTable& table,
        std::string_view a,
        std::string_view b
    ) -> std::optional<std::vector<Symbol>>;

    [[nodiscard]]
    auto has_transition(
        const TransitionTable& table,
        std::string_view a,
        std::string_view b
    ) -> bool;

    [[nodiscard]]
    auto connection_degree(
        const TransitionTable& table,
        std::string_view a,
        std::string_view b
    ) -> Connection;
}

#endif
