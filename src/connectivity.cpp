#include "../include/connectivity.hpp"

#include <algorithm>
#include <ranges>

namespace model
{
    namespace ranges = std::ranges;

    auto symbols_between(
        const TransitionTable& table,
        std::string_view a,
        std::string_view b
    ) -> std::optional<std::vector<Symbol>>
    {
        const auto* entries = table.entries(a);
        if (entries == nullptr)
        {
            return std::nullopt;
        }

        bool found = false;
        SymbolKey symbols;
        for (const auto& [key, destinations] : *entries)
        {
            if (ranges::find(destinations, b) != destinations.end())
            {
                found = true;
                symbols.insert(key.begin(), key.end());
            }
        }

        if (!found)
        {
            return std::nullopt;
        }
        return std::vector<Symbol>(symbols.begin(), symbols.end());
    }

    auto has_transition(
        const TransitionTable& table,
        std::string_view a,
        std::string_view b
    ) -> bool
    {
        return symbols_between(table, a, b).has_value();
    }

    auto connection_degree(
        const TransitionTable& table,
        std::string_view a,
        std::string_view b
    ) -> Connection
    {
        const bool forward  = has_transition(table, a, b);
        const bool backward = has_transition(table, b, a);

        if (forward && backward)
        {
            return Connection::Mutual;
        }
        else if (forward || backward)
        {
            return Connection::OneWay;
        }
        return Connection::None;
    }
}
