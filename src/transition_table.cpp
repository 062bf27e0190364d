#include "../include/transition_table.hpp"

#include <algorithm>
#include <ranges>

namespace model
{
    namespace ranges = std::ranges;

    TransitionTable::TransitionTable(const std::vector<TransitionRecord>& records)
    {
        for (const auto& record : records)
        {
            add(record);
        }
    }

    auto TransitionTable::add(const TransitionRecord& record) -> void
    {
        auto& entries = m_table[record.m_source];
        auto& destinations = entries[SymbolKey(record.m_symbols.begin(), record.m_symbols.end())];

        // repeating a record must not count the transition twice
        if (ranges::find(destinations, record.m_destination) == destinations.end())
        {
            destinations.push_back(record.m_destination);
        }
    }

    auto TransitionTable::entries(std::string_view source) const -> const Entries*
    {
        if (auto it = m_table.find(source); it != m_table.end())
        {
            return &it->second;
        }
        return nullptr;
    }

    auto TransitionTable::for_each_transition(
        const std::function<void(const State&, const SymbolKey&, const State&)>& visit
    ) const -> void
    {
        for (const auto& [source, entries] : m_table)
        {
            for (const auto& [key, destinations] : entries)
            {
                for (const auto& destination : destinations)
                {
                    visit(source, key, destination);
                }
            }
        }
    }

    auto TransitionTable::size() const -> std::size_t
    {
        std::size_t count = 0;
        for_each_transition([&count](const State&, const SymbolKey&, const State&){ ++count; });
        return count;
    }

    auto TransitionTable::empty() const -> bool
    {
        return m_table.empty();
    }
}
