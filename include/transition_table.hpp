#ifndef TRANSITION_TABLE_H
#define TRANSITION_TABLE_H

#include "automaton.hpp"

#include <string_view>
#include <functional>
#include <vector>
#include <set>
#include <map>

namespace model
{
    // the symbols of one record, kept sorted so equal sets share an entry
    using SymbolKey = std::set<Symbol>;

    class TransitionTable
    {
    public:
        using Entries = std::map<SymbolKey, std::vector<State>>;

        TransitionTable() = default;
        explicit TransitionTable(const std::vector<TransitionRecord>& records);

        // appends the destination to the record's symbol set, never overwriting earlier entries
        auto add(const TransitionRecord& record) -> void;

        // the symbol-set entries of a source, nullptr for a state without outgoing transitions
        auto entries(std::string_view source) const -> const Entries*;

        // visits every (source, symbol set, destination) triple in table order
        auto for_each_transition(
            const std::function<void(const State&, const SymbolKey&, const State&)>& visit
        ) const -> void;

        auto size() const -> std::size_t;
        auto empty() const -> bool;

    private:
        std::map<State, Entries, std::less<>> m_table;
    };
}

#endif
