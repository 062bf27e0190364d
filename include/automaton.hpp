#ifndef AUTOMATON_H
#define AUTOMATON_H

#include <string>
#include <string_view>
#include <vector>
#include <algorithm>

namespace model
{
    using State  = std::string;
    using Symbol = std::string;

    // one `source, symbol..., destination` entry of the transition list
    struct TransitionRecord
    {
        TransitionRecord() = default;
        TransitionRecord(
            std::string_view source,
            const std::vector<Symbol>& symbols,
            std::string_view destination
        )
            : m_source{source},
              m_symbols{symbols},
              m_destination{destination} {}

        auto operator<=>(const TransitionRecord &) const = default;

        State m_source;
        std::vector<Symbol> m_symbols;
        State m_destination;
    };

    struct Automaton
    {
        auto is_state(std::string_view state) const -> bool
        {
            return std::ranges::find(m_states, state) != m_states.end();
        }

        auto is_accepting(std::string_view state) const -> bool
        {
            return std::ranges::find(m_accepting_states, state) != m_accepting_states.end();
        }

        // declaration order, duplicates removed
        std::vector<State> m_states;
        // the same states grouped as written, rows separated by ';'
        std::vector<std::vector<State>> m_rows;
        State m_initial_state;
        std::vector<State> m_accepting_states;
        std::vector<TransitionRecord> m_transitions;
    };

    enum class WarningKind
    {
        MissingDestination,
        MissingSymbols,
        EmptySymbol,
        DuplicateState,
        UnknownState,
        RelaxedLayout
    };

    struct Warning
    {
        auto operator<=>(const Warning &) const = default;

        WarningKind m_kind;
        std::string m_message;
    };

    using Warnings = std::vector<Warning>;

    [[nodiscard]]
    inline auto count_warnings(const Warnings& warnings, WarningKind kind) -> std::size_t
    {
        return static_cast<std::size_t>(std::ranges::count_if(warnings, [kind](const Warning& w){
            return w.m_kind == kind;
        }));
    }
}

#endif
