#ifndef PARSER_H
#define PARSER_H

#include "automaton.hpp"

#include <string>
#include <string_view>
#include <optional>
#include <filesystem>
#include <vector>

#include <tl/expected.hpp>

namespace parser
{

    enum class ParseError
    {
        EmptyPath,
        UnreadableFile,
        NoStates,
        InvalidFileLine,
        InvalidJflapFile,
        NotFiniteAutomaton,
        MissingStateId,
        UnknownTransitionState
    };

    void HandleParseError(const ParseError err);

    // the four text fields describing an automaton
    struct AutomatonFields
    {
        std::string m_states;
        std::string m_initial;
        std::string m_accepting;
        std::string m_transitions;
    };

    struct ParsedAutomaton
    {
        model::Automaton m_automaton;
        model::Warnings m_warnings;
    };

    // `q1, q2; q3` -> [[q1, q2], [q3]]
    [[nodiscard]]
    auto parse_state_rows(std::string_view states) -> std::vector<std::vector<model::State>>;

    // comma separated, blanks dropped
    [[nodiscard]]
    auto parse_state_list(std::string_view states) -> std::vector<model::State>;

    // `source, symbol..., destination`, nullopt when the entry has no usable destination
    [[nodiscard]]
    auto parse_transition_record(std::string_view entry, model::Warnings& warnings)
        -> std::optional<model::TransitionRecord>;

    // `;` separated records, malformed ones degrade with a warning
    [[nodiscard]]
    auto parse_transitions(std::string_view transitions, model::Warnings& warnings)
        -> std::vector<model::TransitionRecord>;

    [[nodiscard]]
    auto fields_to_automaton(const AutomatonFields& fields) -> tl::expected<ParsedAutomaton, ParseError>;

    [[nodiscard]]
    auto read_file(const std::filesystem::path& path) -> tl::expected<std::string, ParseError>;

    // `key: value` lines for states, initial, accepting and transitions
    [[nodiscard]]
    auto text_to_fields(std::string_view content) -> tl::expected<AutomatonFields, ParseError>;

    [[nodiscard]]
    auto jflap_to_automaton(std::string_view jflap_xml_str) -> tl::expected<ParsedAutomaton, ParseError>;

    // picks the format from the extension, `.jff` is JFLAP and anything else the text format
    [[nodiscard]]
    auto load_automaton(const std::filesystem::path& path) -> tl::expected<ParsedAutomaton, ParseError>;
}

#endif
