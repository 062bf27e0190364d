#include "../include/parser.hpp"
#include "../include/utility.hpp"
#include "../include/ranges_helpers.hpp"

#include <algorithm>
#include <fstream>
#include <ranges>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

#include <tinyxml2.h>
#include <fmt/format.h>

namespace parser
{
    // namespaces aliases
    using namespace tinyxml2;
    namespace views = std::views;
    namespace ranges = std::ranges;

    // helper functions
    namespace helpers
    {
        static auto contains(const std::vector<model::State>& states, std::string_view state) -> bool
        {
            return ranges::find(states, state) != states.end();
        }

        // the first occurrence wins, later ones only leave a warning
        static auto add_state(
            model::Automaton& automaton,
            std::string_view state,
            model::Warnings& warnings
        ) -> bool
        {
            if (contains(automaton.m_states, state))
            {
                warnings.push_back({
                    model::WarningKind::DuplicateState,
                    fmt::format("state '{}' is declared more than once", state)
                });
                return false;
            }
            automaton.m_states.emplace_back(state);
            return true;
        }

        static auto warn_unknown(
            const model::Automaton& automaton,
            std::string_view state,
            std::string_view role,
            model::Warnings& warnings
        ) -> void
        {
            if (!automaton.is_state(state))
            {
                warnings.push_back({
                    model::WarningKind::UnknownState,
                    fmt::format("{} '{}' is not a declared state", role, state)
                });
            }
        }

        // states named by the initial state, accepting list or transitions but never declared
        static auto check_references(const model::Automaton& automaton, model::Warnings& warnings) -> void
        {
            warn_unknown(automaton, automaton.m_initial_state, "initial state", warnings);
            for (const auto& state : automaton.m_accepting_states)
            {
                warn_unknown(automaton, state, "accepting state", warnings);
            }
            for (const auto& record : automaton.m_transitions)
            {
                warn_unknown(automaton, record.m_source, "transition source", warnings);
                warn_unknown(automaton, record.m_destination, "transition destination", warnings);
            }
        }

        static auto text_of(XMLElement* element) -> std::string
        {
            if (element == nullptr || element->GetText() == nullptr)
            {
                return {};
            }
            return std::string{utility::trim(element->GetText())};
        }

        static auto children(XMLElement* parent, const char* name) -> std::vector<XMLElement*>
        {
            std::vector<XMLElement*> elements;
            XMLElement* pChild = parent->FirstChildElement(name);
            while (pChild)
            {
                elements.push_back(pChild);
                pChild = pChild->NextSiblingElement(name);
            }
            return elements;
        }
    }

    auto parse_state_rows(std::string_view states) -> std::vector<std::vector<model::State>>
    {
        std::vector<std::vector<model::State>> rows;
        for (const auto& row_str : utility::split_trimmed(states, ';'))
        {
            auto row = parse_state_list(row_str);
            if (!row.empty())
            {
                rows.push_back(std::move(row));
            }
        }
        return rows;
    }

    auto parse_state_list(std::string_view states) -> std::vector<model::State>
    {
        const auto pieces = utility::split_trimmed(states, ',');
        return pieces
            | views::filter([](const std::string& s){ return !s.empty(); })
            | utility::to<std::vector<model::State>>();
    }

    auto parse_transition_record(std::string_view entry, model::Warnings& warnings)
        -> std::optional<model::TransitionRecord>
    {
        auto fields = utility::split_trimmed(entry, ',');
        if (fields.size() < 2 || fields.front().empty() || fields.back().empty())
        {
            warnings.push_back({
                model::WarningKind::MissingDestination,
                fmt::format("transition '{}' has no destination state", utility::trim(entry))
            });
            return std::nullopt;
        }

        std::vector<model::Symbol> symbols;
        for (std::size_t i = 1; i + 1 < fields.size(); ++i)
        {
            if (fields[i].empty())
            {
                warnings.push_back({
                    model::WarningKind::EmptySymbol,
                    fmt::format("transition '{}' has an empty symbol", utility::trim(entry))
                });
                continue;
            }
            symbols.push_back(fields[i]);
        }

        if (symbols.empty())
        {
            warnings.push_back({
                model::WarningKind::MissingSymbols,
                fmt::format("transition '{}' has no symbols", utility::trim(entry))
            });
        }
        return model::TransitionRecord(fields.front(), symbols, fields.back());
    }

    auto parse_transitions(std::string_view transitions, model::Warnings& warnings)
        -> std::vector<model::TransitionRecord>
    {
        std::vector<model::TransitionRecord> records;
        for (const auto& entry : utility::split_trimmed(transitions, ';'))
        {
            if (entry.empty())
            {
                continue;
            }
            if (auto record = parse_transition_record(entry, warnings))
            {
                records.push_back(std::move(record.value()));
            }
        }
        return records;
    }

    auto fields_to_automaton(const AutomatonFields& fields) -> tl::expected<ParsedAutomaton, ParseError>
    {
        ParsedAutomaton parsed;
        auto& automaton = parsed.m_automaton;

        for (const auto& row : parse_state_rows(fields.m_states))
        {
            std::vector<model::State> unique_row;
            for (const auto& state : row)
            {
                if (helpers::add_state(automaton, state, parsed.m_warnings))
                {
                    unique_row.push_back(state);
                }
            }
            if (!unique_row.empty())
            {
                automaton.m_rows.push_back(std::move(unique_row));
            }
        }

        if (automaton.m_states.empty())
        {
            return tl::unexpected<ParseError>(ParseError::NoStates);
        }

        automaton.m_initial_state = utility::trim(fields.m_initial);
        automaton.m_accepting_states = parse_state_list(fields.m_accepting);
        automaton.m_transitions = parse_transitions(fields.m_transitions, parsed.m_warnings);

        helpers::check_references(automaton, parsed.m_warnings);
        return parsed;
    }

    auto read_file(const std::filesystem::path& path) -> tl::expected<std::string, ParseError>
    {
        if (path.empty())
        {
            return tl::unexpected<ParseError>(ParseError::EmptyPath);
        }

        std::ifstream input_file(path);
        if (!input_file)
        {
            return tl::unexpected<ParseError>(ParseError::UnreadableFile);
        }

        std::stringstream buffer;
        buffer << input_file.rdbuf();
        return buffer.str();
    }

    auto text_to_fields(std::string_view content) -> tl::expected<AutomatonFields, ParseError>
    {
        const std::regex key_line("\\s*(states|initial|accepting|transitions)\\s*:(.*)");

        AutomatonFields fields;
        std::string* current = nullptr;

        for (auto r : content | views::split('\n'))
        {
            const std::string line{std::string_view(r.begin(), r.end())};
            const auto trimmed = utility::trim(line);
            if (trimmed.empty() || trimmed.starts_with('#'))
            {
                continue;
            }

            std::smatch pieces_match;
            if (std::regex_match(line, pieces_match, key_line))
            {
                const auto key = pieces_match[1].str();
                if (key == "states")           current = &fields.m_states;
                else if (key == "initial")     current = &fields.m_initial;
                else if (key == "accepting")   current = &fields.m_accepting;
                else                           current = &fields.m_transitions;

                if (!current->empty())
                {
                    current->push_back('\n');
                }
                current->append(utility::trim(pieces_match[2].str()));
            }
            // continuation of the previous key
            else if (current != nullptr)
            {
                current->push_back('\n');
                current->append(trimmed);
            }
            else
            {
                return tl::unexpected<ParseError>(ParseError::InvalidFileLine);
            }
        }
        return fields;
    }

    namespace
    {
        struct JflapState
        {
            std::string m_id;
            std::string m_name;
            bool m_initial;
            bool m_final;
        };
    }

    static auto states_from_xml_elements(const std::vector<XMLElement *> &elements)
        -> tl::expected<std::vector<JflapState>, ParseError>
    {
        auto to_state = [](XMLElement *el) -> tl::expected<JflapState, ParseError>
        {
            const char* pId = el->Attribute("id");
            if (!pId)
            {
                return tl::unexpected<ParseError>(ParseError::MissingStateId);
            }

            // unnamed states get the name jflap shows for them
            const char* pName = el->Attribute("name");
            std::string name = pName ? std::string{utility::trim(pName)} : fmt::format("q{}", pId);

            return JflapState{
                pId,
                name,
                el->FirstChildElement("initial") != nullptr,
                el->FirstChildElement("final") != nullptr
            };
        };

        return utility::to_expected(elements | views::transform(to_state));
    }

    static auto records_from_xml_elements(
        const std::vector<XMLElement *> &elements,
        const std::unordered_map<std::string, std::string>& names
    ) -> tl::expected<std::vector<model::TransitionRecord>, ParseError>
    {
        auto to_record = [&names](XMLElement *el) -> tl::expected<model::TransitionRecord, ParseError>
        {
            auto from = names.find(helpers::text_of(el->FirstChildElement("from")));
            auto to   = names.find(helpers::text_of(el->FirstChildElement("to")));
            if (from == names.end() || to == names.end())
            {
                return tl::unexpected<ParseError>(ParseError::UnknownTransitionState);
            }

            // an empty read is the empty word
            auto read = helpers::text_of(el->FirstChildElement("read"));
            if (read.empty())
            {
                read = "\\varepsilon";
            }
            return model::TransitionRecord(from->second, {read}, to->second);
        };

        return utility::to_expected(elements | views::transform(to_record));
    }

    auto jflap_to_automaton(std::string_view jflap_xml_str) -> tl::expected<ParsedAutomaton, ParseError>
    {
        XMLDocument doc;
        doc.Parse(jflap_xml_str.data(), jflap_xml_str.size());
        if (doc.ErrorID() != XML_SUCCESS)
        {
            return tl::unexpected<ParseError>(ParseError::InvalidJflapFile);
        }

        XMLElement *pStructure = doc.FirstChildElement("structure");
        if (pStructure == nullptr)
        {
            return tl::unexpected<ParseError>(ParseError::InvalidJflapFile);
        }

        if (auto type = helpers::text_of(pStructure->FirstChildElement("type")); !type.empty() && type != "fa")
        {
            return tl::unexpected<ParseError>(ParseError::NotFiniteAutomaton);
        }

        // newer jflap versions wrap the states in <automaton>, older ones do not
        XMLElement *pAutomaton = pStructure->FirstChildElement("automaton");
        if (pAutomaton == nullptr)
        {
            pAutomaton = pStructure;
        }

        auto states = states_from_xml_elements(helpers::children(pAutomaton, "state"));
        if (!states)
        {
            return tl::unexpected<ParseError>(states.error());
        }
        if (states.value().empty())
        {
            return tl::unexpected<ParseError>(ParseError::NoStates);
        }

        ParsedAutomaton parsed;
        auto& automaton = parsed.m_automaton;
        std::unordered_map<std::string, std::string> names;
        for (const auto& state : states.value())
        {
            names[state.m_id] = state.m_name;
            helpers::add_state(automaton, state.m_name, parsed.m_warnings);
            if (state.m_initial && automaton.m_initial_state.empty())
            {
                automaton.m_initial_state = state.m_name;
            }
            if (state.m_final && !helpers::contains(automaton.m_accepting_states, state.m_name))
            {
                automaton.m_accepting_states.push_back(state.m_name);
            }
        }
        automaton.m_rows.push_back(automaton.m_states);

        auto records = records_from_xml_elements(helpers::children(pAutomaton, "transition"), names);
        if (!records)
        {
            return tl::unexpected<ParseError>(records.error());
        }
        automaton.m_transitions = records.value();

        helpers::check_references(automaton, parsed.m_warnings);
        return parsed;
    }

    auto load_automaton(const std::filesystem::path& path) -> tl::expected<ParsedAutomaton, ParseError>
    {
        if (path.extension() == ".jff")
        {
            return read_file(path)
                .and_then(jflap_to_automaton);
        }
        return read_file(path)
            .and_then(text_to_fields)
            .and_then(fields_to_automaton);
    }

    // handle errors during parsing
    void HandleParseError(const ParseError err)
    {
        switch (err)
        {
        case ParseError::EmptyPath:
            throw std::runtime_error(
                "<EMPTY PATH> : you provided an empty path to the automaton file");
            break;
        case ParseError::UnreadableFile:
            throw std::runtime_error(
                "<UNREADABLE FILE> : could not open the automaton file");
            break;
        case ParseError::NoStates:
            throw std::runtime_error(
                "<NO STATES> : you need to declare at least one state");
            break;
        case ParseError::InvalidFileLine:
            throw std::runtime_error(
                "<INVALID FILE LINE> : every line continues a 'states:', 'initial:', 'accepting:'"
                " or 'transitions:' entry");
            break;
        case ParseError::InvalidJflapFile:
            throw std::runtime_error(
                "<INVALID JFLAP FILE> : the file is not a valid JFLAP document");
            break;
        case ParseError::NotFiniteAutomaton:
            throw std::runtime_error(
                "<NOT A FINITE AUTOMATON> : only JFLAP files of type 'fa' can be drawn");
            break;
        case ParseError::MissingStateId:
            throw std::runtime_error(
                "<MISSING STATE ID> : one of the JFLAP states has no id");
            break;
        case ParseError::UnknownTransitionState:
            throw std::runtime_error(
                "<UNKNOWN TRANSITION STATE> : one of the JFLAP transitions refers to a state that does not exist");
            break;
        default:
            throw std::runtime_error(
                "Something unexpected went wrong ... try again.");
            break;
        }
    }
}
