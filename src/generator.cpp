#include "../include/generator.hpp"
#include "../include/tikz_builder.hpp"
#include "../include/transition_table.hpp"

namespace tikz
{
    static
    auto search_layout(
        const model::Automaton& automaton,
        const model::TransitionTable& table,
        const GenerateOptions& options,
        model::Warnings& warnings
    ) -> tl::expected<layout::Layout, layout::LayoutError>
    {
        layout::LayoutConstraints constraints{
            automaton.m_initial_state,
            automaton.m_accepting_states,
            accepting_at_row_end(options.m_style)
        };

        auto result = layout::find_optimal_layout(automaton.m_states, table, constraints, options.m_search);
        if (!result
            && result.error() == layout::LayoutError::NoLayoutFound
            && constraints.m_accepting_at_row_end
            && options.m_relax_constraints)
        {
            constraints.m_accepting_at_row_end = false;
            result = layout::find_optimal_layout(automaton.m_states, table, constraints, options.m_search);
            if (result)
            {
                warnings.push_back({
                    model::WarningKind::RelaxedLayout,
                    "accepting states cannot all end their rows, laid out without that convention"
                });
            }
        }
        return result;
    }

    auto generate_diagram(
        const model::Automaton& automaton,
        const GenerateOptions& options
    ) -> tl::expected<Diagram, layout::LayoutError>
    {
        const model::TransitionTable table(automaton.m_transitions);

        Diagram diagram;
        auto result = options.m_layout_mode == LayoutMode::Rows
            ? layout::layout_from_rows(automaton.m_rows, table)
            : search_layout(automaton, table, options, diagram.m_warnings);

        if (!result)
        {
            return tl::unexpected<layout::LayoutError>(result.error());
        }

        diagram.m_grid   = std::move(result.value().m_grid);
        diagram.m_cost   = result.value().m_cost;
        diagram.m_routes = layout::route_edges(diagram.m_grid, table, automaton.m_states);

        TikzBuilder builder(automaton, diagram.m_grid, diagram.m_routes, options.m_style);
        diagram.m_text = builder.write();
        return diagram;
    }
}
