#ifndef GENERATOR_H
#define GENERATOR_H

#include "automaton.hpp"
#include "grid.hpp"
#include "layout.hpp"
#include "router.hpp"
#include "style.hpp"

#include <string>
#include <vector>

#include <tl/expected.hpp>

namespace tikz
{
    enum class LayoutMode
    {
        // exhaustive grid search
        Auto,
        // the rows as written in the states field
        Rows
    };

    struct GenerateOptions
    {
        Style m_style;
        LayoutMode m_layout_mode = LayoutMode::Auto;
        layout::SearchOptions m_search;
        // retry without the accepting row-end convention when no grid can meet it
        bool m_relax_constraints = true;
    };

    struct Diagram
    {
        layout::Grid m_grid;
        int m_cost;
        std::vector<layout::EdgeRoute> m_routes;
        std::string m_text;
        model::Warnings m_warnings;
    };

    // table -> layout -> routes -> tikz for one snapshot of the input
    [[nodiscard]]
    auto generate_diagram(
        const model::Automaton& automaton,
        const GenerateOptions& options
    ) -> tl::expected<Diagram, layout::LayoutError>;
}

#endif
