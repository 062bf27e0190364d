#ifndef TIKZ_BUILDER_H
#define TIKZ_BUILDER_H

#include "automaton.hpp"
#include "grid.hpp"
#include "router.hpp"
#include "style.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace tikz
{
    // `q12` -> `$q_{12}$`, anything else -> `$id$`
    [[nodiscard]]
    auto format_state_label(std::string_view state) -> std::string;

    [[nodiscard]]
    auto format_symbol(std::string_view symbol, SymbolStyle style) -> std::string;

    // sorted symbols formatted one by one and comma joined
    [[nodiscard]]
    auto format_label(const std::vector<model::Symbol>& symbols, SymbolStyle style) -> std::string;

    class TikzBuilder
    {
    public:
        TikzBuilder(
            const model::Automaton& automaton,
            const layout::Grid& grid,
            const std::vector<layout::EdgeRoute>& routes,
            const Style& style
        );

        // based on the grid and the routed edges this builds the tikz document
        auto build() -> void;

        auto write() const -> const std::string&;

    private:
        auto write_preamble() const -> std::string;
        auto write_picture_options() const -> std::string;

        // walks the grid row-major, anchoring each node on its left or upper neighbour
        auto write_nodes() const -> std::string;
        auto write_node(std::string_view state, std::string_view anchor) const -> std::string;

        auto write_edge(const layout::EdgeRoute& route) const -> std::string;

        const model::Automaton& m_automaton;
        const layout::Grid& m_grid;
        const std::vector<layout::EdgeRoute>& m_routes;
        const Style& m_style;

        std::string m_tikz_string;
    };
}

#endif
