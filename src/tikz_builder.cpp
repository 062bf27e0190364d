#include "../include/tikz_builder.hpp"
#include "../include/utility.hpp"

#include <ranges>
#include <regex>
#include <variant>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace tikz
{
    using namespace ::utility;

    static
    auto indent(std::string_view multi_line_str, unsigned indent_level) -> std::string
    {
        std::string indent(indent_level * 2, ' ');
        return fmt::format(
            "{}{}",
            indent,
            fmt::join(
                multi_line_str
                    | views::split('\n')
                    | views::transform([](auto r) {
                        return std::string_view(r.begin(), r.end());
                    }),
                "\n"+indent
            )
        );
    }

    auto format_state_label(std::string_view state) -> std::string
    {
        const static std::regex subscripted("[A-Za-z][0-9]+");

        const std::string id{state};
        if (std::regex_match(id, subscripted))
        {
            return fmt::format("${}_{{{}}}$", id.front(), id.substr(1));
        }
        return fmt::format("${}$", id);
    }

    auto format_symbol(std::string_view symbol, SymbolStyle style) -> std::string
    {
        // tex macros such as \varepsilon only work in math mode
        if (symbol.starts_with('\\'))
        {
            return fmt::format("${}$", symbol);
        }

        switch (style)
        {
        case SymbolStyle::Monospace:
            return fmt::format("\\texttt{{{}}}", symbol);
        case SymbolStyle::Math:
            return fmt::format("${}$", symbol);
        case SymbolStyle::Verbatim:
        default:
            return std::string{symbol};
        }
    }

    auto format_label(const std::vector<model::Symbol>& symbols, SymbolStyle style) -> std::string
    {
        auto formatted = symbols
            | views::transform([style](std::string_view s){ return format_symbol(s, style); });
        return fmt::format("{}", fmt::join(formatted, ","));
    }

    TikzBuilder::TikzBuilder(
        const model::Automaton& automaton,
        const layout::Grid& grid,
        const std::vector<layout::EdgeRoute>& routes,
        const Style& style
    )
        : m_automaton{automaton},
          m_grid{grid},
          m_routes{routes},
          m_style{style}
    {
        build();
    }

    auto TikzBuilder::write() const -> const std::string&
    {
        return m_tikz_string;
    }

    auto TikzBuilder::build() -> void
    {
        auto edges = m_routes
            | views::transform([this](const layout::EdgeRoute& route){ return write_edge(route); });

        std::vector<std::string> sections{
            write_preamble(),
            fmt::format("\\begin{{tikzpicture}}{}", write_picture_options())
        };
        if (auto nodes = write_nodes(); !nodes.empty())
        {
            sections.push_back(indent(nodes, 1));
        }
        if (auto edge_lines = join_non_empty_strings(edges, "\n"); !edge_lines.empty())
        {
            sections.push_back(indent(edge_lines, 1));
        }
        sections.emplace_back("\\end{tikzpicture}");
        sections.emplace_back("\\end{document}");

        m_tikz_string = fmt::format("{}\n", fmt::join(sections, "\n"));
    }

    auto TikzBuilder::write_preamble() const -> std::string
    {
        std::vector<std::string> lines;
        if (m_style.m_standalone)
        {
            lines.emplace_back("\\documentclass[tikz]{standalone}");
        }
        lines.emplace_back("\\usepackage{tikz}");
        lines.emplace_back("\\usetikzlibrary{automata, arrows.meta, positioning}");
        lines.emplace_back("\\begin{document}");

        auto define_color = [&lines](std::string_view name, const std::optional<std::string>& hex)
        {
            if (hex.has_value())
            {
                lines.push_back(fmt::format("\\definecolor{{{}}}{{HTML}}{{{}}}", name, hex.value()));
            }
        };
        define_color("nodeFillColor", m_style.m_node_fill_color);
        define_color("nodeBorderColor", m_style.m_node_border_color);
        define_color("edgeColor", m_style.m_edge_color);

        return fmt::format("{}", fmt::join(lines, "\n"));
    }

    auto TikzBuilder::write_picture_options() const -> std::string
    {
        std::vector<std::string> options{
            fmt::format("shorten >={}pt", m_style.m_shorten),
            fmt::format("bend angle={}", m_style.m_bend_angle),
            fmt::format("inner sep={}pt", m_style.m_inner_sep),
            m_style.m_line_width,
            fmt::format("node distance={}pt", m_style.m_node_distance),
            fmt::format(">={{{}}}", m_style.m_arrow_type),
            fmt::format("initial text={}", m_style.m_initial_text),
        };

        std::vector<std::string> state_style;
        if (m_style.m_node_fill_color.has_value())
        {
            state_style.emplace_back("fill=nodeFillColor");
        }
        if (m_style.m_node_border_color.has_value())
        {
            state_style.emplace_back("draw=nodeBorderColor");
        }
        if (!state_style.empty())
        {
            options.push_back(fmt::format("every state/.style={{{}}}", fmt::join(state_style, ", ")));
        }
        if (m_style.m_edge_color.has_value())
        {
            options.emplace_back("every edge/.style={draw=edgeColor}");
        }

        if (m_style.m_accepting_by == AcceptingBy::Double)
        {
            options.push_back(fmt::format(
                "accepting by double/.style={{double, double distance={}pt}}", m_style.m_double_distance));
        }
        else
        {
            options.emplace_back("accepting/.style=accepting by arrow");
        }
        options.emplace_back("on grid");

        return fmt::format("[\n{}]", indent(fmt::format("{}", fmt::join(options, ",\n")), 1));
    }

    auto TikzBuilder::write_nodes() const -> std::string
    {
        std::vector<std::string> nodes;
        std::optional<std::string> previous_row_first;

        for (std::size_t row = 0; row < m_grid.size(); ++row)
        {
            std::optional<std::string> previous;
            for (std::size_t col = 0; col < m_grid[row].size(); ++col)
            {
                if (!m_grid[row][col].has_value())
                {
                    continue;
                }
                const auto& state = m_grid[row][col].value();

                // first state of a later row goes below the first state of the row above,
                // the rest of a row goes right of its left neighbour
                std::string anchor;
                if (col == 0 && row > 0 && previous_row_first.has_value())
                {
                    anchor = fmt::format("below of={}", previous_row_first.value());
                    previous_row_first = state;
                }
                else if (col > 0 && previous.has_value())
                {
                    anchor = fmt::format("right of={}", previous.value());
                }
                else
                {
                    previous_row_first = state;
                }
                previous = state;

                nodes.push_back(write_node(state, anchor));
            }
        }
        return fmt::format("{}", fmt::join(nodes, "\n"));
    }

    auto TikzBuilder::write_node(std::string_view state, std::string_view anchor) const -> std::string
    {
        std::vector<std::string> flags{"state"};
        if (state == m_automaton.m_initial_state)
        {
            flags.push_back(fmt::format("initial {}", m_style.m_initial_where));
        }
        if (m_automaton.is_accepting(state))
        {
            flags.emplace_back("accepting");
        }

        if (anchor.empty())
        {
            return fmt::format(
                "\\node[{}] ({}) {{{}}};",
                join_non_empty_strings(flags, ", "),
                state,
                format_state_label(state)
            );
        }
        return fmt::format(
            "\\node[{}] ({}) [{}] {{{}}};",
            join_non_empty_strings(flags, ", "),
            state,
            anchor,
            format_state_label(state)
        );
    }

    auto TikzBuilder::write_edge(const layout::EdgeRoute& route) const -> std::string
    {
        std::string options;
        if (const auto* loop = std::get_if<layout::SelfLoop>(&route.m_shape))
        {
            options = fmt::format("loop {}, ->", layout::to_string(loop->m_side));
        }
        else if (const auto* straight = std::get_if<layout::StraightEdge>(&route.m_shape))
        {
            options = fmt::format("{}, ->", layout::to_string(straight->m_label_side));
        }
        else if (const auto* bent = std::get_if<layout::BentEdge>(&route.m_shape))
        {
            options = fmt::format(
                "{}, {}, ->",
                layout::to_string(layout::drawn_bend(*bent)),
                layout::to_string(bent->m_label_side)
            );
        }

        return fmt::format(
            "\\draw ({}) edge[{}] node[auto]{{{}}} ({});",
            route.m_from,
            options,
            format_label(route.m_symbols, m_style.m_symbol_style),
            route.m_to
        );
    }
}
