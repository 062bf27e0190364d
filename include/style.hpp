#ifndef STYLE_H
#define STYLE_H

#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace tikz
{
    enum class AcceptingBy
    {
        Double,
        Arrow
    };

    enum class SymbolStyle
    {
        Verbatim,
        Monospace,
        Math
    };

    enum class StyleError
    {
        InvalidAcceptingBy,
        InvalidSymbolStyle,
        InvalidInitialWhere,
        InvalidLineWidth,
        InvalidColor
    };

    void HandleStyleError(const StyleError err);

    // drawing parameters passed through to the tikzpicture, only m_accepting_by touches the layout
    struct Style
    {
        int m_node_distance = 120;
        int m_inner_sep = 4;
        int m_bend_angle = 30;
        int m_shorten = 3;
        std::string m_initial_text = "start";
        std::string m_initial_where = "left";
        AcceptingBy m_accepting_by = AcceptingBy::Double;
        double m_double_distance = 1.5;
        std::string m_arrow_type = "Stealth[round]";
        std::optional<std::string> m_node_fill_color = "f0f0f0";
        std::optional<std::string> m_node_border_color;
        std::optional<std::string> m_edge_color;
        std::string m_line_width = "thick";
        SymbolStyle m_symbol_style = SymbolStyle::Verbatim;
        bool m_standalone = false;
    };

    // accepting by double keeps accepting states at the row ends
    [[nodiscard]]
    auto accepting_at_row_end(const Style& style) -> bool;

    [[nodiscard]]
    auto parse_accepting_by(std::string_view str) -> tl::expected<AcceptingBy, StyleError>;

    [[nodiscard]]
    auto parse_symbol_style(std::string_view str) -> tl::expected<SymbolStyle, StyleError>;

    [[nodiscard]]
    auto parse_initial_where(std::string_view str) -> tl::expected<std::string, StyleError>;

    [[nodiscard]]
    auto parse_line_width(std::string_view str) -> tl::expected<std::string, StyleError>;

    // `#A0B1C2` or `a0b1c2` to the bare hex digits, `none` to nullopt
    [[nodiscard]]
    auto parse_color(std::string_view str) -> tl::expected<std::optional<std::string>, StyleError>;
}

#endif
