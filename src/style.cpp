#include "../include/style.hpp"
#include "../include/utility.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>

namespace tikz
{
    namespace ranges = std::ranges;

    auto accepting_at_row_end(const Style& style) -> bool
    {
        return style.m_accepting_by == AcceptingBy::Double;
    }

    auto parse_accepting_by(std::string_view str) -> tl::expected<AcceptingBy, StyleError>
    {
        const auto value = utility::trim(str);
        if (value == "double" || value == "accepting by double")
        {
            return AcceptingBy::Double;
        }
        else if (value == "arrow" || value == "accepting by arrow")
        {
            return AcceptingBy::Arrow;
        }
        return tl::unexpected<StyleError>(StyleError::InvalidAcceptingBy);
    }

    auto parse_symbol_style(std::string_view str) -> tl::expected<SymbolStyle, StyleError>
    {
        const auto value = utility::trim(str);
        if (value == "verbatim")
        {
            return SymbolStyle::Verbatim;
        }
        else if (value == "monospace")
        {
            return SymbolStyle::Monospace;
        }
        else if (value == "math")
        {
            return SymbolStyle::Math;
        }
        return tl::unexpected<StyleError>(StyleError::InvalidSymbolStyle);
    }

    auto parse_initial_where(std::string_view str) -> tl::expected<std::string, StyleError>
    {
        const static auto sides = {"above", "below", "left", "right"};

        const auto value = utility::trim(str);
        if (ranges::find(sides, value) != sides.end())
        {
            return std::string{value};
        }
        return tl::unexpected<StyleError>(StyleError::InvalidInitialWhere);
    }

    auto parse_line_width(std::string_view str) -> tl::expected<std::string, StyleError>
    {
        const static auto widths = {"semithick", "thick", "very thick"};

        const auto value = utility::trim(str);
        if (ranges::find(widths, value) != widths.end())
        {
            return std::string{value};
        }
        return tl::unexpected<StyleError>(StyleError::InvalidLineWidth);
    }

    auto parse_color(std::string_view str) -> tl::expected<std::optional<std::string>, StyleError>
    {
        auto value = utility::trim(str);
        if (value.empty() || value == "none")
        {
            return std::optional<std::string>{};
        }
        if (value.starts_with('#'))
        {
            value.remove_prefix(1);
        }

        std::string hex{value};
        if (!std::regex_match(hex, std::regex("[0-9A-Fa-f]{6}")))
        {
            return tl::unexpected<StyleError>(StyleError::InvalidColor);
        }
        ranges::transform(hex, hex.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        return std::optional<std::string>{hex};
    }

    // handle errors in the style options
    void HandleStyleError(const StyleError err)
    {
        switch (err)
        {
        case StyleError::InvalidAcceptingBy:
            throw std::runtime_error(
                "<INVALID ACCEPTING STYLE> : accepting states are marked by either 'double' or 'arrow'");
            break;
        case StyleError::InvalidSymbolStyle:
            throw std::runtime_error(
                "<INVALID SYMBOL STYLE> : symbols are typeset 'verbatim', 'monospace' or 'math'");
            break;
        case StyleError::InvalidInitialWhere:
            throw std::runtime_error(
                "<INVALID INITIAL POSITION> : the initial arrow goes 'above', 'below', 'left' or 'right'");
            break;
        case StyleError::InvalidLineWidth:
            throw std::runtime_error(
                "<INVALID LINE WIDTH> : the line width is 'semithick', 'thick' or 'very thick'");
            break;
        case StyleError::InvalidColor:
            throw std::runtime_error(
                "<INVALID COLOR> : colors are six hex digits, e.g. #f0f0f0, or 'none'");
            break;
        default:
            throw std::runtime_error(
                "Something unexpected went wrong ... try again.");
            break;
        }
    }
}
