#include "../include/app.hpp"
#include "../include/style.hpp"

#include <argparse/argparse.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

static auto style_from_args(const argparse::ArgumentParser& program) -> tikz::Style
{
    tikz::Style style;
    style.m_node_distance   = program.get<int>("--node-distance");
    style.m_inner_sep       = program.get<int>("--inner-sep");
    style.m_bend_angle      = program.get<int>("--bend-angle");
    style.m_shorten         = program.get<int>("--shorten");
    style.m_initial_text    = program.get("--initial-text");
    style.m_double_distance = program.get<double>("--double-distance");
    style.m_arrow_type      = program.get("--arrow-type");
    style.m_standalone      = program.get<bool>("--standalone");

    style.m_initial_where = tikz::parse_initial_where(program.get("--initial-where"))
        .or_else(tikz::HandleStyleError).value();
    style.m_accepting_by = tikz::parse_accepting_by(program.get("--accepting-by"))
        .or_else(tikz::HandleStyleError).value();
    style.m_symbol_style = tikz::parse_symbol_style(program.get("--symbols"))
        .or_else(tikz::HandleStyleError).value();
    style.m_line_width = tikz::parse_line_width(program.get("--line-width"))
        .or_else(tikz::HandleStyleError).value();
    style.m_node_fill_color = tikz::parse_color(program.get("--fill-color"))
        .or_else(tikz::HandleStyleError).value();
    style.m_node_border_color = tikz::parse_color(program.get("--border-color"))
        .or_else(tikz::HandleStyleError).value();
    style.m_edge_color = tikz::parse_color(program.get("--edge-color"))
        .or_else(tikz::HandleStyleError).value();
    return style;
}

auto main(const int argc, char const * const * const argv) -> int
{
    argparse::ArgumentParser program("fsm_tikz");

    // input
    program.add_argument("-f", "--file")
        .help("Read the automaton from a file: JFLAP (.jff) or 'states:/initial:/accepting:/transitions:' lines.");
    program.add_argument("--states")
        .default_value(std::string{})
        .help("States, comma separated, ';' starts a new row: 'q1, q2; q3'");
    program.add_argument("--initial")
        .default_value(std::string{})
        .help("The initial state.");
    program.add_argument("--accepting")
        .default_value(std::string{})
        .help("Accepting states, comma separated.");
    program.add_argument("--transitions")
        .default_value(std::string{})
        .help("Transitions 'from, symbol1, ..., to; ...'");

    // layout
    program.add_argument("--layout")
        .default_value(std::string{"auto"})
        .help("'auto' searches the best grid, 'rows' keeps the rows given in --states.");
    program.add_argument("--max-states")
        .default_value(10)
        .scan<'i', int>()
        .help("Refuse the exhaustive search above this many states (0 for no limit).");
    program.add_argument("--timeout")
        .default_value(0)
        .scan<'i', int>()
        .help("Give up the layout search after this many milliseconds (0 for no limit).");
    program.add_argument("--strict")
        .default_value(false)
        .implicit_value(true)
        .help("Fail instead of relaxing the accepting placement convention when it cannot be met.");

    // style
    program.add_argument("--node-distance").default_value(120).scan<'i', int>().help("Node distance in pt.");
    program.add_argument("--inner-sep").default_value(4).scan<'i', int>().help("Inner sep in pt.");
    program.add_argument("--bend-angle").default_value(30).scan<'i', int>().help("Bend angle in degrees.");
    program.add_argument("--shorten").default_value(3).scan<'i', int>().help("Arrow shortening in pt.");
    program.add_argument("--initial-text").default_value(std::string{"start"}).help("Label of the initial arrow.");
    program.add_argument("--initial-where").default_value(std::string{"left"}).help("above, below, left or right.");
    program.add_argument("--accepting-by").default_value(std::string{"double"}).help("double or arrow.");
    program.add_argument("--double-distance").default_value(1.5).scan<'g', double>().help("Double border distance in pt.");
    program.add_argument("--arrow-type").default_value(std::string{"Stealth[round]"}).help("Arrow tip, e.g. Latex.");
    program.add_argument("--fill-color").default_value(std::string{"f0f0f0"}).help("Node fill, hex or 'none'.");
    program.add_argument("--border-color").default_value(std::string{"none"}).help("Node border, hex or 'none'.");
    program.add_argument("--edge-color").default_value(std::string{"none"}).help("Edge color, hex or 'none'.");
    program.add_argument("--line-width").default_value(std::string{"thick"}).help("semithick, thick or very thick.");
    program.add_argument("--symbols").default_value(std::string{"verbatim"}).help("verbatim, monospace or math.");
    program.add_argument("--standalone")
        .default_value(false)
        .implicit_value(true)
        .help("Start the document with \\documentclass[tikz]{standalone}.");

    // output
    program.add_argument("-o", "--outfile")
        .help("Specify the file you wish to write the diagram to (optional, stdout otherwise)");
    program.add_argument("--watch")
        .default_value(false)
        .implicit_value(true)
        .help("Regenerate whenever the input file changes.");
    program.add_argument("--verbose")
        .default_value(false)
        .implicit_value(true)
        .help("Print the chosen grid and its cost.");
    program.add_argument("--quiet")
        .default_value(false)
        .implicit_value(true)
        .help("Do not print warnings about the input.");

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::runtime_error& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        std::exit(1);
    }

    try {
        // set up the optional arguments
        app::Options options;
        if (auto f = program.present("-f"))
        {
            options.in_file = std::filesystem::path{*f};
        }
        if (auto o = program.present("-o"))
        {
            options.out_file = std::filesystem::path{*o};
        }
        options.fields = parser::AutomatonFields{
            program.get("--states"),
            program.get("--initial"),
            program.get("--accepting"),
            program.get("--transitions")
        };

        options.generate.m_style = style_from_args(program);
        if (const auto mode = program.get("--layout"); mode == "rows")
        {
            options.generate.m_layout_mode = tikz::LayoutMode::Rows;
        }
        else if (mode != "auto")
        {
            throw std::runtime_error(
                "<INVALID LAYOUT MODE> : the layout is either 'auto' or 'rows'");
        }
        options.generate.m_search.m_max_states = static_cast<std::size_t>(std::max(0, program.get<int>("--max-states")));
        if (auto timeout = program.get<int>("--timeout"); timeout > 0)
        {
            options.generate.m_search.m_time_budget = std::chrono::milliseconds{timeout};
        }
        options.generate.m_relax_constraints = !program.get<bool>("--strict");

        options.watch   = program.get<bool>("--watch");
        options.verbose = program.get<bool>("--verbose");
        options.quiet   = program.get<bool>("--quiet");

        app::run(options);
    }
    catch (const std::runtime_error& err) {
        fmt::print(stderr, "{}\n", err.what());
        return 1;
    }
    return 0;
}
