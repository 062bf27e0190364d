#include "../include/app.hpp"

#include "../include/generator.hpp"
#include "../include/grid.hpp"
#include "../include/latest_runner.hpp"
#include "../include/parser.hpp"
#include "../include/sink.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <exception>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace app
{
    static auto load_input(const Options& options) -> tl::expected<parser::ParsedAutomaton, parser::ParseError>
    {
        if (options.in_file.has_value())
        {
            return parser::load_automaton(options.in_file.value());
        }
        return parser::fields_to_automaton(options.fields);
    }

    static auto report_warnings(const model::Warnings& warnings, const Options& options) -> void
    {
        if (options.quiet)
        {
            return;
        }
        for (const auto& warning : warnings)
        {
            fmt::print(stderr, "warning: {}\n", warning.m_message);
        }
    }

    static auto report_layout(const tikz::Diagram& diagram, const Options& options) -> void
    {
        if (options.verbose)
        {
            fmt::print(stderr, "layout: {} (cost {})\n", layout::to_string(diagram.m_grid), diagram.m_cost);
        }
    }

    // parse -> generate -> render, every failure raised through the Handle*Error functions
    static auto generate_once(const Options& options, DiagramSink& sink) -> void
    {
        auto parsed = load_input(options)
            .or_else(parser::HandleParseError);
        report_warnings(parsed.value().m_warnings, options);

        auto diagram = tikz::generate_diagram(parsed.value().m_automaton, options.generate)
            .or_else(layout::HandleLayoutError);
        report_warnings(diagram.value().m_warnings, options);
        report_layout(diagram.value(), options);

        sink.render(diagram.value().m_text)
            .or_else(HandleSinkError);
    }

    static auto last_write(const std::filesystem::path& path) -> std::optional<std::filesystem::file_time_type>
    {
        std::error_code ec;
        auto time = std::filesystem::last_write_time(path, ec);
        if (ec)
        {
            return std::nullopt;
        }
        return time;
    }

    auto run_watch_job(const Options& options, DiagramSink& sink, std::stop_token token) -> void
    {
        auto job_options = options;
        job_options.generate.m_search.m_stop_token = token;
        try
        {
            generate_once(job_options, sink);
        }
        catch (const std::exception& err)
        {
            // a cancelled search was superseded by a newer snapshot
            if (!token.stop_requested())
            {
                fmt::print(stderr, "{}\n", err.what());
            }
        }
    }

    // re-generates whenever the input file changes, a newer snapshot cancels the search of an older one
    static auto watch(const Options& options, DiagramSink& sink) -> void
    {
        if (!options.in_file.has_value())
        {
            throw std::runtime_error(
                "<WATCH WITHOUT FILE> : --watch needs the automaton in a file (-f)");
        }

        LatestRequestRunner runner;
        std::optional<std::filesystem::file_time_type> seen;

        while (true)
        {
            auto current = last_write(options.in_file.value());
            if (current.has_value() && current != seen)
            {
                seen = current;
                runner.submit([&options, &sink](std::stop_token token){
                    run_watch_job(options, sink, token);
                });
            }
            std::this_thread::sleep_for(options.poll_interval);
        }
    }

    auto run(const Options& options) -> void
    {
        auto sink = make_sink(options.out_file);

        if (options.watch)
        {
            watch(options, *sink);
        }
        else
        {
            generate_once(options, *sink);
        }
    }
}
