#ifndef APP_H
#define APP_H

#include "generator.hpp"
#include "parser.hpp"
#include "sink.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>

namespace app
{
    struct Options
    {
        // the automaton comes from in_file when given, otherwise from the text fields
        std::optional<std::filesystem::path> in_file;
        parser::AutomatonFields fields;

        std::optional<std::filesystem::path> out_file;
        tikz::GenerateOptions generate;

        bool watch = false;
        std::chrono::milliseconds poll_interval{250};
        bool verbose = false;
        bool quiet = false;
    };

    // one regeneration of the watch loop, failures are reported to stderr and never leave the job;
    // nothing is reported once the job has been superseded
    auto run_watch_job(const Options& options, DiagramSink& sink, std::stop_token token) -> void;

    auto run(const Options& options) -> void;
}

#endif
