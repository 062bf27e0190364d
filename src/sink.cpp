#include "../include/sink.hpp"

#include <cstdio>
#include <fstream>
#include <stdexcept>

#include <fmt/format.h>

namespace app
{
    auto StdoutSink::render(std::string_view diagram) -> tl::expected<void, SinkError>
    {
        fmt::print("{}", diagram);
        if (std::fflush(stdout) != 0)
        {
            return tl::unexpected<SinkError>(SinkError::WriteFailed);
        }
        return {};
    }

    FileSink::FileSink(std::filesystem::path path)
        : m_path{std::move(path)}
    {}

    auto FileSink::render(std::string_view diagram) -> tl::expected<void, SinkError>
    {
        std::ofstream output_file;
        output_file.open(m_path, std::ios::out | std::ios::trunc);
        if (!output_file.is_open())
        {
            return tl::unexpected<SinkError>(SinkError::OpenFailed);
        }

        output_file << diagram;
        output_file.close();
        if (output_file.fail())
        {
            return tl::unexpected<SinkError>(SinkError::WriteFailed);
        }
        return {};
    }

    auto make_sink(const std::optional<std::filesystem::path>& out_file) -> std::unique_ptr<DiagramSink>
    {
        if (out_file.has_value())
        {
            return std::make_unique<FileSink>(out_file.value());
        }
        return std::make_unique<StdoutSink>();
    }

    // handle errors while writing the diagram out
    void HandleSinkError(const SinkError err)
    {
        switch (err)
        {
        case SinkError::OpenFailed:
            throw std::runtime_error(
                "<OUTPUT FILE ERROR> : could not open the output file for writing");
            break;
        case SinkError::WriteFailed:
            throw std::runtime_error(
                "<OUTPUT WRITE ERROR> : could not write the diagram");
            break;
        default:
            throw std::runtime_error(
                "Something unexpected went wrong ... try again.");
            break;
        }
    }
}
