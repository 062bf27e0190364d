#ifndef SINK_H
#define SINK_H

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

#include <tl/expected.hpp>

namespace app
{
    enum class SinkError
    {
        OpenFailed,
        WriteFailed
    };

    void HandleSinkError(const SinkError err);

    // where a finished diagram goes, handed to the application once at startup
    class DiagramSink
    {
    public:
        virtual ~DiagramSink() = default;

        virtual auto render(std::string_view diagram) -> tl::expected<void, SinkError> = 0;
    };

    class StdoutSink final : public DiagramSink
    {
    public:
        auto render(std::string_view diagram) -> tl::expected<void, SinkError> override;
    };

    // rewrites the whole file on every render
    class FileSink final : public DiagramSink
    {
    public:
        explicit FileSink(std::filesystem::path path);

        auto render(std::string_view diagram) -> tl::expected<void, SinkError> override;

    private:
        std::filesystem::path m_path;
    };

    [[nodiscard]]
    auto make_sink(const std::optional<std::filesystem::path>& out_file) -> std::unique_ptr<DiagramSink>;
}

#endif
