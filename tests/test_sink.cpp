#include <gtest/gtest.h>

#include "../include/sink.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace app;

namespace {

std::string read_back(const std::filesystem::path& path) {
    std::ifstream input(path);
    std::stringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

}  // namespace

TEST(SinkTest, FileSinkReplacesPreviousDiagram) {
    const auto path = std::filesystem::temp_directory_path() / "fsm_tikz_sink_test.tex";

    FileSink sink(path);
    ASSERT_TRUE(sink.render("first diagram, long enough to leave a tail\n").has_value());
    ASSERT_TRUE(sink.render("second\n").has_value());

    EXPECT_EQ(read_back(path), "second\n");
    std::filesystem::remove(path);
}

TEST(SinkTest, FileSinkReportsUnopenableFile) {
    FileSink sink(std::filesystem::temp_directory_path() / "fsm_tikz_missing_dir" / "nested" / "out.tex");

    auto result = sink.render("diagram");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), SinkError::OpenFailed);
    EXPECT_THROW(HandleSinkError(result.error()), std::runtime_error);
}

TEST(SinkTest, MakeSinkPicksFileWhenGiven) {
    auto to_file = make_sink(std::filesystem::path{"out.tex"});
    auto to_stdout = make_sink(std::nullopt);

    EXPECT_NE(dynamic_cast<FileSink*>(to_file.get()), nullptr);
    EXPECT_NE(dynamic_cast<StdoutSink*>(to_stdout.get()), nullptr);
}
