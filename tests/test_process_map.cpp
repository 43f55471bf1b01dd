/*
 * Process map tests - Launch-TOML
 * Copyright (c) 2025 iDev srl
 * MIT License.
 */
#include <gtest/gtest.h>
#include <launch-toml/model/process_map.hpp>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace launchtoml;
namespace fs = std::filesystem;

TEST(ProcessMap, SetKeepsFirstPositionLastValue) {
    ProcessMap m;
    m.set("web", "one");
    m.set("worker", "two");
    m.set("web", "three");
    ASSERT_EQ(m.size(), 2u);
    EXPECT_EQ(m.begin()->type, "web");
    EXPECT_EQ(m.begin()->command, "three");
    ASSERT_NE(m.find("worker"), nullptr);
    EXPECT_EQ(*m.find("worker"), "two");
    EXPECT_EQ(m.find("missing"), nullptr);
}

TEST(ParseProcesses, NoMarkerEmpty) {
    EXPECT_TRUE(parse_processes("[processes]\ntype = \"web\"\ncommand = [\"x\"]\n").empty());
}

TEST(ParseProcesses, DuplicateTypeLastWriteWins) {
    auto m = parse_processes(
        "[[processes]]\ntype = \"web\"\ncommand = [\"first\"]\n"
        "[[processes]]\ntype = \"worker\"\ncommand = [\"bg\"]\n"
        "[[processes]]\ntype = \"web\"\ncommand = [\"second\"]\n");
    ASSERT_EQ(m.size(), 2u);
    EXPECT_EQ(*m.find("web"), "second");
    EXPECT_EQ(m.begin()->type, "web");
}

TEST(ParseProcesses, EmptyCommandContributesNothing) {
    auto m = parse_processes(
        "[[processes]]\ntype = \"web\"\ncommand = []\n"
        "[[processes]]\ntype = \"worker\"\ncommand = [\"run\"]\n");
    ASSERT_EQ(m.size(), 1u);
    EXPECT_EQ(m.find("web"), nullptr);
}

TEST(LoadProcesses, ReadsFileAndToleratesMissing) {
    fs::path p = fs::temp_directory_path() / ("__launch_toml_map_" + std::to_string(getpid()) + ".toml");
    {
        std::ofstream out(p);
        out << "[[processes]]\ntype = \"web\"\ncommand = [\"bash\", \"-c\", \"gunicorn app:app\"]\n";
    }
    auto m = load_processes(p.string());
    ASSERT_EQ(m.size(), 1u);
    EXPECT_EQ(*m.find("web"), "gunicorn app:app");
    fs::remove(p);

    EXPECT_TRUE(load_processes(p.string()).empty());
    EXPECT_FALSE(read_file(p.string()).has_value());
    EXPECT_FALSE(read_file(fs::temp_directory_path().string()).has_value());
}

TEST(NormalizeNewlines, CrLfAndLoneCr) {
    EXPECT_EQ(normalize_newlines("a\r\nb\rc\n\r\n"), "a\nb\nc\n\n");
    EXPECT_EQ(normalize_newlines("plain"), "plain");
}

TEST(LoadProcesses, CrLfDescriptorMatchesLfOutput) {
    fs::path p = fs::temp_directory_path() / ("__launch_toml_crlf_" + std::to_string(getpid()) + ".toml");
    {
        std::ofstream out(p, std::ios::binary);
        out << "[[processes]]\r\ntype = \"web\"\r\ncommand = [\"bash\", \"-c\", \"echo a\r\necho b\"]\r\n"
               "[[processes]]\r\ntype = \"worker\"\r\ncommand = [\"sh\", \"x\r\ny\"]\r\n";
    }
    auto m = load_processes(p.string());
    fs::remove(p);
    ASSERT_EQ(m.size(), 2u);
    EXPECT_EQ(*m.find("web"), "echo a\necho b");
    EXPECT_EQ(*m.find("worker"), "sh 'x\ny'");
}
