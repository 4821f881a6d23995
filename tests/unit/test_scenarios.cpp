// File: tests/unit/test_scenarios.cpp
// Purpose: End-to-end conversion of the sample scripts under tests/data,
//          from script file to Go source file.
// Key invariants: A failed conversion never leaves an output file behind.
// Ownership/Lifetime: Standalone unit test executable; creates and removes
//                     a scratch directory under the system temp directory.
// Links: docs/codemap.md

#include "driver/Transpiler.hpp"
#include "ir/IRBuilder.hpp"
#include "support/source_manager.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <unistd.h>

namespace fs = std::filesystem;
using namespace shgo;

namespace
{
std::string dataFile(const char *name)
{
    return std::string(SHGO_TEST_DATA_DIR) + "/" + name;
}

std::string slurp(const fs::path &path)
{
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

bool contains(const std::string &haystack, const std::string &needle)
{
    return haystack.find(needle) != std::string::npos;
}

class Scenarios : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        dir_ = fs::temp_directory_path() /
               ("shgo-scenarios-" + std::to_string(::getpid()) + "-" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string convert(const char *script)
    {
        const fs::path out = dir_ / "main.go";
        auto result = driver::convertFile(dataFile(script), out.string(), sm_);
        EXPECT_TRUE(result.hasValue()) << (result ? "" : result.error().message);
        return slurp(out);
    }

    fs::path dir_;
    support::SourceManager sm_;
};
} // namespace

TEST_F(Scenarios, HelloWorld)
{
    auto program = driver::lowerSource("NAME=\"World\"\necho \"Hello, $NAME!\"\n", 1);
    ASSERT_TRUE(program.hasValue());
    ASSERT_EQ(program.value().statements.size(), 2u);
    const auto &assign = program.value().statements[0].as<ir::Assignment>();
    EXPECT_EQ(assign.name, "NAME");
    ASSERT_TRUE(assign.value.has_value());
    EXPECT_EQ(assign.value->literalText(), "World");

    const std::string go = convert("hello.sh");
    EXPECT_TRUE(contains(go, "\tNAME = \"World\"\n\tfmt.Println(\"Hello, \" + NAME + \"!\")\n"))
        << go;
}

TEST_F(Scenarios, FileCheck)
{
    auto program = driver::lowerSource(slurp(dataFile("file_check.sh")), 1);
    ASSERT_TRUE(program.hasValue());
    const auto &cond = program.value().statements.at(0).as<ir::Conditional>();
    EXPECT_EQ(cond.category, ir::ConditionCategory::FileTest);

    const std::string go = convert("file_check.sh");
    EXPECT_TRUE(contains(go, "\tif shTestFile(\"-f\", \"go.mod\") {\n"
                             "\t\tfmt.Println(\"exists\")\n"
                             "\t} else {\n"
                             "\t\tfmt.Println(\"missing\")\n"
                             "\t}\n"))
        << go;
}

TEST_F(Scenarios, ThreeStagePipeline)
{
    auto program = driver::lowerSource(slurp(dataFile("pipeline.sh")), 1);
    ASSERT_TRUE(program.hasValue());
    const auto &pipe = program.value().statements.at(0).as<ir::Pipeline>();
    ASSERT_EQ(pipe.stages.size(), 3u);
    EXPECT_EQ(pipe.stages[0].name, "ls");
    EXPECT_EQ(pipe.stages[1].name, "grep");
    EXPECT_EQ(pipe.stages[2].name, "wc");

    const std::string go = convert("pipeline.sh");
    EXPECT_TRUE(contains(go, "shPipeline([]string{\"ls\", \"-la\"}, []string{\"grep\", \".sh\"}, "
                             "[]string{\"wc\", \"-l\"})"))
        << go;
    // Every stage is started before the first wait.
    const auto start = go.find("if err := cmd.Start(); err != nil {");
    const auto wait = go.find("cmds[i].Wait()");
    ASSERT_NE(start, std::string::npos) << go;
    ASSERT_NE(wait, std::string::npos) << go;
    EXPECT_LT(start, wait);
}

TEST_F(Scenarios, UnsupportedConstructLeavesNoOutput)
{
    const fs::path out = dir_ / "main.go";
    auto result = driver::convertFile(dataFile("unsupported.sh"), out.string(), sm_);
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().kind, support::ErrorKind::UnsupportedConstruct);
    EXPECT_EQ(result.error().message, "unsupported construct: case clause");
    EXPECT_EQ(result.error().loc.line, 2u);
    EXPECT_FALSE(fs::exists(out));
    EXPECT_TRUE(fs::is_empty(dir_));
}

TEST_F(Scenarios, FailedConversionKeepsPreviousOutput)
{
    const fs::path out = dir_ / "main.go";
    {
        std::ofstream previous(out);
        previous << "package main\n";
    }
    auto result = driver::convertFile(dataFile("malformed.sh"), out.string(), sm_);
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().kind, support::ErrorKind::MalformedSource);
    EXPECT_EQ(slurp(out), "package main\n");
}

TEST_F(Scenarios, MissingScriptIsIoFailure)
{
    auto result = driver::convertFile((dir_ / "absent.sh").string(), (dir_ / "x.go").string(), sm_);
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().kind, support::ErrorKind::IoFailure);
    EXPECT_FALSE(fs::exists(dir_ / "x.go"));
}
