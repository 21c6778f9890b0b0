/**
 * @file casereader_cli_test.cpp
 * @brief Integration tests for casereader-cli
 *
 * Runs the CLI binary as a subprocess against a generated store.
 */

#include <gtest/gtest.h>
#include <sys/wait.h>

#include <array>
#include <cstdio>
#include <memory>
#include <string>

#include "test_utils/sellar_store.h"

#ifndef CASEREADER_CLI_PATH
#define CASEREADER_CLI_PATH "../bin/casereader-cli"
#endif

namespace casereader {
namespace cli {
namespace test {

namespace {

struct CommandResult {
  std::string output;
  int exit_code = -1;
};

/**
 * @brief Execute shell command and capture output
 */
CommandResult ExecuteCommand(const std::string& command) {
  std::array<char, 4096> buffer{};
  CommandResult result;
  FILE* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return result;
  }
  while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
    result.output += buffer.data();
  }
  int status = pclose(pipe);
  if (status != -1 && WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  }
  return result;
}

}  // namespace

/**
 * @brief Test fixture for CLI integration tests
 */
class CaseReaderCliTest : public ::testing::Test {
 protected:
  void SetUp() override {
    builder_ = std::make_unique<casereader::test::StoreBuilder>("cli_sellar", 3);
    builder_->SetDriverMetadata({{"tree", {{"name", "root"}}}});
    builder_->AddSolverMetadata("root.mda.nonlinear_solver", {{"maxiter", 10}}, "NonlinearBlockGS");
    casereader::test::WriteSellarCases(*builder_, {2, 1});
  }

  CommandResult RunCommand(const std::string& command) {
    std::string full_command = std::string(CASEREADER_CLI_PATH) + " " + builder_->Path() + " " + command + " 2>&1";
    return ExecuteCommand(full_command);
  }

  CommandResult RunInteractive(const std::string& command) {
    // Send the command followed by quit on stdin
    std::string full_command =
        "printf '" + command + "\\nquit\\n' | " + std::string(CASEREADER_CLI_PATH) + " " + builder_->Path() + " 2>&1";
    return ExecuteCommand(full_command);
  }

  std::unique_ptr<casereader::test::StoreBuilder> builder_;
};

TEST_F(CaseReaderCliTest, InfoCommand) {
  auto result = RunCommand("INFO");
  EXPECT_EQ(result.exit_code, 0) << result.output;
  EXPECT_NE(result.output.find("format_version: 3"), std::string::npos);
  EXPECT_NE(result.output.find("driver: 2"), std::string::npos);
  EXPECT_NE(result.output.find("solver: 4"), std::string::npos);
}

TEST_F(CaseReaderCliTest, SourcesCommand) {
  auto result = RunCommand("SOURCES");
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_NE(result.output.find("root.mda.nonlinear_solver"), std::string::npos);
  EXPECT_NE(result.output.find("problem"), std::string::npos);
}

TEST_F(CaseReaderCliTest, ListCommand) {
  auto driver = RunCommand("LIST driver");
  EXPECT_EQ(driver.exit_code, 0);
  EXPECT_NE(driver.output.find("(2 cases)"), std::string::npos);
  EXPECT_NE(driver.output.find("2) rank0:SLSQP|1"), std::string::npos);

  auto recursive = RunCommand("LIST \"rank0:SLSQP|0\" RECURSE");
  EXPECT_EQ(recursive.exit_code, 0);
  EXPECT_NE(recursive.output.find("(5 cases)"), std::string::npos) << recursive.output;
}

TEST_F(CaseReaderCliTest, CaseCommand) {
  auto result = RunCommand("CASE \"rank0:SLSQP|1\"");
  EXPECT_EQ(result.exit_code, 0) << result.output;
  EXPECT_NE(result.output.find("category: driver"), std::string::npos);
  EXPECT_NE(result.output.find("pz.z = [4.5, 2]"), std::string::npos) << result.output;

  auto derivatives = RunCommand("DERIV \"rank0:SLSQP|1\"");
  EXPECT_EQ(derivatives.exit_code, 0);
  EXPECT_NE(derivatives.output.find("obj_cmp.obj,pz.z"), std::string::npos);
}

TEST_F(CaseReaderCliTest, UnknownCaseFails) {
  auto result = RunCommand("CASE \"rank0:SLSQP|9\"");
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.output.find("(error)"), std::string::npos);

  auto source = RunCommand("LIST root.nothing");
  EXPECT_EQ(source.exit_code, 1);
}

TEST_F(CaseReaderCliTest, OutputsCommand) {
  auto result = RunCommand("OUTPUTS IMPLICIT");
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_NE(result.output.find("(1 outputs)"), std::string::npos) << result.output;
  EXPECT_NE(result.output.find("mda.d2.y2"), std::string::npos);

  auto inputs = RunCommand("INPUTS");
  EXPECT_NE(inputs.output.find("(4 inputs)"), std::string::npos) << inputs.output;
  EXPECT_NE(inputs.output.find("units=m"), std::string::npos);
}

TEST_F(CaseReaderCliTest, MetaCommand) {
  auto driver = RunCommand("META DRIVER");
  EXPECT_EQ(driver.exit_code, 0);
  EXPECT_NE(driver.output.find("\"root\""), std::string::npos);

  auto solver = RunCommand("META SOLVER root.mda.nonlinear_solver");
  EXPECT_EQ(solver.exit_code, 0);
  EXPECT_NE(solver.output.find("NonlinearBlockGS"), std::string::npos);
}

TEST_F(CaseReaderCliTest, InteractiveMode) {
  auto result = RunInteractive("VARS root");
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_NE(result.output.find("outputs: mda.d1.y1 mda.d2.y2 obj_cmp.obj px.x pz.z"), std::string::npos)
      << result.output;
  EXPECT_NE(result.output.find("Bye!"), std::string::npos);
}

TEST(CaseReaderCliStandaloneTest, MissingStore) {
  auto result = ExecuteCommand(std::string(CASEREADER_CLI_PATH) + " /nonexistent/store.sqlite INFO 2>&1");
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.output.find("Failed to open"), std::string::npos);
}

TEST(CaseReaderCliStandaloneTest, Version) {
  auto result = ExecuteCommand(std::string(CASEREADER_CLI_PATH) + " --version");
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_NE(result.output.find("casereader-cli"), std::string::npos);
}

}  // namespace test
}  // namespace cli
}  // namespace casereader
