#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "infrastructure/cli/command_line.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include "orchestrator/pipeline_engine.hpp"

using namespace DPF;
using namespace DPF::CLI;

// EN: Test fixture with the dpfctl option set.
// FR: Fixture de test avec le jeu d'options de dpfctl.
class CommandLineParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        parser_.addStandardOptions();
        parser_.setVersionInfo("dpfctl 1.0.0");
        parser_.setUsage("dpfctl [options] <command> <pipeline-file>",
                         "  run       Execute the pipeline\n  validate  Validate only\n");
    }

    CommandLineParser parser_{"dpfctl"};
};

TEST_F(CommandLineParserTest, PositionalCommandAndFile) {
    auto result = parser_.parse({"run", "pipelines/refresh-stack.yaml"});

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.positional, (std::vector<std::string>{"run", "pipelines/refresh-stack.yaml"}));
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(CommandLineParserTest, OptionsMayAppearAnywhere) {
    auto result = parser_.parse({"-j", "4", "run", "--lock-backend=memory", "deploy.yaml",
                                 "--param", "AWS_REGION=us-east-1", "-pPULUMI_PREVIEW=true"});

    ASSERT_TRUE(result.isSuccess()) << (result.errors.empty() ? "" : result.errors.front());
    EXPECT_EQ(result.positional, (std::vector<std::string>{"run", "deploy.yaml"}));
    EXPECT_EQ(result.getValue("max-parallel"), "4");
    EXPECT_EQ(result.getValue("lock-backend"), "memory");

    auto params = result.getKeyValues("param");
    EXPECT_EQ(params.size(), 2u);
    EXPECT_EQ(params["AWS_REGION"], "us-east-1");
    EXPECT_EQ(params["PULUMI_PREVIEW"], "true");
}

TEST_F(CommandLineParserTest, LaterParamValuesWin) {
    auto result = parser_.parse({"run", "x.yaml", "-p", "A=1", "-p", "A=2", "-p", "B=x=y"});

    ASSERT_TRUE(result.isSuccess());
    auto params = result.getKeyValues("param");
    EXPECT_EQ(params["A"], "2");
    // EN: Only the first '=' separates key and value.
    // FR: Seul le premier '=' sépare clé et valeur.
    EXPECT_EQ(params["B"], "x=y");
}

TEST_F(CommandLineParserTest, OverridesCarryConfigurationPaths) {
    auto result = parser_.parse({"--max-parallel", "2", "--log-level", "DEBUG", "--run-log-dir", "/tmp/runs",
                                 "run", "x.yaml"});

    ASSERT_TRUE(result.isSuccess());
    ASSERT_EQ(result.overrides.count("engine.max_parallelism"), 1u);
    EXPECT_EQ(result.overrides.at("engine.max_parallelism").as<int>(), 2);
    EXPECT_EQ(result.overrides.at("logging.level").as<std::string>(), "DEBUG");
    EXPECT_EQ(result.overrides.at("runs.log_directory").as<std::string>(), "/tmp/runs");
}

TEST_F(CommandLineParserTest, ApplyOverridesWritesTheConfiguration) {
    auto& config = ConfigManager::getInstance();
    config.reset();
    Orchestrator::EngineSettings::registerDefaults(config);

    auto result = parser_.parse({"--max-parallel", "3", "--lock-backend", "memory", "run", "x.yaml"});
    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(parser_.applyOverrides(result, config), 2u);

    EXPECT_EQ(config.get("engine.max_parallelism").as<int>(), 3);
    EXPECT_EQ(config.get("locks.backend").as<std::string>(), "memory");
    config.reset();
}

TEST_F(CommandLineParserTest, UnknownOption) {
    auto result = parser_.parse({"run", "--frobnicate", "x.yaml"});
    EXPECT_EQ(result.status, CliParseStatus::INVALID_OPTION);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_NE(result.errors[0].find("--frobnicate"), std::string::npos);
}

TEST_F(CommandLineParserTest, MissingValue) {
    auto result = parser_.parse({"run", "x.yaml", "--config"});
    EXPECT_EQ(result.status, CliParseStatus::MISSING_VALUE);
}

TEST_F(CommandLineParserTest, InvalidValues) {
    EXPECT_EQ(parser_.parse({"-j", "many"}).status, CliParseStatus::INVALID_VALUE);
    EXPECT_EQ(parser_.parse({"-p", "NOEQUALS"}).status, CliParseStatus::INVALID_VALUE);
    EXPECT_EQ(parser_.parse({"-p", "=value"}).status, CliParseStatus::INVALID_VALUE);
    EXPECT_EQ(parser_.parse({"--help=yes"}).status, CliParseStatus::INVALID_VALUE);
}

TEST_F(CommandLineParserTest, ConstraintViolations) {
    EXPECT_EQ(parser_.parse({"--max-parallel", "-1"}).status, CliParseStatus::CONSTRAINT_VIOLATION);
    EXPECT_EQ(parser_.parse({"--lock-backend", "redis"}).status, CliParseStatus::CONSTRAINT_VIOLATION);
    EXPECT_EQ(parser_.parse({"--log-level", "TRACE"}).status, CliParseStatus::CONSTRAINT_VIOLATION);
}

TEST_F(CommandLineParserTest, DuplicateNonRepeatableOption) {
    auto result = parser_.parse({"--config", "a.yaml", "--config", "b.yaml"});
    EXPECT_EQ(result.status, CliParseStatus::DUPLICATE_OPTION);
}

TEST_F(CommandLineParserTest, DoubleDashEndsOptions) {
    auto result = parser_.parse({"run", "--", "--weird-file-name.yaml"});
    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.positional, (std::vector<std::string>{"run", "--weird-file-name.yaml"}));
}

TEST_F(CommandLineParserTest, HelpAndVersion) {
    auto help = parser_.parse({"run", "--help"});
    EXPECT_EQ(help.status, CliParseStatus::HELP_REQUESTED);
    EXPECT_NE(help.help_text.find("Usage: dpfctl [options] <command> <pipeline-file>"), std::string::npos);
    EXPECT_NE(help.help_text.find("--max-parallel N"), std::string::npos);
    EXPECT_NE(help.help_text.find("Commands:"), std::string::npos);

    auto version = parser_.parse({"--version"});
    EXPECT_EQ(version.status, CliParseStatus::VERSION_REQUESTED);
    EXPECT_EQ(version.version_text, "dpfctl 1.0.0");
}

TEST_F(CommandLineParserTest, DuplicateDefinitionsAreRejected) {
    CliOptionDefinition again;
    again.long_name = "config";
    EXPECT_THROW(parser_.addOption(again), std::invalid_argument);

    CliOptionDefinition clash;
    clash.long_name = "other";
    clash.short_name = 'j';
    EXPECT_THROW(parser_.addOption(clash), std::invalid_argument);
}

TEST(CommandLineUtilsTest, ParseKeyValue) {
    auto kv = CommandLineUtils::parseKeyValue("AWS_REGION=eu-west-1");
    ASSERT_TRUE(kv.has_value());
    EXPECT_EQ(kv->first, "AWS_REGION");
    EXPECT_EQ(kv->second, "eu-west-1");

    auto empty_value = CommandLineUtils::parseKeyValue("FLAG=");
    ASSERT_TRUE(empty_value.has_value());
    EXPECT_EQ(empty_value->second, "");

    EXPECT_FALSE(CommandLineUtils::parseKeyValue("novalue").has_value());
    EXPECT_FALSE(CommandLineUtils::parseKeyValue("=x").has_value());
}

TEST(CommandLineUtilsTest, StatusToString) {
    EXPECT_EQ(CommandLineUtils::statusToString(CliParseStatus::SUCCESS), "SUCCESS");
    EXPECT_EQ(CommandLineUtils::statusToString(CliParseStatus::CONSTRAINT_VIOLATION), "CONSTRAINT_VIOLATION");
}
