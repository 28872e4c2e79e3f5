#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "infrastructure/logging/logger.hpp"
#include "orchestrator/pipeline_engine.hpp"
#include "orchestrator/pipeline_errors.hpp"

using namespace DPF;
using namespace DPF::Orchestrator;
using namespace std::chrono_literals;

// EN: Test fixture with reusable child pipelines registered by name.
// FR: Fixture de test avec des pipelines enfants réutilisables enregistrés par nom.
class SubPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);

        actions_ = ActionRegistry::createWithBuiltins();
        actions_->registerAction("capture", [this](const ActionContext& context) {
            std::lock_guard<std::mutex> lock(capture_mutex_);
            captured_.push_back(context.parameters);
            return ActionOutcome::succeeded();
        });
        actions_->registerAction("fail", [](const ActionContext&) {
            return ActionOutcome::failed(4, "pulumi refresh failed");
        });

        config_.log_directory = "";
        config_.inject_runner_context = false;

        loader_.registerDefinition("stack", loader_.loadString(R"(
name: stack
inputs:
  AWS_REGION:
    required: true
  PULUMI_STACK: dev
stages:
  select:
    action: capture
  work:
    needs: select
    action: noop
)"));
        loader_.registerDefinition("failing-stack", loader_.loadString(R"(
name: failing-stack
inputs:
  AWS_REGION:
    required: true
stages:
  select:
    action: capture
  work:
    needs: select
    action: fail
)"));
        loader_.registerDefinition("slow", loader_.loadString(R"(
name: slow
stages:
  wait:
    action: sleep
    with:
      duration: 10s
)"));
    }

    void TearDown() override {
        engine_.reset();
        Logger::getInstance().setLogLevel(LogLevel::INFO);
    }

    PipelineEngine& engine() {
        if (!engine_) {
            engine_ = std::make_unique<PipelineEngine>(config_, actions_);
        }
        return *engine_;
    }

    template<typename Predicate>
    static bool waitUntil(Predicate predicate, std::chrono::milliseconds timeout = 5000ms) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (predicate()) {
                return true;
            }
            std::this_thread::sleep_for(5ms);
        }
        return predicate();
    }

    std::vector<RunParameters> captured() {
        std::lock_guard<std::mutex> lock(capture_mutex_);
        return captured_;
    }

    PipelineEngine::Config config_;
    std::shared_ptr<ActionRegistry> actions_;
    std::unique_ptr<PipelineEngine> engine_;
    PipelineDefinitionLoader loader_;

    std::mutex capture_mutex_;
    std::vector<RunParameters> captured_;
};

TEST(SubPipelineInvokerTest, BindingUsesOnlyParentParameters) {
    SubPipelineStageBody body;
    body.reference = "stack";
    body.bindings = {
        {"AWS_REGION", "${AWS_REGION}"},
        {"PULUMI_STACK", "prod-${ENV}"},
        {"LITERAL", "fixed"},
        {"LATER", "${NOT_SET}"},
    };

    RunParameters parent = {{"AWS_REGION", "eu-west-1"}, {"ENV", "blue"}, {"SECRET", "s3cr3t"}};
    auto bound = SubPipelineInvoker::bindParameters(body, parent);

    EXPECT_EQ(bound.size(), 4u);
    EXPECT_EQ(bound.at("AWS_REGION"), "eu-west-1");
    EXPECT_EQ(bound.at("PULUMI_STACK"), "prod-blue");
    EXPECT_EQ(bound.at("LITERAL"), "fixed");
    EXPECT_EQ(bound.at("LATER"), "${NOT_SET}");
    EXPECT_EQ(bound.count("SECRET"), 0u);
}

TEST(SubPipelineInvokerTest, UnresolvedReferenceThrows) {
    PipelineEngine::Config config;
    config.log_directory = "";
    PipelineEngine engine(config);
    SubPipelineInvoker invoker(engine);

    SubPipelineStageBody body;
    body.reference = "nowhere.yaml";
    EXPECT_THROW(invoker.invoke(body, {}, CancellationToken(), "run-1", "deploy"), PipelineError);
}

TEST_F(SubPipelineTest, ChildRunsWithItsOwnParameterSet) {
    auto parent = loader_.loadString(R"(
name: refresh-stack
inputs:
  AWS_REGION:
    required: true
  SECRET: hidden
stages:
  refresh:
    uses: stack
    with:
      AWS_REGION: ${AWS_REGION}
  preview:
    needs: refresh
    uses: stack
    with:
      AWS_REGION: ${AWS_REGION}
      PULUMI_STACK: prod
)");

    auto report = engine().run(parent, {{"AWS_REGION", "eu-west-1"}});
    ASSERT_EQ(report.status, RunStatus::SUCCEEDED);

    const auto* refresh = report.findStage("refresh");
    const auto* preview = report.findStage("preview");
    ASSERT_NE(refresh, nullptr);
    ASSERT_NE(preview, nullptr);
    ASSERT_NE(refresh->sub_run, nullptr);
    ASSERT_NE(preview->sub_run, nullptr);

    EXPECT_EQ(refresh->sub_run->pipeline_name, "stack");
    EXPECT_EQ(refresh->sub_run->parent_run_id, report.run_id);
    EXPECT_EQ(refresh->sub_run->parent_stage, "refresh");
    EXPECT_EQ(refresh->sub_run->status, RunStatus::SUCCEEDED);
    EXPECT_NE(refresh->sub_run->run_id, preview->sub_run->run_id);

    EXPECT_EQ(refresh->sub_run->parameters.at("PULUMI_STACK"), "dev");
    EXPECT_EQ(preview->sub_run->parameters.at("PULUMI_STACK"), "prod");
    EXPECT_EQ(refresh->sub_run->parameters.count("SECRET"), 0u);

    // EN: Each invocation saw exactly its own binding.
    // FR: Chaque invocation a vu exactement sa propre liaison.
    auto seen = captured();
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].at("PULUMI_STACK"), "dev");
    EXPECT_EQ(seen[1].at("PULUMI_STACK"), "prod");
    for (const auto& parameters : seen) {
        EXPECT_EQ(parameters.at("AWS_REGION"), "eu-west-1");
        EXPECT_EQ(parameters.count("SECRET"), 0u);
    }
}

TEST_F(SubPipelineTest, ChildFailureFailsTheParentStage) {
    auto parent = loader_.loadString(R"(
name: deploy
stages:
  refresh:
    uses: failing-stack
    with:
      AWS_REGION: eu-west-1
  announce:
    needs: refresh
    action: noop
  docs:
    action: noop
)");

    auto report = engine().run(parent);
    EXPECT_EQ(report.status, RunStatus::FAILED);
    EXPECT_EQ(report.exitCode(), 1);

    const auto* refresh = report.findStage("refresh");
    ASSERT_NE(refresh, nullptr);
    EXPECT_EQ(refresh->status, StageStatus::FAILED);
    EXPECT_EQ(refresh->error_kind, StageErrorKind::ACTION_FAILURE);
    EXPECT_EQ(refresh->error_message, "sub-pipeline 'failing-stack' failed at stage 'work': pulumi refresh failed");
    ASSERT_NE(refresh->sub_run, nullptr);
    EXPECT_EQ(refresh->sub_run->status, RunStatus::FAILED);
    EXPECT_EQ(refresh->sub_run->findStage("work")->exit_code, 4);

    EXPECT_EQ(report.findStage("announce")->status, StageStatus::SKIPPED_BY_UPSTREAM_FAILURE);
    EXPECT_EQ(report.findStage("docs")->status, StageStatus::SUCCEEDED);
}

TEST_F(SubPipelineTest, CancellingTheParentCancelsTheChild) {
    auto parent = loader_.loadString(R"(
name: deploy
stages:
  wait:
    uses: slow
)");

    auto future = engine().runAsync(parent);
    ASSERT_TRUE(waitUntil([this]() { return engine().getActiveRunIds().size() == 2; }));

    std::string parent_id;
    for (const auto& id : engine().getActiveRunIds()) {
        auto snapshot = engine().getRunReport(id);
        if (snapshot && snapshot->parent_run_id.empty()) {
            parent_id = id;
        }
    }
    ASSERT_FALSE(parent_id.empty());
    EXPECT_TRUE(engine().cancelRun(parent_id, "cancelled by request"));

    RunReport report = future.get();
    EXPECT_EQ(report.status, RunStatus::CANCELLED);
    EXPECT_TRUE(report.cancelled_by_request);

    const auto* wait = report.findStage("wait");
    ASSERT_NE(wait, nullptr);
    EXPECT_EQ(wait->status, StageStatus::CANCELLED);
    EXPECT_EQ(wait->error_kind, StageErrorKind::RUN_CANCELLED);
    ASSERT_NE(wait->sub_run, nullptr);
    EXPECT_EQ(wait->sub_run->status, RunStatus::CANCELLED);
    EXPECT_EQ(wait->sub_run->cancel_reason, "cancelled by request");
    EXPECT_TRUE(engine().getActiveRunIds().empty());
}

TEST_F(SubPipelineTest, StageTimeoutOnUsesStageWaitsForTheChild) {
    auto parent = loader_.loadString(R"(
name: deploy
stages:
  wait:
    uses: slow
    timeout: 150ms
)");

    auto start = std::chrono::steady_clock::now();
    auto report = engine().run(parent);

    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    EXPECT_EQ(report.status, RunStatus::FAILED);

    const auto* wait = report.findStage("wait");
    ASSERT_NE(wait, nullptr);
    EXPECT_EQ(wait->status, StageStatus::CANCELLED);
    EXPECT_EQ(wait->error_kind, StageErrorKind::ACTION_TIMEOUT);
    ASSERT_NE(wait->sub_run, nullptr);
    EXPECT_EQ(wait->sub_run->status, RunStatus::CANCELLED);
    EXPECT_TRUE(engine().getActiveRunIds().empty());
}

TEST_F(SubPipelineTest, ChildReportsAreNestedNotInHistory) {
    auto parent = loader_.loadString(R"(
name: deploy
stages:
  refresh:
    uses: stack
    with:
      AWS_REGION: eu-west-1
)");

    auto report = engine().run(parent);
    ASSERT_EQ(report.status, RunStatus::SUCCEEDED);
    const std::string child_id = report.findStage("refresh")->sub_run->run_id;

    auto history = engine().getRunHistory();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].run_id, report.run_id);

    auto child = engine().getRunReport(child_id);
    ASSERT_TRUE(child.has_value());
    EXPECT_EQ(child->pipeline_name, "stack");
    EXPECT_EQ(child->parent_run_id, report.run_id);

    auto stats = engine().getEngineStatistics();
    EXPECT_EQ(stats.total_runs, 1u);
    EXPECT_EQ(stats.child_runs, 1u);
    EXPECT_EQ(stats.successful_runs, 1u);
}

TEST_F(SubPipelineTest, RunnerContextReachesChildren) {
    config_.inject_runner_context = true;
    auto parent = loader_.loadString(R"(
name: deploy
stages:
  refresh:
    uses: stack
    with:
      AWS_REGION: eu-west-1
)");

    auto report = engine().run(parent);
    ASSERT_EQ(report.status, RunStatus::SUCCEEDED);
    EXPECT_EQ(report.parameters.count("runner.os"), 1u);
    EXPECT_EQ(report.findStage("refresh")->sub_run->parameters.count("runner.os"), 1u);
}

TEST_F(SubPipelineTest, ValidationReachesIntoChildren) {
    loader_.registerDefinition("broken", loader_.loadString(R"(
name: broken
stages:
  deploy:
    action: teleport
)"));
    auto parent = loader_.loadString(R"(
name: deploy
stages:
  first:
    action: capture
  call:
    needs: first
    uses: broken
)");

    try {
        engine().run(parent);
        FAIL() << "expected DefinitionError";
    } catch (const DefinitionError& e) {
        EXPECT_THAT(e.problems(), ::testing::Contains("in 'broken': stage 'deploy': unknown action 'teleport'"));
    }

    // EN: Nothing was dispatched.
    // FR: Rien n'a été lancé.
    EXPECT_TRUE(captured().empty());
    EXPECT_TRUE(engine().getRunHistory().empty());
}
