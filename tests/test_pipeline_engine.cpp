#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <map>
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
using ::testing::Contains;
using ::testing::HasSubstr;

// EN: Test fixture for PipelineEngine tests
// FR: Fixture de test pour les tests de PipelineEngine
class PipelineEngineTest : public ::testing::Test {
protected:
    struct Interval {
        std::string stage;
        std::chrono::steady_clock::time_point start;
        std::chrono::steady_clock::time_point end;
        std::string run_id;
    };

    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);

        // EN: `hold` sleeps `with.ms` while tracking how many holds overlap.
        // FR: `hold` dort `with.ms` en suivant combien de holds se chevauchent.
        actions_ = ActionRegistry::createWithBuiltins();
        actions_->registerAction("hold", [this](const ActionContext& context) {
            auto it = context.arguments.find("ms");
            auto duration = std::chrono::milliseconds(it == context.arguments.end() ? 200 : std::stoi(it->second));

            int now = ++inside_;
            int previous = peak_inside_.load();
            while (now > previous && !peak_inside_.compare_exchange_weak(previous, now)) {
            }

            Interval interval{context.stage_name, std::chrono::steady_clock::now(), {}, context.run_id};
            bool cancelled = context.cancel.waitFor(duration);
            interval.end = std::chrono::steady_clock::now();
            --inside_;

            std::lock_guard<std::mutex> lock(intervals_mutex_);
            intervals_.push_back(interval);
            return cancelled ? ActionOutcome::failed(130, "hold interrupted") : ActionOutcome::succeeded();
        });
        actions_->registerAction("fail", [](const ActionContext&) {
            return ActionOutcome::failed(2, "tests failed");
        });

        config_.log_directory = "";
        config_.inject_runner_context = false;
        config_.max_run_history = 10;
    }

    void TearDown() override {
        if (engine_) {
            engine_->shutdown();
        }
        engine_.reset();
        Logger::getInstance().setLogLevel(LogLevel::INFO);
    }

    PipelineEngine& engine() {
        if (!engine_) {
            engine_ = std::make_unique<PipelineEngine>(config_, actions_);
        }
        return *engine_;
    }

    static std::shared_ptr<PipelineDefinition> makeDefinition(const std::string& name) {
        auto definition = std::make_shared<PipelineDefinition>();
        definition->name = name;
        return definition;
    }

    // EN: Helper method to append an action stage
    // FR: Méthode d'aide pour ajouter une étape action
    static StageSpec& addStage(PipelineDefinition& definition, const std::string& name,
                               const std::string& action = "hold",
                               const std::vector<std::string>& needs = {},
                               const std::map<std::string, std::string>& arguments = {}) {
        StageSpec stage;
        stage.name = name;
        stage.needs = needs;
        ActionStageBody body;
        body.action = action;
        body.arguments = arguments;
        stage.body = body;
        definition.stages.push_back(stage);
        return definition.stages.back();
    }

    std::vector<Interval> intervals() {
        std::lock_guard<std::mutex> lock(intervals_mutex_);
        return intervals_;
    }

    const Interval* intervalOf(const std::vector<Interval>& all, const std::string& stage) {
        auto it = std::find_if(all.begin(), all.end(), [&](const Interval& i) { return i.stage == stage; });
        return it == all.end() ? nullptr : &*it;
    }

    const Interval* intervalOf(const std::vector<Interval>& all, const std::string& run_id,
                               const std::string& stage) {
        auto it = std::find_if(all.begin(), all.end(), [&](const Interval& i) {
            return i.run_id == run_id && i.stage == stage;
        });
        return it == all.end() ? nullptr : &*it;
    }

    // EN: lint, then refresh and preview both holding the shared venv lock.
    // FR: lint, puis refresh et preview tenant tous deux le verrou partagé du venv.
    static std::shared_ptr<PipelineDefinition> makeRefreshStack(const std::string& lint_action) {
        auto definition = makeDefinition("refresh-stack");
        addStage(*definition, "lint", lint_action, {}, {{"ms", "50"}});
        StageSpec& refresh = addStage(*definition, "refresh", "hold", {"lint"}, {{"ms", "150"}});
        refresh.resource_lock = "venv";
        refresh.lock_timeout = 10s;
        StageSpec& preview = addStage(*definition, "preview", "hold", {"refresh"}, {{"ms", "150"}});
        preview.resource_lock = "venv";
        preview.lock_timeout = 10s;
        return definition;
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

    PipelineEngine::Config config_;
    std::shared_ptr<ActionRegistry> actions_;
    std::unique_ptr<PipelineEngine> engine_;

    std::atomic<int> inside_{0};
    std::atomic<int> peak_inside_{0};
    std::mutex intervals_mutex_;
    std::vector<Interval> intervals_;
};

// ============================================================================
// EN: Dependency scheduling / FR: Ordonnancement des dépendances
// ============================================================================

TEST_F(PipelineEngineTest, ChainRunsInDependencyOrder) {
    auto definition = makeDefinition("refresh-stack");
    addStage(*definition, "lint", "hold", {}, {{"ms", "50"}});
    addStage(*definition, "refresh", "hold", {"lint"}, {{"ms", "50"}});
    addStage(*definition, "preview", "hold", {"refresh"}, {{"ms", "50"}});

    auto report = engine().run(definition);

    EXPECT_EQ(report.status, RunStatus::SUCCEEDED);
    EXPECT_EQ(report.exitCode(), 0);
    EXPECT_EQ(report.countStages(StageStatus::SUCCEEDED), 3u);
    ASSERT_EQ(report.stages.size(), 3u);
    EXPECT_EQ(report.stages[0].stage_name, "lint");

    auto all = intervals();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_LE(intervalOf(all, "lint")->end, intervalOf(all, "refresh")->start);
    EXPECT_LE(intervalOf(all, "refresh")->end, intervalOf(all, "preview")->start);
}

TEST_F(PipelineEngineTest, IndependentStagesRunInParallel) {
    auto definition = makeDefinition("fan-out");
    addStage(*definition, "unit", "hold", {}, {{"ms", "300"}});
    addStage(*definition, "lint", "hold", {}, {{"ms", "300"}});
    addStage(*definition, "docs", "hold", {}, {{"ms", "300"}});

    auto report = engine().run(definition);

    EXPECT_EQ(report.status, RunStatus::SUCCEEDED);
    EXPECT_EQ(peak_inside_.load(), 3);
}

TEST_F(PipelineEngineTest, MaxParallelismBoundsRunningStages) {
    config_.max_parallelism = 1;
    auto definition = makeDefinition("fan-out");
    addStage(*definition, "unit", "hold", {}, {{"ms", "60"}});
    addStage(*definition, "lint", "hold", {}, {{"ms", "60"}});
    addStage(*definition, "docs", "hold", {}, {{"ms", "60"}});

    auto report = engine().run(definition);

    EXPECT_EQ(report.status, RunStatus::SUCCEEDED);
    EXPECT_EQ(peak_inside_.load(), 1);
}

TEST_F(PipelineEngineTest, ConditionSkipSatisfiesDependents) {
    auto definition = makeDefinition("refresh-stack");
    addStage(*definition, "refresh", "noop");
    StageSpec& preview = addStage(*definition, "preview", "noop", {"refresh"});
    preview.condition = std::make_shared<const ConditionExpression>(
        ConditionExpression::parse("PULUMI_PREVIEW == 'true'"));
    addStage(*definition, "summary", "noop", {"preview"});

    auto report = engine().run(definition, {{"PULUMI_PREVIEW", "false"}});

    EXPECT_EQ(report.status, RunStatus::SUCCEEDED);
    EXPECT_EQ(report.findStage("preview")->status, StageStatus::SKIPPED_BY_CONDITION);
    EXPECT_EQ(report.findStage("preview")->error_message, "condition is false: PULUMI_PREVIEW == 'true'");
    EXPECT_EQ(report.findStage("summary")->status, StageStatus::SUCCEEDED);

    auto second = engine().run(definition, {{"PULUMI_PREVIEW", "true"}});
    EXPECT_EQ(second.findStage("preview")->status, StageStatus::SUCCEEDED);
}

TEST_F(PipelineEngineTest, UpstreamFailureSkipsOnlyTheSubtree) {
    auto definition = makeDefinition("release");
    addStage(*definition, "build", "fail");
    addStage(*definition, "test", "noop", {"build"});
    addStage(*definition, "deploy", "noop", {"test"});
    addStage(*definition, "docs", "hold", {}, {{"ms", "20"}});

    auto report = engine().run(definition);

    EXPECT_EQ(report.status, RunStatus::FAILED);
    EXPECT_EQ(report.exitCode(), 1);
    EXPECT_EQ(report.findStage("build")->status, StageStatus::FAILED);
    EXPECT_EQ(report.findStage("build")->exit_code, 2);
    EXPECT_EQ(report.findStage("test")->status, StageStatus::SKIPPED_BY_UPSTREAM_FAILURE);
    EXPECT_EQ(report.findStage("test")->error_message, "upstream stage 'build' did not complete");
    EXPECT_EQ(report.findStage("deploy")->status, StageStatus::SKIPPED_BY_UPSTREAM_FAILURE);
    EXPECT_EQ(report.findStage("deploy")->error_message, "upstream stage 'test' did not complete");
    EXPECT_EQ(report.findStage("docs")->status, StageStatus::SUCCEEDED);
}

TEST_F(PipelineEngineTest, StageTimeoutFailsTheRun) {
    auto definition = makeDefinition("slow");
    StageSpec& stage = addStage(*definition, "wait", "sleep", {}, {{"duration", "10s"}});
    stage.timeout = 100ms;
    addStage(*definition, "after", "noop", {"wait"});

    auto start = std::chrono::steady_clock::now();
    auto report = engine().run(definition);

    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    EXPECT_EQ(report.status, RunStatus::FAILED);
    EXPECT_EQ(report.findStage("wait")->status, StageStatus::CANCELLED);
    EXPECT_EQ(report.findStage("wait")->error_kind, StageErrorKind::ACTION_TIMEOUT);
    EXPECT_EQ(report.findStage("after")->status, StageStatus::SKIPPED_BY_UPSTREAM_FAILURE);
    EXPECT_FALSE(report.cancelled_by_request);
}

// ============================================================================
// EN: Definition errors / FR: Erreurs de définition
// ============================================================================

TEST_F(PipelineEngineTest, CycleIsRejectedBeforeDispatch) {
    std::atomic<int> events{0};
    engine().registerEventCallback([&events](const PipelineEvent&) { events++; });

    auto definition = makeDefinition("cyclic");
    addStage(*definition, "setup", "hold", {}, {{"ms", "10"}});
    addStage(*definition, "a", "noop", {"setup", "b"});
    addStage(*definition, "b", "noop", {"a"});

    try {
        engine().run(definition);
        FAIL() << "expected DefinitionError";
    } catch (const DefinitionError& e) {
        EXPECT_THAT(e.problems(), Contains("dependency cycle: a -> b -> a"));
    }

    EXPECT_TRUE(intervals().empty());
    EXPECT_EQ(events.load(), 0);
    EXPECT_TRUE(engine().getRunHistory().empty());
    EXPECT_EQ(engine().getEngineStatistics().total_runs, 0u);
}

TEST_F(PipelineEngineTest, ValidationReportsEveryProblem) {
    auto definition = makeDefinition("broken");
    addStage(*definition, "deploy", "teleport", {"build"});
    addStage(*definition, "deploy", "noop");

    try {
        engine().validate(*definition);
        FAIL() << "expected DefinitionError";
    } catch (const DefinitionError& e) {
        EXPECT_THAT(e.problems(), Contains("duplicate stage name 'deploy'"));
        EXPECT_THAT(e.problems(), Contains("stage 'deploy' needs unknown stage 'build'"));
        EXPECT_THAT(e.problems(), Contains("stage 'deploy': unknown action 'teleport'"));
        EXPECT_EQ(e.source(), "broken");
    }

    EXPECT_THROW(engine().validate(*makeDefinition("empty")), DefinitionError);
}

TEST_F(PipelineEngineTest, MissingRequiredInputIsADefinitionError) {
    auto definition = makeDefinition("deploy");
    PipelineInput region;
    region.name = "AWS_REGION";
    region.required = true;
    definition->inputs.push_back(region);
    addStage(*definition, "refresh", "noop");

    try {
        engine().run(definition);
        FAIL() << "expected DefinitionError";
    } catch (const DefinitionError& e) {
        EXPECT_THAT(e.problems(), Contains("missing required input 'AWS_REGION'"));
    }

    auto report = engine().run(definition, {{"AWS_REGION", "eu-west-1"}});
    EXPECT_EQ(report.status, RunStatus::SUCCEEDED);
    EXPECT_EQ(report.parameters.at("AWS_REGION"), "eu-west-1");
}

TEST_F(PipelineEngineTest, NullDefinitionIsRejected) {
    EXPECT_THROW(engine().run(nullptr), std::invalid_argument);
}

// ============================================================================
// EN: Resource locks across runs / FR: Verrous de ressources entre runs
// ============================================================================

TEST_F(PipelineEngineTest, ConcurrentRunsSerializeOnTheSameLock) {
    auto definition = makeDefinition("refresh-stack");
    StageSpec& lint = addStage(*definition, "lint", "hold", {}, {{"ms", "250"}});
    lint.resource_lock = "mutex-venv-${runner.os}-py3.12.7";
    lint.lock_timeout = 10s;

    RunParameters parameters = {{"runner.os", "Linux"}};
    auto start = std::chrono::steady_clock::now();
    auto first = engine().runAsync(definition, parameters);
    auto second = engine().runAsync(definition, parameters);
    RunReport a = first.get();
    RunReport b = second.get();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(a.status, RunStatus::SUCCEEDED);
    EXPECT_EQ(b.status, RunStatus::SUCCEEDED);
    EXPECT_EQ(peak_inside_.load(), 1);
    EXPECT_GE(elapsed, 480ms);

    // EN: Exactly one of the two runs waited for the other.
    // FR: Exactement un des deux runs a attendu l'autre.
    auto waited = std::max(a.findStage("lint")->lock_wait_time, b.findStage("lint")->lock_wait_time);
    EXPECT_GE(waited, 200ms);

    auto stats = engine().getLockManager().getStats("mutex-venv-Linux-py3.12.7");
    EXPECT_EQ(stats.acquisitions, 2u);
    EXPECT_FALSE(stats.held);
}

TEST_F(PipelineEngineTest, FailedLintSkipsBothLockedStages) {
    auto report = engine().run(makeRefreshStack("fail"));

    EXPECT_EQ(report.status, RunStatus::FAILED);
    EXPECT_EQ(report.findStage("lint")->status, StageStatus::FAILED);
    EXPECT_EQ(report.findStage("refresh")->status, StageStatus::SKIPPED_BY_UPSTREAM_FAILURE);
    EXPECT_EQ(report.findStage("preview")->status, StageStatus::SKIPPED_BY_UPSTREAM_FAILURE);
    EXPECT_TRUE(intervals().empty());

    // EN: Skipped stages never touched the lock.
    // FR: Les étapes ignorées n'ont jamais touché le verrou.
    auto stats = engine().getLockManager().getStats("venv");
    EXPECT_EQ(stats.acquisitions, 0u);
    EXPECT_FALSE(stats.held);
}

TEST_F(PipelineEngineTest, ConcurrentRefreshStacksSerializeLockedStages) {
    auto definition = makeRefreshStack("hold");

    auto start = std::chrono::steady_clock::now();
    auto first = engine().runAsync(definition);
    auto second = engine().runAsync(definition);
    RunReport a = first.get();
    RunReport b = second.get();
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_EQ(a.status, RunStatus::SUCCEEDED);
    ASSERT_EQ(b.status, RunStatus::SUCCEEDED);

    auto all = intervals();
    ASSERT_EQ(all.size(), 6u);

    std::vector<const Interval*> locked;
    std::chrono::steady_clock::duration held{0};
    for (const auto* report : {&a, &b}) {
        const Interval* lint = intervalOf(all, report->run_id, "lint");
        const Interval* refresh = intervalOf(all, report->run_id, "refresh");
        const Interval* preview = intervalOf(all, report->run_id, "preview");
        ASSERT_NE(lint, nullptr);
        ASSERT_NE(refresh, nullptr);
        ASSERT_NE(preview, nullptr);
        EXPECT_LE(lint->end, refresh->start);
        EXPECT_LE(refresh->end, preview->start);
        locked.push_back(refresh);
        locked.push_back(preview);
        held += (refresh->end - refresh->start) + (preview->end - preview->start);
    }

    // EN: No two venv holders overlap, across runs included.
    // FR: Aucun détenteur du venv ne se chevauche, y compris entre runs.
    for (size_t i = 0; i < locked.size(); ++i) {
        for (size_t j = i + 1; j < locked.size(); ++j) {
            bool disjoint = locked[i]->end <= locked[j]->start || locked[j]->end <= locked[i]->start;
            EXPECT_TRUE(disjoint) << locked[i]->stage << " overlaps " << locked[j]->stage;
        }
    }
    EXPECT_GE(elapsed, held);

    auto stats = engine().getLockManager().getStats("venv");
    EXPECT_EQ(stats.acquisitions, 4u);
    EXPECT_FALSE(stats.held);
}

TEST_F(PipelineEngineTest, DifferentLocksDoNotSerialize) {
    auto definition = makeDefinition("two-stacks");
    StageSpec& dev = addStage(*definition, "refresh-dev", "hold", {}, {{"ms", "300"}});
    dev.resource_lock = "pulumi-state-dev";
    StageSpec& prod = addStage(*definition, "refresh-prod", "hold", {}, {{"ms", "300"}});
    prod.resource_lock = "pulumi-state-prod";

    auto report = engine().run(definition);

    EXPECT_EQ(report.status, RunStatus::SUCCEEDED);
    EXPECT_EQ(peak_inside_.load(), 2);
}

TEST_F(PipelineEngineTest, StagesOfOneRunShareLocksToo) {
    auto definition = makeDefinition("venv");
    StageSpec& first = addStage(*definition, "install", "hold", {}, {{"ms", "150"}});
    first.resource_lock = "venv";
    StageSpec& second = addStage(*definition, "lint", "hold", {}, {{"ms", "150"}});
    second.resource_lock = "venv";

    auto report = engine().run(definition);

    EXPECT_EQ(report.status, RunStatus::SUCCEEDED);
    EXPECT_EQ(peak_inside_.load(), 1);
}

TEST_F(PipelineEngineTest, LockTimeoutFailsTheStage) {
    auto definition = makeDefinition("refresh-stack");
    StageSpec& lint = addStage(*definition, "lint", "hold", {}, {{"ms", "10"}});
    lint.resource_lock = "venv";
    lint.lock_timeout = 150ms;
    addStage(*definition, "refresh", "noop", {"lint"});

    LockToken holder = engine().getLockManager().acquire("venv", 1s, "other-run/lint");
    auto report = engine().run(definition);
    holder.release();

    EXPECT_EQ(report.status, RunStatus::FAILED);
    const auto* stage = report.findStage("lint");
    EXPECT_EQ(stage->status, StageStatus::FAILED);
    EXPECT_EQ(stage->error_kind, StageErrorKind::LOCK_TIMEOUT);
    EXPECT_GE(stage->lock_wait_time, 140ms);
    EXPECT_EQ(report.findStage("refresh")->status, StageStatus::SKIPPED_BY_UPSTREAM_FAILURE);
    EXPECT_TRUE(intervals().empty());
}

// ============================================================================
// EN: Run control / FR: Contrôle des runs
// ============================================================================

TEST_F(PipelineEngineTest, CancelRunStopsRunningAndPendingStages) {
    auto definition = makeDefinition("long");
    addStage(*definition, "wait", "sleep", {}, {{"duration", "30s"}});
    addStage(*definition, "after", "noop", {"wait"});

    auto future = engine().runAsync(definition);
    ASSERT_TRUE(waitUntil([this]() { return !engine().getActiveRunIds().empty(); }));
    const std::string run_id = engine().getActiveRunIds().front();

    auto snapshot = engine().getRunReport(run_id);
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->status, RunStatus::RUNNING);

    EXPECT_TRUE(engine().cancelRun(run_id));
    EXPECT_FALSE(engine().cancelRun(run_id));

    RunReport report = future.get();
    EXPECT_EQ(report.status, RunStatus::CANCELLED);
    EXPECT_EQ(report.exitCode(), 2);
    EXPECT_TRUE(report.cancelled_by_request);
    EXPECT_EQ(report.cancel_reason, "cancelled by request");
    EXPECT_EQ(report.findStage("wait")->status, StageStatus::CANCELLED);
    EXPECT_EQ(report.findStage("wait")->error_kind, StageErrorKind::RUN_CANCELLED);
    EXPECT_NE(report.findStage("after")->status, StageStatus::SUCCEEDED);

    EXPECT_FALSE(engine().cancelRun("no-such-run"));
    EXPECT_TRUE(engine().getActiveRunIds().empty());
    EXPECT_EQ(engine().getEngineStatistics().cancelled_runs, 1u);
}

TEST_F(PipelineEngineTest, ShutdownCancelsAndRefusesRuns) {
    auto definition = makeDefinition("long");
    addStage(*definition, "wait", "sleep", {}, {{"duration", "30s"}});

    auto future = engine().runAsync(definition);
    ASSERT_TRUE(waitUntil([this]() { return !engine().getActiveRunIds().empty(); }));

    engine().shutdown();
    RunReport report = future.get();
    EXPECT_EQ(report.status, RunStatus::CANCELLED);
    EXPECT_EQ(report.cancel_reason, "engine shutdown");

    EXPECT_THROW(engine().run(definition), PipelineError);
    EXPECT_THROW(engine().runAsync(definition).get(), PipelineError);
}

TEST_F(PipelineEngineTest, EngineMayBeDestroyedRightAfterRunAsync) {
    auto definition = makeDefinition("short-lived");
    addStage(*definition, "wait", "sleep", {}, {{"duration", "5s"}});

    for (int i = 0; i < 20; ++i) {
        std::future<RunReport> future;
        {
            PipelineEngine local(config_, actions_);
            future = local.runAsync(definition);
        }

        // EN: Either the run was registered and cancelled by shutdown, or it was refused.
        // FR: Soit le run a été enregistré puis annulé par l'arrêt, soit il a été refusé.
        try {
            RunReport report = future.get();
            EXPECT_EQ(report.status, RunStatus::CANCELLED);
            EXPECT_EQ(report.cancel_reason, "engine shutdown");
        } catch (const PipelineError& e) {
            EXPECT_THAT(e.what(), HasSubstr("shutting down"));
        }
    }
}

TEST_F(PipelineEngineTest, EventsFollowTheRun) {
    std::mutex mutex;
    std::vector<PipelineEvent> events;
    engine().registerEventCallback([&](const PipelineEvent& event) {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(event);
    });

    auto definition = makeDefinition("events");
    addStage(*definition, "build", "noop");
    StageSpec& skipped = addStage(*definition, "publish", "noop", {"build"});
    skipped.condition = std::make_shared<const ConditionExpression>(ConditionExpression::parse("false"));

    auto report = engine().run(definition);
    engine().unregisterEventCallback();

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_GE(events.size(), 4u);
    EXPECT_EQ(events.front().type, PipelineEventType::RUN_STARTED);
    EXPECT_EQ(events.back().type, PipelineEventType::RUN_COMPLETED);
    for (const auto& event : events) {
        EXPECT_EQ(event.run_id, report.run_id);
        EXPECT_EQ(event.pipeline_name, "events");
    }

    auto count = [&events](PipelineEventType type, const std::string& stage) {
        return std::count_if(events.begin(), events.end(), [&](const PipelineEvent& event) {
            return event.type == type && event.stage_name == stage;
        });
    };
    EXPECT_EQ(count(PipelineEventType::STAGE_STARTED, "build"), 1);
    EXPECT_EQ(count(PipelineEventType::STAGE_COMPLETED, "build"), 1);
    EXPECT_EQ(count(PipelineEventType::STAGE_SKIPPED, "publish"), 1);
    EXPECT_EQ(count(PipelineEventType::STAGE_STARTED, "publish"), 0);
}

TEST_F(PipelineEngineTest, FailingEventCallbackDoesNotBreakTheRun) {
    engine().registerEventCallback([](const PipelineEvent&) { throw std::runtime_error("observer crashed"); });

    auto definition = makeDefinition("robust");
    addStage(*definition, "build", "noop");

    EXPECT_EQ(engine().run(definition).status, RunStatus::SUCCEEDED);
}

TEST_F(PipelineEngineTest, HistoryIsBoundedAndStatisticsAccumulate) {
    config_.max_run_history = 2;
    auto ok = makeDefinition("ok");
    addStage(*ok, "build", "noop");
    auto broken = makeDefinition("broken");
    addStage(*broken, "build", "fail");

    auto first = engine().run(ok);
    auto second = engine().run(broken);
    auto third = engine().run(ok);

    auto history = engine().getRunHistory();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].run_id, second.run_id);
    EXPECT_EQ(history[1].run_id, third.run_id);

    EXPECT_FALSE(engine().getRunReport(first.run_id).has_value());
    ASSERT_TRUE(engine().getRunReport(third.run_id).has_value());
    EXPECT_EQ(engine().getRunReport(third.run_id)->status, RunStatus::SUCCEEDED);

    auto stats = engine().getEngineStatistics();
    EXPECT_EQ(stats.total_runs, 3u);
    EXPECT_EQ(stats.successful_runs, 2u);
    EXPECT_EQ(stats.failed_runs, 1u);
    EXPECT_EQ(stats.active_runs, 0u);
    EXPECT_EQ(stats.total_stages_executed, 3u);
}

TEST_F(PipelineEngineTest, RunIdsAreUnique) {
    auto definition = makeDefinition("refresh-stack");
    addStage(*definition, "build", "noop");

    auto a = engine().run(definition);
    auto b = engine().run(definition);

    EXPECT_NE(a.run_id, b.run_id);
    EXPECT_EQ(a.run_id.rfind("refresh-stack-", 0), 0u);
    EXPECT_EQ(a.definition_checksum, definition->checksum);
}

TEST_F(PipelineEngineTest, RunnerContextIsInjected) {
    config_.inject_runner_context = true;
    auto definition = makeDefinition("ctx");
    StageSpec& stage = addStage(*definition, "linux-only", "noop");
    stage.condition = std::make_shared<const ConditionExpression>(ConditionExpression::parse("runner.os != ''"));

    auto report = engine().run(definition, {{"runner.os", "Custom"}});

    EXPECT_EQ(report.parameters.count("runner.arch"), 1u);
    EXPECT_EQ(report.parameters.count("runner.host"), 1u);
    // EN: Supplied values win over detected ones.
    // FR: Les valeurs fournies l'emportent sur celles détectées.
    EXPECT_EQ(report.parameters.at("runner.os"), "Custom");
    EXPECT_EQ(report.findStage("linux-only")->status, StageStatus::SUCCEEDED);
}
