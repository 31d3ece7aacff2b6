#include "test_helpers.hpp"
#include <effects/effect_chain.hpp>
#include <effects/report.hpp>
#include <stdexcept>

// Scripted effect recording its calls into a shared journal.
class FakeEffect : public Effect {
public:
    enum class Outcome { Succeed, Fail, Timeout, Throw };

    FakeEffect(std::string id, std::vector<std::string>& journal,
               Outcome outcome = Outcome::Succeed, bool continue_on_error = false)
        : id_(std::move(id)), journal_(journal), outcome_(outcome),
          continue_on_error_(continue_on_error) {}

    bool applicable = true;

    bool can_apply(const WorktreeContext&) const override { return applicable; }

    Result<EffectResult> apply(const WorktreeContext&) override {
        journal_.push_back("apply " + id_);
        switch (outcome_) {
            case Outcome::Succeed:
                return Result<EffectResult>::Ok(EffectResult::ok("fake", id_, "done"));
            case Outcome::Fail:
                return Result<EffectResult>::Err(ErrorKind::EffectCritical, id_ + " broke");
            case Outcome::Timeout:
                return Result<EffectResult>::Err(ErrorKind::Timeout, "timed out after 1s");
            case Outcome::Throw:
                throw std::runtime_error("disk on fire");
        }
        return Result<EffectResult>::Err("unreachable");
    }

    Result<void> rollback(const WorktreeContext&) override {
        journal_.push_back("rollback " + id_);
        return Result<void>::Ok();
    }

    std::string effect_type() const override { return "fake"; }
    bool continue_on_error() const override { return continue_on_error_; }
    std::string describe(const WorktreeContext&) const override { return "fake " + id_; }
    std::string target(const WorktreeContext&) const override { return id_; }

private:
    std::string id_;
    std::vector<std::string>& journal_;
    Outcome outcome_;
    bool continue_on_error_;
};

class EffectChainTest : public ::testing::Test {
protected:
    std::vector<std::string> journal;
    WorktreeContext ctx{"b", "/tmp/wt", "/tmp/repo"};

    std::unique_ptr<FakeEffect> fake(const std::string& id,
                                     FakeEffect::Outcome outcome = FakeEffect::Outcome::Succeed,
                                     bool continue_on_error = false) {
        return std::make_unique<FakeEffect>(id, journal, outcome, continue_on_error);
    }
};

TEST_F(EffectChainTest, EmptyPhaseCompletes) {
    EffectChain chain;
    auto report = chain.execute(LifecyclePhase::PostAdd, ctx);
    EXPECT_EQ(report.state, PhaseState::Completed);
    EXPECT_TRUE(report.results.empty());
}

TEST_F(EffectChainTest, RunsInDeclarationOrder) {
    EffectChain chain;
    chain.add(LifecyclePhase::PostAdd, fake("a"));
    chain.add(LifecyclePhase::PostAdd, fake("b"));
    chain.add(LifecyclePhase::PostAdd, fake("c"));
    chain.add(LifecyclePhase::PreAdd, fake("other-phase"));

    auto report = chain.execute(LifecyclePhase::PostAdd, ctx);
    EXPECT_EQ(report.state, PhaseState::Completed);
    ASSERT_EQ(report.results.size(), 3u);
    EXPECT_EQ(journal, (std::vector<std::string>{"apply a", "apply b", "apply c"}));
}

TEST_F(EffectChainTest, ContinueOnErrorIsolatesFailure) {
    EffectChain chain(ErrorHandling::Abort);
    chain.add(LifecyclePhase::PostAdd, fake("a", FakeEffect::Outcome::Fail, true));
    chain.add(LifecyclePhase::PostAdd, fake("b"));

    auto report = chain.execute(LifecyclePhase::PostAdd, ctx);
    EXPECT_EQ(report.state, PhaseState::Completed);
    ASSERT_EQ(report.results.size(), 2u);
    EXPECT_EQ(report.results[0].kind, EffectKind::Warning);
    EXPECT_EQ(report.results[0].error_kind, ErrorKind::EffectWarning);
    EXPECT_EQ(report.results[1].kind, EffectKind::Success);
    EXPECT_EQ(journal.back(), "apply b");
}

TEST_F(EffectChainTest, AbortStopsRemainingEffects) {
    EffectChain chain(ErrorHandling::Abort);
    chain.add(LifecyclePhase::PostAdd, fake("a", FakeEffect::Outcome::Fail));
    chain.add(LifecyclePhase::PostAdd, fake("b"));
    chain.add(LifecyclePhase::PostAdd, fake("c"));

    auto report = chain.execute(LifecyclePhase::PostAdd, ctx);
    EXPECT_TRUE(report.aborted());
    EXPECT_EQ(report.abort_kind, ErrorKind::EffectCritical);
    ASSERT_EQ(report.results.size(), 1u);
    EXPECT_EQ(report.results[0].kind, EffectKind::Failure);
    EXPECT_EQ(journal, (std::vector<std::string>{"apply a"}));
}

TEST_F(EffectChainTest, ContinuePolicyRecordsFailureAndMovesOn) {
    EffectChain chain(ErrorHandling::Continue);
    chain.add(LifecyclePhase::PostAdd, fake("a", FakeEffect::Outcome::Fail));
    chain.add(LifecyclePhase::PostAdd, fake("b"));

    auto report = chain.execute(LifecyclePhase::PostAdd, ctx);
    EXPECT_EQ(report.state, PhaseState::Completed);
    ASSERT_EQ(report.results.size(), 2u);
    EXPECT_EQ(report.results[0].kind, EffectKind::Failure);
    EXPECT_EQ(report.results[1].kind, EffectKind::Success);
}

TEST_F(EffectChainTest, TimeoutKindIsPreserved) {
    EffectChain chain;
    chain.add(LifecyclePhase::PostAdd, fake("slow", FakeEffect::Outcome::Timeout, true));
    auto report = chain.execute(LifecyclePhase::PostAdd, ctx);
    ASSERT_EQ(report.results.size(), 1u);
    EXPECT_EQ(report.results[0].kind, EffectKind::Warning);
    EXPECT_EQ(report.results[0].error_kind, ErrorKind::Timeout);
}

TEST_F(EffectChainTest, UnapplicableEffectIsSkipped) {
    EffectChain chain;
    auto skipped = fake("a");
    skipped->applicable = false;
    chain.add(LifecyclePhase::PostAdd, std::move(skipped));
    chain.add(LifecyclePhase::PostAdd, fake("b"));

    auto report = chain.execute(LifecyclePhase::PostAdd, ctx);
    ASSERT_EQ(report.results.size(), 2u);
    EXPECT_EQ(report.results[0].kind, EffectKind::Skipped);
    EXPECT_EQ(journal, (std::vector<std::string>{"apply b"}));
}

TEST_F(EffectChainTest, ExceptionBecomesFailure) {
    EffectChain chain;
    chain.add(LifecyclePhase::PostAdd, fake("a", FakeEffect::Outcome::Throw));
    auto report = chain.execute(LifecyclePhase::PostAdd, ctx);
    EXPECT_TRUE(report.aborted());
    EXPECT_NE(report.results[0].message.find("disk on fire"), std::string::npos);
}

TEST_F(EffectChainTest, RollbackRunsNewestFirst) {
    EffectChain chain;
    chain.add(LifecyclePhase::PostAdd, fake("a"));
    chain.add(LifecyclePhase::PostAdd, fake("b"));
    chain.add(LifecyclePhase::PostAdd, fake("c", FakeEffect::Outcome::Fail));

    auto report = chain.execute(LifecyclePhase::PostAdd, ctx);
    ASSERT_TRUE(report.aborted());
    auto errors = chain.rollback(LifecyclePhase::PostAdd, ctx);
    EXPECT_TRUE(errors.empty());
    EXPECT_EQ(journal, (std::vector<std::string>{"apply a", "apply b", "apply c",
                                                 "rollback b", "rollback a"}));
}

TEST_F(EffectChainTest, HooksAppendMarkersInOrder) {
#ifdef _WIN32
    GTEST_SKIP() << "uses POSIX shell commands";
#endif
    fs::path dir = fs::temp_directory_path() / "twin_chain_order_test";
    fs::remove_all(dir);
    fs::create_directories(dir);

    EffectPlan plan;
    for (const char* marker : {"one", "two", "three"}) {
        HookDefinition hook;
        hook.command = std::string("echo ") + marker + " >> markers.txt";
        plan.phases[LifecyclePhase::PostAdd].push_back(hook);
    }

    platform::CopyLinkStrategy links;
    RuntimeOptions options;
    EffectChain chain = build_effect_chain(plan, links, options);
    WorktreeContext here("b", dir, dir);
    auto report = chain.execute(LifecyclePhase::PostAdd, here);

    EXPECT_EQ(report.state, PhaseState::Completed);
    std::ifstream in(dir / "markers.txt");
    std::stringstream buf;
    buf << in.rdbuf();
    EXPECT_EQ(buf.str(), "one\ntwo\nthree\n");
    fs::remove_all(dir);
}

TEST_F(EffectChainTest, PlanMapsFilesToUnlinkInRemovePhases) {
    EffectPlan plan;
    SymlinkDefinition def;
    def.source = def.target = ".env";
    plan.phases[LifecyclePhase::PostAdd].push_back(def);
    plan.phases[LifecyclePhase::PreRemove].push_back(def);

    platform::CopyLinkStrategy links;
    EffectChain chain = build_effect_chain(plan, links, RuntimeOptions{});
    EXPECT_EQ(chain.size(LifecyclePhase::PostAdd), 1u);
    EXPECT_EQ(chain.size(LifecyclePhase::PreRemove), 1u);

    // Nothing linked yet: the unlink is skipped, not failed.
    auto report = chain.execute(LifecyclePhase::PreRemove, ctx);
    ASSERT_EQ(report.results.size(), 1u);
    EXPECT_EQ(report.results[0].effect_type, "unlink");
    EXPECT_EQ(report.results[0].kind, EffectKind::Skipped);
}

// ── OperationReport ──────────────────────────────────────────

static EffectResult result_of(EffectKind kind) {
    EffectResult r;
    r.kind = kind;
    r.success = kind == EffectKind::Success || kind == EffectKind::Skipped;
    return r;
}

TEST(OperationReport, WarningsAndSkipsDoNotFail) {
    OperationReport report("add", "/tmp/wt", "b");
    report.set_git_outcome({true, true, "created"});
    PhaseReport phase;
    phase.phase = LifecyclePhase::PostAdd;
    phase.state = PhaseState::Completed;
    phase.results = {result_of(EffectKind::Success), result_of(EffectKind::Skipped),
                     result_of(EffectKind::Warning)};
    report.add_phase(phase);

    EXPECT_TRUE(report.success());
    EXPECT_EQ(report.exit_code(), 0);
    EXPECT_EQ(report.summary(), "1 ok, 1 skipped, 1 warnings, 0 failed");
    EXPECT_TRUE(report.remediation().empty());
}

TEST(OperationReport, GitFailureFails) {
    OperationReport report("add", "/tmp/wt", "b");
    report.set_git_outcome({true, false, "fatal: already exists"});
    EXPECT_FALSE(report.success());
    EXPECT_EQ(report.exit_code(), 1);
}

TEST(OperationReport, AbortFailsWithRemediation) {
    OperationReport report("add", "/tmp/wt", "b");
    report.set_git_outcome({true, true, "created"});
    PhaseReport phase;
    phase.phase = LifecyclePhase::PostAdd;
    phase.state = PhaseState::Aborted;
    phase.results = {result_of(EffectKind::Failure)};
    report.add_phase(phase);

    EXPECT_FALSE(report.success());
    EXPECT_EQ(report.count(EffectKind::Failure), 1u);
    EXPECT_NE(report.remediation().find("/tmp/wt"), std::string::npos);
}

TEST(OperationReport, ContinuePolicyFailureStillSucceeds) {
    OperationReport report("add", "/tmp/wt", "b");
    report.set_git_outcome({true, true, "created"});
    PhaseReport phase;
    phase.phase = LifecyclePhase::PostAdd;
    phase.state = PhaseState::Completed;
    phase.results = {result_of(EffectKind::Failure)};
    report.add_phase(phase);
    EXPECT_TRUE(report.success());
}

TEST(OperationReport, LockErrorFails) {
    OperationReport report("remove", "/tmp/wt", "b");
    report.set_error(ErrorKind::LockAcquisition, "held by another invocation");
    EXPECT_FALSE(report.success());
    EXPECT_FALSE(report.git().attempted);
}
