#include "test_helpers.hpp"
#include <core/config.hpp>
#include <limits>

TEST(Config, EmptyDocumentGivesDefaults) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& s = r.value.settings();
    EXPECT_EQ(s.branch_prefix, "agent/");
    EXPECT_EQ(s.error_handling, ErrorHandling::Abort);
    EXPECT_EQ(s.link_mode, LinkMode::Auto);
    EXPECT_FALSE(s.rollback_on_abort);
    EXPECT_TRUE(s.lock.wait);
    EXPECT_EQ(s.lock.timeout_seconds, 30);
}

TEST(Config, FullDocument) {
    auto r = Config::parse(R"(
worktree_base: ../worktrees
branch_prefix: wt/
error_handling: continue
link_mode: copy
rollback_on_abort: true
lock:
  wait: false
  timeout_seconds: 5
files:
  - path: .env
    skip_if_exists: true
  - source: config/shared.json
    target: config/local.json
    mapping_type: copy
    description: shared settings
hooks:
  post_create:
    - "echo hi {name}"
    - command: npm
      args: [install, --silent]
      timeout: 300
      continue_on_error: true
      env:
        NODE_ENV: development
  pre_remove: "echo bye"
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& s = r.value.settings();
    EXPECT_EQ(s.worktree_base, "../worktrees");
    EXPECT_EQ(s.branch_prefix, "wt/");
    EXPECT_EQ(s.error_handling, ErrorHandling::Continue);
    EXPECT_EQ(s.link_mode, LinkMode::Copy);
    EXPECT_TRUE(s.rollback_on_abort);
    EXPECT_FALSE(s.lock.wait);
    EXPECT_EQ(s.lock.timeout_seconds, 5);

    ASSERT_EQ(s.files.size(), 2u);
    EXPECT_EQ(s.files[0].source, ".env");
    EXPECT_EQ(s.files[0].target, ".env");
    EXPECT_TRUE(s.files[0].skip_if_exists);
    EXPECT_EQ(s.files[1].target, "config/local.json");
    EXPECT_EQ(s.files[1].mapping_type, MappingType::Copy);

    const auto& post = s.hooks.at(LifecyclePhase::PostAdd);
    ASSERT_EQ(post.size(), 2u);
    EXPECT_EQ(post[0].command, "echo hi {name}");
    EXPECT_FALSE(post[0].args.has_value());
    EXPECT_EQ(post[0].timeout_seconds, 60u);
    EXPECT_EQ(post[1].command, "npm");
    ASSERT_TRUE(post[1].args.has_value());
    EXPECT_EQ(*post[1].args, (std::vector<std::string>{"install", "--silent"}));
    EXPECT_EQ(post[1].timeout_seconds, 300u);
    EXPECT_TRUE(post[1].continue_on_error);
    EXPECT_EQ(post[1].env.at("NODE_ENV"), "development");

    ASSERT_EQ(s.hooks.at(LifecyclePhase::PreRemove).size(), 1u);
}

TEST(Config, ZeroTimeoutMeansDefault) {
    auto r = Config::parse("hooks:\n  post_add:\n    - command: make\n      timeout: 0\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.settings().hooks.at(LifecyclePhase::PostAdd)[0].timeout_seconds, 60u);
}

TEST(Config, HugeLockTimeoutIsClamped) {
    auto r = Config::parse("lock:\n  timeout_seconds: 99999999999\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.settings().lock.timeout_seconds, std::numeric_limits<int>::max() / 1000);
}

TEST(Config, RejectsInvalidValues) {
    const char* bad[] = {
        "error_handling: sometimes\n",
        "link_mode: hard\n",
        "files:\n  - path: .env\n    mapping_type: hardlink\n",
        "files:\n  - description: nothing to link\n",
        "files:\n  - source: a\n    target: /etc/passwd\n",
        "files:\n  - source: a\n    target: ../outside\n",
        "hooks:\n  post_add:\n    - args: [x]\n",
        "hooks:\n  post_add:\n    - command: make\n      timeout: -1\n",
        "hooks:\n  on_merge: [echo]\n",
        "unknown_key: 1\n",
        "files: [unterminated\n",
    };
    for (const char* text : bad) {
        auto r = Config::parse(text, "twin.yaml");
        EXPECT_TRUE(r.is_err()) << text;
        EXPECT_EQ(r.kind, ErrorKind::Config) << text;
    }
}

TEST(Config, DotsInsideTargetAreAllowed) {
    auto r = Config::parse("files:\n  - source: a\n    target: sub/../b\n");
    EXPECT_TRUE(r.is_ok()) << r.error;
}

TEST(Config, EffectPlanOrdering) {
    auto r = Config::parse(R"(
files:
  - path: .env
hooks:
  pre_add: ["echo pre"]
  post_add: ["echo post"]
  pre_remove: ["echo teardown"]
  post_remove: ["echo gone"]
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    auto plan = r.value.effect_plan();

    const auto& post = plan.effects_for(LifecyclePhase::PostAdd);
    ASSERT_EQ(post.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<SymlinkDefinition>(post[0]));
    EXPECT_TRUE(std::holds_alternative<HookDefinition>(post[1]));

    const auto& pre_remove = plan.effects_for(LifecyclePhase::PreRemove);
    ASSERT_EQ(pre_remove.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<HookDefinition>(pre_remove[0]));
    EXPECT_TRUE(std::holds_alternative<SymlinkDefinition>(pre_remove[1]));

    EXPECT_EQ(plan.effects_for(LifecyclePhase::PreAdd).size(), 1u);
    EXPECT_EQ(plan.effects_for(LifecyclePhase::PostRemove).size(), 1u);
}

TEST(Config, MergePrefersProjectKeys) {
    auto global = Config::parse(R"(
branch_prefix: global/
link_mode: copy
files:
  - path: global.env
hooks:
  post_add: ["echo global"]
  pre_remove: ["echo global teardown"]
)");
    auto project = Config::parse(R"(
branch_prefix: project/
hooks:
  post_add: ["echo project"]
)");
    ASSERT_TRUE(global.is_ok() && project.is_ok());

    auto merged = Config::merge(global.value, project.value);
    const auto& s = merged.settings();
    EXPECT_EQ(s.branch_prefix, "project/");
    EXPECT_EQ(s.link_mode, LinkMode::Copy);
    ASSERT_EQ(s.files.size(), 1u);
    EXPECT_EQ(s.files[0].source, "global.env");
    EXPECT_EQ(s.hooks.at(LifecyclePhase::PostAdd)[0].command, "echo project");
    EXPECT_EQ(s.hooks.at(LifecyclePhase::PreRemove)[0].command, "echo global teardown");
}

TEST(Config, ToYamlRoundTripsThroughParser) {
    auto r = Config::parse("branch_prefix: x/\nfiles:\n  - path: .env\nhooks:\n  post_add: [\"echo hi\"]\n");
    ASSERT_TRUE(r.is_ok());
    auto again = Config::parse(r.value.to_yaml());
    ASSERT_TRUE(again.is_ok()) << again.error << "\n" << r.value.to_yaml();
    EXPECT_EQ(again.value.settings().branch_prefix, "x/");
    EXPECT_EQ(again.value.settings().files.size(), 1u);
}

class ConfigFileTest : public ScratchTest {};

TEST_F(ConfigFileTest, FindsConfigWalkingUp) {
    write_file("twin.yaml", "branch_prefix: found/\n");
    fs::create_directories(test_dir / "a" / "b");

    auto found = find_project_config(test_dir / "a" / "b");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(fs::canonical(*found), fs::canonical(test_dir / "twin.yaml"));

    auto loaded = Config::load_project(test_dir / "a" / "b");
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(loaded.value.settings().branch_prefix, "found/");
}

TEST_F(ConfigFileTest, HiddenNameIsAccepted) {
    write_file(".twin.yaml", "error_handling: continue\n");
    auto loaded = Config::load_project(test_dir);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(loaded.value.settings().error_handling, ErrorHandling::Continue);
}

TEST_F(ConfigFileTest, MissingExplicitFileIsNotFound) {
    auto r = Config::load_file(test_dir / "nope.yaml");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::NotFound);
}

TEST_F(ConfigFileTest, ExampleConfigParsesAndRefusesOverwrite) {
    auto written = create_example_project_config(test_dir, false);
    ASSERT_TRUE(written.is_ok()) << written.error;

    auto parsed = Config::load_file(written.value);
    ASSERT_TRUE(parsed.is_ok()) << parsed.error;
    EXPECT_FALSE(parsed.value.settings().files.empty());

    auto again = create_example_project_config(test_dir, false);
    ASSERT_TRUE(again.is_err());
    EXPECT_EQ(again.kind, ErrorKind::AlreadyExists);

    EXPECT_TRUE(create_example_project_config(test_dir, true).is_ok());
}
