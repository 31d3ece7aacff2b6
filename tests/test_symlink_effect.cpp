#include "test_helpers.hpp"
#include <effects/symlink_effect.hpp>
#include <platform/link_strategy.hpp>

// Native linking always refused, as on Windows without Developer Mode.
class DeniedLinkStrategy : public platform::LinkStrategy {
public:
    std::error_code create_link(const fs::path&, const fs::path&) override {
        attempts++;
        return std::make_error_code(std::errc::permission_denied);
    }
    std::error_code remove_link(const fs::path& target) override {
        std::error_code ec;
        fs::remove(target, ec);
        return ec;
    }
    bool supports_native_symlink() const override { return true; }
    std::string name() const override { return "denied"; }
    std::string manual_instructions(const fs::path&, const fs::path&) const override {
        return "ln -s";
    }

    int attempts = 0;
};

class SymlinkEffectTest : public ScratchTest {
protected:
    fs::path repo;
    fs::path worktree;
    RuntimeOptions options;
    std::unique_ptr<platform::LinkStrategy> native = platform::make_native_link_strategy();

    void SetUp() override {
        ScratchTest::SetUp();
        repo = test_dir / "repo";
        worktree = test_dir / "wt";
        fs::create_directories(repo);
        fs::create_directories(worktree);
        write_file("repo/.env", "API_KEY=123\n");
        write_file("repo/config/settings.json", "{\"debug\": true}\n");
    }

    WorktreeContext ctx() const { return WorktreeContext("feature-x", worktree, repo); }

    static SymlinkDefinition mapping(const std::string& source, const std::string& target = "") {
        SymlinkDefinition def;
        def.source = source;
        def.target = target.empty() ? source : target;
        return def;
    }
};

TEST_F(SymlinkEffectTest, CreatesTargetWithIdenticalContent) {
    SymlinkEffect effect(mapping(".env"), *native, options);
    ASSERT_TRUE(effect.can_apply(ctx()));

    auto r = effect.apply(ctx());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.kind, EffectKind::Success);
    EXPECT_TRUE(fs::exists(worktree / ".env"));
    EXPECT_EQ(read_file(worktree / ".env"), "API_KEY=123\n");
}

TEST_F(SymlinkEffectTest, CreatesParentDirectories) {
    SymlinkEffect effect(mapping("config/settings.json", "nested/deeper/settings.json"), *native, options);
    auto r = effect.apply(ctx());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(read_file(worktree / "nested/deeper/settings.json"), "{\"debug\": true}\n");
}

TEST_F(SymlinkEffectTest, SkipIfExistsIsIdempotent) {
    auto def = mapping(".env");
    def.skip_if_exists = true;

    SymlinkEffect first(def, *native, options);
    ASSERT_TRUE(first.apply(ctx()).is_ok());

    SymlinkEffect second(def, *native, options);
    auto r = second.apply(ctx());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.kind, EffectKind::Skipped);
    EXPECT_EQ(read_file(worktree / ".env"), "API_KEY=123\n");
}

TEST_F(SymlinkEffectTest, ReplacesExistingFileWithoutSkip) {
    write_file("wt/.env", "stale");
    SymlinkEffect effect(mapping(".env"), *native, options);
    auto r = effect.apply(ctx());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(read_file(worktree / ".env"), "API_KEY=123\n");
}

TEST_F(SymlinkEffectTest, MissingSourceCannotApply) {
    SymlinkEffect effect(mapping("does-not-exist"), *native, options);
    EXPECT_FALSE(effect.can_apply(ctx()));
    EXPECT_NE(effect.skip_reason(ctx()).find("source missing"), std::string::npos);
}

TEST_F(SymlinkEffectTest, PermissionDeniedFallsBackToCopy) {
    DeniedLinkStrategy denied;
    SymlinkEffect effect(mapping(".env"), denied, options);

    auto r = effect.apply(ctx());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(denied.attempts, 1);
    EXPECT_TRUE(r.value.success);
    EXPECT_EQ(r.value.error_kind, ErrorKind::EffectRecoverable);
    EXPECT_NE(r.value.message.find("fallback: copy used"), std::string::npos);
    EXPECT_FALSE(fs::is_symlink(fs::symlink_status(worktree / ".env")));
    EXPECT_TRUE(fs::is_regular_file(worktree / ".env"));
    EXPECT_EQ(read_file(worktree / ".env"), "API_KEY=123\n");
}

TEST_F(SymlinkEffectTest, CopyStrategyCopiesDirectories) {
    write_file("repo/data/a.txt", "a");
    write_file("repo/data/sub/b.txt", "b");
    platform::CopyLinkStrategy copy;
    SymlinkEffect effect(mapping("data"), copy, options);

    auto r = effect.apply(ctx());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_FALSE(fs::is_symlink(fs::symlink_status(worktree / "data")));
    EXPECT_EQ(read_file(worktree / "data/a.txt"), "a");
    EXPECT_EQ(read_file(worktree / "data/sub/b.txt"), "b");
}

TEST_F(SymlinkEffectTest, CopyMappingNeverLinks) {
    auto def = mapping(".env");
    def.mapping_type = MappingType::Copy;
    SymlinkEffect effect(def, *native, options);

    auto r = effect.apply(ctx());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.effect_type, "copy");
    EXPECT_FALSE(fs::is_symlink(fs::symlink_status(worktree / ".env")));
}

TEST_F(SymlinkEffectTest, DryRunTouchesNothing) {
    options.dry_run = true;
    SymlinkEffect effect(mapping(".env"), *native, options);
    auto r = effect.apply(ctx());
    ASSERT_TRUE(r.is_ok());
    EXPECT_NE(r.value.message.find("[dry run]"), std::string::npos);
    EXPECT_FALSE(fs::exists(fs::symlink_status(worktree / ".env")));
}

TEST_F(SymlinkEffectTest, TemplatedTargetEscapingWorktreeFails) {
    WorktreeContext escaping("..", worktree, repo);
    SymlinkEffect effect(mapping(".env", "{branch}/{branch}/leak"), *native, options);
    auto r = effect.apply(escaping);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::InvalidArgument);
}

TEST_F(SymlinkEffectTest, RollbackRemovesCreatedTarget) {
    SymlinkEffect effect(mapping(".env"), *native, options);
    ASSERT_TRUE(effect.apply(ctx()).is_ok());
    ASSERT_TRUE(effect.rollback(ctx()).is_ok());
    EXPECT_FALSE(fs::exists(fs::symlink_status(worktree / ".env")));
    EXPECT_TRUE(fs::exists(repo / ".env"));
}

TEST_F(SymlinkEffectTest, RollbackOfMergedCopyKeepsExistingFiles) {
    write_file("wt/config/tracked.txt", "checked out");
    write_file("repo/shared/settings.json", "{}");
    write_file("repo/shared/nested/extra.txt", "x");
    auto def = mapping("shared", "config");
    def.mapping_type = MappingType::Copy;
    SymlinkEffect effect(def, *native, options);

    auto r = effect.apply(ctx());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(read_file(worktree / "config/settings.json"), "{}");

    ASSERT_TRUE(effect.rollback(ctx()).is_ok());
    EXPECT_EQ(read_file(worktree / "config/tracked.txt"), "checked out");
    EXPECT_FALSE(fs::exists(worktree / "config/settings.json"));
    EXPECT_FALSE(fs::exists(worktree / "config/nested"));
}

#ifndef _WIN32
TEST_F(SymlinkEffectTest, CopyKeepsExecutableBit) {
    auto script = write_file("repo/tools/run.sh", "#!/bin/sh\necho hi\n");
    fs::permissions(script, fs::perms::owner_all | fs::perms::group_read |
                    fs::perms::group_exec, fs::perm_options::replace);
    auto def = mapping("tools/run.sh");
    def.mapping_type = MappingType::Copy;
    SymlinkEffect effect(def, *native, options);

    ASSERT_TRUE(effect.apply(ctx()).is_ok());
    auto perms = fs::status(worktree / "tools/run.sh").permissions();
    EXPECT_NE(perms & fs::perms::owner_exec, fs::perms::none);
    EXPECT_NE(perms & fs::perms::group_exec, fs::perms::none);
    EXPECT_EQ(perms & fs::perms::others_all, fs::perms::none);
}

TEST_F(SymlinkEffectTest, CopyKeepsPrivateDirectoryMode) {
    write_file("repo/secrets/key", "k");
    fs::permissions(repo / "secrets", fs::perms::owner_all, fs::perm_options::replace);
    platform::CopyLinkStrategy copy;
    SymlinkEffect effect(mapping("secrets"), copy, options);

    ASSERT_TRUE(effect.apply(ctx()).is_ok());
    EXPECT_EQ(fs::status(worktree / "secrets").permissions() & fs::perms::all,
              fs::perms::owner_all);
    EXPECT_EQ(read_file(worktree / "secrets/key"), "k");
}
#endif

TEST_F(SymlinkEffectTest, UnlinkRemovesManagedLink) {
    SymlinkEffect link(mapping(".env"), *native, options);
    auto applied = link.apply(ctx());
    ASSERT_TRUE(applied.is_ok());
    if (applied.value.error_kind == ErrorKind::EffectRecoverable) {
        GTEST_SKIP() << "native symlinks unavailable on this machine";
    }

    UnlinkEffect unlink(mapping(".env"), *native, options);
    ASSERT_TRUE(unlink.can_apply(ctx()));
    auto r = unlink.apply(ctx());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_FALSE(fs::exists(fs::symlink_status(worktree / ".env")));
    EXPECT_EQ(read_file(repo / ".env"), "API_KEY=123\n");
}

TEST_F(SymlinkEffectTest, UnlinkPreservesRegularFiles) {
    write_file("wt/.env", "local edits");
    UnlinkEffect unlink(mapping(".env"), *native, options);
    EXPECT_FALSE(unlink.can_apply(ctx()));
    EXPECT_EQ(unlink.skip_reason(ctx()), "not a symlink, preserved");
    EXPECT_EQ(read_file(worktree / ".env"), "local edits");
}

TEST_F(SymlinkEffectTest, UnlinkPreservesCopyMappings) {
    auto def = mapping(".env");
    def.mapping_type = MappingType::Copy;
    write_file("wt/.env", "copied");
    UnlinkEffect unlink(def, *native, options);
    EXPECT_FALSE(unlink.can_apply(ctx()));
    EXPECT_EQ(unlink.skip_reason(ctx()), "copy-mode target preserved");
}
