#include "test_helpers.hpp"
#include <effects/status.hpp>

class StatusTest : public ScratchTest {
protected:
    fs::path repo;
    fs::path worktree;

    void SetUp() override {
        ScratchTest::SetUp();
        repo = test_dir / "repo";
        worktree = test_dir / "wt";
        fs::create_directories(worktree);
        write_file("repo/.env", "X=1");
    }

    WorktreeContext ctx() const { return WorktreeContext("b", worktree, repo); }

    bool try_symlink(const fs::path& source, const fs::path& target) {
        std::error_code ec;
        fs::create_symlink(source, target, ec);
        return !ec;
    }

    static SymlinkDefinition mapping(const std::string& path) {
        SymlinkDefinition def;
        def.source = def.target = path;
        return def;
    }
};

TEST_F(StatusTest, MissingTarget) {
    auto st = inspect_mapping(mapping(".env"), ctx());
    EXPECT_EQ(st.state, StatusState::Missing);
}

TEST_F(StatusTest, CorrectLinkIsOk) {
    if (!try_symlink(repo / ".env", worktree / ".env")) GTEST_SKIP() << "no symlink support";
    auto st = inspect_mapping(mapping(".env"), ctx());
    EXPECT_EQ(st.state, StatusState::Ok);
    EXPECT_EQ(st.detail, "linked");
}

TEST_F(StatusTest, DanglingLinkIsError) {
    if (!try_symlink(repo / "gone", worktree / ".env")) GTEST_SKIP() << "no symlink support";
    auto st = inspect_mapping(mapping(".env"), ctx());
    EXPECT_EQ(st.state, StatusState::Error);
    EXPECT_NE(st.detail.find("dangling"), std::string::npos);
}

TEST_F(StatusTest, LinkElsewhereIsWarning) {
    write_file("other", "Y=2");
    if (!try_symlink(test_dir / "other", worktree / ".env")) GTEST_SKIP() << "no symlink support";
    auto st = inspect_mapping(mapping(".env"), ctx());
    EXPECT_EQ(st.state, StatusState::Warning);
}

TEST_F(StatusTest, CopyMappingPresentIsOk) {
    write_file("wt/.env", "X=1");
    auto def = mapping(".env");
    def.mapping_type = MappingType::Copy;
    auto st = inspect_mapping(def, ctx());
    EXPECT_EQ(st.state, StatusState::Ok);
}

TEST_F(StatusTest, DeriveKeepsOrder) {
    auto all = derive_status({mapping(".env"), mapping("nothing")}, ctx());
    ASSERT_EQ(all.size(), 2u);
    EXPECT_NE(all[0].target.find(".env"), std::string::npos);
    EXPECT_NE(all[1].target.find("nothing"), std::string::npos);
}
