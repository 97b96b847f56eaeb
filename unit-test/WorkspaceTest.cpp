#include <sys/stat.h>
#include <set>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "engine/workspace.hpp"
#include "gtest/gtest.h"
#include "test/environment.hpp"

using namespace std;
using namespace runner;

TEST(WorkspaceTest, CreatesSourceFile) {
    workspace_manager manager(RUN_DIR);
    filesystem::path root;
    {
        auto ws = manager.acquire(language::c, "int main() { return 0; }");
        root = ws->root_dir();
        EXPECT_EQ(root.parent_path().string(), RUN_DIR.string());
        EXPECT_EQ(root.filename().string().rfind("run-", 0), 0u);
        EXPECT_EQ(ws->source_name(), "main.c");
        EXPECT_EQ(ws->source_file().string(), (root / "main.c").string());
        EXPECT_EQ(read_file_content(ws->source_file()), "int main() { return 0; }");
        EXPECT_FALSE(ws->binary_file);

        struct stat st;
        ASSERT_EQ(stat(root.c_str(), &st), 0);
        EXPECT_EQ(st.st_mode & 0777, 0700u);
    }
    EXPECT_FALSE(filesystem::exists(root));
}

TEST(WorkspaceTest, UniqueDirectories) {
    workspace_manager manager(RUN_DIR);
    set<filesystem::path> roots;
    vector<unique_ptr<workspace>> workspaces;
    for (int i = 0; i < 20; ++i) {
        workspaces.push_back(manager.acquire(language::python, "print(1)"));
        roots.insert(workspaces.back()->root_dir());
    }
    EXPECT_EQ(roots.size(), 20u);
    workspaces.clear();
    for (auto &root : roots)
        EXPECT_FALSE(filesystem::exists(root));
}

TEST(WorkspaceTest, RemovedOnException) {
    workspace_manager manager(RUN_DIR);
    filesystem::path root;
    try {
        auto ws = manager.acquire(language::python, "print(1)");
        root = ws->root_dir();
        write_file_content(ws->root_dir() / "artifact", "data");
        throw runtime_error("failure during execution");
    } catch (runtime_error &) {
    }
    ASSERT_FALSE(root.empty());
    EXPECT_FALSE(filesystem::exists(root));
}

TEST(WorkspaceTest, CreationFailureRaisesWorkspaceError) {
    // run_dir 的父路径是一个普通文件，无法创建目录
    filesystem::path blocker = RUN_DIR / "not-a-directory";
    write_file_content(blocker, "");
    workspace_manager manager(blocker / "run");
    EXPECT_THROW(manager.acquire(language::python, "print(1)"), workspace_error);
    filesystem::remove(blocker);
}

TEST(WorkspaceTest, CleanStale) {
    filesystem::path dir = RUN_DIR / "clean";
    filesystem::create_directories(dir / "run-stale-1");
    filesystem::create_directories(dir / "run-stale-2" / "nested");
    filesystem::create_directories(dir / "keep");
    workspace_manager manager(dir);
    EXPECT_EQ(manager.clean_stale(), 2u);
    EXPECT_FALSE(filesystem::exists(dir / "run-stale-1"));
    EXPECT_TRUE(filesystem::exists(dir / "keep"));
    filesystem::remove_all(dir);
}

TEST(SafePathTest, RejectsTraversal) {
    EXPECT_EQ(assert_safe_path("run-abc"), "run-abc");
    EXPECT_THROW(assert_safe_path(".."), std::exception);
    EXPECT_THROW(assert_safe_path("a/b"), std::exception);
    EXPECT_THROW(assert_safe_path(""), std::exception);
}
