#include <filesystem>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/transpile_errors.hpp"
#include "session/workspace_manager.hpp"
#include "test_support.hpp"

namespace {

using transpiler::core::errors::ErrorCategory;
using transpiler::core::errors::get_error;
using transpiler::core::errors::get_value;
using transpiler::core::errors::is_error;
using transpiler::session::ScopedWorkspace;
using transpiler::session::Workspace;
using transpiler::session::WorkspaceManager;
using transpiler::testing::TempDir;
using transpiler::testing::count_entries;
using transpiler::testing::read_file;

TEST(WorkspaceManagerTest, AcquireWritesSourceVerbatim) {
    TempDir dir("workspace");
    WorkspaceManager manager(dir.root() / "ws");

    const std::string source = "def f(x):\n\treturn x+1\n# \xc3\xa9 'quoted' \"$(rm -rf /)\"\n";
    auto acquired = manager.acquire(source);
    ASSERT_FALSE(is_error(acquired));
    const auto& workspace = get_value(acquired);

    EXPECT_TRUE(std::filesystem::is_directory(workspace.root_dir));
    EXPECT_EQ(workspace.input_file.parent_path(), workspace.root_dir);
    EXPECT_EQ(workspace.input_file.extension(), ".py");
    EXPECT_EQ(read_file(workspace.input_file), source);
    EXPECT_EQ(manager.acquired_count(), 1u);

    manager.release(workspace);
    EXPECT_FALSE(std::filesystem::exists(workspace.root_dir));
    EXPECT_EQ(manager.released_count(), 1u);
}

TEST(WorkspaceManagerTest, ReleaseIsIdempotent) {
    TempDir dir("workspace");
    WorkspaceManager manager(dir.root());

    auto acquired = manager.acquire("x = 1\n");
    ASSERT_FALSE(is_error(acquired));
    const auto workspace = get_value(acquired);

    manager.release(workspace);
    manager.release(workspace);
    EXPECT_FALSE(std::filesystem::exists(workspace.root_dir));
    EXPECT_EQ(manager.released_count(), 1u);
    EXPECT_EQ(count_entries(dir.root()), 0u);
}

TEST(WorkspaceManagerTest, ReleaseRefusesPathsOutsideBaseDir) {
    TempDir dir("workspace");
    const auto outside = dir.root() / "outside";
    std::filesystem::create_directories(outside);
    WorkspaceManager manager(dir.root() / "ws");

    Workspace bogus;
    bogus.id = "bogus";
    bogus.root_dir = outside;
    bogus.input_file = outside / "input.py";
    manager.release(bogus);
    EXPECT_TRUE(std::filesystem::exists(outside));

    Workspace base_itself;
    base_itself.root_dir = manager.base_dir();
    std::filesystem::create_directories(manager.base_dir());
    manager.release(base_itself);
    EXPECT_TRUE(std::filesystem::exists(manager.base_dir()));
}

TEST(WorkspaceManagerTest, TrailingSlashBaseDirStillReleases) {
    TempDir dir("workspace");
    WorkspaceManager manager(dir.root().string() + "/");

    auto acquired = manager.acquire("x = 1\n");
    ASSERT_FALSE(is_error(acquired));
    manager.release(get_value(acquired));
    EXPECT_EQ(count_entries(dir.root()), 0u);
}

TEST(WorkspaceManagerTest, AcquireFailsWhenBaseDirIsAFile) {
    TempDir dir("workspace");
    const auto blocker = dir.root() / "not_a_dir";
    transpiler::testing::write_file(blocker, "file");
    WorkspaceManager manager(blocker);

    auto acquired = manager.acquire("x = 1\n");
    ASSERT_TRUE(is_error(acquired));
    EXPECT_EQ(get_error(acquired).category, ErrorCategory::IO);
    EXPECT_EQ(manager.acquired_count(), 0u);
}

TEST(WorkspaceManagerTest, ScopedWorkspaceReleasesOnException) {
    TempDir dir("workspace");
    WorkspaceManager manager(dir.root());
    std::filesystem::path seen;

    try {
        auto acquired = manager.acquire("x = 1\n");
        ASSERT_FALSE(is_error(acquired));
        ScopedWorkspace scoped(manager, get_value(acquired));
        seen = scoped.get().root_dir;
        ASSERT_TRUE(std::filesystem::exists(seen));
        throw std::runtime_error("stage failed");
    } catch (const std::runtime_error&) {
    }

    EXPECT_FALSE(seen.empty());
    EXPECT_FALSE(std::filesystem::exists(seen));
    EXPECT_EQ(manager.acquired_count(), manager.released_count());
    EXPECT_EQ(count_entries(dir.root()), 0u);
}

TEST(WorkspaceManagerTest, ConcurrentAcquiresNeverShareADirectory) {
    TempDir dir("workspace");
    WorkspaceManager manager(dir.root());
    constexpr int kThreads = 16;

    std::vector<Workspace> workspaces(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&manager, &workspaces, i]() {
            auto acquired = manager.acquire("same source\n");
            if (!is_error(acquired)) {
                workspaces[i] = get_value(acquired);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<std::string> roots;
    for (const auto& workspace : workspaces) {
        ASSERT_FALSE(workspace.root_dir.empty());
        roots.insert(workspace.root_dir.string());
    }
    EXPECT_EQ(roots.size(), static_cast<std::size_t>(kThreads));
    EXPECT_EQ(count_entries(dir.root()), static_cast<std::size_t>(kThreads));

    for (const auto& workspace : workspaces) {
        manager.release(workspace);
    }
    EXPECT_EQ(count_entries(dir.root()), 0u);
}

}  // namespace
