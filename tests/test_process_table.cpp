#include <gtest/gtest.h>

#include "testing.hpp"
#include "update/process_table.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <unistd.h>

namespace selfupdate {
namespace {

ProcessInfo Proc(pid_t pid, std::string comm, std::string exe = {}, std::string argv0 = {}) {
    ProcessInfo p;
    p.pid = pid;
    p.comm = std::move(comm);
    p.exe_path = std::move(exe);
    p.argv0 = std::move(argv0);
    return p;
}

TEST(ProcessMatchTest, MatchesExeBasenameIgnoringCase) {
    EXPECT_TRUE(MatchesImageName(Proc(10, "other", "/opt/app/ps2jpmod.EXE"), "PS2JPMod.exe"));
}

TEST(ProcessMatchTest, MatchesWindowsStyleArgv0) {
    EXPECT_TRUE(MatchesImageName(Proc(10, "wine64-preloade", "/usr/bin/wine64-preloader",
                                      "C:\\Program Files\\PS2JPMod\\PS2JPMod.exe"),
                                 "ps2jpmod.exe"));
}

TEST(ProcessMatchTest, MatchesTruncatedComm) {
    // "PS2JPMod-Launcher.exe" is cut to 15 bytes by the kernel.
    EXPECT_TRUE(MatchesImageName(Proc(10, "PS2JPMod-Launch"), "PS2JPMod-Launcher.exe"));
    EXPECT_TRUE(MatchesImageName(Proc(10, "app.exe"), "App.exe"));
    EXPECT_FALSE(MatchesImageName(Proc(10, "PS2JPMod"), "PS2JPMod.exe"));
}

TEST(ProcessMatchTest, IgnoresTruncatedCommWhenExeOrArgvIsKnown) {
    // Same 15-byte comm prefix, different program.
    EXPECT_FALSE(MatchesImageName(Proc(10, "PS2JPMod-Launch", "/usr/bin/PS2JPMod-Launch-helper"),
                                  "PS2JPMod-Launcher.exe"));
    EXPECT_FALSE(MatchesImageName(Proc(10, "PS2JPMod-Launch", "", "./PS2JPMod-Launchpad"),
                                  "PS2JPMod-Launcher.exe"));
    EXPECT_FALSE(MatchesImageName(Proc(10, "App.exe", "/usr/bin/renamed"), "App.exe"));
}

TEST(ProcessMatchTest, RejectsOtherNames) {
    EXPECT_FALSE(MatchesImageName(Proc(10, "bash", "/usr/bin/bash", "-bash"), "App.exe"));
    EXPECT_FALSE(MatchesImageName(Proc(10, "App.exe.bak", "/opt/App.exe.bak"), "App.exe"));
    EXPECT_FALSE(MatchesImageName(Proc(10, "App.exe"), ""));
}

TEST(ProcessMatchTest, FindSkipsExcludedPid) {
    const std::vector<ProcessInfo> snapshot = {
        Proc(1, "init"),
        Proc(42, "App.exe"),
        Proc(43, "APP.EXE"),
    };

    auto hit = FindByImageName(snapshot, "app.exe", 42);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->pid, 43);

    EXPECT_FALSE(FindByImageName({Proc(42, "App.exe")}, "App.exe", 42).has_value());
    EXPECT_FALSE(FindByImageName({}, "App.exe", 0).has_value());
}

class ProcFsProcessTableTest : public ::testing::Test {
protected:
    testutil::TemporaryDirectory proc_root;

    void AddProcess(const std::string& pid, const std::string& comm, const std::string& cmdline) {
        testutil::WriteFile(proc_root.Join(pid + "/comm"), comm + "\n");
        testutil::WriteFile(proc_root.Join(pid + "/cmdline"), cmdline);
    }
};

TEST_F(ProcFsProcessTableTest, ReadsNumericEntries) {
    AddProcess("100", "App.exe", std::string("C:\\Games\\App.exe\0--flag\0", 24));
    AddProcess("200", "bash", std::string("/bin/bash\0", 10));
    testutil::WriteFile(proc_root.Join("self/comm"), "ignored\n");
    testutil::WriteFile(proc_root.Join("12ab/comm"), "ignored\n");
    ASSERT_EQ(::symlink("/opt/games/App.exe (deleted)", proc_root.Join("100/exe").c_str()), 0);

    ProcFsProcessTable table(proc_root.Path());
    auto snapshot = table.Snapshot();
    std::sort(snapshot.begin(), snapshot.end(),
              [](const ProcessInfo& a, const ProcessInfo& b) { return a.pid < b.pid; });

    ASSERT_EQ(snapshot.size(), 2u);
    EXPECT_EQ(snapshot[0].pid, 100);
    EXPECT_EQ(snapshot[0].comm, "App.exe");
    EXPECT_EQ(snapshot[0].exe_path, "/opt/games/App.exe");
    EXPECT_EQ(snapshot[0].argv0, "C:\\Games\\App.exe");
    EXPECT_EQ(snapshot[1].pid, 200);
    EXPECT_EQ(snapshot[1].exe_path, "");
    EXPECT_EQ(snapshot[1].argv0, "/bin/bash");
}

TEST_F(ProcFsProcessTableTest, SkipsEntriesWithoutComm) {
    testutil::WriteFile(proc_root.Join("300/cmdline"), "gone");
    ProcFsProcessTable table(proc_root.Path());
    EXPECT_TRUE(table.Snapshot().empty());
}

TEST(ProcFsProcessTableLiveTest, FindsOwnProcess) {
    const auto self_exe = std::filesystem::read_symlink("/proc/self/exe").string();
    const std::string name(ImageBaseName(self_exe));

    ProcFsProcessTable table;
    const auto snapshot = table.Snapshot();
    const auto self = std::find_if(snapshot.begin(), snapshot.end(),
                                   [](const ProcessInfo& p) { return p.pid == ::getpid(); });
    ASSERT_NE(self, snapshot.end());
    EXPECT_TRUE(MatchesImageName(*self, name));
    EXPECT_TRUE(FindByImageName(snapshot, name, 0).has_value());
}

TEST(ProcFsProcessTableLiveTest, MissingRootYieldsEmptySnapshot) {
    ProcFsProcessTable table("/nonexistent/selfupdate/proc");
    EXPECT_TRUE(table.Snapshot().empty());
}

} // namespace
} // namespace selfupdate
