#include <gtest/gtest.h>

#include "io/fd.hpp"
#include "update/console.hpp"

#include <cstdio>
#include <string>
#include <unistd.h>

namespace selfupdate {
namespace {

std::string ReadBack(std::FILE* f) {
    std::fflush(f);
    std::rewind(f);
    std::string out;
    char buf[256];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
        out.append(buf, n);
    }
    return out;
}

TEST(TerminalConsoleTest, ShowMessageWritesLine) {
    std::FILE* out = std::tmpfile();
    ASSERT_NE(out, nullptr);

    TerminalConsole console(out, STDIN_FILENO);
    console.ShowMessage("App.exe is still running.");
    EXPECT_EQ(ReadBack(out), "App.exe is still running.\n");
    std::fclose(out);
}

TEST(TerminalConsoleTest, WaitForAnyKeyConsumesOneByte) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    Fd read_end(fds[0]);
    Fd write_end(fds[1]);
    ASSERT_EQ(::write(write_end.Get(), "xy", 2), 2);

    std::FILE* out = std::tmpfile();
    ASSERT_NE(out, nullptr);

    TerminalConsole console(out, read_end.Get());
    console.WaitForAnyKey("Press any key to exit...");
    EXPECT_EQ(ReadBack(out), "Press any key to exit...\n");

    char rest = 0;
    ASSERT_EQ(::read(read_end.Get(), &rest, 1), 1);
    EXPECT_EQ(rest, 'y');
    std::fclose(out);
}

TEST(TerminalConsoleTest, WaitForAnyKeyReturnsOnEof) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    Fd read_end(fds[0]);
    ::close(fds[1]);

    std::FILE* out = std::tmpfile();
    ASSERT_NE(out, nullptr);

    TerminalConsole console(out, read_end.Get());
    console.WaitForAnyKey("prompt");
    EXPECT_EQ(ReadBack(out), "prompt\n");
    std::fclose(out);
}

} // namespace
} // namespace selfupdate
