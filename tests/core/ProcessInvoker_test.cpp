#include <gtest/gtest.h>
#include "core/Errors.hpp"
#include "core/ProcessInvoker.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

using namespace flux_mcp;
namespace fs = std::filesystem;

class ProcessInvokerTest : public ::testing::Test {
protected:
    static InvocationRequest shell(const std::string& script) {
        InvocationRequest request;
        request.program = "/bin/sh";
        request.args = {"-c", script};
        return request;
    }

    ProcessInvoker invoker;
};

TEST_F(ProcessInvokerTest, CapturesStreamsSeparately) {
    auto outcome = invoker.run(shell("printf 'to stdout'; printf 'to stderr' >&2"));

    EXPECT_TRUE(outcome.succeeded());
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(outcome.stdout_data, "to stdout");
    EXPECT_EQ(outcome.stderr_data, "to stderr");
}

TEST_F(ProcessInvokerTest, ReportsExitCode) {
    auto outcome = invoker.run(shell("echo failing >&2; exit 3"));

    EXPECT_FALSE(outcome.succeeded());
    EXPECT_FALSE(outcome.signaled);
    EXPECT_EQ(outcome.exit_code, 3);
    EXPECT_EQ(outcome.stderr_data, "failing\n");
    EXPECT_EQ(outcome.status_description(), "exit code 3");
}

TEST_F(ProcessInvokerTest, ReportsTerminatingSignal) {
    auto outcome = invoker.run(shell("kill -9 $$"));

    EXPECT_FALSE(outcome.succeeded());
    EXPECT_TRUE(outcome.signaled);
    EXPECT_EQ(outcome.term_signal, SIGKILL);
}

TEST_F(ProcessInvokerTest, ArgumentsArePassedVerbatim) {
    InvocationRequest request;
    request.program = "/bin/sh";
    request.args = {"-c", "printf '%s|' \"$@\"", "sh", "a b", "$HOME", "--flag", ""};

    auto outcome = invoker.run(request);

    EXPECT_EQ(outcome.stdout_data, "a b|$HOME|--flag||");
}

TEST_F(ProcessInvokerTest, MissingProgramIsInfrastructureError) {
    InvocationRequest request;
    request.program = "/nonexistent/bin/python";
    request.args = {"fluxcli.py", "generate"};

    try {
        invoker.run(request);
        FAIL() << "Expected ToolError";
    } catch (const ToolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Infrastructure);
        EXPECT_NE(std::string(e.what()).find("/nonexistent/bin/python"), std::string::npos);
    }
    EXPECT_EQ(invoker.active_count(), 0);
}

TEST_F(ProcessInvokerTest, ConcurrentSpawnFailuresReportTheirCause) {
    constexpr int kCount = 8;
    std::vector<std::string> messages(kCount);
    std::vector<std::thread> threads;

    for (int i = 0; i < kCount; ++i) {
        threads.emplace_back([this, i, &messages]() {
            InvocationRequest request;
            request.program = "/nonexistent/bin/python" + std::to_string(i);
            try {
                invoker.run(request);
            } catch (const ToolError& e) {
                if (e.kind() == ErrorKind::Infrastructure) {
                    messages[i] = e.what();
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int i = 0; i < kCount; ++i) {
        EXPECT_NE(messages[i].find("/nonexistent/bin/python" + std::to_string(i)), std::string::npos) << i;
        EXPECT_NE(messages[i].find("No such file or directory"), std::string::npos) << messages[i];
    }
    EXPECT_EQ(invoker.active_count(), 0);
}

TEST_F(ProcessInvokerTest, ProgramNotOnPathIsInfrastructureError) {
    InvocationRequest request;
    request.program = "flux-mcp-no-such-interpreter";

    try {
        invoker.run(request);
        FAIL() << "Expected ToolError";
    } catch (const ToolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Infrastructure);
    }
}

TEST_F(ProcessInvokerTest, MissingWorkingDirectoryIsInfrastructureError) {
    auto request = shell("true");
    request.working_directory = "/nonexistent/flux/dir";

    try {
        invoker.run(request);
        FAIL() << "Expected ToolError";
    } catch (const ToolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Infrastructure);
        EXPECT_NE(std::string(e.what()).find("working directory"), std::string::npos);
    }
}

TEST_F(ProcessInvokerTest, RunsInWorkingDirectory) {
    fs::path dir = fs::canonical(fs::temp_directory_path());
    auto request = shell("pwd -P");
    request.working_directory = dir;

    auto outcome = invoker.run(request);

    EXPECT_EQ(outcome.stdout_data, dir.string() + "\n");
}

TEST_F(ProcessInvokerTest, InheritsEnvironment) {
    ::setenv("FLUX_MCP_TEST_MARKER", "inherited", 1);
    auto outcome = invoker.run(shell("printf '%s' \"$FLUX_MCP_TEST_MARKER\""));
    ::unsetenv("FLUX_MCP_TEST_MARKER");

    EXPECT_EQ(outcome.stdout_data, "inherited");
}

TEST_F(ProcessInvokerTest, StdinIsEmpty) {
    auto outcome = invoker.run(shell("cat; echo done"));

    EXPECT_TRUE(outcome.succeeded());
    EXPECT_EQ(outcome.stdout_data, "done\n");
}

TEST_F(ProcessInvokerTest, LargeOutputOnBothStreams) {
    // Far more than a pipe buffer on each stream
    auto outcome = invoker.run(shell(
        "i=0; while [ $i -lt 2000 ]; do "
        "echo 0123456789012345678901234567890123456789012345678901234567890123456789012345678; "
        "echo abcdefghijabcdefghijabcdefghijabcdefghijabcdefghijabcdefghijabcdefghijabcdefghi >&2; "
        "i=$((i+1)); done"));

    EXPECT_TRUE(outcome.succeeded());
    EXPECT_EQ(outcome.stdout_data.size(), 2000u * 80u);
    EXPECT_EQ(outcome.stderr_data.size(), 2000u * 80u);
}

TEST_F(ProcessInvokerTest, TimeoutKillsChild) {
    auto request = shell("exec sleep 30");
    request.timeout = std::chrono::milliseconds(200);

    auto start = std::chrono::steady_clock::now();
    auto outcome = invoker.run(request);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(outcome.timed_out);
    EXPECT_FALSE(outcome.succeeded());
    EXPECT_EQ(outcome.status_description(), "timed out");
    EXPECT_LT(elapsed, std::chrono::seconds(10));
    EXPECT_EQ(invoker.active_count(), 0);
}

TEST_F(ProcessInvokerTest, NoTimeoutByDefault) {
    auto outcome = invoker.run(shell("sleep 1; echo late"));

    EXPECT_FALSE(outcome.timed_out);
    EXPECT_EQ(outcome.stdout_data, "late\n");
}

TEST_F(ProcessInvokerTest, ConcurrentInvocationsAreIndependent) {
    constexpr int kCount = 8;
    std::vector<InvocationOutcome> outcomes(kCount);
    std::vector<std::thread> threads;

    for (int i = 0; i < kCount; ++i) {
        threads.emplace_back([this, i, &outcomes]() {
            InvocationRequest request;
            request.program = "/bin/sh";
            request.args = {"-c", "sleep 0.2; printf 'out%s' \"$1\"; printf 'err%s' \"$1\" >&2; exit $1",
                            "sh", std::to_string(i)};
            outcomes[i] = invoker.run(request);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int i = 0; i < kCount; ++i) {
        EXPECT_EQ(outcomes[i].stdout_data, "out" + std::to_string(i));
        EXPECT_EQ(outcomes[i].stderr_data, "err" + std::to_string(i));
        EXPECT_EQ(outcomes[i].exit_code, i);
    }
    EXPECT_EQ(invoker.active_count(), 0);
}

TEST_F(ProcessInvokerTest, TerminateAllStopsRunningChildren) {
    InvocationOutcome outcome;
    std::thread runner([this, &outcome]() {
        outcome = invoker.run(shell("exec sleep 30"));
    });

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (invoker.active_count() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_EQ(invoker.active_count(), 1);

    EXPECT_EQ(invoker.terminate_all(), 1);
    runner.join();

    EXPECT_TRUE(outcome.signaled);
    EXPECT_EQ(outcome.term_signal, SIGTERM);
    EXPECT_EQ(invoker.active_count(), 0);
}

TEST(InterpreterTest, DefaultsToPython3) {
    EXPECT_EQ(resolve_interpreter(nullptr), "python3");
    EXPECT_EQ(resolve_interpreter(""), "python3");
}

TEST(InterpreterTest, VirtualEnvWins) {
    EXPECT_EQ(resolve_interpreter("/opt/venv"), "/opt/venv/bin/python");
}

TEST(InterpreterTest, ReadsEnvironmentOnEveryCall) {
    ::setenv("VIRTUAL_ENV", "/first", 1);
    EXPECT_EQ(resolve_interpreter(), "/first/bin/python");

    ::setenv("VIRTUAL_ENV", "/second", 1);
    EXPECT_EQ(resolve_interpreter(), "/second/bin/python");

    ::unsetenv("VIRTUAL_ENV");
    EXPECT_EQ(resolve_interpreter(), "python3");
}
