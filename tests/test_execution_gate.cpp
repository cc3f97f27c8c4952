/**
 * test_execution_gate.cpp - Unit tests for answer display and confirmed execution
 */

#include "lh/Error.hpp"
#include "lh/ExecutionGate.hpp"

#include "FakeRunner.hpp"

#include <cassert>
#include <iostream>
#include <sstream>

using lh_test::FakeRunner;
using lh_test::exited;
using lh_test::notStarted;

namespace {

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

lh::LLMResponse unstageResponse() {
    lh::LLMResponse response;
    response.explanation = "Unstage everything.";
    response.recommended_command = "git reset HEAD";
    response.warnings = "Affects all staged files.";
    return response;
}

} // anonymous namespace

void test_split_command() {
    using V = std::vector<std::string>;

    assert(lh::ExecutionGate::splitCommand("git reset HEAD") == (V{"git", "reset", "HEAD"}));
    assert(lh::ExecutionGate::splitCommand("  ls   -la ") == (V{"ls", "-la"}));
    // No quoting: quotes stay part of the fragment
    assert(lh::ExecutionGate::splitCommand("echo 'a b'") == (V{"echo", "'a", "b'"}));
    assert(lh::ExecutionGate::splitCommand("").empty());
    assert(lh::ExecutionGate::splitCommand("    ").empty());

    std::cout << "[PASS] test_split_command\n";
}

void test_is_affirmative() {
    assert(lh::ExecutionGate::isAffirmative("y"));
    assert(lh::ExecutionGate::isAffirmative("Y"));
    assert(lh::ExecutionGate::isAffirmative("yes"));
    assert(lh::ExecutionGate::isAffirmative("  yes \r"));

    assert(!lh::ExecutionGate::isAffirmative(""));
    assert(!lh::ExecutionGate::isAffirmative("n"));
    assert(!lh::ExecutionGate::isAffirmative("YES"));
    assert(!lh::ExecutionGate::isAffirmative("Yes"));
    assert(!lh::ExecutionGate::isAffirmative("yep"));

    std::cout << "[PASS] test_is_affirmative\n";
}

void test_display_sections() {
    FakeRunner runner;
    std::istringstream in;
    std::ostringstream out;
    lh::ExecutionGate gate(runner, in, out);

    lh::LLMResponse response = unstageResponse();
    response.additional_info = "NONE";
    gate.display(response);

    std::string text = out.str();
    assert(contains(text, "AI Assistant Response:"));
    assert(contains(text, "EXPLANATION:"));
    assert(contains(text, "Unstage everything."));
    assert(contains(text, "RECOMMENDED COMMAND:"));
    assert(contains(text, "git reset HEAD"));
    assert(contains(text, "WARNINGS:"));
    assert(!contains(text, "ADDITIONAL INFO:"));
    assert(runner.calls.empty());

    std::cout << "[PASS] test_display_sections\n";
}

void test_decline_does_not_run() {
    for (const std::string input : {"n\n", "\n", "YES\n", ""}) {
        FakeRunner runner;
        std::istringstream in(input);
        std::ostringstream out;
        lh::ExecutionGate gate(runner, in, out);

        assert(!gate.present(unstageResponse()));
        assert(runner.calls.empty());
        assert(contains(out.str(), "Run this command? (y/N): "));
        assert(contains(out.str(), "Command: git reset HEAD"));
        assert(contains(out.str(), "Command not executed."));
    }

    std::cout << "[PASS] test_decline_does_not_run\n";
}

void test_confirm_runs_command() {
    FakeRunner runner;
    runner.handler = [](const std::vector<std::string>&, const std::string&) {
        return exited(0, "Unstaged changes after reset:\nM\tfile.txt\n");
    };
    std::istringstream in("yes\n");
    std::ostringstream out;
    lh::ExecutionGate gate(runner, in, out);

    assert(gate.present(unstageResponse()));
    assert(runner.calls.size() == 1);
    assert(runner.called({"git", "reset", "HEAD"}));
    assert(runner.inputs[0].empty());

    std::string text = out.str();
    assert(contains(text, "Executing: git reset HEAD"));
    assert(contains(text, "Output:"));
    assert(contains(text, "M\tfile.txt"));
    assert(contains(text, "Command executed successfully!"));
    assert(!contains(text, "Error output:"));

    std::cout << "[PASS] test_confirm_runs_command\n";
}

void test_failing_command_is_reported() {
    FakeRunner runner;
    runner.handler = [](const std::vector<std::string>&, const std::string&) {
        return exited(128, "", "fatal: not a git repository\n");
    };
    std::istringstream in("y\n");
    std::ostringstream out;
    lh::ExecutionGate gate(runner, in, out);

    assert(gate.present(unstageResponse()));

    std::string text = out.str();
    assert(contains(text, "Error output:"));
    assert(contains(text, "fatal: not a git repository"));
    assert(contains(text, "Command failed with exit code: 128"));
    assert(!contains(text, "executed successfully"));

    std::cout << "[PASS] test_failing_command_is_reported\n";
}

void test_spawn_failure_is_reported() {
    FakeRunner runner;
    runner.handler = [](const std::vector<std::string>&, const std::string&) {
        return notStarted("failed to execute 'nosuchtool': No such file or directory");
    };
    std::istringstream in("y\n");
    std::ostringstream out;
    lh::ExecutionGate gate(runner, in, out);

    lh::LLMResponse response;
    response.explanation = "x";
    response.recommended_command = "nosuchtool --flag";
    gate.present(response);

    assert(runner.called({"nosuchtool", "--flag"}));
    assert(contains(out.str(), "Error executing command: failed to execute 'nosuchtool'"));

    std::cout << "[PASS] test_spawn_failure_is_reported\n";
}

void test_none_command_is_not_offered() {
    FakeRunner runner;
    std::istringstream in("y\n");
    std::ostringstream out;
    lh::ExecutionGate gate(runner, in, out);

    lh::LLMResponse response;
    response.explanation = "Nothing to run.";
    response.recommended_command = "NONE";
    assert(!gate.present(response));

    lh::LLMResponse absent;
    absent.explanation = "Nothing to run.";
    assert(!gate.present(absent));

    assert(runner.calls.empty());
    assert(!contains(out.str(), "Run this command?"));
    assert(!contains(out.str(), "RECOMMENDED COMMAND:"));

    std::cout << "[PASS] test_none_command_is_not_offered\n";
}

void test_blank_command_reports_error() {
    FakeRunner runner;
    std::istringstream in("y\n");
    std::ostringstream out;
    lh::ExecutionGate gate(runner, in, out);

    lh::LLMResponse response;
    response.explanation = "x";
    response.recommended_command = "   ";
    assert(!gate.present(response));
    assert(runner.calls.empty());
    assert(contains(out.str(), "Error: No command to execute"));

    bool threw = false;
    try {
        gate.execute("");
    } catch (const lh::Error& e) {
        threw = e.code() == lh::ErrorCode::NO_COMMAND_TO_EXECUTE;
    }
    assert(threw);

    std::cout << "[PASS] test_blank_command_reports_error\n";
}

int main() {
    std::cout << "Running ExecutionGate tests...\n\n";

    test_split_command();
    test_is_affirmative();
    test_display_sections();
    test_decline_does_not_run();
    test_confirm_runs_command();
    test_failing_command_is_reported();
    test_spawn_failure_is_reported();
    test_none_command_is_not_offered();
    test_blank_command_reports_error();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
