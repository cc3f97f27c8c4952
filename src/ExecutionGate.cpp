/**
 * ExecutionGate.cpp - Show the answer and run the recommended command on confirmation
 */

#include "lh/ExecutionGate.hpp"
#include "lh/Console.hpp"
#include "lh/Error.hpp"
#include "lh/Subprocess.hpp"

#include <istream>
#include <ostream>

namespace lh {

using namespace console;

namespace {

const std::string THIN_RULE = "─────────────────────────";

bool isPresent(const std::optional<std::string>& field) {
    return field && *field != "NONE";
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // anonymous namespace

ExecutionGate::ExecutionGate(CommandRunner& runner, std::istream& in, std::ostream& out)
    : runner_(runner), in_(in), out_(out) {}

void ExecutionGate::display(const LLMResponse& response) {
    out_ << "\n" << BOLD << "🤖 AI Assistant Response:" << RESET << "\n"
         << RULE << "\n";

    out_ << "\n" << CYAN << "📋 EXPLANATION:" << RESET << "\n" << response.explanation << "\n";

    if (isPresent(response.recommended_command)) {
        out_ << "\n" << GREEN << "💻 RECOMMENDED COMMAND:" << RESET << "\n"
             << *response.recommended_command << "\n";
    }

    if (isPresent(response.warnings)) {
        out_ << "\n" << RED << "⚠️  WARNINGS:" << RESET << "\n" << *response.warnings << "\n";
    }

    if (isPresent(response.additional_info)) {
        out_ << "\n" << YELLOW << "💡 ADDITIONAL INFO:" << RESET << "\n"
             << *response.additional_info << "\n";
    }

    out_ << "\n" << RULE << "\n";
}

bool ExecutionGate::present(const LLMResponse& response) {
    display(response);

    if (!isPresent(response.recommended_command)) {
        return false;
    }

    const std::string& command = *response.recommended_command;
    if (!askConfirmation(command)) {
        out_ << "\n🚫 Command not executed.\n";
        return false;
    }

    try {
        execute(command);
    } catch (const Error& e) {
        if (e.code() != ErrorCode::NO_COMMAND_TO_EXECUTE) throw;
        out_ << RED << "❌ Error: " << e.what() << RESET << "\n";
        return false;
    }
    return true;
}

bool ExecutionGate::isAffirmative(const std::string& answer) {
    std::string trimmed = trim(answer);
    return trimmed == "y" || trimmed == "Y" || trimmed == "yes";
}

bool ExecutionGate::askConfirmation(const std::string& command) {
    out_ << "\n" << BOLD << "🚀 Execute Command?" << RESET << "\n"
         << "Command: " << command << "\n"
         << GREEN << "Run this command? (y/N): " << RESET;
    out_.flush();

    std::string answer;
    if (!std::getline(in_, answer)) {
        return false;  // EOF declines
    }
    return isAffirmative(answer);
}

std::vector<std::string> ExecutionGate::splitCommand(const std::string& command) {
    std::vector<std::string> argv;
    size_t start = 0;
    while (start <= command.size()) {
        size_t end = command.find(' ', start);
        if (end == std::string::npos) end = command.size();
        if (end > start) {
            argv.push_back(command.substr(start, end - start));
        }
        start = end + 1;
    }
    return argv;
}

void ExecutionGate::execute(const std::string& command) {
    auto argv = splitCommand(command);
    if (argv.empty()) {
        throw Error(ErrorCode::NO_COMMAND_TO_EXECUTE, "No command to execute");
    }

    out_ << "\n" << CYAN << "⚡ Executing: " << command << RESET << "\n"
         << THIN_RULE << "\n";

    auto result = runner_.run(argv);
    if (!result.started) {
        out_ << RED << "❌ Error executing command: " << result.error << RESET << "\n";
        return;
    }

    if (!result.stdout_text.empty()) {
        out_ << "\n📤 Output:\n" << result.stdout_text;
    }
    if (!result.stderr_text.empty()) {
        out_ << "\n📤 Error output:\n" << result.stderr_text;
    }

    // A failing child is reported, not escalated
    if (result.exit_code == 0) {
        out_ << "\n" << GREEN << "✅ Command executed successfully!" << RESET << "\n";
    } else {
        out_ << "\n" << RED << "❌ Command failed with exit code: " << result.exit_code
             << RESET << "\n";
    }
}

} // namespace lh
