/**
 * main.cpp - localhelp CLI entry point
 *
 * Usage:
 *   localhelp git reset 'I want to unstage my changes'   # docs + LLM answer
 *   localhelp tar                                        # print documentation only
 *
 * Environment:
 *   LOCALHELP_LLM_PROVIDER  openrouter|openai|anthropic|local|simulation
 *   LOCALHELP_API_KEY       API key (otherwise looked up in the keyring)
 *   LOCALHELP_API_URL       endpoint for the local provider
 *   LOCALHELP_MODEL         model override
 *   LOCALHELP_DEV           "true" or "1" for debug output on stderr
 */

#include "lh/Assistant.hpp"
#include "lh/Config.hpp"
#include "lh/Console.hpp"
#include "lh/Error.hpp"
#include "lh/SecretStore.hpp"
#include "lh/Subprocess.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    using namespace lh::console;

    if (argc < 2) {
        lh::printUsage(std::cout);
        return 0;
    }

    // Skip the program name
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        lh::SubprocessRunner runner;
        auto secrets = lh::makeSecretStore();
        lh::Config config = lh::Config::fromEnvironment(*secrets, runner);

        lh::Assistant assistant(config, runner, std::cin, std::cout);
        assistant.process(args);
    } catch (const lh::Error& e) {
        std::cerr << RED << "Error (" << lh::errorCodeName(e.code()) << "): " << e.what()
                  << RESET << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << RED << "Error: " << e.what() << RESET << "\n";
        return 1;
    }

    return 0;
}
