/**
 * test_prompt_builder.cpp - Unit tests for PromptBuilder
 */

#include "lh/PromptBuilder.hpp"

#include <cassert>
#include <iostream>

void test_prompt_contains_context() {
    lh::PromptBuilder builder;

    auto prompt = builder.build("git", {"reset", "--soft"}, "undo last commit", std::nullopt);

    assert(prompt.find("COMMAND CONTEXT: git reset --soft\n") != std::string::npos);
    assert(prompt.find("USER QUERY: undo last commit") != std::string::npos);
    assert(prompt.find(lh::DOC_HEADER) == std::string::npos);

    std::cout << "[PASS] test_prompt_contains_context\n";
}

void test_prompt_asks_for_four_fields() {
    lh::PromptBuilder builder;

    auto prompt = builder.build("ls", {}, "show hidden files", std::string("Usage: ls"));

    assert(prompt.find("\nEXPLANATION: ") != std::string::npos);
    assert(prompt.find("\nCOMMAND: ") != std::string::npos);
    assert(prompt.find("\nWARNINGS: ") != std::string::npos);
    assert(prompt.find("\nINFO: ") != std::string::npos);
    assert(prompt.find("NONE") != std::string::npos);
    assert(prompt.find("MAN PAGE CONTENT:\nUsage: ls") != std::string::npos);

    std::cout << "[PASS] test_prompt_asks_for_four_fields\n";
}

void test_prompt_is_deterministic() {
    lh::PromptBuilder builder;

    auto a = builder.build("tar", {"-x"}, "extract", std::string("docs"));
    auto b = builder.build("tar", {"-x"}, "extract", std::string("docs"));

    assert(a == b);

    std::cout << "[PASS] test_prompt_is_deterministic\n";
}

void test_exactly_limit_not_truncated() {
    std::string docs(lh::MAX_DOC_CHARS, 'a');

    auto limited = lh::PromptBuilder::limitDocumentation(docs);

    assert(limited == docs);
    assert(limited.find(lh::TRUNCATED_MARKER) == std::string::npos);

    std::cout << "[PASS] test_exactly_limit_not_truncated\n";
}

void test_over_limit_truncated() {
    std::string docs(lh::MAX_DOC_CHARS, 'a');
    docs += 'b';

    auto limited = lh::PromptBuilder::limitDocumentation(docs);

    assert(limited.compare(0, lh::MAX_DOC_CHARS, std::string(lh::MAX_DOC_CHARS, 'a')) == 0);
    assert(limited.find('b') == std::string::npos);
    assert(limited.size() > lh::MAX_DOC_CHARS);
    assert(limited.substr(limited.size() - lh::TRUNCATED_MARKER.size()) == lh::TRUNCATED_MARKER);

    lh::PromptBuilder builder;
    auto prompt = builder.build("x", {}, "q", docs);
    assert(prompt.find(lh::TRUNCATED_MARKER) != std::string::npos);

    std::cout << "[PASS] test_over_limit_truncated\n";
}

namespace {

bool isValidUtf8(const std::string& text) {
    size_t i = 0;
    while (i < text.size()) {
        unsigned char lead = static_cast<unsigned char>(text[i]);
        size_t length = lead < 0x80 ? 1 : (lead >> 5) == 0x6 ? 2 : (lead >> 4) == 0xE ? 3
                      : (lead >> 3) == 0x1E ? 4 : 0;
        if (length == 0 || i + length > text.size()) return false;
        for (size_t j = 1; j < length; ++j) {
            if ((static_cast<unsigned char>(text[i + j]) & 0xC0) != 0x80) return false;
        }
        i += length;
    }
    return true;
}

} // anonymous namespace

void test_truncation_keeps_utf8_characters_whole() {
    // U+2010 HYPHEN (3 bytes) straddles the limit, as groff emits it
    std::string docs(lh::MAX_DOC_CHARS - 1, 'a');
    docs += "\xE2\x80\x90 more text";
    assert(isValidUtf8(docs));

    auto limited = lh::PromptBuilder::limitDocumentation(docs);

    assert(isValidUtf8(limited));
    assert(limited == std::string(lh::MAX_DOC_CHARS - 1, 'a') + "\n... " + lh::TRUNCATED_MARKER);

    // A character ending exactly at the limit is kept
    std::string exact(lh::MAX_DOC_CHARS - 3, 'a');
    exact += "\xE2\x80\x90tail";
    auto kept = lh::PromptBuilder::limitDocumentation(exact);
    assert(kept.compare(0, lh::MAX_DOC_CHARS, exact.substr(0, lh::MAX_DOC_CHARS)) == 0);
    assert(isValidUtf8(kept));

    std::cout << "[PASS] test_truncation_keeps_utf8_characters_whole\n";
}

int main() {
    std::cout << "Running PromptBuilder tests...\n\n";

    test_prompt_contains_context();
    test_prompt_asks_for_four_fields();
    test_prompt_is_deterministic();
    test_exactly_limit_not_truncated();
    test_over_limit_truncated();
    test_truncation_keeps_utf8_characters_whole();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
