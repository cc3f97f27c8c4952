/**
 * PromptBuilder.hpp - Build the structured LLM prompt
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace lh {

// Documentation beyond this many bytes is cut
constexpr size_t MAX_DOC_CHARS = 2000;

extern const std::string DOC_HEADER;        // "MAN PAGE CONTENT:"
extern const std::string TRUNCATED_MARKER;  // "(truncated)"

class PromptBuilder {
public:
    std::string build(const std::string& command,
                      const std::vector<std::string>& args,
                      const std::string& query,
                      const std::optional<std::string>& documentation) const;

    // Documentation as embedded in the prompt: at most MAX_DOC_CHARS bytes, cut at a
    // UTF-8 character boundary, plus marker
    static std::string limitDocumentation(const std::string& documentation);

    static std::string joinCommand(const std::string& command,
                                   const std::vector<std::string>& args);
};

} // namespace lh
