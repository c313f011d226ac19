#pragma once

#include <string>
#include <vector>

namespace groundwork {

// Text analyzer shared by the lexical index, the hashed embedder and keyword checks.
class Analyzer {
public:
    // Split on non-alnum and lowercase.
    static std::vector<std::string> tokenize(const std::string& text);

    static std::string toLower(const std::string& text);

    // True when the text contains at least one of the keywords (case-insensitive).
    static bool containsAny(const std::string& text, const std::vector<std::string>& keywords);

    static std::string trim(const std::string& text);
};

} // namespace groundwork
