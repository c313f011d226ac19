#include "groundwork/Analyzer.hpp"

#include <algorithm>
#include <cctype>

namespace groundwork {

std::vector<std::string> Analyzer::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;

    for (unsigned char ch : text) {
        if (std::isalnum(ch)) {
            current.push_back(static_cast<char>(std::tolower(ch)));
        } else {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
        }
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }

    return tokens;
}

std::string Analyzer::toLower(const std::string& text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

bool Analyzer::containsAny(const std::string& text, const std::vector<std::string>& keywords) {
    const std::string lowered = toLower(text);
    for (const auto& kw : keywords) {
        if (kw.empty()) continue;
        if (lowered.find(toLower(kw)) != std::string::npos) return true;
    }
    return false;
}

std::string Analyzer::trim(const std::string& text) {
    const auto first = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
    const auto last = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    if (first >= last) return {};
    return std::string(first, last);
}

} // namespace groundwork
