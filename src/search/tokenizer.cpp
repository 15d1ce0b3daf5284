#include <ranklab/search/tokenizer.h>

#include <cctype>

namespace ranklab::search {

std::vector<std::string> tokenize(std::string_view text) {
    std::vector<std::string> tokens;
    std::string current;

    for (unsigned char c : text) {
        if (std::isalnum(c) && c < 0x80) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

std::string snippet(std::string_view text, size_t maxLength) {
    std::string collapsed;
    collapsed.reserve(text.size());
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            if (!collapsed.empty() && collapsed.back() != ' ') {
                collapsed.push_back(' ');
            }
        } else {
            collapsed.push_back(static_cast<char>(c));
        }
    }
    if (!collapsed.empty() && collapsed.back() == ' ') {
        collapsed.pop_back();
    }

    if (collapsed.size() <= maxLength) {
        return collapsed;
    }
    if (maxLength <= 3) {
        return collapsed.substr(0, maxLength);
    }
    return collapsed.substr(0, maxLength - 3) + "...";
}

} // namespace ranklab::search
