#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ranklab::search {

/// Lowercased runs of [a-z0-9]; everything else separates tokens.
std::vector<std::string> tokenize(std::string_view text);

/// Collapse whitespace and cut to maxLength characters, ending in "..." when cut.
std::string snippet(std::string_view text, size_t maxLength = 160);

} // namespace ranklab::search
