#ifndef AGENTGRAPH_COMMON_UTILS_STRING_UTILS_H
#define AGENTGRAPH_COMMON_UTILS_STRING_UTILS_H

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentgraph {

// 大小写不敏感的 Levenshtein 距离
size_t edit_distance(std::string_view a, std::string_view b);

// 在 candidates 中找距离最近且 <= max_distance 的项
std::optional<std::string> closest_match(std::string_view target,
                                         const std::vector<std::string>& candidates,
                                         size_t max_distance = 2);

bool is_identifier(std::string_view s);

std::vector<std::string> split(std::string_view s, char delim);

std::string trim(std::string_view s);

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_UTILS_STRING_UTILS_H
