#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

#include <optional>
#include <string>
#include <vector>

std::string trim(const std::string& input);
std::string join(const std::vector<std::string>& inputs, const std::string& connector);
std::string toLower(const std::string& input);
std::vector<std::string> parseTokens(const std::string& input, char delimiter);
std::optional<int> parseInt(const std::string& input);

#endif // STRING_UTILS_HPP
