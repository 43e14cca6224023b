#include "util/string_utils.hpp"

#include <cctype>
#include <exception>
#include <optional>
#include <string>
#include <vector>

std::string trim(const std::string& input) {
    int inputSize = input.size();

    int start = 0;
    while (start < inputSize && std::isspace(static_cast<unsigned char>(input[start]))) {
        ++start;
    }

    int end = inputSize - 1;
    while (end >= 0 && std::isspace(static_cast<unsigned char>(input[end]))) {
        --end;
    }

    if (end < start) {
        return "";
    }

    int outputLength = end - start + 1;
    return input.substr(start, outputLength);
}

std::string join(const std::vector<std::string>& inputs, const std::string& connector) {
    std::string output;
    for (std::size_t i = 0; i < inputs.size(); ++i) {
        if (i > 0) {
            output += connector;
        }
        output += inputs[i];
    }
    return output;
}

std::string toLower(const std::string& input) {
    std::string output = input;
    for (char& c : output) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return output;
}

std::vector<std::string> parseTokens(const std::string& input, char delimiter) {
    std::vector<std::string> tokens;

    auto insertToken = [&input, &tokens](int start, int end) {
        int tokenSize = end - start + 1;
        if (tokenSize > 0) {
            std::string trimmed = trim(input.substr(start, tokenSize));
            if (!trimmed.empty()) {
                tokens.push_back(trimmed);
            }
        }
    };

    int inputSize = input.size();
    int nextTokenStart = 0;
    for (int i = 0; i < inputSize; ++i) {
        if (input[i] == delimiter) {
            insertToken(nextTokenStart, i - 1);
            nextTokenStart = i + 1;
        }
    }
    insertToken(nextTokenStart, inputSize - 1);

    return tokens;
}

std::optional<int> parseInt(const std::string& input) {
    try {
        std::size_t charsRead = 0;
        int value = std::stoi(input, &charsRead);
        if (charsRead != input.size()) {
            return std::nullopt;
        }
        return value;
    }
    catch (const std::exception&) {
        return std::nullopt;
    }
}
