#include "util/names.hpp"

#include <algorithm>
#include <array>
#include <set>
#include <string>
#include <vector>

namespace {
const std::array<std::string, 12> StockNames = {
    "Bob", "Alice", "Cali", "Arjun", "Bianca", "Kalyna",
    "Chen", "Zhu", "Cielo", "Eva", "Franco", "Lopa"
};
} // namespace

std::string disambiguateName(const std::string& name, const std::set<std::string>& taken) {
    if (taken.find(name) == taken.end()) {
        return name;
    }

    // At most taken.size() suffixes can be in use, so this terminates
    for (int suffix = 2;; ++suffix) {
        std::string candidate = name + std::to_string(suffix);
        if (taken.find(candidate) == taken.end()) {
            return candidate;
        }
    }
}

std::vector<std::string> getDefaultNames(int count) {
    int numNames = std::clamp(count, 0, static_cast<int>(StockNames.size()));
    return std::vector<std::string>(StockNames.begin(), StockNames.begin() + numNames);
}
