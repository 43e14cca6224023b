#ifndef NAMES_HPP
#define NAMES_HPP

#include <set>
#include <string>
#include <vector>

// Returns name unchanged when it is free, otherwise name followed by the smallest free suffix starting at 2
std::string disambiguateName(const std::string& name, const std::set<std::string>& taken);

// Up to the number of stock names available
std::vector<std::string> getDefaultNames(int count);

#endif // NAMES_HPP
