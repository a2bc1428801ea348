#pragma once
#include <string>
#include <vector>
#include "common.hpp"

Timestamp getCurrentTime();
json readJsonFromFile(const std::string& filepath);
std::vector<std::string> splitString(const std::string& s, char delim);
std::string memberListToString(const std::vector<MemberId>& members);

// Zero padded so lexicographic key order matches numeric order
std::string uint64ToKey(uint64_t value);
