#ifndef UTILS_H
#define UTILS_H

#include <string>
#include <vector>

std::string get_current_time();

std::string trim(const std::string& text);

std::vector<std::string> splitLines(const std::string& text);

// Fixed-point rendering, e.g. formatFixed(0.5, 3) == "0.500".
std::string formatFixed(double value, int precision);

// Strict decimal parse; false on trailing junk, empty input or overflow.
bool parseDouble(const std::string& text, double& value);

// Kernel device names: 1..15 chars of [A-Za-z0-9_.-], not led by '-' or '.'.
// Anything else is refused before it reaches an ip/tc argument vector.
bool isSafeDeviceName(const std::string& name);

#endif // UTILS_H
