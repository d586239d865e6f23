#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace qamem::config {

// Pattern register widths accepted by the driver (2w + 2 qubits in total)
constexpr int kMinPatternWidth = 1;
constexpr int kMaxPatternWidth = 11;

// Validates pattern register width and returns error in 'err' if invalid.
bool is_valid_width(int width, std::string& err);

// Checks that value fits in 'width' bits; 'what' names the value in the error.
bool value_fits(std::uint64_t value, int width, const std::string& what, std::string& err);

// Parses "1,4, 6" into values. Returns false and sets 'err' on malformed input.
bool parse_value_list(const std::string& text, std::vector<std::uint64_t>& out, std::string& err);

// Parses a list of qubit indices ("5,3").
bool parse_qubit_list(const std::string& text, std::vector<int>& out, std::string& err);

} // namespace qamem::config
