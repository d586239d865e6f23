#include <qamem/config/validator.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <fmt/core.h>

namespace qamem::config {

static std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

static bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool is_valid_width(int width, std::string& err) {
    if (width < kMinPatternWidth || width > kMaxPatternWidth) {
        err = fmt::format("pattern width must be in [{}..{}], got {}", kMinPatternWidth, kMaxPatternWidth, width);
        return false;
    }
    return true;
}

bool value_fits(std::uint64_t value, int width, const std::string& what, std::string& err) {
    if (width < 64 && (value >> width) != 0) {
        err = fmt::format("{} {} does not fit in {} bits", what, value, width);
        return false;
    }
    return true;
}

bool parse_value_list(const std::string& text, std::vector<std::uint64_t>& out, std::string& err) {
    out.clear();
    if (trim(text).empty()) return true;

    std::size_t start = 0;
    while (true) {
        auto comma = text.find(',', start);
        std::string item = trim(text.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
        if (!all_digits(item)) {
            err = fmt::format("invalid value '{}' in list (expected non-negative integers)", item);
            return false;
        }
        try {
            out.push_back(std::stoull(item));
        } catch (const std::exception&) {
            err = fmt::format("value '{}' out of range", item);
            return false;
        }
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return true;
}

bool parse_qubit_list(const std::string& text, std::vector<int>& out, std::string& err) {
    std::vector<std::uint64_t> values;
    if (!parse_value_list(text, values, err)) return false;
    out.clear();
    for (auto v : values) {
        if (v > 63) {
            err = fmt::format("qubit index {} out of range", v);
            return false;
        }
        out.push_back(static_cast<int>(v));
    }
    return true;
}

} // namespace qamem::config
