#include "UsbIdentifier.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdlib>
#include <cerrno>

namespace sampler_monitor {

namespace {

// A sign is only accepted where allowSign is set; "0x" digits never carry one.
std::optional<int> parseWhole(const std::string& text, int base, bool allowSign = true) {
    size_t digits = 0;
    if (allowSign && !text.empty() && (text.front() == '+' || text.front() == '-')) {
        digits = 1;
    }
    // strtol would also skip blanks and a second sign
    if (digits >= text.size() || !std::isxdigit(static_cast<unsigned char>(text[digits]))) {
        return std::nullopt;
    }

    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, base);
    if (errno != 0 || end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    if (value > INT_MAX || value < INT_MIN) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

std::string trimmedLower(const std::string& value) {
    auto first = std::find_if_not(value.begin(), value.end(),
        [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(value.rbegin(), value.rend(),
        [](unsigned char c) { return std::isspace(c); }).base();

    std::string result = first < last ? std::string(first, last) : std::string();
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<int> normalizeUsbId(const std::string& raw) {
    std::string value = trimmedLower(raw);
    if (value.empty()) {
        return std::nullopt;
    }

    if (value.rfind("0x", 0) == 0) {
        if (auto hex = parseWhole(value.substr(2), 16, false)) {
            return hex;
        }
    }

    if (value.size() == 4) {
        if (auto hex = parseWhole(value, 16)) {
            return hex;
        }
    }

    if (auto decimal = parseWhole(value, 10)) {
        return decimal;
    }

    return parseWhole(value, 16);
}

std::optional<int> normalizeUsbId(const UsbIdValue& value) {
    if (const int* number = std::get_if<int>(&value)) {
        return *number;
    }
    if (const std::string* text = std::get_if<std::string>(&value)) {
        return normalizeUsbId(*text);
    }
    return std::nullopt;
}

std::string formatUsbId(const UsbIdValue& value) {
    if (const int* number = std::get_if<int>(&value)) {
        return std::to_string(*number);
    }
    if (const std::string* text = std::get_if<std::string>(&value)) {
        return "\"" + *text + "\"";
    }
    return "null";
}

}
