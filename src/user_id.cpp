#include "user_id.hpp"
#include <algorithm>
#include <cctype>

namespace wkd {

namespace {

std::string trim(const std::string& s) {
    auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string();
}

bool is_addr_spec(const std::string& addr) {
    if (std::count(addr.begin(), addr.end(), '@') != 1) return false;
    if (!split_email(addr)) return false;
    return std::none_of(addr.begin(), addr.end(), [](unsigned char c) {
        return std::isspace(c) || std::iscntrl(c) || c == '<' || c == '>' || c == ',';
    });
}

}

std::optional<std::pair<std::string, std::string>> split_email(const std::string& address) {
    auto at = address.rfind('@');
    if (at == std::string::npos || at == 0 || at + 1 == address.size()) {
        return std::nullopt;
    }
    return std::make_pair(address.substr(0, at), address.substr(at + 1));
}

std::optional<std::string> UserId::email() const {
    if (is_attribute) return std::nullopt;

    std::string text = trim(value);
    if (text.empty()) return std::nullopt;

    std::string candidate;
    if (text.back() == '>') {
        auto open = text.rfind('<');
        if (open == std::string::npos) return std::nullopt;
        candidate = text.substr(open + 1, text.size() - open - 2);
    } else {
        candidate = text;
    }

    if (!is_addr_spec(candidate)) return std::nullopt;
    return candidate;
}

std::optional<std::string> UserId::email_normalized() const {
    auto addr = email();
    if (!addr) return std::nullopt;
    std::transform(addr->begin(), addr->end(), addr->begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return addr;
}

}
