#pragma once

#include <string>
#include <cctype>
#include <algorithm>
#include <boost/json.hpp>

namespace wkd {

// Validation of request-supplied values before they reach the key store.
class InputValidator {
public:
    // A WKD token: exactly 32 characters of the Z-Base-32 alphabet.
    static bool is_valid_wkd_token(const std::string& token) {
        static const std::string alphabet = "ybndrfg8ejkmcpqxot1uwisza345h769";
        if (token.size() != 32) return false;
        return std::all_of(token.begin(), token.end(), [](char c) {
            return alphabet.find(c) != std::string::npos;
        });
    }

    /**
     * Checks a DNS name as it appears in a lookup path or Host header:
     * dot-separated labels of letters, digits and hyphens, no label longer
     * than 63 characters and no hyphen at either end of a label.
     */
    static bool is_valid_domain(const std::string& domain) {
        if (domain.empty() || domain.size() > 253) return false;

        size_t label_start = 0;
        while (label_start <= domain.size()) {
            size_t dot = domain.find('.', label_start);
            if (dot == std::string::npos) dot = domain.size();
            size_t len = dot - label_start;
            if (len == 0 || len > 63) return false;
            if (domain[label_start] == '-' || domain[dot - 1] == '-') return false;
            for (size_t i = label_start; i < dot; ++i) {
                unsigned char c = static_cast<unsigned char>(domain[i]);
                if (!std::isalnum(c) && c != '-') return false;
            }
            label_start = dot + 1;
        }
        return true;
    }

    static bool is_within_size_limit(size_t size, size_t max_size) {
        return size <= max_size;
    }

    static std::string to_lower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    /**
     * JSON parsing with a recursion depth limit.
     */
    static boost::json::value safe_parse_json(const std::string& input) {
        boost::json::parse_options opt;
        opt.max_depth = 16;
        return boost::json::parse(input, {}, opt);
    }
};

}
