#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace bridge::utils {

    inline bool is_space(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    inline std::string_view trim(std::string_view s) {
        while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
        while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
        return s;
    }

    // strips trailing CR/LF only, leaves other whitespace untouched
    inline std::string_view trim_line_ending(std::string_view s) {
        while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.remove_suffix(1);
        return s;
    }

    inline std::string to_lower(std::string_view s) {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    inline bool iequals(std::string_view a, std::string_view b) {
        if (a.size() != b.size()) return false;
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }

    inline bool istarts_with(std::string_view s, std::string_view prefix) {
        return s.size() >= prefix.size() && iequals(s.substr(0, prefix.size()), prefix);
    }

    inline bool ends_with(std::string_view s, std::string_view suffix) {
        return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
    }

    /**
     * @brief Split a comma separated list, dropping empty and whitespace-only items.
     */
    inline std::vector<std::string> split_list(std::string_view s, char sep = ',') {
        std::vector<std::string> items;
        while (true) {
            auto pos = s.find(sep);
            auto item = trim(s.substr(0, pos));
            if (!item.empty()) items.emplace_back(item);
            if (pos == std::string_view::npos) break;
            s.remove_prefix(pos + 1);
        }
        return items;
    }

}// namespace bridge::utils
