#include "security/destructive_screen.hpp"

#include <cctype>

namespace querygate {

namespace {

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Case-insensitive whole-word search
bool contains_keyword(std::string_view sql, std::string_view keyword) {
    const size_t kw_len = keyword.size();
    if (kw_len > sql.size()) return false;

    for (size_t i = 0; i <= sql.size() - kw_len; ++i) {
        bool match = true;
        for (size_t j = 0; j < kw_len; ++j) {
            if (std::toupper(static_cast<unsigned char>(sql[i + j])) !=
                static_cast<unsigned char>(keyword[j])) {
                match = false;
                break;
            }
        }
        if (!match) continue;

        // Word boundary before and after
        if (i > 0 && is_word_char(sql[i - 1])) continue;
        const size_t after = i + kw_len;
        if (after < sql.size() && is_word_char(sql[after])) continue;
        return true;
    }
    return false;
}

} // anonymous namespace

std::vector<std::string> DestructiveScreen::scan(std::string_view sql) {
    std::vector<std::string> found;
    for (const auto keyword : kKeywords) {
        if (contains_keyword(sql, keyword)) {
            found.emplace_back(keyword);
        }
    }
    return found;
}

std::string DestructiveScreen::format_error(const std::vector<std::string>& keywords) {
    std::string message = "Destructive operations not allowed: ";
    for (size_t i = 0; i < keywords.size(); ++i) {
        if (i > 0) message += ", ";
        message += keywords[i];
    }
    return message;
}

} // namespace querygate
