#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace querygate {

/**
 * @brief Lexical pre-parse screen for data-modifying keywords
 *
 * Matches whole words case-insensitively anywhere in the raw text,
 * string literals and comments included: text that merely mentions
 * a destructive keyword is rejected. False positives are accepted.
 */
class DestructiveScreen {
public:
    static constexpr std::array<std::string_view, 9> kKeywords = {
        "DROP", "TRUNCATE", "DELETE", "INSERT", "UPDATE",
        "ALTER", "CREATE", "GRANT", "REVOKE"
    };

    /// Matched keywords (upper case) in list order, each at most once
    [[nodiscard]] static std::vector<std::string> scan(std::string_view sql);

    /// "Destructive operations not allowed: DROP, DELETE"
    [[nodiscard]] static std::string format_error(const std::vector<std::string>& keywords);
};

} // namespace querygate
