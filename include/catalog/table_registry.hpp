#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace querygate {

/// One row of the administrator-curated table registry
struct AllowedTable {
    std::string schema;
    std::string table;
    int tier = 3;            // trust tier, lower is more trusted
    bool active = true;
};

class RegistryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Read-only view of the table registry
 *
 * list_active_tables() throws RegistryError when the registry cannot be read.
 */
class ITableRegistry {
public:
    virtual ~ITableRegistry() = default;

    [[nodiscard]] virtual std::vector<AllowedTable> list_active_tables() = 0;
};

} // namespace querygate
