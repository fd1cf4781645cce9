#pragma once

#include <string>
#include <vector>
#include <set>

namespace kgx {

/**
 * @brief Single owned set of claimed element identifiers
 *
 * Nodes and edges share one namespace, so one pool is threaded through both
 * node and edge id resolution of a sanitization pass.
 */
class IdentifierPool {
public:
    IdentifierPool() = default;
    explicit IdentifierPool(const std::vector<std::string>& used);

    bool contains(const std::string& id) const { return used_.count(id) > 0; }
    size_t size() const { return used_.size(); }

    /**
     * @brief Claim `base`, or the first free `base__1`, `base__2`, ...
     * @return The identifier that was registered
     */
    std::string claim(const std::string& base);

private:
    std::set<std::string> used_;
};

} // namespace kgx
