#include "expansion/identifier_pool.hpp"

namespace kgx {

IdentifierPool::IdentifierPool(const std::vector<std::string>& used)
    : used_(used.begin(), used.end()) {}

std::string IdentifierPool::claim(const std::string& base) {
    std::string id = base;
    int suffix = 1;
    while (used_.count(id)) {
        id = base + "__" + std::to_string(suffix++);
    }
    used_.insert(id);
    return id;
}

} // namespace kgx
