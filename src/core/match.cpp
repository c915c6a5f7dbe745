#include <fnr/core/match.hpp>

namespace fnr {

std::filesystem::path Match::destination() const {
    return path.parent_path() / new_name;
}

size_t Match::depth() const {
    size_t n = 0;
    for (const auto& part : path) {
        if (!part.empty()) n++;
    }
    return n;
}

} // namespace fnr
