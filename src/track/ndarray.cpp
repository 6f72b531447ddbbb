#include "track/ndarray.hpp"

#include <limits>

namespace genotrack {

size_t checked_element_count(const std::vector<int64_t>& shape) {
    size_t count = 1;
    for (size_t i = 0; i < shape.size(); i++) {
        int64_t extent = shape[i];
        if (extent < 0) {
            throw InvalidArgumentError("negative extent " + std::to_string(extent)
                                       + " in dimension " + std::to_string(i));
        }
        auto d = static_cast<uint64_t>(extent);
        if (d != 0 && count > std::numeric_limits<size_t>::max() / d) {
            throw InvalidArgumentError("array shape too large");
        }
        count *= static_cast<size_t>(d);
    }
    return count;
}

size_t checked_product(const std::vector<size_t>& shape) {
    size_t count = 1;
    for (size_t d : shape) {
        if (d != 0 && count > std::numeric_limits<size_t>::max() / d) {
            throw InvalidArgumentError("array shape " + shape_to_string(shape)
                                       + " too large");
        }
        count *= d;
    }
    return count;
}

std::string shape_to_string(const std::vector<size_t>& shape) {
    std::string s = "(";
    for (size_t i = 0; i < shape.size(); i++) {
        if (i > 0) s += ", ";
        s += std::to_string(shape[i]);
    }
    if (shape.size() == 1) s += ",";
    s += ")";
    return s;
}

} // namespace genotrack
