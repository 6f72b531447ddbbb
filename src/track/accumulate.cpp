#include "track/accumulate.hpp"

namespace genotrack {

const char* reduction_name(Reduction op) {
    return (op == Reduction::kMin) ? "min" : "max";
}

} // namespace genotrack
