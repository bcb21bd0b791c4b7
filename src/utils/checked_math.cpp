#include <stdexcept>

#include "ndcopy/utils/checked_math.hpp"

namespace ndcopy {

void throw_overflow_exception() {
    throw std::overflow_error("index arithmetic resulted in overflow");
}

}  // namespace ndcopy
