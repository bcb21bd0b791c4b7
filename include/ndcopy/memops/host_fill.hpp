#pragma once

#include <cstddef>

#include "ndcopy/core/fill_def.hpp"

namespace ndcopy {

/**
 * Writes `pattern_nbytes` bytes from `pattern` repeatedly into `dst_buffer` until `nbytes` bytes
 * have been written. `nbytes` must be a multiple of `pattern_nbytes`.
 */
void execute_fill(void* dst_buffer, size_t nbytes, const void* pattern, size_t pattern_nbytes);

/**
 * Performs the fill described by `fill_description`.
 */
void execute_fill(void* dst_buffer, const FillDef& fill_description);

}  // namespace ndcopy
