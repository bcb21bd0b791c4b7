#pragma once

#include "ndcopy/core/copy_def.hpp"

namespace ndcopy {

/**
 * Performs the copy described by `copy_description`, one `memcpy` per row. The descriptor must
 * address memory inside both buffers and the two regions must not overlap.
 */
void execute_copy(const void* src_buffer, void* dst_buffer, const CopyDef& copy_description);

}  // namespace ndcopy
