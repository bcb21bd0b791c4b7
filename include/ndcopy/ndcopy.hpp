#pragma once

#include "ndcopy/core/config.hpp"
#include "ndcopy/core/errors.hpp"
#include "ndcopy/core/geometry.hpp"
#include "ndcopy/core/runtime_shape.hpp"
#include "ndcopy/core/shape.hpp"
#include "ndcopy/copy.hpp"
#include "ndcopy/fill.hpp"
