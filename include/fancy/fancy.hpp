#pragma once

#include "core.hpp"
#include "errors.hpp"
#include "dtype.hpp"
#include "buffer.hpp"
#include "profiler.hpp"
#include "exec_context.hpp"
#include "ndarray.hpp"
#include "kernels.hpp"
#include "indexing.hpp"
#include "config.hpp"
