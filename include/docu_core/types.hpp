#pragma once

// Aggregator header for commonly-used core types.
// Instead of including each individual header (e.g. docu_core/types/chunk.hpp),
// users can simply do `#include "docu_core/types.hpp"`.
//
#include "docu_core/types/chunk.hpp"
#include "docu_core/types/document.hpp"
#include "docu_core/types/indexing_result.hpp"
