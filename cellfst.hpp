#pragma once

// ============================================================================
// cellfst -- frozen sets and maps of H3 cells on a byte-keyed FST
//
// Build with frozen_set_builder / frozen_map_builder from cells sorted by
// key_less, then query read-only from memory, a borrowed buffer or a
// mapped file.
// ============================================================================

#include "cellfst_support.hpp"
#include "cellfst_error.hpp"
#include "cellfst_cell.hpp"
#include "cellfst_key.hpp"
#include "cellfst_fst_node.hpp"
#include "cellfst_fst_builder.hpp"
#include "cellfst_fst.hpp"
#include "cellfst_query.hpp"
#include "cellfst_builder.hpp"
#include "cellfst_mmap.hpp"
#include "cellfst_storage.hpp"
#include "cellfst_iter.hpp"
#include "cellfst_set.hpp"
#include "cellfst_map.hpp"
