#pragma once

// Aggregator header for commonly-used core types.
// Instead of including each individual header (e.g. docchat_core/types/chunk.hpp),
// users can simply do `#include "docchat_core/types.hpp"`.
//
#include "docchat_core/types/chunk.hpp"
#include "docchat_core/types/conversation.hpp"
#include "docchat_core/types/document.hpp"
