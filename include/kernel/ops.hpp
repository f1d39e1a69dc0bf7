#pragma once
#include "tg_types.hpp"

namespace tg { namespace ops {

// Registers the built-in handler factories with OpRegistry::instance().
// Safe to call more than once.
void register_builtin();

}} // namespace tg::ops
