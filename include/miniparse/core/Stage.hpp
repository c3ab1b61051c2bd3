#pragma once
#include <functional>

#include "miniparse/core/Types.hpp"

namespace miniparse {

// One pipeline step. The record is moved in and handed back, so a stage only
// ever mutates a value it owns. Throwing aborts the whole process() call.
using Stage = std::function<IntentResult(IntentResult)>;

} // namespace miniparse
