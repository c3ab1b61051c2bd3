#pragma once
#include "miniparse/core/Types.hpp"

namespace miniparse {

// drops punct tokens, keeps order of the rest; entities untouched
IntentResult clean(IntentResult input);

} // namespace miniparse
