#pragma once

#include <string>

namespace folio {

// Random 128-bit identifier formatted like a UUID (8-4-4-4-12 hex).
std::string makeId();

} // namespace folio
