#pragma once

#include "tmbdd/ast.hpp"

#include <string>

namespace tmbdd {

// Parse surface language source. Throws ParseError on bad syntax or a
// mistyped expression, SemanticError on duplicate definitions.
Program Parse(const std::string& source);

}  // namespace tmbdd
