#ifndef PARSER_H_
#define PARSER_H_

#include "Ast.h"
#include "Constants.h"
#include "Options.h"

#include <cstdint>
#include <string_view>

ParseTree ParsePattern(std::u16string_view pattern, uint32_t options, CaseFold caseFold, int nestingLimit = DefaultNestingLimit);

#endif
