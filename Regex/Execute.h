#ifndef EXECUTE_H_
#define EXECUTE_H_

#include "MatchResult.h"

#include <cstddef>
#include <optional>
#include <string_view>

class Regex;

std::optional<MatchResult> Execute(const Regex &re, std::u16string_view input, size_t start);

#endif
