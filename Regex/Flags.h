#ifndef FLAGS_H_
#define FLAGS_H_

#include "Options.h"

#include <cstdint>
#include <string_view>

struct RegexFlags {
	uint32_t options = RE_OPTION_SINGLELINE;
	bool global      = false;
};

RegexFlags ParseFlags(std::u16string_view flags);

#endif
