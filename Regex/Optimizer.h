#ifndef OPTIMIZER_H_
#define OPTIMIZER_H_

#include "Ast.h"
#include "Options.h"
#include "SearchStrategy.h"

#include <QString>

#include <array>
#include <cstdint>
#include <string_view>

enum ANCHOR_TYPE : uint32_t {
	ANCHOR_BEGIN_BUF    = 1u << 0,
	ANCHOR_BEGIN_LINE   = 1u << 1,
	ANCHOR_END_BUF      = 1u << 2,
	ANCHOR_SEMI_END_BUF = 1u << 3,
	ANCHOR_END_LINE     = 1u << 4,
};

constexpr uint32_t ANCHOR_END_BUF_MASK = ANCHOR_END_BUF | ANCHOR_SEMI_END_BUF;

/**
 * @brief Search acceleration data derived from a parse tree.
 *
 * `anchor` holds the buffer anchors every match satisfies. For the end
 * anchors `anchorDmin` and `anchorDmax` bound the distance between the end of
 * the match and the end of the buffer. `subAnchor` holds the line anchors.
 *
 * `dMin` and `dMax` bound the distance from the start of the match to the
 * exact run (or map character) the strategy searches for.
 * `thresholdLength` is the least number of code units that must remain after
 * a candidate start for a match to be possible.
 */
struct OptimizeInfo {
	SearchStrategy strategy;
	uint32_t anchor          = 0;
	uint32_t anchorDmin      = 0;
	uint32_t anchorDmax      = 0;
	uint32_t subAnchor       = 0;
	uint32_t dMin            = 0;
	uint32_t dMax            = 0;
	uint32_t thresholdLength = 0;
	MinMaxLength length;
};

OptimizeInfo Optimize(const ParseTree &tree, uint32_t options, CaseFold caseFold, bool allowBoyerMoore);
std::array<uint32_t, CharTableSize> BuildSkipTable(std::u16string_view exact);
QString AnchorToString(uint32_t anchor);
QString DistanceToString(uint32_t distance);
QString OptimizeInfoToString(const OptimizeInfo &info);

#endif
