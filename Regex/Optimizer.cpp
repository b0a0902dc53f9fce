
#include "Optimizer.h"
#include "CaseFold.h"

#include <gsl/gsl_util>

#include <QStringList>

#include <algorithm>
#include <bitset>
#include <string>
#include <utility>

namespace {

// A literal run guaranteed to occur in every match of a node, at a distance
// in [dMin, dMax] from the start of that match.
struct ExactRun {
	std::u16string text;
	uint32_t dMin = 0;
	uint32_t dMax = 0;
};

struct NodeInfo {
	MinMaxLength len;
	std::u16string prefix;       // every match starts with this
	bool prefixComplete = false; // every match is exactly `prefix`
	ExactRun exact;
	std::bitset<CharTableSize> first; // low bytes of possible first code units
	bool firstAny        = false;
	uint32_t leftAnchor  = 0;
	uint32_t rightAnchor = 0;
};

/**
 * @brief Compares two runs. Longer runs win, then runs at a bounded distance,
 * then runs closer to the start of the match.
 */
bool IsBetter(const ExactRun &candidate, const ExactRun &current) {
	if (candidate.text.empty()) {
		return false;
	}

	if (current.text.empty()) {
		return true;
	}

	if (candidate.text.size() != current.text.size()) {
		return candidate.text.size() > current.text.size();
	}

	const bool candidateBounded = candidate.dMax != InfiniteDistance;
	const bool currentBounded   = current.dMax != InfiniteDistance;
	if (candidateBounded != currentBounded) {
		return candidateBounded;
	}

	return candidate.dMin < current.dMin;
}

void Consider(ExactRun &best, ExactRun candidate) {
	if (IsBetter(candidate, best)) {
		best = std::move(candidate);
	}
}

bool Truncate(std::u16string &text) {
	if (text.size() > OptExactMaxLength) {
		text.resize(OptExactMaxLength);
		return true;
	}

	return false;
}

void AddFirst(NodeInfo &info, char16_t ch) {
	info.first.set(ch & 0xff);
}

void AddFirst(NodeInfo &info, const CharSet &set) {
	if (set.negated()) {
		info.firstAny = true;
		return;
	}

	for (const CharSet::Range &range : set.ranges()) {
		if (static_cast<uint32_t>(range.last) - range.first >= CharTableSize - 1) {
			info.firstAny = true;
			return;
		}

		for (uint32_t ch = range.first; ch <= range.last; ++ch) {
			info.first.set(ch & 0xff);
		}
	}
}

class Optimizer {
public:
	Optimizer(const ParseTree &tree, uint32_t options, CaseFold caseFold)
		: tree_(tree), caseFold_(caseFold), ignoreCase_((options & RE_OPTION_IGNORECASE) != 0) {
	}

public:
	NodeInfo run();

private:
	void visitLeaf(const Node &node, NodeInfo &info) const;
	void visitConcatenation(const Node &node, NodeInfo &info) const;
	void visitAlternation(const Node &node, NodeInfo &info) const;
	void visitQuantifier(const Node &node, NodeInfo &info) const;

private:
	const ParseTree &tree_;
	CaseFold caseFold_;
	bool ignoreCase_;
	std::vector<NodeInfo> infos_;
};

NodeInfo Optimizer::run() {
	infos_.assign(tree_.nodes.size(), NodeInfo{});

	const std::vector<MinMaxLength> lengths = tree_.lengths();

	for (NodeIndex index : tree_.postOrder()) {
		const Node &node = tree_[index];
		NodeInfo &info   = infos_[index];
		info.len         = lengths[index];

		switch (node.type) {
		case NodeType::Concatenation:
			visitConcatenation(node, info);
			break;
		case NodeType::Alternation:
			visitAlternation(node, info);
			break;
		case NodeType::Quantifier:
			visitQuantifier(node, info);
			break;
		case NodeType::Group: {
			const MinMaxLength len = info.len;
			info                   = infos_[node.children[0]];
			info.len               = len;
			break;
		}
		default:
			visitLeaf(node, info);
			break;
		}
	}

	return infos_[tree_.root];
}

void Optimizer::visitLeaf(const Node &node, NodeInfo &info) const {
	switch (node.type) {
	case NodeType::Empty:
	case NodeType::LookAround:
		info.prefixComplete = true;
		break;

	case NodeType::String: {
		std::u16string text = tree_.strings[node.operand];
		if (ignoreCase_) {
			AddFirst(info, ToUpperCase(text[0], caseFold_));
			AddFirst(info, ToLowerCase(text[0], caseFold_));
			std::transform(text.begin(), text.end(), text.begin(), [this](char16_t ch) {
				return FoldCase(ch, caseFold_);
			});
		} else {
			AddFirst(info, text[0]);
		}

		info.prefixComplete = true;
		info.prefix         = text;
		if (Truncate(info.prefix)) {
			info.prefixComplete = false;
		}

		info.exact = ExactRun{info.prefix, 0, 0};
		break;
	}

	case NodeType::CharClass:
		AddFirst(info, tree_.classes[node.operand]);
		break;

	case NodeType::AnyChar:
	case NodeType::BackReference:
		info.firstAny = true;
		break;

	case NodeType::Anchor:
		info.prefixComplete = true;
		switch (static_cast<AnchorType>(node.operand)) {
		case AnchorType::BeginBuf:
			info.leftAnchor = ANCHOR_BEGIN_BUF;
			break;
		case AnchorType::BeginLine:
			info.leftAnchor = ANCHOR_BEGIN_LINE;
			break;
		case AnchorType::EndBuf:
			info.rightAnchor = ANCHOR_END_BUF;
			break;
		case AnchorType::SemiEndBuf:
			info.rightAnchor = ANCHOR_SEMI_END_BUF;
			break;
		case AnchorType::EndLine:
			info.rightAnchor = ANCHOR_END_LINE;
			break;
		case AnchorType::WordBoundary:
		case AnchorType::NotWordBoundary:
			break;
		}
		break;

	default:
		break;
	}
}

void Optimizer::visitConcatenation(const Node &node, NodeInfo &info) const {

	MinMaxLength dist;
	ExactRun chain;
	bool inPrefix = true;

	info.prefixComplete = true;

	for (NodeIndex child : node.children) {
		const NodeInfo &sub = infos_[child];

		// exact runs inside the child
		if (!sub.exact.text.empty()) {
			Consider(info.exact, ExactRun{sub.exact.text, AddDistance(dist.min, sub.exact.dMin), AddDistance(dist.max, sub.exact.dMax)});
		}

		// literal runs spanning several children
		if (chain.text.empty()) {
			chain.dMin = dist.min;
			chain.dMax = dist.max;
		}

		chain.text += sub.prefix;
		if (inPrefix) {
			info.prefix += sub.prefix;
			if (!sub.prefixComplete) {
				inPrefix            = false;
				info.prefixComplete = false;
			}
		}

		if (!sub.prefixComplete) {
			Truncate(chain.text);
			Consider(info.exact, std::move(chain));
			chain = ExactRun{};
		}

		dist.min = AddDistance(dist.min, sub.len.min);
		dist.max = AddDistance(dist.max, sub.len.max);
	}

	Truncate(chain.text);
	Consider(info.exact, std::move(chain));
	if (Truncate(info.prefix)) {
		info.prefixComplete = false;
	}

	// first code units
	for (NodeIndex child : node.children) {
		const NodeInfo &sub = infos_[child];
		info.first |= sub.first;
		info.firstAny = info.firstAny || sub.firstAny;
		if (sub.len.min != 0) {
			break;
		}
	}

	// anchors, skipping over zero width children
	for (NodeIndex child : node.children) {
		const NodeInfo &sub = infos_[child];
		info.leftAnchor |= sub.leftAnchor;
		if (sub.len.max != 0) {
			break;
		}
	}

	for (auto it = node.children.rbegin(); it != node.children.rend(); ++it) {
		const NodeInfo &sub = infos_[*it];
		info.rightAnchor |= sub.rightAnchor;
		if (sub.len.max != 0) {
			break;
		}
	}
}

void Optimizer::visitAlternation(const Node &node, NodeInfo &info) const {

	const NodeInfo &head = infos_[node.children.front()];
	info.prefix          = head.prefix;
	info.prefixComplete  = head.prefixComplete;
	info.leftAnchor      = head.leftAnchor;
	info.rightAnchor     = head.rightAnchor;

	for (NodeIndex child : node.children) {
		const NodeInfo &sub = infos_[child];

		auto mismatch = std::mismatch(info.prefix.begin(), info.prefix.end(), sub.prefix.begin(), sub.prefix.end());
		if (mismatch.first != info.prefix.end() || sub.prefix.size() != info.prefix.size() || !sub.prefixComplete) {
			info.prefixComplete = false;
		}

		info.prefix.erase(mismatch.first, info.prefix.end());

		info.first |= sub.first;
		info.firstAny = info.firstAny || sub.firstAny;
		info.leftAnchor &= sub.leftAnchor;
		info.rightAnchor &= sub.rightAnchor;
	}

	info.exact = ExactRun{info.prefix, 0, 0};
}

void Optimizer::visitQuantifier(const Node &node, NodeInfo &info) const {
	const NodeInfo &body = infos_[node.children[0]];

	info.first    = body.first;
	info.firstAny = body.firstAny;

	if (node.min == 0) {
		info.prefixComplete = (node.max == 0);
		return;
	}

	info.leftAnchor  = body.leftAnchor;
	info.rightAnchor = body.rightAnchor;
	info.exact       = body.exact;

	if (body.prefixComplete) {
		info.prefixComplete = (node.min == node.max);
		for (uint32_t i = 0; i < node.min && info.prefix.size() <= OptExactMaxLength; ++i) {
			info.prefix += body.prefix;
		}

		if (Truncate(info.prefix)) {
			info.prefixComplete = false;
		}
	} else {
		info.prefix = body.prefix;
	}

	Consider(info.exact, ExactRun{info.prefix, 0, 0});
}

}

/**
 * @brief Builds the Boyer-Moore-Horspool skip table for an exact run. Every
 * entry defaults to the run length; for each position i except the last,
 * the entry of the low byte of exact[i] becomes L-1-i. Later positions
 * overwrite earlier ones.
 *
 * @param exact The run.
 * @return The skip table.
 */
std::array<uint32_t, CharTableSize> BuildSkipTable(std::u16string_view exact) {
	const auto len = gsl::narrow_cast<uint32_t>(exact.size());

	std::array<uint32_t, CharTableSize> skip;
	skip.fill(len);

	for (uint32_t i = 0; i + 1 < len; ++i) {
		skip[exact[i] & 0xff] = len - 1 - i;
	}

	return skip;
}

/**
 * @brief Derives the search strategy and anchor information for a pattern.
 * Never fails; when nothing useful is found the strategy is SearchNone.
 *
 * @param tree The parse tree.
 * @param options RE_OPTION bits.
 * @param caseFold Rules used to fold literals when ignoring case.
 * @param allowBoyerMoore If false, exact runs are searched with ExactSlow.
 * @return The optimizer result.
 */
OptimizeInfo Optimize(const ParseTree &tree, uint32_t options, CaseFold caseFold, bool allowBoyerMoore) {

	const bool ignoreCase = (options & RE_OPTION_IGNORECASE) != 0;

	Optimizer optimizer(tree, options, caseFold);
	NodeInfo root = optimizer.run();

	OptimizeInfo info;
	info.length = root.len;

	info.anchor = (root.leftAnchor & ANCHOR_BEGIN_BUF) | (root.rightAnchor & ANCHOR_END_BUF_MASK);
	if (info.anchor & ANCHOR_END_BUF) {
		info.anchorDmin = 0;
		info.anchorDmax = 0;
	} else if (info.anchor & ANCHOR_SEMI_END_BUF) {
		info.anchorDmin = 0;
		info.anchorDmax = 1;
	}

	info.subAnchor = (root.leftAnchor & ANCHOR_BEGIN_LINE) | (root.rightAnchor & ANCHOR_END_LINE);

	ExactRun &exact = root.exact;

	if (!exact.text.empty()) {
		info.dMin = exact.dMin;
		info.dMax = exact.dMax;

		if (ignoreCase) {
			info.strategy = SearchExactSlowIC{exact.text};
		} else if (exact.text.size() == 1) {
			SearchCharacterMap map;
			map.map.set(exact.text[0] & 0xff);
			info.strategy = map;
		} else if (allowBoyerMoore) {
			info.strategy = SearchBoyerMoore{exact.text, BuildSkipTable(exact.text)};
		} else {
			info.strategy = SearchExactSlow{exact.text};
		}

		if (info.dMin != InfiniteDistance) {
			info.thresholdLength = AddDistance(info.dMin, gsl::narrow_cast<uint32_t>(exact.text.size()));
		}
	} else if (!ignoreCase && !root.firstAny && root.len.min > 0) {
		info.strategy        = SearchCharacterMap{root.first};
		info.dMin            = 0;
		info.dMax            = 0;
		info.thresholdLength = 1;
	} else {
		info.strategy        = SearchNone{};
		info.thresholdLength = root.len.min;
	}

	return info;
}

const char *AlgorithmName(SearchAlgorithm algorithm) noexcept {
	switch (algorithm) {
	case SearchAlgorithm::None:
		return "None";
	case SearchAlgorithm::ExactSlow:
		return "ExactSlow";
	case SearchAlgorithm::ExactSlowCaseInsensitive:
		return "ExactSlowCaseInsensitive";
	case SearchAlgorithm::BoyerMoore:
		return "BoyerMoore";
	case SearchAlgorithm::CharacterMap:
		return "CharacterMap";
	}

	return "Unknown";
}

QString AnchorToString(uint32_t anchor) {
	QStringList names;

	if (anchor & ANCHOR_BEGIN_BUF) {
		names << QLatin1String("begin-buf");
	}

	if (anchor & ANCHOR_BEGIN_LINE) {
		names << QLatin1String("begin-line");
	}

	if (anchor & ANCHOR_END_BUF) {
		names << QLatin1String("end-buf");
	}

	if (anchor & ANCHOR_SEMI_END_BUF) {
		names << QLatin1String("semi-end-buf");
	}

	if (anchor & ANCHOR_END_LINE) {
		names << QLatin1String("end-line");
	}

	return QStringLiteral("[%1]").arg(names.join(QLatin1Char(' ')));
}

QString DistanceToString(uint32_t distance) {
	if (distance == InfiniteDistance) {
		return QLatin1String("inf");
	}

	return QString::number(distance);
}

/**
 * @brief Formats the optimizer result for debugging.
 */
QString OptimizeInfoToString(const OptimizeInfo &info) {
	const SearchAlgorithm algorithm = AlgorithmOf(info.strategy);

	QString s;
	s += QStringLiteral("optimize: %1\n").arg(QLatin1String(AlgorithmName(algorithm)));
	s += QStringLiteral("  anchor:     %1").arg(AnchorToString(info.anchor));

	if (info.anchor & ANCHOR_END_BUF_MASK) {
		s += QStringLiteral("(%1, %2)").arg(DistanceToString(info.anchorDmin), DistanceToString(info.anchorDmax));
	}

	s += QLatin1Char('\n');

	if (algorithm != SearchAlgorithm::None) {
		s += QStringLiteral("  sub anchor: %1\n").arg(AnchorToString(info.subAnchor));
	}

	s += QStringLiteral("dmin: %1 dmax: %2\n").arg(DistanceToString(info.dMin), DistanceToString(info.dMax));
	s += QStringLiteral("threshold length: %1\n").arg(info.thresholdLength);

	std::u16string_view exact;
	if (auto bm = std::get_if<SearchBoyerMoore>(&info.strategy)) {
		exact = bm->exact;
	} else if (auto slow = std::get_if<SearchExactSlow>(&info.strategy)) {
		exact = slow->exact;
	} else if (auto slowIC = std::get_if<SearchExactSlowIC>(&info.strategy)) {
		exact = slowIC->exact;
	}

	if (!exact.empty()) {
		s += QStringLiteral("exact: [%1]: length: %2\n").arg(QString::fromStdU16String(std::u16string(exact))).arg(exact.size());
	} else if (auto map = std::get_if<SearchCharacterMap>(&info.strategy)) {
		s += QStringLiteral("map: n = %1\n").arg(map->map.count());

		if (map->map.any()) {
			QStringList chars;
			for (size_t i = 0; i < CharTableSize; ++i) {
				if (map->map.test(i)) {
					chars << QString(QChar(static_cast<ushort>(i)));
				}
			}

			s += QStringLiteral("[%1]\n").arg(chars.join(QLatin1String(", ")));
		}
	}

	return s;
}
