
#include "Ast.h"

#include <gsl/gsl_util>

#include <algorithm>
#include <utility>

/**
 * @brief Adds two distances, saturating at InfiniteDistance.
 */
uint32_t AddDistance(uint32_t a, uint32_t b) noexcept {
	if (a == InfiniteDistance || b == InfiniteDistance) {
		return InfiniteDistance;
	}

	const uint64_t sum = uint64_t{a} + b;
	return sum >= InfiniteDistance ? InfiniteDistance : gsl::narrow_cast<uint32_t>(sum);
}

/**
 * @brief Multiplies two distances, saturating at InfiniteDistance.
 */
uint32_t MultiplyDistance(uint32_t a, uint32_t b) noexcept {
	if (a == 0 || b == 0) {
		return 0;
	}

	if (a == InfiniteDistance || b == InfiniteDistance) {
		return InfiniteDistance;
	}

	const uint64_t product = uint64_t{a} * b;
	return product >= InfiniteDistance ? InfiniteDistance : gsl::narrow_cast<uint32_t>(product);
}

/**
 * @brief Appends a node to the arena.
 *
 * @param node The node to add.
 * @return The index of the new node.
 */
NodeIndex ParseTree::add(Node node) {
	nodes.push_back(std::move(node));
	return gsl::narrow_cast<NodeIndex>(nodes.size() - 1);
}

/**
 * @brief Looks up a named group.
 *
 * @param name The group name.
 * @return The capture number, if the name is defined.
 */
std::optional<uint32_t> ParseTree::groupNumber(std::u16string_view name) const {
	auto it = std::find_if(names.begin(), names.end(), [name](const GroupName &entry) {
		return entry.name == name;
	});

	if (it == names.end()) {
		return {};
	}

	return it->number;
}

/**
 * @brief Lists the nodes reachable from the root so that every node comes
 * after all of its children. Uses an explicit stack, so arbitrarily deep
 * trees are fine.
 *
 * @return The nodes in post-order.
 */
std::vector<NodeIndex> ParseTree::postOrder() const {
	std::vector<NodeIndex> order;
	if (root == InvalidNode) {
		return order;
	}

	order.reserve(nodes.size());

	// second member: the next child to descend into
	std::vector<std::pair<NodeIndex, size_t>> stack;
	stack.emplace_back(root, 0);

	while (!stack.empty()) {
		auto &[index, next] = stack.back();
		const Node &node    = nodes[index];

		if (next < node.children.size()) {
			const NodeIndex child = node.children[next++];
			stack.emplace_back(child, 0);
		} else {
			order.push_back(index);
			stack.pop_back();
		}
	}

	return order;
}

/**
 * @brief Computes the minimum and maximum length of every node.
 * Backreferences are treated as 0..infinite.
 *
 * @return The lengths, indexed by NodeIndex.
 */
std::vector<MinMaxLength> ParseTree::lengths() const {
	std::vector<MinMaxLength> result(nodes.size());

	for (NodeIndex index : postOrder()) {
		const Node &node = nodes[index];
		MinMaxLength &len = result[index];

		switch (node.type) {
		case NodeType::Empty:
		case NodeType::Anchor:
		case NodeType::LookAround:
			len = {0, 0};
			break;
		case NodeType::String: {
			const auto n = gsl::narrow_cast<uint32_t>(strings[node.operand].size());
			len          = {n, n};
			break;
		}
		case NodeType::CharClass:
		case NodeType::AnyChar:
			len = {1, 1};
			break;
		case NodeType::Group:
			len = result[node.children[0]];
			break;
		case NodeType::BackReference:
			len = {0, InfiniteDistance};
			break;
		case NodeType::Concatenation:
			len = {0, 0};
			for (NodeIndex child : node.children) {
				len.min = AddDistance(len.min, result[child].min);
				len.max = AddDistance(len.max, result[child].max);
			}
			break;
		case NodeType::Alternation:
			len = {InfiniteDistance, 0};
			for (NodeIndex child : node.children) {
				len.min = std::min(len.min, result[child].min);
				len.max = std::max(len.max, result[child].max);
			}
			break;
		case NodeType::Quantifier: {
			const MinMaxLength &body = result[node.children[0]];
			len.min                  = MultiplyDistance(body.min, node.min);
			len.max                  = (node.max == InfiniteDistance && body.max != 0) ? InfiniteDistance : MultiplyDistance(body.max, node.max);
			break;
		}
		}
	}

	return result;
}
