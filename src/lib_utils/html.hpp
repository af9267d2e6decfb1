#pragma once

// HTML tree, built by a tolerant SAX-style parser.
// Text is kept verbatim (whitespace included): teletext rows are fixed-width.

#include "lib_utils/small_map.hpp"
#include <string>
#include <vector>

namespace html {

struct Node {
	std::string name; // lowercase tag name, empty for text nodes
	SmallMap<std::string, std::string> attr;
	std::vector<Node> children;
	std::string text; // text nodes only, entities already decoded

	bool isText() const {
		return name.empty();
	}

	// empty string when absent
	std::string attribute(const char* attrName) const;
	bool hasAttribute(const char* attrName) const;

	std::vector<std::string> classes() const;
	bool hasClass(const std::string& cls) const;
};

// Returns a "#document" root node.
// Throws std::runtime_error when the input ends inside a tag.
Node parse(const std::string& text);

// Selectors: "tag", ".class", "#id", "tag.class", "tag#id".
bool matches(const Node& node, const std::string& selector);
Node const* findFirst(const Node& root, const std::string& selector);
std::vector<Node const*> findAll(const Node& root, const std::string& selector);

}
