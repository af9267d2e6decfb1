#include "html.hpp"
#include "utf8.hpp"
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <sstream>
#include <stdexcept>

namespace html {
namespace {

typedef void NodeStartFunc(std::string /*name*/, SmallMap<std::string, std::string>& /*attributes*/, bool /*selfClosing*/);
typedef void NodeEndFunc(std::string /*name*/);
typedef void TextFunc(std::string /*text*/);

bool isVoidElement(const std::string& name) {
	static const char* const voidElements[] = {
		"area", "base", "br", "col", "embed", "hr", "img", "input",
		"link", "meta", "param", "source", "track", "wbr",
	};
	for(auto v : voidElements)
		if(name == v)
			return true;
	return false;
}

bool isRawTextElement(const std::string& name) {
	return name == "script" || name == "style";
}

struct Entity {
	const char* name;
	uint32_t codepoint;
};

Entity const entities[] = {
	{ "amp", '&' },
	{ "lt", '<' },
	{ "gt", '>' },
	{ "quot", '"' },
	{ "apos", '\'' },
	{ "nbsp", 0xa0 },
	{ "shy", 0xad },
	{ "copy", 0xa9 },
	{ "deg", 0xb0 },
	{ "sect", 0xa7 },
	{ "middot", 0xb7 },
	{ "laquo", 0xab },
	{ "raquo", 0xbb },
	{ "Auml", 0xc4 },
	{ "Ouml", 0xd6 },
	{ "Uuml", 0xdc },
	{ "auml", 0xe4 },
	{ "ouml", 0xf6 },
	{ "uuml", 0xfc },
	{ "szlig", 0xdf },
	{ "euro", 0x20ac },
};

bool decodeEntity(const std::string& name, uint32_t& codepoint) {
	if(name.size() > 1 && name[0] == '#') {
		auto const hex = name[1] == 'x' || name[1] == 'X';
		auto const digits = name.c_str() + (hex ? 2 : 1);
		if(*digits == 0)
			return false;
		char* end = nullptr;
		auto const value = strtoul(digits, &end, hex ? 16 : 10);
		if(*end != 0 || value == 0 || value >= 0x110000 || (value >= 0xd800 && value <= 0xdfff))
			return false;
		codepoint = (uint32_t)value;
		return true;
	}

	for(auto& e : entities) {
		if(name == e.name) {
			codepoint = e.codepoint;
			return true;
		}
	}

	return false;
}

// unknown or malformed entities are kept as they are
std::string decodeEntities(const std::string& raw) {
	std::string r;
	size_t i = 0;
	while(i < raw.size()) {
		if(raw[i] != '&') {
			r += raw[i++];
			continue;
		}

		auto const semi = raw.find(';', i);
		uint32_t codepoint = 0;
		if(semi == std::string::npos || semi - i > 12 || !decodeEntity(raw.substr(i + 1, semi - i - 1), codepoint)) {
			r += raw[i++];
			continue;
		}

		appendUtf8(r, codepoint);
		i = semi + 1;
	}
	return r;
}

void saxParse(const std::string& input, std::function<NodeStartFunc> onNodeStart, std::function<NodeEndFunc> onNodeEnd, std::function<TextFunc> onText) {
	using namespace std;

	size_t pos = 0;
	auto const len = input.size();

	auto front = [&]() -> char {
		if(pos >= len)
			throw runtime_error("Unexpected end of document");

		return input[pos];
	};

	auto skipSpaces = [&]() {
		while(pos < len && isspace((unsigned char)input[pos]))
			++pos;
	};

	auto skipPast = [&](const char* terminator) {
		auto const end = input.find(terminator, pos);
		if(end == string::npos)
			throw runtime_error("Unexpected end of document");
		pos = end + strlen(terminator);
	};

	auto parseTagName = [&]() {
		string r;
		while(pos < len && (isalnum((unsigned char)input[pos]) || input[pos] == ':' || input[pos] == '_' || input[pos] == '-'))
			r += (char)tolower((unsigned char)input[pos++]);
		return r;
	};

	auto parseAttributeName = [&]() {
		string r;
		while(pos < len && !isspace((unsigned char)input[pos]) && !strchr("/>=\"'", input[pos]))
			r += (char)tolower((unsigned char)input[pos++]);
		return r;
	};

	auto parseAttributeValue = [&]() {
		string r;
		auto const quote = front();
		if(quote == '"' || quote == '\'') {
			++pos;
			while(front() != quote)
				r += input[pos++];
			++pos;
		} else {
			while(pos < len && !isspace((unsigned char)input[pos]) && input[pos] != '>')
				r += input[pos++];
		}
		return decodeEntities(r);
	};

	string text;
	auto flushText = [&]() {
		if(!text.empty()) {
			onText(decodeEntities(text));
			text.clear();
		}
	};

	while(pos < len) {
		if(input[pos] != '<') {
			text += input[pos++];
			continue;
		}

		// a '<' that doesn't open markup is plain text
		auto const next = pos + 1 < len ? input[pos + 1] : '\0';
		if(!isalpha((unsigned char)next) && next != '/' && next != '!' && next != '?') {
			text += input[pos++];
			continue;
		}

		flushText();

		if(input.compare(pos, 4, "<!--") == 0) {
			pos += 4;
			skipPast("-->");
		} else if(next == '!' || next == '?') {
			// doctype, processing instruction
			skipPast(">");
		} else if(next == '/') {
			// closing tag
			pos += 2;
			auto const name = parseTagName();
			skipPast(">");
			if(!name.empty())
				onNodeEnd(name);
		} else {
			// opening tag
			++pos;
			auto const name = parseTagName();
			SmallMap<string, string> attr;
			bool selfClosing = false;

			for(;;) {
				skipSpaces();
				auto const c = front();
				if(c == '>') {
					++pos;
					break;
				}
				if(c == '/') {
					++pos;
					if(front() == '>') {
						++pos;
						selfClosing = true;
						break;
					}
					continue;
				}

				auto const attrName = parseAttributeName();
				if(attrName.empty()) {
					// stray quote or '='
					++pos;
					continue;
				}

				skipSpaces();
				string value;
				if(front() == '=') {
					++pos;
					skipSpaces();
					value = parseAttributeValue();
				}
				if(!attr.contains(attrName))
					attr[attrName] = value;
			}

			if(isVoidElement(name))
				selfClosing = true;

			onNodeStart(name, attr, selfClosing);

			if(!selfClosing && isRawTextElement(name)) {
				auto const end = input.find("</" + name, pos);
				if(end == string::npos)
					throw runtime_error("Unexpected end of document in <" + name + ">");
				if(end > pos)
					onText(input.substr(pos, end - pos));
				pos = end;
			}
		}
	}

	flushText();
}

void collectMatches(const Node& node, const std::string& selector, std::vector<Node const*>& out) {
	if(matches(node, selector))
		out.push_back(&node);
	for(auto& child : node.children)
		collectMatches(child, selector, out);
}

}

std::string Node::attribute(const char* attrName) const {
	auto i = attr.find(attrName);
	if(i == attr.end())
		return "";
	return (*i).value;
}

bool Node::hasAttribute(const char* attrName) const {
	return attr.contains(attrName);
}

std::vector<std::string> Node::classes() const {
	std::vector<std::string> r;
	std::stringstream ss(attribute("class"));
	std::string cls;
	while(ss >> cls)
		r.push_back(cls);
	return r;
}

bool Node::hasClass(const std::string& cls) const {
	for(auto& c : classes())
		if(c == cls)
			return true;
	return false;
}

Node parse(const std::string& text) {
	Node root;
	root.name = "#document";
	std::vector<Node*> stack { &root };

	auto onNodeStart = [&](std::string name, SmallMap<std::string, std::string>& attr, bool selfClosing) {
		Node node;
		node.name = name;
		node.attr = attr;
		auto parent = stack.back();
		parent->children.push_back(std::move(node));
		if(!selfClosing)
			stack.push_back(&parent->children.back());
	};

	auto onNodeEnd = [&](std::string name) {
		// close up to the matching element, ignore stray closing tags
		for(auto i = stack.size(); i > 1; --i) {
			if(stack[i - 1]->name == name) {
				stack.resize(i - 1);
				return;
			}
		}
	};

	auto onText = [&](std::string content) {
		auto parent = stack.back();
		if(!parent->children.empty() && parent->children.back().isText()) {
			parent->children.back().text += content;
		} else {
			Node node;
			node.text = content;
			parent->children.push_back(std::move(node));
		}
	};

	saxParse(text, onNodeStart, onNodeEnd, onText);
	return root;
}

bool matches(const Node& node, const std::string& selector) {
	if(node.isText())
		return false;

	auto const sep = selector.find_first_of(".#");
	auto const tag = selector.substr(0, sep);
	if(!tag.empty() && tag != node.name)
		return false;

	if(sep != std::string::npos) {
		auto const value = selector.substr(sep + 1);
		if(selector[sep] == '.')
			return node.hasClass(value);
		return node.attribute("id") == value;
	}

	return true;
}

Node const* findFirst(const Node& root, const std::string& selector) {
	if(matches(root, selector))
		return &root;
	for(auto& child : root.children)
		if(auto found = findFirst(child, selector))
			return found;
	return nullptr;
}

std::vector<Node const*> findAll(const Node& root, const std::string& selector) {
	std::vector<Node const*> r;
	collectMatches(root, selector, r);
	return r;
}

}
