#include "tests/tests.hpp"
#include "lib_utils/html.hpp"

using namespace html;

namespace {
std::string textOf(Node const* node) {
	if(node->isText())
		return node->text;
	std::string r;
	for(auto& child : node->children)
		r += textOf(&child);
	return r;
}
}

unittest("html: tree and attributes") {
	auto doc = parse("<!DOCTYPE html><html><body><div id=content class='page main'><span class=c0f0>Hi</span></div></body></html>");
	auto content = findFirst(doc, "#content");
	ASSERT(content != nullptr);
	ASSERT_EQUALS("div", content->name);
	ASSERT(content->hasClass("main"));
	ASSERT(!content->hasClass("mai"));
	ASSERT_EQUALS(std::vector<std::string>({ "page", "main" }), content->classes());

	auto span = findFirst(*content, "span.c0f0");
	ASSERT(span != nullptr);
	ASSERT_EQUALS("Hi", textOf(span));
	ASSERT_EQUALS("", span->attribute("style"));
	ASSERT(!span->hasAttribute("style"));
}

unittest("html: text is kept verbatim") {
	auto doc = parse("<pre class=\"txt\">\n  a  <b class=\"f1 b0\">B</b>\n c\n</pre>");
	auto pre = findFirst(doc, "pre.txt");
	ASSERT(pre != nullptr);
	ASSERT_EQUALS("\n  a  B\n c\n", textOf(pre));
	ASSERT_EQUALS(3u, pre->children.size());
	ASSERT(pre->children[0].isText());
	ASSERT_EQUALS("b", pre->children[1].name);
}

unittest("html: entities") {
	auto doc = parse("<p>K&ouml;ln &amp; Bonn&nbsp;&#65;&#x42;&lt;&unknown;</p>");
	ASSERT_EQUALS("K\xc3\xb6ln & Bonn\xc2\xa0" "AB<&unknown;", textOf(findFirst(doc, "p")));
}

unittest("html: tolerant markup") {
	// void elements, unclosed tags, stray closing tags, comments and scripts
	auto doc = parse("<div class=row><br><img src=x.gif><span>a</i></span><!-- <span>no</span> --><script>if(a<b) x();</script><span>b</div>");
	auto spans = findAll(doc, "span");
	ASSERT_EQUALS(2u, spans.size());
	ASSERT_EQUALS("a", textOf(spans[0]));
	ASSERT_EQUALS("b", textOf(spans[1]));
	ASSERT_EQUALS(1u, findAll(doc, "div.row").size());
}

unittest("html: a lone '<' is text") {
	auto doc = parse("<p>1 < 2</p>");
	ASSERT_EQUALS("1 < 2", textOf(findFirst(doc, "p")));
}

unittest("html: truncated tag") {
	ASSERT_THROWN(parse("<div class=\"row"));
}

unittest("html: selectors") {
	auto doc = parse("<div id=a class=row></div><p class=row></p>");
	ASSERT_EQUALS(2u, findAll(doc, ".row").size());
	ASSERT_EQUALS(1u, findAll(doc, "div.row").size());
	ASSERT_EQUALS(1u, findAll(doc, "div#a").size());
	ASSERT_EQUALS(0u, findAll(doc, "p#a").size());
	ASSERT(findFirst(doc, "span") == nullptr);
}
