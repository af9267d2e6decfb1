#include "page.hpp"
#include "lib_utils/utf8.hpp"

namespace Teletext {

size_t rowWidth(const Row &row) {
	size_t width = 0;
	for(auto& seg : row)
		width += utf8Length(seg.text);
	return width;
}

Row coalesce(const Row &row) {
	Row r;
	for(auto& seg : row) {
		if(seg.text.empty())
			continue;
		if(!r.empty() && r.back().attr == seg.attr && r.back().link == seg.link)
			r.back().text += seg.text;
		else
			r.push_back(seg);
	}
	return r;
}

}
