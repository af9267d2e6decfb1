#include "link.hpp"
#include "error.hpp"
#include <cctype>

namespace Teletext {

namespace {
bool parseNumber(const std::string &s, int &value) {
	if(s.empty() || s.size() > 4)
		return false;
	value = 0;
	for(auto c : s) {
		if(!isdigit((unsigned char)c))
			return false;
		value = value * 10 + (c - '0');
	}
	return true;
}

bool endsWith(const std::string &s, const std::string &suffix) {
	return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}
}

Link parseLinkTarget(const std::string &target) {
	Link r;
	auto const sep = target.find_first_of("/_-");
	if(!parseNumber(target.substr(0, sep), r.page))
		throw InvalidLinkTarget(target);

	if(sep != std::string::npos) {
		if(!parseNumber(target.substr(sep + 1), r.subPage) || r.subPage < 1)
			throw InvalidLinkTarget(target);
	}

	if(r.page < 100 || r.page > 899)
		throw InvalidLinkTarget(target);

	return r;
}

Link parseLinkHref(const std::string &href) {
	auto s = href;

	auto const query = s.find('?');
	if(query != std::string::npos) {
		// "?page=101": the target is the query value
		auto const eq = s.find('=', query);
		if(query == 0 && eq != std::string::npos)
			s = s.substr(eq + 1);
		else
			s = s.substr(0, query);
	}

	auto const fragment = s.find('#');
	if(fragment != std::string::npos)
		s = s.substr(0, fragment);

	for(auto ext : { ".html", ".htm" }) {
		if(endsWith(s, ext)) {
			s.resize(s.size() - std::string(ext).size());
			break;
		}
	}

	while(!s.empty() && s.front() == '/')
		s.erase(0, 1);
	while(!s.empty() && s.back() == '/')
		s.pop_back();

	try {
		return parseLinkTarget(s);
	} catch(InvalidLinkTarget const&) {
		throw InvalidLinkTarget(href);
	}
}

}
