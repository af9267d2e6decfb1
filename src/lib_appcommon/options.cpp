#include "options.hpp"
#include <stdexcept>

std::string safePop(ArgQueue& args) {
	if(args.empty())
		throw std::runtime_error("unexpected end of command line");
	auto val = args.front();
	args.pop();
	return val;
}

void parseValue(int& var, ArgQueue& args) {
	auto const word = safePop(args);
	std::stringstream ss(word);
	char trailing;
	if(!(ss >> var) || (ss >> trailing))
		throw std::runtime_error("expected an integer, got \"" + word + "\"");
}

void parseValue(bool& var, ArgQueue&) {
	var = true;
}

void parseValue(std::string& var, ArgQueue& args) {
	var = safePop(args);
}

void parseValue(std::vector<std::string>& var, ArgQueue& args) {
	var.clear();
	while(!args.empty() && args.front()[0] != '-') {
		var.push_back(safePop(args));
	}
}

std::vector<std::string> CmdLineOptions::parse(int argc, const char* argv[]) {

	std::vector<std::string> remaining;

	ArgQueue args;
	for(int i = 1; i < argc; ++i) // skip argv[0]
		args.push(argv[i]);

	while(!args.empty()) {
		auto word = args.front();
		args.pop();

		if(word.substr(0, 1) != "-") {
			remaining.push_back(word);
			continue;
		}

		AbstractOption* opt = nullptr;

		for(auto& o : m_Options) {
			if(word == o->shortName || word == o->longName) {
				opt = o.get();
				break;
			}
		}

		if(!opt)
			throw std::runtime_error("unknown option: \"" + word + "\"");

		opt->parse(args);
	}

	return remaining;
}

void CmdLineOptions::printHelp(std::ostream& out) {
	for(auto& o : m_Options) {
		auto s = o->shortName + ", " + o->longName;
		while(s.size()< 30)
			s += " ";
		out << "    " << s << o->desc << std::endl;
	}
}
