#include <iostream>
#include <fstream>
#include <stdexcept>
#include <cstdlib>
#include <csignal>
#include <climits>
#include <algorithm> // sort
#include "tests.hpp"
#include "lib_utils/log.hpp"

namespace {
using TestFunction = void (*)();

struct UnitTest {
	void (*fn)();
	std::string name;

	// First class tests run by default. Second class tests may be slow
	// or depend on the environment.
	int type; // 0:first class, 1:second class, 2:fuzztest

	// for sorting
	std::string file;
	int line;
};

std::vector<UnitTest>& allTests() {
	static std::vector<UnitTest> all;
	return all;
}

struct Filter {
	int minIdx = 0;
	int maxIdx = INT_MAX;
	bool noSecondClass = true;
	int fuzzIdx = -1;
	std::string fuzzPath;
};

void listAll() {
	int i=0;
	for (auto& test : allTests())
		std::cout << "Test #" << i++ << ": " << test.name << std::endl;
}

bool startsWith(std::string s, std::string prefix) {
	return s.substr(0, prefix.size()) == prefix;
}

bool matches(Filter filter, int idx) {
	if(idx < filter.minIdx)
		return false;
	if(idx > filter.maxIdx)
		return false;
	if(allTests()[idx].type == 2)
		return false;
	if(filter.noSecondClass && allTests()[idx].type == 1)
		return false;
	if(startsWith(allTests()[idx].name, "[DISABLED]"))
		return false;
	return true;
}

uint8_t fuzzBuffer[4096];
size_t fuzzLength = 0;

void RunAll(Filter filter) {
	if(filter.fuzzIdx >= 0) {
		if(filter.fuzzIdx >= (int)allTests().size())
			throw std::runtime_error("no test #" + std::to_string(filter.fuzzIdx));
		std::ifstream fp(filter.fuzzPath, std::ios::binary);
		fp.read((char*)fuzzBuffer, sizeof fuzzBuffer);
		fuzzLength = (size_t)fp.gcount();
		allTests()[filter.fuzzIdx].fn();
	} else {
		int count = 0;
		for(int i=0; i < (int)allTests().size(); ++i) {
			if(matches(filter, i)) {
				std::cout << "#" << i << ": " << allTests()[i].name << std::endl;
				allTests()[i].fn();
				++count;
			}
		}
		std::cout << count << " tests passed" << std::endl;
	}
}

void SortTests() {
	// registration order depends on the link order: sort by location
	auto byName = [](UnitTest const& a, UnitTest const& b) -> bool {
		if(a.file != b.file)
			return a.file < b.file;
		return a.line < b.line;
	};
	std::sort(allTests().begin(), allTests().end(), byName);
}
}

namespace Tests {

void Fail(char const* file, int line, const char* msg) {
	std::cerr << "TEST FAILED: " << file << "(" << line << "): " << msg << std::endl;
	std::raise(SIGABRT);
}

int RegisterTest(void (*fn)(), const char* testName, int type, const char* filename, int line) {
	UnitTest test {};
	test.fn = fn;
	test.name = testName;
	test.type = type;
	test.file = filename;
	test.line = line;
	allTests().push_back(test);
	return 0;
}

void GetFuzzTestData(uint8_t const*& ptr, size_t& len) {
	ptr = fuzzBuffer;
	len = fuzzLength;
}
}

int main(int argc, const char* argv[]) {
	int i = 1;
	auto popWord = [&]() -> std::string {
		if(i >= argc)
			throw std::runtime_error("unexpected end of command line");
		return argv[i++];
	};

	SortTests();

	// decoding failures are expected by many tests: keep the output readable
	setGlobalLogLevel(Quiet);

	Filter filter;

	while(i < argc) {
		auto const word = popWord();

		if(word == "--list" || word == "-l") {
			listAll();
			return 0;
		} else if(word == "--only") {
			auto idx = atoi(popWord().c_str());
			filter.minIdx = idx;
			filter.maxIdx = idx;
			filter.noSecondClass = false;
		} else if(word == "--range") {
			filter.minIdx =  atoi(popWord().c_str());
			filter.maxIdx =  atoi(popWord().c_str());
		} else if(word == "--second-class") {
			filter.noSecondClass = false;
		} else if(word == "--log") {
			setGlobalLogLevel(parseLogLevel(popWord().c_str()));
		} else if(word == "--fuzz") {
			filter.fuzzIdx = atoi(popWord().c_str());
			filter.fuzzPath = popWord().c_str();
		} else {
			std::cerr << "Usage: " << argv[0] << " [--list] [--only <index>] [--range <first> <last>] [--second-class] [--log <level>] [--fuzz <index> <file>]" << std::endl;
			return 1;
		}
	}

	RunAll(filter);
	return 0;
}
