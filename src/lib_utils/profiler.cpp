#include "profiler.hpp"
#include "format.hpp"
#include "log.hpp"

namespace Tools {
Profiler::Profiler(const std::string &name) : name(name) {
	startTime = std::chrono::steady_clock::now();
}

Profiler::~Profiler() {
	g_Log->log(Info, format("[%s] %s ms", name, (long long)(elapsedInSeconds() * 1000)).c_str());
}

double Profiler::elapsedInSeconds() const {
	auto const stopTime = std::chrono::steady_clock::now();
	return std::chrono::duration<double>(stopTime - startTime).count();
}

}
