#pragma once

#include <string>
#include <chrono>

namespace Tools {

// Logs the lifetime of the scope at 'Info' level.
class Profiler {
	public:
		Profiler(const std::string &name);
		~Profiler();

		double elapsedInSeconds() const;

	private:
		Profiler(const Profiler&) = delete;
		Profiler& operator= (const Profiler&) = delete;

		std::string name;
		std::chrono::steady_clock::time_point startTime;
};

}
