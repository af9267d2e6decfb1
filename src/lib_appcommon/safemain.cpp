#include "lib_utils/log.hpp"
#include "lib_utils/profiler.hpp"
#include <iostream> // cerr

// user-provided
extern void safeMain(int argc, const char* argv[]);

extern const char *g_appName;
extern const char *g_version;

int main(int argc, char const* argv[]) {
	try {
		Tools::Profiler profilerGlobal(g_appName);
		g_Log->log(Debug, (std::string("BUILD: ") + g_appName + "-" + g_version).c_str());

		safeMain(argc, argv);

		return 0;
	} catch (std::exception const& e) {
		std::cerr << "[" << g_appName << "] " << "Error: " << e.what() << std::endl;
		return 1;
	}
}
