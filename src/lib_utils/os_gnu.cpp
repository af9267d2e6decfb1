#include "os.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>

using namespace std;

#include <sys/stat.h> // mode constants
#include <dirent.h>   // opendir

std::string getEnvironmentVariable(string name) {
	const char* value = std::getenv(name.c_str());
	if(!value)
		value = "";
	return value;
}

bool dirExists(string path) {
	struct stat sb;
	return stat(path.c_str(), &sb) == 0 && S_ISDIR(sb.st_mode);
}

void mkdir(string path) {
	if(::mkdir(path.c_str(), 0755) != 0)
		throw runtime_error("couldn't create dir \"" + path + "\": please check you have sufficient permissions");
}

void moveFile(string src, string dst) {
	if(rename(src.c_str(), dst.c_str()))
		throw runtime_error("can't move file '" + src + "' to '" + dst + "'");
}

vector<string> listDir(string path) {
	unique_ptr<DIR, int(*)(DIR*)> dir(opendir(path.c_str()), &closedir);
	if(!dir)
		throw runtime_error("can't open dir '" + path + "'");

	vector<string> r;
	while(auto entry = readdir(dir.get())) {
		string name = entry->d_name;
		if(name == "." || name == "..")
			continue;
		r.push_back(name);
	}

	sort(r.begin(), r.end());
	return r;
}

string loadFile(string path) {
	ifstream fp(path, ios::binary);
	if(!fp.is_open())
		throw runtime_error("can't open '" + path + "' for reading");

	stringstream ss;
	ss << fp.rdbuf();
	return ss.str();
}
