#pragma once

#include <string>
#include <vector>

// process
std::string getEnvironmentVariable(std::string name);

// filesystem
bool dirExists(std::string path);
void mkdir(std::string path);
void moveFile(std::string src, std::string dst);
std::vector<std::string> listDir(std::string path); // sorted names, no "." nor ".."
std::string loadFile(std::string path);
