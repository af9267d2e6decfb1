#pragma once

#include <cstdint>
#include <string>

// Capture timestamps are UTC seconds since the epoch.
int64_t getUtcSeconds();

// "2022-01-28T14:13:12", no zone suffix. Throws on anything else.
int64_t parseDate(std::string s);
std::string formatDate(int64_t utcSeconds);
