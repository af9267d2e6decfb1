#include "time.hpp"
#include "format.hpp"
#include <cstdio>
#include <ctime>
#include <stdexcept>

int64_t getUtcSeconds() {
	return (int64_t)std::time(nullptr);
}

// portable 'timegm'
static int64_t pTimegm(struct tm * t) {
	auto const MONTHSPERYEAR = 12;
	static const int cumulatedDays[MONTHSPERYEAR] =
	{ 0, 31, 59, 90, 120, 151, 181, 212, 243, 273, 304, 334 };

	long year = 1900 + t->tm_year + t->tm_mon / MONTHSPERYEAR;
	int64_t r = (year - 1970) * 365 + cumulatedDays[t->tm_mon % MONTHSPERYEAR];
	r += (year - 1968) / 4;
	r -= (year - 1900) / 100;
	r += (year - 1600) / 400;
	if ((year % 4) == 0
	    && ((year % 100) != 0 || (year % 400) == 0)
	    && (t->tm_mon % MONTHSPERYEAR) < 2)
		r--;
	r += t->tm_mday - 1;
	r *= 24;
	r += t->tm_hour;
	r *= 60;
	r += t->tm_min;
	r *= 60;
	r += t->tm_sec;

	return r;
}

int64_t parseDate(std::string s) {
	int year, month, day, hour, minute, second;
	int consumed = 0;
	int ret = sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
	        &year,
	        &month,
	        &day,
	        &hour,
	        &minute,
	        &second,
	        &consumed);
	if(ret != 6 || consumed != (int)s.size() || s.size() != 19)
		throw std::runtime_error("Invalid date '" + s + "'");

	if(month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60)
		throw std::runtime_error("Invalid date '" + s + "'");

	tm date {};
	date.tm_year = year - 1900;
	date.tm_mon = month - 1;
	date.tm_mday = day;
	date.tm_hour = hour;
	date.tm_min = minute;
	date.tm_sec = second;

	return pTimegm(&date);
}

std::string formatDate(int64_t utcSeconds) {
	auto const t = (time_t)utcSeconds;
	std::tm tm {};
	if(!gmtime_r(&t, &tm))
		throw std::runtime_error(format("Can't convert timestamp %s", utcSeconds));

	char buffer[32];
	auto const size = strftime(buffer, sizeof buffer, "%Y-%m-%dT%H:%M:%S", &tm);
	if(size != 19)
		throw std::runtime_error(format("Timestamp %s is out of the supported range", utcSeconds));
	return std::string(buffer, size);
}
