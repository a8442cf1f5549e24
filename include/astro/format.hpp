#pragma once

#include<string>

int parse_tz(const std::string&tz);

std::string fmt_tz(int off_min);

struct IsoTime{
	double jd_utc=0.0;
	int tz_off=0;
	bool has_tz=false;
};

// YYYY-MM-DD[THH:MM[:SS[.fff]]][Z|+HH:MM]; throws std::invalid_argument
IsoTime parse_iso(const std::string&text,const std::string&default_tz);

std::string fmt_iso(double jd_utc,int off_min,bool with_ms=true);

// calendar date (YYYY-MM-DD) at the given offset
std::string fmt_date(double jd_utc,int off_min=0);
