#pragma once

#include<string>

// Fixed offsets only: Z, +HH:MM, -HH:MM. Minutes east of UTC.
int parse_tz(const std::string&tz);

bool is_fixed_tz(const std::string&tz);

std::string fmt_tz(int off_min);

// Offset of a fixed or IANA zone at a UTC instant, minutes east of UTC.
int zone_off(const std::string&tz,double jd_utc);

// Civil time in a zone to UTC Julian day.
double loc2utc(int year,int month,int day,int hour,int minute,double second,
			   const std::string&tz);

struct IsoTime{
	double jd_utc=0.0;
	int tz_off=0;
	bool has_tz=false;
	bool has_time=false;
	std::string tz;
};

// YYYY-MM-DD[THH:MM[:SS[.fff]]][Z|+HH:MM]; times without suffix are read in
// default_tz, which may be an IANA name.
IsoTime parse_iso(const std::string&text,const std::string&default_tz);

std::string fmt_iso(double jd_utc,int off_min,bool with_ms=true);

std::string fmt_date(double jd_utc,int off_min);
