#pragma once

#include<optional>
#include<string>

// A UTC point in time at a place. Built once per request through mk_instant.
struct Instant{
	double jd_utc=0.0;
	double lat=0.0;
	double lon=0.0;
	std::string tz="Z";
};

// Validates coordinates, zone and era; never clamps.
Instant mk_instant(double jd_utc,double lat,double lon,const std::string&tz);

struct ClockTime{
	int hour=0;
	int minute=0;
	double second=0.0;
};

struct BirthCtx{
	int year=2000;
	int month=1;
	int day=1;
	std::optional<ClockTime> time;
	double lat=0.0;
	double lon=0.0;
	std::string tz="Z";

	bool has_time() const{ return time.has_value(); }
};

// Birth instant; local noon stands in for an unknown clock time so that
// date-level quantities (Moon, dasha) stay usable.
Instant birth_instant(const BirthCtx&ctx);

BirthCtx parse_birth(const std::string&text,double lat,double lon,
					 const std::string&tz);

void chk_coord(double lat,double lon);
