#pragma once

#include "graha/math.hpp"

struct TimeScale{
	// TT-UT1 in seconds for a decimal year.
	static double delta_t(double year);

	static int leap_sec(double jd_utc);

	static double utc_to_tt(double jd_utc);

	static double utc_to_tdb(double jd_utc);

	// Greenwich mean sidereal time in radians, [0,2pi).
	static double gmst(double jd_utc);

	static double dec_year(double jd);
};
