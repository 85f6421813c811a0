#pragma once

// Lahiri reference: 23.250020 deg at 1956-03-21 00:00 UT.
constexpr double AYAN_REF_JD=2435553.5;
constexpr double AYAN_REF_DEG=23.250020;

struct Ayanamsha{
	// General precession in longitude since J2000, degrees (IAU 2006).
	// Strictly increasing for T above -2274 centuries.
	static double gen_prec(double jd);

	// Lahiri ayanamsha in degrees for a UTC instant.
	static double value(double jd_utc);

	// Rate in degrees per Julian year.
	static double rate(double jd_utc);

	static double to_sidereal(double trop_lon,double jd_utc);

	static double to_tropical(double sid_lon,double jd_utc);
};
