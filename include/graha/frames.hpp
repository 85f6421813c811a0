#pragma once

#include<utility>

#include "graha/math.hpp"

enum class PrecModel{ AUTO,IAU2006,VONDRAK };

extern const PrecModel PREC_MODEL;
extern const double LONG_THR;

struct CoordTf{
	static Mat3 R1(double angle);

	static Mat3 R3(double angle);

	static Mat3 bias_mat();
};

struct PrecNut{
	static Mat3 prec_mat(double jd_tdb);

	static double mean_obl(double jd_tdb);

	static double true_obl(double jd_tdb);

	// (dpsi,deps) in radians
	static std::pair<double,double> nut_ang(double jd_tdb);

	static Mat3 nut_mat(double jd_tdb);

	// GCRS to true ecliptic and equinox of date.
	static Mat3 ecl_mat(double jd_tdb);
};

// Ecliptic spherical coordinates of a rectangular vector, radians.
struct EclSph{
	double lon;
	double lat;
	double dist;
};

EclSph to_sph(const Vec3&v);

// d(lon)/dt for position p and velocity v in the same frame.
double lon_rate(const Vec3&p,const Vec3&v);
