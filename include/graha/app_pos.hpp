#pragma once

#include "graha/frames.hpp"
#include "graha/spc_ephem.hpp"

struct RetProp{
	Vec3 X;
	Vec3 V;
	double tr;
};

struct AberCorr{
	static double lightday(const Vec3&vec);

	// geometric geocentric state at the light-time corrected epoch
	static RetProp geo_prop(EphRead&eph,int target,double jd_tdb,
							int max_iter=3);

	// apparent direction: light time plus stellar aberration
	static Vec3 geo_app(EphRead&eph,int target,double jd_tdb,int max_iter=3);
};

// Apparent geocentric ecliptic coordinates of date, degrees and deg/day.
struct EclState{
	double lon=0.0;
	double lat=0.0;
	double dist=0.0;
	double speed=0.0;
};

struct AppPos{
	EphRead&eph;

	bool rot_ok;
	double rot_jd;
	Mat3 rot_cache;

	explicit AppPos(EphRead&reader);

	// J2000/GCRS axes to true ecliptic and equinox of date
	Mat3 rot_mat(double jd_tdb);

	EclState body_calc(int target,double jd_tdb);
};
