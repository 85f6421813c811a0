#pragma once

#include "graha/bodies.hpp"
#include "graha/frames.hpp"

// Osculating-free mean orbit, J2000 ecliptic and equinox. Angles in degrees,
// rates per Julian century.
struct KepElem{
	double a,e,incl,L,peri,node;
	double a_dot,e_dot,incl_dot,L_dot,peri_dot,node_dot;
};

struct MeanOrb{
	// heliocentric ecliptic J2000 position in AU; EMB for the Earth
	static Vec3 helio(Body b,double jd_tdb);

	static Vec3 helio_emb(double jd_tdb);

	static double kepler(double M,double e);

	// Moon, truncated lunar theory: (lon, lat) in degrees of the mean
	// equinox of date, distance omitted
	static void moon_mean(double jd_tdb,double&lon,double&lat);

	static double mean_node(double jd_tdb);

	static double node_rate(double jd_tdb);
};

// Apparent ecliptic longitude/latitude of date for one body, degrees.
// Speeds come from a central difference.
struct MeanPos{
	double lon;
	double lat;
	double speed;
};

MeanPos mean_pos(Body b,double jd_tdb);
