#pragma once

#include<array>
#include<string>

#include "graha/bodies.hpp"

constexpr int NAK_CNT=27;
// 13 deg 20'
constexpr double NAK_SPAN=360.0/27.0;
constexpr double PADA_SPAN=NAK_SPAN/4.0;

struct NakInfo{
	int index=1;
	std::string name;
	Body lord=Body::KETU;
	int pada=1;
	double deg_in=0.0;
	double elapsed=0.0;
};

// Vimshottari cycle order, starting with Ketu.
extern const std::array<Body,9> DASHA_ORDER;

// Years of each lord in the 120 year cycle; 0 for bodies outside it.
int dasha_years(Body lord);

std::string nak_name(int index);

Body nak_lord(int index);

// From a sidereal longitude in degrees; throws std::invalid_argument on
// non-finite input.
NakInfo nakshatra(double sid_lon);
