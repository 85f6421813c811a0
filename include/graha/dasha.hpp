#pragma once

#include<string>
#include<vector>

#include "graha/bodies.hpp"
#include "graha/math.hpp"
#include "graha/nakshatra.hpp"

constexpr int DASHA_CYCLE_YEARS=120;
constexpr int DASHA_MAX_LEVEL=5;

// One period of the Vimshottari tree. Times are UTC Julian days, [start,end).
struct DashaPeriod{
	Body lord=Body::KETU;
	int level=1;
	double start=0.0;
	double end=0.0;
	// arena links; -1 when absent or not materialized
	int parent=-1;
	int first_child=-1;
	int child_cnt=0;

	double years() const{ return (end-start)/JUL_YEAR; }
	bool contains(double jd) const{ return jd>=start&&jd<end; }
};

// Arena of periods. Level-1 periods come first; the children of a node are
// contiguous and ordered in time.
struct DashaTree{
	double birth=0.0;
	double until=0.0;
	int max_level=1;
	NakInfo moon_nak;
	double balance=0.0;
	std::vector<DashaPeriod> nodes;

	std::vector<int> level(int lv) const;
};

std::string level_name(int level);

// Nested periods overlapping [birth_jd, until_jd] down to max_level.
// Throws std::invalid_argument for until < birth, max_level outside 1..5 or
// non-finite input.
DashaTree assemble(double birth_jd,double moon_sid,double until_jd,
				   int max_level);

// All nine children of a period, starting with its own lord. The last child
// ends exactly at p.end. Not attached to any tree.
std::vector<DashaPeriod> subdivide(const DashaPeriod&p);

// Indices of the materialized periods containing jd, level 1 first.
std::vector<int> active_chain(const DashaTree&tree,double jd);

struct DashaTrans{
	int level=1;
	Body lord=Body::KETU;
	double end=0.0;
	double days_left=0.0;
	// false when the 120 year cycle ends with this period
	bool has_next=false;
	Body next_lord=Body::KETU;
};

std::vector<DashaTrans> transitions(const DashaTree&tree,double jd);

Body cyc_next(Body lord);
