#pragma once

#include<array>
#include<cstddef>
#include<optional>
#include<string>
#include<vector>

#include "graha/bodies.hpp"

class EphProvider;

enum class AspectType{ CONJUNCTION,SEXTILE,SQUARE,TRINE,OPPOSITION };

constexpr std::size_t ASP_CNT=5;

extern const std::array<AspectType,ASP_CNT> ALL_ASPECTS;

double asp_angle(AspectType t);

std::string asp_name(AspectType t);

AspectType parse_aspect(const std::string&name);

bool is_harmonious(AspectType t);

bool is_challenging(AspectType t);

// Orb tolerance per aspect; fast bodies use the first column.
struct OrbTbl{
	std::array<double,ASP_CNT> fast={8.0,6.0,7.0,8.0,8.0};
	std::array<double,ASP_CNT> slow={10.0,7.0,8.0,9.0,10.0};

	double of(AspectType t,Body b) const;

	// a pair uses the wider of the two orbs
	double pair(AspectType t,Body a,Body b) const;

	void validate() const;
};

struct AspectEvent{
	Body a=Body::SUN;
	Body b=Body::SUN;
	AspectType type=AspectType::CONJUNCTION;
	double sep=0.0;
	double dev=0.0;
	double tight=0.0;
	std::optional<double> exact_jd;
};

std::string asp_desc(const AspectEvent&ev);

std::optional<AspectEvent> classify(Body a,double lon_a,Body b,double lon_b,
									const OrbTbl&orbs);

// Every (a in set_a, b in set_b) pair.
std::vector<AspectEvent> find_aspects(const PosSet&set_a,const PosSet&set_b,
									  const OrbTbl&orbs);

// Pairs inside one chart; no self pairs and no Rahu-Ketu pair.
std::vector<AspectEvent> chart_aspects(const PosSet&set,const OrbTbl&orbs);

// Transits of all bodies over the natal set in [start_jd, end_jd], with
// exact instants to within one second. Aspects already in orb at start_jd
// whose exact instant is not inside the window come first, without
// exact_jd.
std::vector<AspectEvent> scan_window(EphProvider&prov,const PosSet&natal,
									 double start_jd,double end_jd,Frame frame,
									 const OrbTbl&orbs,double step_days=1.0);

struct PulseCfg{
	double flow_ratio=1.5;
};

struct Pulse{
	std::string label;
	int score=50;
	double harmonious=0.0;
	double challenging=0.0;
	double amplifier=0.0;
	double net=0.0;
	int n_harm=0;
	int n_chal=0;
	int n_conj=0;
	std::vector<std::string> top;
};

Pulse pulse(const std::vector<AspectEvent>&events,
			const PulseCfg&cfg=PulseCfg());

struct DayPulse{
	double jd_utc=0.0;
	Pulse pulse;
	std::vector<AspectEvent> events;
	std::string intensity;
};

std::string day_intensity(const Pulse&p);

// One pulse per day from the fast transiting bodies over the natal set.
std::vector<DayPulse> daily_pulse(EphProvider&prov,const PosSet&natal,
								  double start_jd,int days,const OrbTbl&orbs,
								  const PulseCfg&cfg=PulseCfg());

struct PeakWindow{
	double start_jd=0.0;
	double end_jd=0.0;
	std::string label;
};

// Runs of at least two peak or elevated days with harmonious aspects.
// A run still open on the last day is a "connection peak".
std::vector<PeakWindow> peak_windows(const std::vector<DayPulse>&days,
									 std::size_t max_cnt=3);

struct Shift{
	double jd_utc=0.0;
	int days_away=0;
	std::string state;
	bool found=false;
};

// First day after days.front() that gains an aspect of tightness 0.7 or
// more, or whose aspect count moves by two. Without one the series is
// "grounded" seven days out.
Shift next_shift(const std::vector<DayPulse>&days);
