#pragma once

#include<array>
#include<cstddef>
#include<optional>
#include<string>
#include<vector>

#include "graha/bodies.hpp"

enum class Dignity{ EXALTED,OWN,FRIEND,NEUTRAL,ENEMY,DEBILITATED };

constexpr std::size_t DIG_CNT=6;

enum class Domain{ CAREER,RELATIONSHIP,HEALTH,SPIRITUAL };

constexpr std::size_t DOMAIN_CNT=4;

std::string dig_name(Dignity d);

std::string domain_name(Domain d);

using DomainVals=std::array<double,DOMAIN_CNT>;

struct StrengthTbl{
	std::array<double,DIG_CNT> dig={100.0,85.0,65.0,50.0,35.0,0.0};
	double angular=100.0;
	double succedent=60.0;
	double cadent=30.0;
	double w_pos=0.5;
	double w_dir=0.25;
	double w_temp=0.25;
	double aligned=75.0;
	double opposed=25.0;
	double plain=50.0;
	double retro_mult=0.85;
	std::array<DomainVals,BODY_CNT> affinity;

	StrengthTbl();

	void validate() const;
};

struct StrengthScore{
	Body body=Body::SUN;
	double positional=0.0;
	std::optional<double> directional;
	double temporal=0.0;
	double composite=0.0;
	Dignity dignity=Dignity::NEUTRAL;
	std::string label;
	// affinity x composite / 10, 0..10
	DomainVals impact{};
};

struct ChartCtx{
	std::optional<double> asc;
};

struct StrengthSet{
	std::array<StrengthScore,BODY_CNT> scores;
	DomainVals aggregate{};
	std::optional<bool> day_birth;

	const StrengthScore&at(Body b) const{ return scores[body_idx(b)]; }
};

Dignity dignity_of(Body b,int sign);

std::string strength_label(double composite);

// Sun above the horizon: houses 7 to 12.
bool is_day_birth(double sun_lon,double asc);

StrengthSet score(const PosSet&ps,const ChartCtx&ctx,
				  const StrengthTbl&tbl=StrengthTbl());

struct DashaImpact{
	Body lord=Body::SUN;
	double strength=0.0;
	std::string label;
	DomainVals impact{};
	std::string tone;
	std::string tone_desc;
	std::vector<std::string> keywords;
};

DashaImpact dasha_impact(Body lord,const StrengthSet&set,
						 const StrengthTbl&tbl=StrengthTbl());

struct ImpactCmp{
	DashaImpact cur;
	DashaImpact next;
	DomainVals delta{};
	std::vector<std::string> shifts;
	std::string summary;
};

ImpactCmp cmp_impact(Body cur,Body next,const StrengthSet&set,
					 const StrengthTbl&tbl=StrengthTbl());
