#include<gtest/gtest.h>

#include<stdexcept>

#include "graha/strength.hpp"

namespace{

// Every body at 15 Libra unless moved.
PosSet chart(){
	PosSet ps;
	ps.frame=Frame::SIDEREAL;
	for(Body b : ALL_BODIES){
		BodyPos&p=ps.at(b);
		p.body=b;
		p.lon=195.0;
		p.speed=0.5;
	}
	return ps;
}

}

TEST(Dignity,ClassicalTable){
	EXPECT_EQ(dignity_of(Body::SUN,0),Dignity::EXALTED);
	EXPECT_EQ(dignity_of(Body::SUN,6),Dignity::DEBILITATED);
	EXPECT_EQ(dignity_of(Body::SUN,4),Dignity::OWN);
	EXPECT_EQ(dignity_of(Body::SATURN,0),Dignity::DEBILITATED);
	EXPECT_EQ(dignity_of(Body::JUPITER,3),Dignity::EXALTED);
	// Moon in Gemini, ruled by its friend Mercury
	EXPECT_EQ(dignity_of(Body::MOON,2),Dignity::FRIEND);
	// Saturn in Leo, ruled by the Sun
	EXPECT_EQ(dignity_of(Body::SATURN,4),Dignity::ENEMY);
	EXPECT_EQ(dignity_of(Body::URANUS,4),Dignity::NEUTRAL);
}

TEST(Dignity,Labels){
	EXPECT_EQ(strength_label(80.0),"very_strong");
	EXPECT_EQ(strength_label(75.0),"very_strong");
	EXPECT_EQ(strength_label(60.0),"strong");
	EXPECT_EQ(strength_label(40.0),"moderate");
	EXPECT_EQ(strength_label(39.9),"weak");
}

TEST(Strength,WithoutBirthTimeRenormalizes){
	PosSet ps=chart();
	ps.at(Body::SUN).lon=10.0;
	StrengthSet s=score(ps,ChartCtx());
	const StrengthScore&sun=s.at(Body::SUN);
	EXPECT_FALSE(sun.directional.has_value());
	EXPECT_FALSE(s.day_birth.has_value());
	EXPECT_DOUBLE_EQ(sun.positional,100.0);
	EXPECT_DOUBLE_EQ(sun.temporal,50.0);
	EXPECT_NEAR(sun.composite,(0.5*100.0+0.25*50.0)/0.75,1e-9);
	EXPECT_EQ(sun.label,"very_strong");
}

TEST(Strength,FullChartUsesHousesAndSect){
	PosSet ps=chart();
	ps.at(Body::SUN).lon=10.0;
	ChartCtx ctx;
	ctx.asc=10.0;
	StrengthSet s=score(ps,ctx);
	ASSERT_TRUE(s.day_birth.has_value());
	EXPECT_FALSE(*s.day_birth);
	const StrengthScore&sun=s.at(Body::SUN);
	ASSERT_TRUE(sun.directional.has_value());
	EXPECT_DOUBLE_EQ(*sun.directional,100.0);
	// day ruler in a night chart
	EXPECT_DOUBLE_EQ(sun.temporal,25.0);
	EXPECT_NEAR(sun.composite,0.5*100.0+0.25*100.0+0.25*25.0,1e-9);

	// Libra is the 7th house: angular
	EXPECT_DOUBLE_EQ(*s.at(Body::MOON).directional,100.0);
	EXPECT_DOUBLE_EQ(s.at(Body::MOON).temporal,75.0);
}

TEST(Strength,RetrogradeDampsTemporal){
	PosSet ps=chart();
	ps.at(Body::MARS).speed=-0.2;
	ps.at(Body::MARS).retro=true;
	ps.at(Body::RAHU).retro=true;
	StrengthSet s=score(ps,ChartCtx());
	EXPECT_NEAR(s.at(Body::MARS).temporal,50.0*0.85,1e-9);
	EXPECT_DOUBLE_EQ(s.at(Body::RAHU).temporal,50.0);
}

TEST(Strength,ScoresStayInRange){
	PosSet ps=chart();
	for(int k=0;k<12;++k){
		for(Body b : ALL_BODIES){
			ps.at(b).lon=30.0*k+static_cast<double>(body_idx(b));
			ps.at(b).retro=(k%2)==1;
		}
		ChartCtx ctx;
		ctx.asc=30.0*((k*5)%12);
		StrengthSet s=score(ps,ctx);
		for(const auto&sc : s.scores){
			EXPECT_GE(sc.composite,0.0);
			EXPECT_LE(sc.composite,100.0);
			for(double v : sc.impact){
				EXPECT_GE(v,0.0);
				EXPECT_LE(v,10.0);
			}
		}
		for(double a : s.aggregate){
			EXPECT_GE(a,0.0);
			EXPECT_LE(a,100.0);
		}
	}
}

TEST(Strength,OuterPlanetsCarryNoDomainImpact){
	StrengthSet s=score(chart(),ChartCtx());
	for(double v : s.at(Body::PLUTO).impact){
		EXPECT_DOUBLE_EQ(v,0.0);
	}
}

TEST(Strength,TableValidation){
	StrengthTbl t;
	EXPECT_NO_THROW(t.validate());
	t.w_pos=0.6;
	EXPECT_THROW(t.validate(),std::invalid_argument);
	t.w_pos=0.5;
	t.retro_mult=1.5;
	EXPECT_THROW(t.validate(),std::invalid_argument);
	t.retro_mult=0.85;
	t.w_pos=0.0;
	t.w_temp=0.0;
	t.w_dir=1.0;
	EXPECT_THROW(t.validate(),std::invalid_argument);
}

TEST(DashaImpact,ToneFollowsStrength){
	PosSet ps=chart();
	ps.at(Body::SUN).lon=10.0;
	ps.at(Body::SATURN).lon=10.0;
	StrengthSet s=score(ps,ChartCtx());
	DashaImpact sun=dasha_impact(Body::SUN,s);
	EXPECT_EQ(sun.tone,"supportive");
	EXPECT_EQ(sun.keywords.size(),4u);
	DashaImpact sat=dasha_impact(Body::SATURN,s);
	// debilitated: (0*0.5 + 50*0.25)/0.75
	EXPECT_NEAR(sat.strength,50.0/3.0,1e-9);
	EXPECT_EQ(sat.tone,"transformative");

	ImpactCmp c=cmp_impact(Body::SATURN,Body::SUN,s);
	EXPECT_NEAR(c.delta[0],sun.impact[0]-sat.impact[0],1e-12);
	EXPECT_FALSE(c.shifts.empty());
	EXPECT_EQ(c.shifts.front(),"career increases significantly");
	EXPECT_NE(c.summary.find("Saturn"),std::string::npos);
}
