#include<gtest/gtest.h>

#include<algorithm>
#include<cmath>
#include<memory>
#include<stdexcept>
#include<vector>

#include "graha/aspects.hpp"
#include "graha/ephem.hpp"
#include "graha/math.hpp"

namespace{

// The Moon runs at one degree per day from 100.5 at J2000; everything
// else sits at 200.
class LinearSrc : public EphSrc{
  public:
	std::string name() const override{ return "linear"; }
	Accuracy accuracy() const override{ return Accuracy::PRECISE; }
	bool covers(double) const override{ return true; }

	PosSet tropical(double jd_utc) override{
		PosSet ps;
		ps.jd_utc=jd_utc;
		for(Body b : ALL_BODIES){
			BodyPos&p=ps.at(b);
			p.body=b;
			p.lon=200.0;
		}
		ps.at(Body::MOON).lon=norm_deg(100.5+(jd_utc-J2000));
		ps.at(Body::MOON).speed=1.0;
		return ps;
	}
};

PosSet flat(double lon){
	PosSet ps;
	for(Body b : ALL_BODIES){
		ps.at(b).body=b;
		ps.at(b).lon=lon;
	}
	return ps;
}

AspectEvent ev_of(Body a,AspectType t,double tight){
	AspectEvent e;
	e.a=a;
	e.b=Body::SUN;
	e.type=t;
	e.tight=tight;
	return e;
}

DayPulse day_of(double jd,const std::vector<AspectEvent>&evs){
	DayPulse d;
	d.jd_utc=jd;
	d.pulse=pulse(evs);
	d.intensity=day_intensity(d.pulse);
	d.events=evs;
	return d;
}

AspectEvent ev(AspectType t,double tight){
	AspectEvent e;
	e.a=Body::MOON;
	e.b=Body::VENUS;
	e.type=t;
	e.tight=tight;
	return e;
}

}

TEST(Aspects,AnglesAndNames){
	EXPECT_DOUBLE_EQ(asp_angle(AspectType::SEXTILE),60.0);
	EXPECT_DOUBLE_EQ(asp_angle(AspectType::OPPOSITION),180.0);
	EXPECT_EQ(parse_aspect("trine"),AspectType::TRINE);
	EXPECT_THROW(parse_aspect("quincunx"),std::invalid_argument);
	EXPECT_TRUE(is_harmonious(AspectType::TRINE));
	EXPECT_TRUE(is_challenging(AspectType::SQUARE));
	EXPECT_FALSE(is_harmonious(AspectType::CONJUNCTION));
	EXPECT_FALSE(is_challenging(AspectType::CONJUNCTION));
}

TEST(Aspects,ExactAnglesClassify){
	for(AspectType t : ALL_ASPECTS){
		auto e=classify(Body::SUN,10.0,Body::MARS,10.0+asp_angle(t),OrbTbl());
		ASSERT_TRUE(e.has_value());
		EXPECT_EQ(e->type,t);
		EXPECT_NEAR(e->dev,0.0,1e-9);
		EXPECT_NEAR(e->tight,1.0,1e-9);
	}
}

TEST(Aspects,SeparationWrapsAroundZero){
	auto e=classify(Body::SUN,355.0,Body::MOON,2.0,OrbTbl());
	ASSERT_TRUE(e.has_value());
	EXPECT_EQ(e->type,AspectType::CONJUNCTION);
	EXPECT_NEAR(e->sep,7.0,1e-9);
	EXPECT_EQ(e->a,Body::SUN);
	EXPECT_EQ(e->b,Body::MOON);

	// 10 degrees is past the 8 degree conjunction orb of two fast bodies
	EXPECT_FALSE(classify(Body::SUN,355.0,Body::MOON,5.0,OrbTbl()).has_value());
	e=classify(Body::SUN,355.0,Body::SATURN,4.0,OrbTbl());
	ASSERT_TRUE(e.has_value());
	EXPECT_EQ(e->type,AspectType::CONJUNCTION);
}

TEST(Aspects,OrbEdges){
	OrbTbl orbs;
	for(AspectType t : ALL_ASPECTS){
		std::size_t i=static_cast<std::size_t>(t);
		double ang=asp_angle(t);
		// two fast bodies
		double of=orbs.fast[i];
		double sign=ang>=180.0?-1.0:1.0;
		EXPECT_TRUE(classify(Body::SUN,0.0,Body::VENUS,ang+sign*(of-0.01),
							 orbs)
						.has_value());
		EXPECT_FALSE(classify(Body::SUN,0.0,Body::VENUS,ang+sign*(of+0.01),
							  orbs)
						 .has_value());
		// fast with slow takes the wider orb
		double os=orbs.slow[i];
		EXPECT_DOUBLE_EQ(orbs.pair(t,Body::SUN,Body::SATURN),std::max(of,os));
		EXPECT_TRUE(classify(Body::SUN,0.0,Body::SATURN,ang+sign*(os-0.01),
							 orbs)
						.has_value());
		EXPECT_FALSE(classify(Body::SUN,0.0,Body::SATURN,ang+sign*(os+0.01),
							  orbs)
						 .has_value());
	}
}

TEST(Aspects,TightnessIsLinear){
	OrbTbl orbs;
	auto e=classify(Body::SUN,0.0,Body::MOON,93.5,orbs);
	ASSERT_TRUE(e.has_value());
	EXPECT_EQ(e->type,AspectType::SQUARE);
	EXPECT_NEAR(e->tight,1.0-3.5/7.0,1e-9);
}

TEST(Aspects,OrbTableValidation){
	OrbTbl orbs;
	EXPECT_NO_THROW(orbs.validate());
	orbs.fast[0]=0.0;
	EXPECT_THROW(orbs.validate(),std::invalid_argument);
	orbs.fast[0]=15.0;
	EXPECT_THROW(orbs.validate(),std::invalid_argument);
}

TEST(Aspects,ChartSkipsNodeAxis){
	PosSet ps=flat(0.0);
	for(Body b : ALL_BODIES){
		ps.at(b).lon=37.0*static_cast<double>(body_idx(b));
	}
	ps.at(Body::RAHU).lon=5.0;
	ps.at(Body::KETU).lon=185.0;
	for(const auto&e : chart_aspects(ps,OrbTbl())){
		EXPECT_FALSE(e.a==Body::RAHU&&e.b==Body::KETU);
		EXPECT_LT(body_idx(e.a),body_idx(e.b));
	}
}

TEST(Aspects,SynastryCoversAllPairs){
	std::vector<AspectEvent> evs=find_aspects(flat(0.0),flat(0.0),OrbTbl());
	EXPECT_EQ(evs.size(),BODY_CNT*BODY_CNT);
	for(const auto&e : evs){
		EXPECT_EQ(e.type,AspectType::CONJUNCTION);
	}
}

TEST(Pulse,Labels){
	Pulse p=pulse({});
	EXPECT_EQ(p.label,"grounded");
	EXPECT_EQ(p.score,50);

	p=pulse({ev(AspectType::TRINE,1.0)});
	EXPECT_EQ(p.label,"flowing");
	EXPECT_EQ(p.score,60);

	p=pulse({ev(AspectType::SQUARE,0.5)});
	EXPECT_EQ(p.label,"friction");
	EXPECT_EQ(p.score,51);

	p=pulse({ev(AspectType::TRINE,0.5),ev(AspectType::SQUARE,0.4)});
	EXPECT_EQ(p.label,"electric");
	EXPECT_EQ(p.score,54);

	p=pulse({ev(AspectType::CONJUNCTION,1.0)});
	EXPECT_EQ(p.label,"magnetic");
	EXPECT_EQ(p.score,60);
	EXPECT_EQ(p.n_conj,1);
}

TEST(Pulse,ScoresAreCapped){
	std::vector<AspectEvent> many(10,ev(AspectType::SEXTILE,0.9));
	Pulse p=pulse(many);
	EXPECT_EQ(p.label,"flowing");
	EXPECT_EQ(p.score,80);
	EXPECT_EQ(p.top.size(),2u);

	std::vector<AspectEvent> hard(10,ev(AspectType::OPPOSITION,0.9));
	p=pulse(hard);
	EXPECT_EQ(p.label,"friction");
	EXPECT_EQ(p.score,35);
}

TEST(Pulse,TopListsTightestFirst){
	AspectEvent a=ev(AspectType::TRINE,0.2);
	AspectEvent b=ev(AspectType::SQUARE,0.9);
	b.a=Body::MARS;
	Pulse p=pulse({a,b});
	ASSERT_EQ(p.top.size(),2u);
	EXPECT_EQ(p.top[0],"Mars square Venus");
}

TEST(Transits,FindsExactCrossings){
	EphProvider prov(std::make_unique<LinearSrc>(),nullptr,4096,1.0);
	PosSet natal=flat(0.0);
	std::vector<AspectEvent> evs=scan_window(prov,natal,J2000,J2000+25.0,
											 Frame::TROPICAL,OrbTbl());
	ASSERT_EQ(evs.size(),BODY_CNT);
	for(const auto&e : evs){
		EXPECT_EQ(e.a,Body::MOON);
		EXPECT_EQ(e.type,AspectType::TRINE);
		ASSERT_TRUE(e.exact_jd.has_value());
		EXPECT_NEAR(*e.exact_jd,J2000+19.5,3.0/SEC_DAY);
		EXPECT_GT(e.tight,0.99);
	}
}

TEST(Transits,ReportsAspectsInOrbAtStart){
	EphProvider prov(std::make_unique<LinearSrc>(),nullptr,4096,1.0);
	// Moon at 100.5, natal points at 195: square within 4.5 degrees
	PosSet natal=flat(195.0);
	std::vector<AspectEvent> evs=scan_window(prov,natal,J2000,J2000+1.0,
											 Frame::TROPICAL,OrbTbl());
	bool moon_sq=false;
	for(const auto&e : evs){
		if(e.a==Body::MOON&&e.type==AspectType::SQUARE){
			moon_sq=true;
			EXPECT_FALSE(e.exact_jd.has_value());
		}
	}
	EXPECT_TRUE(moon_sq);
}

TEST(Transits,RejectsBadWindow){
	EphProvider prov(std::make_unique<LinearSrc>(),nullptr,16,1.0);
	PosSet natal=flat(0.0);
	EXPECT_THROW(scan_window(prov,natal,J2000+1.0,J2000,Frame::TROPICAL,
							 OrbTbl()),
				 std::invalid_argument);
	EXPECT_THROW(scan_window(prov,natal,J2000,J2000+1.0,Frame::SIDEREAL,
							 OrbTbl()),
				 std::invalid_argument);
	EXPECT_THROW(scan_window(prov,natal,J2000,J2000+1.0,Frame::TROPICAL,
							 OrbTbl(),0.0),
				 std::invalid_argument);
}

TEST(Transits,DailyPulseUsesFastBodies){
	EphProvider prov(std::make_unique<LinearSrc>(),nullptr,64,1.0);
	// slow transiting bodies at 200 conjoin these natal points; only the
	// fast ones (Sun, Mercury, Venus, Mars also at 200) count
	PosSet natal=flat(200.0);
	std::vector<DayPulse> days=daily_pulse(prov,natal,J2000,2,OrbTbl());
	ASSERT_EQ(days.size(),2u);
	for(const auto&d : days){
		EXPECT_EQ(d.pulse.n_conj,4*static_cast<int>(BODY_CNT));
		EXPECT_EQ(d.pulse.label,"magnetic");
		EXPECT_EQ(d.intensity,"neutral");
		EXPECT_EQ(d.events.size(),4*BODY_CNT);
	}
	EXPECT_THROW(daily_pulse(prov,natal,J2000,0,OrbTbl()),
				 std::invalid_argument);
}

TEST(Forecast,DayIntensity){
	EXPECT_EQ(day_of(J2000,{}).intensity,"quiet");
	EXPECT_EQ(day_of(J2000,{ev_of(Body::MOON,AspectType::TRINE,0.9),
							ev_of(Body::VENUS,AspectType::SEXTILE,0.9)})
				  .intensity,
			  "peak");
	EXPECT_EQ(day_of(J2000,{ev_of(Body::MOON,AspectType::TRINE,0.8),
							ev_of(Body::VENUS,AspectType::SQUARE,0.5)})
				  .intensity,
			  "elevated");
	EXPECT_EQ(day_of(J2000,{ev_of(Body::MOON,AspectType::SQUARE,0.3),
							ev_of(Body::VENUS,AspectType::OPPOSITION,0.3)})
				  .intensity,
			  "challenging");
	EXPECT_EQ(day_of(J2000,{ev_of(Body::MOON,AspectType::CONJUNCTION,0.2)})
				  .intensity,
			  "neutral");
}

TEST(Forecast,PeakWindows){
	std::vector<AspectEvent> peak={ev_of(Body::MOON,AspectType::TRINE,0.9),
								   ev_of(Body::VENUS,AspectType::TRINE,0.9)};
	std::vector<AspectEvent> elev={ev_of(Body::MOON,AspectType::TRINE,0.8),
								   ev_of(Body::MARS,AspectType::SQUARE,0.5)};
	std::vector<DayPulse> days={
		day_of(J2000,peak),		day_of(J2000+1.0,peak),
		day_of(J2000+2.0,{}),	day_of(J2000+3.0,elev),
		day_of(J2000+4.0,{}),	day_of(J2000+5.0,elev),
		day_of(J2000+6.0,elev),
	};
	std::vector<PeakWindow> pw=peak_windows(days);
	ASSERT_EQ(pw.size(),2u);
	EXPECT_DOUBLE_EQ(pw[0].start_jd,J2000);
	EXPECT_DOUBLE_EQ(pw[0].end_jd,J2000+1.0);
	EXPECT_EQ(pw[0].label,"harmony window");
	EXPECT_DOUBLE_EQ(pw[1].start_jd,J2000+5.0);
	EXPECT_DOUBLE_EQ(pw[1].end_jd,J2000+6.0);
	EXPECT_EQ(pw[1].label,"connection peak");

	EXPECT_EQ(peak_windows(days,1).size(),1u);
	EXPECT_TRUE(peak_windows({}).empty());
}

TEST(Forecast,NextShiftOnNewTightAspect){
	std::vector<AspectEvent> base={ev_of(Body::SUN,AspectType::TRINE,0.5)};
	std::vector<AspectEvent> more=base;
	more.push_back(ev_of(Body::MARS,AspectType::TRINE,0.8));
	std::vector<DayPulse> days={day_of(J2000,base),day_of(J2000+1.0,base),
								day_of(J2000+2.0,more)};
	Shift sh=next_shift(days);
	EXPECT_TRUE(sh.found);
	EXPECT_EQ(sh.days_away,2);
	EXPECT_DOUBLE_EQ(sh.jd_utc,J2000+2.0);
	EXPECT_EQ(sh.state,"flowing");
}

TEST(Forecast,NextShiftOnCountChange){
	// loose aspects still count when two arrive at once
	std::vector<DayPulse> days={
		day_of(J2000,{}),
		day_of(J2000+1.0,{ev_of(Body::MOON,AspectType::SQUARE,0.3),
						  ev_of(Body::MARS,AspectType::SQUARE,0.3)}),
	};
	Shift sh=next_shift(days);
	EXPECT_TRUE(sh.found);
	EXPECT_EQ(sh.days_away,1);
	EXPECT_EQ(sh.state,"friction");
}

TEST(Forecast,NextShiftFallsBackToGrounded){
	std::vector<AspectEvent> same={ev_of(Body::MOON,AspectType::TRINE,0.9)};
	std::vector<DayPulse> days={day_of(J2000,same),day_of(J2000+1.0,same),
								day_of(J2000+2.0,same)};
	Shift sh=next_shift(days);
	EXPECT_FALSE(sh.found);
	EXPECT_EQ(sh.days_away,7);
	EXPECT_DOUBLE_EQ(sh.jd_utc,J2000+7.0);
	EXPECT_EQ(sh.state,"grounded");
	EXPECT_THROW(next_shift({}),std::invalid_argument);
}
