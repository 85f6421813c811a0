#include<gtest/gtest.h>

#include<cmath>
#include<limits>
#include<stdexcept>
#include<vector>

#include "graha/dasha.hpp"

namespace{

const double BIRTH=2447262.3; // 1988-04-15 19:12 UTC
const double CYCLE=DASHA_CYCLE_YEARS*JUL_YEAR;

double yrs(double y){ return BIRTH+y*JUL_YEAR; }

}

TEST(Dasha,BalanceFromMoonPosition){
	DashaTree t=assemble(BIRTH,NAK_SPAN*0.5,BIRTH+CYCLE,1);
	EXPECT_EQ(t.moon_nak.name,"Ashwini");
	EXPECT_NEAR(t.balance,3.5,1e-9);
	ASSERT_FALSE(t.nodes.empty());
	EXPECT_EQ(t.nodes[0].lord,Body::KETU);
	EXPECT_NEAR(t.nodes[0].years(),3.5,1e-9);
}

TEST(Dasha,VenusSequenceWithRemainder){
	DashaTree t=assemble(BIRTH,NAK_SPAN*1.5,BIRTH+CYCLE,1);
	const std::vector<Body> want={
		Body::VENUS,Body::SUN,Body::MOON,Body::MARS,Body::RAHU,
		Body::JUPITER,Body::SATURN,Body::MERCURY,Body::KETU,Body::VENUS,
	};
	std::vector<int> l1=t.level(1);
	ASSERT_EQ(l1.size(),want.size());
	for(std::size_t i=0;i<want.size();++i){
		EXPECT_EQ(t.nodes[static_cast<std::size_t>(l1[i])].lord,want[i]);
	}
	EXPECT_NEAR(t.nodes[0].years(),10.0,1e-9);
	EXPECT_NEAR(t.nodes[9].years(),10.0,1e-9);
}

TEST(Dasha,MahadashasCoverExactlyOneCycle){
	for(double moon : {0.0,5.0,47.3,133.33,200.0,359.9}){
		DashaTree t=assemble(BIRTH,moon,BIRTH+CYCLE,1);
		std::vector<int> l1=t.level(1);
		ASSERT_FALSE(l1.empty());
		const DashaPeriod&first=t.nodes[static_cast<std::size_t>(l1.front())];
		const DashaPeriod&last=t.nodes[static_cast<std::size_t>(l1.back())];
		EXPECT_DOUBLE_EQ(first.start,BIRTH);
		EXPECT_DOUBLE_EQ(last.end,BIRTH+CYCLE);
		double total=0.0;
		for(std::size_t i=0;i<l1.size();++i){
			const DashaPeriod&p=t.nodes[static_cast<std::size_t>(l1[i])];
			total+=p.end-p.start;
			if(i>0){
				EXPECT_DOUBLE_EQ(
					p.start,t.nodes[static_cast<std::size_t>(l1[i-1])].end);
			}
		}
		EXPECT_NEAR(total,CYCLE,1e-6);
	}
}

TEST(Dasha,ChildrenFillTheirParent){
	DashaTree t=assemble(BIRTH,77.7,BIRTH+CYCLE,2);
	for(int idx : t.level(1)){
		const DashaPeriod&p=t.nodes[static_cast<std::size_t>(idx)];
		ASSERT_GT(p.child_cnt,0);
		double sum=0.0;
		for(int c=p.first_child;c<p.first_child+p.child_cnt;++c){
			const DashaPeriod&k=t.nodes[static_cast<std::size_t>(c)];
			EXPECT_EQ(k.parent,idx);
			EXPECT_EQ(k.level,2);
			sum+=k.end-k.start;
		}
		EXPECT_NEAR(sum,p.end-p.start,1e-6);
		EXPECT_EQ(t.nodes[static_cast<std::size_t>(p.first_child)].lord,p.lord);
		EXPECT_DOUBLE_EQ(
			t.nodes[static_cast<std::size_t>(p.first_child+p.child_cnt-1)].end,
			p.end);
	}
}

TEST(Dasha,ChildrenFillTheirParentAtEveryLevel){
	DashaTree t=assemble(BIRTH,212.4,BIRTH+CYCLE,DASHA_MAX_LEVEL);
	std::vector<int> cnt(DASHA_MAX_LEVEL+1,0);
	for(std::size_t i=0;i<t.nodes.size();++i){
		const DashaPeriod&p=t.nodes[i];
		++cnt[static_cast<std::size_t>(p.level)];
		if(p.level==DASHA_MAX_LEVEL){
			EXPECT_EQ(p.child_cnt,0);
			continue;
		}
		ASSERT_EQ(p.child_cnt,9);
		const DashaPeriod&head=t.nodes[static_cast<std::size_t>(p.first_child)];
		EXPECT_DOUBLE_EQ(head.start,p.start);
		double sum=0.0;
		double prev_end=p.start;
		for(int c=p.first_child;c<p.first_child+p.child_cnt;++c){
			const DashaPeriod&k=t.nodes[static_cast<std::size_t>(c)];
			EXPECT_EQ(k.parent,static_cast<int>(i));
			EXPECT_EQ(k.level,p.level+1);
			EXPECT_DOUBLE_EQ(k.start,prev_end);
			prev_end=k.end;
			sum+=k.end-k.start;
		}
		EXPECT_DOUBLE_EQ(prev_end,p.end);
		EXPECT_NEAR(sum,p.end-p.start,1e-6);
	}
	for(int lv=2;lv<=DASHA_MAX_LEVEL;++lv){
		EXPECT_EQ(cnt[static_cast<std::size_t>(lv)],
				  9*cnt[static_cast<std::size_t>(lv-1)]);
	}
}

TEST(Dasha,BalancePeriodIsSubdividedProportionally){
	DashaTree t=assemble(BIRTH,NAK_SPAN*1.5,BIRTH+CYCLE,2);
	const DashaPeriod&venus=t.nodes[0];
	const DashaPeriod&first=t.nodes[static_cast<std::size_t>(venus.first_child)];
	EXPECT_EQ(first.lord,Body::VENUS);
	EXPECT_NEAR(first.years(),10.0*20.0/120.0,1e-9);
}

TEST(Dasha,SubdivideStopsAtPrana){
	DashaPeriod p;
	p.lord=Body::MOON;
	p.level=DASHA_MAX_LEVEL;
	p.start=BIRTH;
	p.end=BIRTH+1.0;
	EXPECT_TRUE(subdivide(p).empty());

	p.level=1;
	std::vector<DashaPeriod> kids=subdivide(p);
	ASSERT_EQ(kids.size(),9u);
	EXPECT_EQ(kids.front().lord,Body::MOON);
	EXPECT_EQ(kids.back().lord,Body::SUN);
	EXPECT_DOUBLE_EQ(kids.back().end,p.end);
}

TEST(Dasha,UntilLimitsMaterializedPeriods){
	DashaTree t=assemble(BIRTH,NAK_SPAN*1.5,yrs(30.0),1);
	ASSERT_EQ(t.nodes.size(),4u);
	EXPECT_EQ(t.nodes[3].lord,Body::MARS);
}

TEST(Dasha,Deterministic){
	DashaTree a=assemble(BIRTH,123.456,yrs(60.0),3);
	DashaTree b=assemble(BIRTH,123.456,yrs(60.0),3);
	ASSERT_EQ(a.nodes.size(),b.nodes.size());
	for(std::size_t i=0;i<a.nodes.size();++i){
		EXPECT_EQ(a.nodes[i].lord,b.nodes[i].lord);
		EXPECT_EQ(a.nodes[i].start,b.nodes[i].start);
		EXPECT_EQ(a.nodes[i].end,b.nodes[i].end);
	}
}

TEST(Dasha,ActiveChainDescendsLevels){
	DashaTree t=assemble(BIRTH,NAK_SPAN*1.5,BIRTH+CYCLE,3);
	// Sun mahadasha runs from year 10 to 16, Rahu bhukti 11.15 .. 12.05
	std::vector<int> chain=active_chain(t,yrs(12.0));
	ASSERT_EQ(chain.size(),3u);
	EXPECT_EQ(t.nodes[static_cast<std::size_t>(chain[0])].lord,Body::SUN);
	EXPECT_EQ(t.nodes[static_cast<std::size_t>(chain[1])].lord,Body::RAHU);
	for(int idx : chain){
		EXPECT_TRUE(t.nodes[static_cast<std::size_t>(idx)].contains(yrs(12.0)));
	}
	EXPECT_TRUE(active_chain(t,BIRTH-1.0).empty());
}

TEST(Dasha,TransitionsReportNextLord){
	DashaTree t=assemble(BIRTH,NAK_SPAN*1.5,BIRTH+CYCLE,2);
	std::vector<DashaTrans> tr=transitions(t,yrs(1.0));
	ASSERT_EQ(tr.size(),2u);
	EXPECT_EQ(tr[0].lord,Body::VENUS);
	EXPECT_TRUE(tr[0].has_next);
	EXPECT_EQ(tr[0].next_lord,Body::SUN);
	EXPECT_NEAR(tr[0].days_left,9.0*JUL_YEAR,1e-6);

	tr=transitions(t,yrs(119.0));
	ASSERT_FALSE(tr.empty());
	EXPECT_EQ(tr[0].lord,Body::VENUS);
	EXPECT_FALSE(tr[0].has_next);
}

TEST(Dasha,RejectsInvalidInput){
	EXPECT_THROW(assemble(BIRTH,10.0,BIRTH-1.0,2),std::invalid_argument);
	EXPECT_THROW(assemble(BIRTH,10.0,BIRTH+1.0,0),std::invalid_argument);
	EXPECT_THROW(assemble(BIRTH,10.0,BIRTH+1.0,6),std::invalid_argument);
	EXPECT_THROW(assemble(BIRTH,std::numeric_limits<double>::quiet_NaN(),
						  BIRTH+1.0,2),
				 std::invalid_argument);
	EXPECT_THROW(level_name(7),std::invalid_argument);
	EXPECT_EQ(level_name(2),"antardasha");
}
