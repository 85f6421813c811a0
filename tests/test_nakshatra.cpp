#include<gtest/gtest.h>

#include<cmath>
#include<limits>
#include<stdexcept>

#include "graha/nakshatra.hpp"

TEST(Nakshatra,CycleTotalsOneHundredTwenty){
	int sum=0;
	for(Body b : DASHA_ORDER){
		sum+=dasha_years(b);
	}
	EXPECT_EQ(sum,120);
	EXPECT_EQ(dasha_years(Body::URANUS),0);
}

TEST(Nakshatra,StartOfZodiac){
	NakInfo n=nakshatra(0.0);
	EXPECT_EQ(n.index,1);
	EXPECT_EQ(n.name,"Ashwini");
	EXPECT_EQ(n.lord,Body::KETU);
	EXPECT_EQ(n.pada,1);
	EXPECT_DOUBLE_EQ(n.elapsed,0.0);
}

TEST(Nakshatra,BoundariesAndPadas){
	NakInfo n=nakshatra(NAK_SPAN);
	EXPECT_EQ(n.index,2);
	EXPECT_EQ(n.name,"Bharani");
	EXPECT_EQ(n.lord,Body::VENUS);

	n=nakshatra(NAK_SPAN*1.5);
	EXPECT_EQ(n.index,2);
	EXPECT_EQ(n.pada,3);
	EXPECT_NEAR(n.elapsed,0.5,1e-12);

	n=nakshatra(20.0);
	EXPECT_EQ(n.index,2);
	EXPECT_EQ(n.pada,3);

	n=nakshatra(30.0);
	EXPECT_EQ(n.index,3);
	EXPECT_EQ(n.name,"Krittika");
	EXPECT_EQ(n.pada,2);

	n=nakshatra(359.999999);
	EXPECT_EQ(n.index,27);
	EXPECT_EQ(n.name,"Revati");
	EXPECT_EQ(n.lord,Body::MERCURY);
	EXPECT_EQ(n.pada,4);
	EXPECT_LT(n.elapsed,1.0);
}

TEST(Nakshatra,LordsRepeatEveryNine){
	for(int i=1;i<=NAK_CNT;++i){
		EXPECT_EQ(nak_lord(i),DASHA_ORDER[static_cast<std::size_t>((i-1)%9)]);
	}
	EXPECT_EQ(nak_lord(10),Body::KETU);
	EXPECT_EQ(nak_name(10),"Magha");
}

TEST(Nakshatra,WrapsLongitude){
	EXPECT_EQ(nakshatra(360.0).index,1);
	EXPECT_EQ(nakshatra(-1.0).index,27);
}

TEST(Nakshatra,RejectsNonFinite){
	EXPECT_THROW(nakshatra(std::numeric_limits<double>::quiet_NaN()),
				 std::invalid_argument);
	EXPECT_THROW(nak_name(0),std::out_of_range);
}
