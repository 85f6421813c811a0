#include<gtest/gtest.h>

#include<cmath>
#include<filesystem>
#include<sstream>
#include<stdexcept>

#include "graha/format.hpp"
#include "graha/instant.hpp"
#include "graha/js_writer.hpp"
#include "graha/math.hpp"

TEST(Iso,ParsesUtcAndOffsets){
	IsoTime t=parse_iso("2000-01-01T12:00:00Z","Z");
	EXPECT_NEAR(t.jd_utc,J2000,1e-9);
	EXPECT_TRUE(t.has_time);
	EXPECT_TRUE(t.has_tz);

	t=parse_iso("2000-01-01T17:30+05:30","Z");
	EXPECT_NEAR(t.jd_utc,J2000,1e-9);
	EXPECT_EQ(t.tz_off,330);

	t=parse_iso("2000-01-01T12:00:00.500","Z");
	EXPECT_NEAR((t.jd_utc-J2000)*SEC_DAY,0.5,1e-4);
	EXPECT_FALSE(t.has_tz);
}

TEST(Iso,DefaultZoneAppliesWithoutSuffix){
	IsoTime t=parse_iso("2000-01-01T07:00","-05:00");
	EXPECT_NEAR(t.jd_utc,J2000,1e-9);
	t=parse_iso("2000-01-01","Z");
	EXPECT_FALSE(t.has_time);
	EXPECT_NEAR(t.jd_utc,J2000-0.5,1e-9);
}

TEST(Iso,RejectsMalformed){
	EXPECT_THROW(parse_iso("",""),std::invalid_argument);
	EXPECT_THROW(parse_iso("2000-13-01","Z"),std::invalid_argument);
	EXPECT_THROW(parse_iso("2023-02-29","Z"),std::invalid_argument);
	EXPECT_THROW(parse_iso("2000-01-01T25:00","Z"),std::invalid_argument);
	EXPECT_THROW(parse_iso("2000-01-01T10:00+5","Z"),std::invalid_argument);
	EXPECT_THROW(parse_iso("01/01/2000","Z"),std::invalid_argument);
}

TEST(Iso,Formats){
	EXPECT_EQ(fmt_iso(J2000,0),"2000-01-01T12:00:00.000Z");
	EXPECT_EQ(fmt_iso(J2000,330,false),"2000-01-01T17:30:00+05:30");
	EXPECT_EQ(fmt_date(J2000,-720),"2000-01-01");
	EXPECT_EQ(fmt_tz(-90),"-01:30");
}

TEST(Iso,NamedZone){
	if(!std::filesystem::exists("/usr/share/zoneinfo/Asia/Kolkata")){
		GTEST_SKIP()<<"no zone database";
	}
	IsoTime t=parse_iso("2000-01-01T17:30","Asia/Kolkata");
	EXPECT_NEAR(t.jd_utc,J2000,1e-9);
	EXPECT_EQ(t.tz_off,330);
	EXPECT_THROW(zone_off("Nowhere/Atlantis",J2000),std::invalid_argument);
}

TEST(Birth,UnknownTimeUsesNoon){
	BirthCtx b=parse_birth("1990-05-15",19.07,72.88,"+05:30");
	EXPECT_FALSE(b.has_time());
	EXPECT_EQ(b.day,15);
	Instant in=birth_instant(b);
	EXPECT_NEAR(in.jd_utc,greg2jd(1990,5,15,6,30,0.0),1e-9);
}

TEST(Birth,KeepsClockTime){
	BirthCtx b=parse_birth("1990-05-15T08:30:15+05:30",19.07,72.88,"Z");
	ASSERT_TRUE(b.has_time());
	EXPECT_EQ(b.time->hour,8);
	EXPECT_EQ(b.time->minute,30);
	EXPECT_NEAR(b.time->second,15.0,1e-6);
	Instant in=birth_instant(b);
	EXPECT_NEAR(in.jd_utc,greg2jd(1990,5,15,3,0,15.0),1e-8);
}

TEST(Birth,RejectsCoordinates){
	EXPECT_THROW(parse_birth("1990-05-15",91.0,0.0,"Z"),std::invalid_argument);
	EXPECT_THROW(mk_instant(J2000,0.0,181.0,"Z"),std::invalid_argument);
}

TEST(Json,CompactOutput){
	std::ostringstream os;
	JsonWriter w(os,false);
	w.obj_begin();
	w.field("name","Ashwini");
	w.field("index",1);
	w.field("ok",true);
	w.key("lon");
	w.fixed(12.5,2);
	w.opt_field("asc",std::nullopt);
	w.str_arr("tags",{"a","b\"c"});
	w.obj_end();
	EXPECT_EQ(os.str(),"{\"name\":\"Ashwini\",\"index\":1,\"ok\":true,"
					   "\"lon\":12.50,\"asc\":null,\"tags\":[\"a\",\"b\\\"c\"]}");
}

TEST(Json,MisuseThrows){
	std::ostringstream os;
	JsonWriter w(os,false);
	w.obj_begin();
	EXPECT_THROW(w.value(1),std::logic_error);
	EXPECT_THROW(w.arr_end(),std::logic_error);
}

TEST(Json,NonFiniteBecomesNull){
	std::ostringstream os;
	JsonWriter w(os,false);
	w.arr_begin();
	w.value(std::nan(""));
	w.arr_end();
	EXPECT_EQ(os.str(),"[null]");
}
