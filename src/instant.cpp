#include "graha/instant.hpp"

#include<cmath>
#include<stdexcept>

#include "graha/format.hpp"
#include "graha/math.hpp"

void chk_coord(double lat,double lon){
	if(!std::isfinite(lat)||lat<-90.0||lat>90.0){
		throw std::invalid_argument("latitude outside [-90,90]: "+
									std::to_string(lat));
	}
	if(!std::isfinite(lon)||lon<-180.0||lon>180.0){
		throw std::invalid_argument("longitude outside [-180,180]: "+
									std::to_string(lon));
	}
}

Instant mk_instant(double jd_utc,double lat,double lon,const std::string&tz){
	if(!std::isfinite(jd_utc)){
		throw std::invalid_argument("instant is not finite");
	}
	chk_coord(lat,lon);
	if(!is_fixed_tz(tz)){
		zone_off(tz,J2000);
	}
	Instant in;
	in.jd_utc=jd_utc;
	in.lat=lat;
	in.lon=lon;
	in.tz=tz;
	return in;
}

Instant birth_instant(const BirthCtx&ctx){
	chk_coord(ctx.lat,ctx.lon);
	ClockTime t;
	if(ctx.time){
		t=*ctx.time;
	}else{
		t.hour=12;
	}
	double jd=loc2utc(ctx.year,ctx.month,ctx.day,t.hour,t.minute,t.second,
					  ctx.tz);
	return mk_instant(jd,ctx.lat,ctx.lon,ctx.tz);
}

BirthCtx parse_birth(const std::string&text,double lat,double lon,
					 const std::string&tz){
	IsoTime iso=parse_iso(text,tz);
	double jd_loc=iso.jd_utc+static_cast<double>(iso.tz_off)/1440.0;
	BirthCtx ctx;
	int hh=0;
	int mm=0;
	double ss=0.0;
	jd2greg(jd_loc+0.5/(1000.0*SEC_DAY),ctx.year,ctx.month,ctx.day,hh,mm,ss);
	if(iso.has_time){
		ClockTime t;
		t.hour=hh;
		t.minute=mm;
		t.second=std::floor(ss*1000.0)/1000.0;
		ctx.time=t;
	}
	ctx.lat=lat;
	ctx.lon=lon;
	ctx.tz=iso.tz;
	chk_coord(lat,lon);
	return ctx;
}
