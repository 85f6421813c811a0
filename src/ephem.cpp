#include "graha/ephem.hpp"

#include<algorithm>
#include<cmath>
#include<ostream>
#include<stdexcept>

#include "graha/app_pos.hpp"
#include "graha/ayanamsha.hpp"
#include "graha/format.hpp"
#include "graha/frames.hpp"
#include "graha/mean_eph.hpp"
#include "graha/spc_ephem.hpp"
#include "graha/time_scale.hpp"

namespace{

void set_pos(PosSet&ps,Body b,double lon,double lat,double speed){
	BodyPos&p=ps.at(b);
	p.body=b;
	p.lon=norm_deg(lon);
	p.lat=lat;
	p.speed=speed;
	p.retro=speed<0.0;
	p.frame=Frame::TROPICAL;
	p.acc=ps.acc;
}

void set_nodes(PosSet&ps,double jd_tdb){
	double dpsi=PrecNut::nut_ang(jd_tdb).first*R2D;
	double rahu=MeanOrb::mean_node(jd_tdb)+dpsi;
	double rate=MeanOrb::node_rate(jd_tdb);
	set_pos(ps,Body::RAHU,rahu,0.0,rate);
	set_pos(ps,Body::KETU,rahu+180.0,0.0,rate);
	ps.at(Body::RAHU).retro=true;
	ps.at(Body::KETU).retro=true;
}

int spk_id(Body b){
	switch(b){
	case Body::SUN:
		return 10;
	case Body::MOON:
		return 301;
	case Body::MERCURY:
		return 1;
	case Body::VENUS:
		return 2;
	case Body::MARS:
		return 4;
	case Body::JUPITER:
		return 5;
	case Body::SATURN:
		return 6;
	case Body::URANUS:
		return 7;
	case Body::NEPTUNE:
		return 8;
	case Body::PLUTO:
		return 9;
	default:
		throw std::invalid_argument("no kernel segment for "+body_name(b));
	}
}

void to_sid(PosSet&ps){
	double ayan=Ayanamsha::value(ps.jd_utc);
	double rate=Ayanamsha::rate(ps.jd_utc)/JUL_YEAR;
	ps.frame=Frame::SIDEREAL;
	ps.ayan=ayan;
	for(auto&p : ps.pos){
		p.lon=norm_deg(p.lon-ayan);
		// retrograde stays a property of the motion, not of the frame
		p.speed-=rate;
		p.frame=Frame::SIDEREAL;
	}
}

}

void chk_era(double jd_utc){
	if(!std::isfinite(jd_utc)){
		throw std::invalid_argument("instant is not finite");
	}
	if(std::fabs(jd_utc-J2000)>MAX_ERA_YEARS*JUL_YEAR){
		throw std::out_of_range("instant outside the supported era "
								"(+-6000 years from J2000): JD "+
								std::to_string(jd_utc));
	}
}

SpiceEph::SpiceEph(const std::string&kernel)
	: eph_(std::make_unique<EphRead>(kernel)){}

SpiceEph::~SpiceEph()=default;

std::string SpiceEph::name() const{ return eph_->filepath; }

bool SpiceEph::covers(double jd_tdb) const{ return eph_->covers(jd_tdb); }

std::pair<double,double> SpiceEph::span() const{
	double lo=eph_->cover.front().first;
	double hi=eph_->cover.front().second;
	for(const auto&w : eph_->cover){
		lo=std::min(lo,w.first);
		hi=std::max(hi,w.second);
	}
	return {J2000+lo/SEC_DAY,J2000+hi/SEC_DAY};
}

PosSet SpiceEph::tropical(double jd_utc){
	double jd_tdb=TimeScale::utc_to_tdb(jd_utc);
	PosSet ps;
	ps.jd_utc=jd_utc;
	ps.frame=Frame::TROPICAL;
	ps.acc=Accuracy::PRECISE;

	AppPos ap(*eph_);
	for(Body b : ALL_BODIES){
		if(b==Body::RAHU||b==Body::KETU){
			continue;
		}
		EclState st=ap.body_calc(spk_id(b),jd_tdb);
		set_pos(ps,b,st.lon,st.lat,st.speed);
	}
	set_nodes(ps,jd_tdb);
	return ps;
}

PosSet MeanEph::tropical(double jd_utc){
	double jd_tdb=TimeScale::utc_to_tdb(jd_utc);
	PosSet ps;
	ps.jd_utc=jd_utc;
	ps.frame=Frame::TROPICAL;
	ps.acc=Accuracy::APPROXIMATE;
	for(Body b : ALL_BODIES){
		if(b==Body::RAHU||b==Body::KETU){
			continue;
		}
		MeanPos mp=mean_pos(b,jd_tdb);
		set_pos(ps,b,mp.lon,mp.lat,mp.speed);
	}
	set_nodes(ps,jd_tdb);
	return ps;
}

EphProvider::EphProvider(std::unique_ptr<EphSrc> primary,
						 std::unique_ptr<EphSrc> fallback,
						 std::size_t cache_size,double cache_res_sec,
						 std::ostream*log)
	: primary_(std::move(primary)),fallback_(std::move(fallback)),
	  res_sec_(cache_res_sec),log_(log),cache_(cache_size){
	if(!primary_){
		throw std::invalid_argument("ephemeris provider needs a source");
	}
	if(!(res_sec_>0.0)||!std::isfinite(res_sec_)){
		throw std::invalid_argument("cache_res_sec must be positive");
	}
}

double EphProvider::round_jd(double jd_utc) const{
	double ticks=std::round((jd_utc-J2000)*SEC_DAY/res_sec_);
	return J2000+ticks*res_sec_/SEC_DAY;
}

PosSet EphProvider::compute(double jd_utc,Frame frame){
	double jd_tdb=TimeScale::utc_to_tdb(jd_utc);
	EphSrc*src=primary_.get();
	if(!src->covers(jd_tdb)){
		if(!fallback_){
			throw std::out_of_range("instant outside ephemeris coverage: JD "+
									std::to_string(jd_utc));
		}
		src=fallback_.get();
		if(log_&&!noted_.exchange(true)){
			*log_<<"note: "<<fmt_date(jd_utc,0)
				 <<" is outside the kernel coverage; using "<<src->name()
				 <<" ("<<acc_name(src->accuracy())<<")"<<std::endl;
		}
	}
	PosSet ps=src->tropical(jd_utc);
	if(frame==Frame::SIDEREAL){
		to_sid(ps);
	}
	return ps;
}

PosSet EphProvider::positions(double jd_utc,Frame frame){
	chk_era(jd_utc);
	double jd_r=round_jd(jd_utc);
	Key key(static_cast<long long>(std::llround((jd_r-J2000)*SEC_DAY/res_sec_)),
			static_cast<int>(frame));
	auto hit=cache_.get(key);
	if(hit){
		return *hit;
	}
	PosSet ps=compute(jd_r,frame);
	cache_.put(key,ps);
	return ps;
}

double EphProvider::ascendant(const Instant&in,Frame frame) const{
	chk_era(in.jd_utc);
	double asc=calc_asc(in.jd_utc,in.lat,in.lon);
	if(frame==Frame::SIDEREAL){
		asc=Ayanamsha::to_sidereal(asc,in.jd_utc);
	}
	return asc;
}

std::unique_ptr<EphProvider> open_src(const EphOpts&opts,std::ostream*log){
	std::unique_ptr<EphSrc> primary;
	std::unique_ptr<EphSrc> fallback;
	if(!opts.kernel.empty()){
		try{
			auto sp=std::make_unique<SpiceEph>(opts.kernel);
			if(log){
				auto sp_span=sp->span();
				*log<<"ephemeris: "<<opts.kernel<<" (precise), coverage "
					<<fmt_date(sp_span.first,0)<<" .. "
					<<fmt_date(sp_span.second,0)<<std::endl;
			}
			primary=std::move(sp);
			fallback=std::make_unique<MeanEph>();
		}catch(const std::runtime_error&ex){
			if(log){
				*log<<"note: ephemeris unavailable ("<<ex.what()
					<<"); using mean elements (approximate)"<<std::endl;
			}
		}
	}
	if(!primary){
		if(log&&opts.kernel.empty()){
			*log<<"ephemeris: mean elements (approximate)"<<std::endl;
		}
		primary=std::make_unique<MeanEph>();
	}
	return std::make_unique<EphProvider>(std::move(primary),std::move(fallback),
										 opts.cache_size,opts.cache_res_sec,
										 log);
}

int whole_house(double lon,double asc){
	return (sign_of(lon)-sign_of(asc)+12)%12+1;
}

double calc_asc(double jd_utc,double lat,double lon){
	chk_coord(lat,lon);
	if(std::fabs(lat)>=90.0){
		throw std::invalid_argument("ascendant is undefined at the poles");
	}
	double jd_tdb=TimeScale::utc_to_tdb(jd_utc);
	auto nut=PrecNut::nut_ang(jd_tdb);
	double eps=PrecNut::true_obl(jd_tdb);
	// apparent sidereal time through the equation of the equinoxes
	double ramc=TimeScale::gmst(jd_utc)+nut.first*std::cos(eps)+lon*D2R;
	double phi=lat*D2R;
	double y=std::cos(ramc);
	double x=-(std::sin(ramc)*std::cos(eps)+std::tan(phi)*std::sin(eps));
	return norm_deg(std::atan2(y,x)*R2D);
}
