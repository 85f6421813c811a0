#include "graha/aspects.hpp"

#include<algorithm>
#include<cmath>
#include<cstdlib>
#include<initializer_list>
#include<set>
#include<stdexcept>
#include<tuple>
#include<utility>

#include "graha/ephem.hpp"
#include "graha/math.hpp"

namespace{

const char*const ASP_NAMES[ASP_CNT]={
	"conjunction","sextile","square","trine","opposition",
};

const double ASP_ANGLES[ASP_CNT]={0.0,60.0,90.0,120.0,180.0};

bool is_node_pair(Body a,Body b){
	return (a==Body::RAHU&&b==Body::KETU)||(a==Body::KETU&&b==Body::RAHU);
}

AspectEvent mk_event(Body a,double lon_a,Body b,double lon_b,AspectType t,
					 const OrbTbl&orbs){
	AspectEvent ev;
	ev.a=a;
	ev.b=b;
	ev.type=t;
	ev.sep=sep_deg(lon_a,lon_b);
	ev.dev=std::fabs(ev.sep-asp_angle(t));
	ev.tight=std::max(0.0,1.0-ev.dev/orbs.pair(t,a,b));
	return ev;
}

// One exact configuration to follow through the window. theta carries the
// side of the natal point for 60/90/120.
struct Track{
	Body t;
	Body n;
	AspectType type;
	double theta;
};

std::vector<Track> mk_tracks(){
	std::vector<Track> out;
	for(Body t : ALL_BODIES){
		for(Body n : ALL_BODIES){
			for(AspectType a : ALL_ASPECTS){
				double ang=asp_angle(a);
				out.push_back({t,n,a,ang});
				if(ang>0.0&&ang<180.0){
					out.push_back({t,n,a,-ang});
				}
			}
		}
	}
	return out;
}

double track_dev(const Track&tr,const PosSet&cur,const PosSet&natal){
	double d=diff_deg(cur.at(tr.t).lon,natal.at(tr.n).lon);
	return diff_deg(d,tr.theta);
}

bool crosses(double g0,double g1){
	return ((g0<0.0&&g1>0.0)||(g0>0.0&&g1<0.0))&&std::fabs(g1-g0)<180.0;
}

}

const std::array<AspectType,ASP_CNT> ALL_ASPECTS={
	AspectType::CONJUNCTION,AspectType::SEXTILE,AspectType::SQUARE,
	AspectType::TRINE,AspectType::OPPOSITION,
};

double asp_angle(AspectType t){ return ASP_ANGLES[static_cast<std::size_t>(t)]; }

std::string asp_name(AspectType t){
	return ASP_NAMES[static_cast<std::size_t>(t)];
}

AspectType parse_aspect(const std::string&name){
	for(AspectType t : ALL_ASPECTS){
		if(asp_name(t)==name){
			return t;
		}
	}
	throw std::invalid_argument("unknown aspect: "+name);
}

bool is_harmonious(AspectType t){
	return t==AspectType::SEXTILE||t==AspectType::TRINE;
}

bool is_challenging(AspectType t){
	return t==AspectType::SQUARE||t==AspectType::OPPOSITION;
}

double OrbTbl::of(AspectType t,Body b) const{
	std::size_t i=static_cast<std::size_t>(t);
	return is_fast(b)?fast[i]:slow[i];
}

double OrbTbl::pair(AspectType t,Body a,Body b) const{
	return std::max(of(t,a),of(t,b));
}

void OrbTbl::validate() const{
	for(AspectType t : ALL_ASPECTS){
		std::size_t i=static_cast<std::size_t>(t);
		for(double v : {fast[i],slow[i]}){
			// neighbouring angles are 30 degrees apart at the closest
			if(!std::isfinite(v)||v<=0.0||v>=15.0){
				throw std::invalid_argument("orb for "+asp_name(t)+
											" must be in (0,15)");
			}
		}
	}
}

std::string asp_desc(const AspectEvent&ev){
	return body_name(ev.a)+" "+asp_name(ev.type)+" "+body_name(ev.b);
}

std::optional<AspectEvent> classify(Body a,double lon_a,Body b,double lon_b,
									const OrbTbl&orbs){
	double sep=sep_deg(lon_a,lon_b);
	std::optional<AspectEvent> best;
	for(AspectType t : ALL_ASPECTS){
		double dev=std::fabs(sep-asp_angle(t));
		if(dev>orbs.pair(t,a,b)){
			continue;
		}
		if(!best||dev<best->dev){
			best=mk_event(a,lon_a,b,lon_b,t,orbs);
		}
	}
	return best;
}

std::vector<AspectEvent> find_aspects(const PosSet&set_a,const PosSet&set_b,
									  const OrbTbl&orbs){
	std::vector<AspectEvent> out;
	for(Body a : ALL_BODIES){
		for(Body b : ALL_BODIES){
			auto ev=classify(a,set_a.at(a).lon,b,set_b.at(b).lon,orbs);
			if(ev){
				out.push_back(*ev);
			}
		}
	}
	return out;
}

std::vector<AspectEvent> chart_aspects(const PosSet&set,const OrbTbl&orbs){
	std::vector<AspectEvent> out;
	for(std::size_t i=0;i<BODY_CNT;++i){
		for(std::size_t j=i+1;j<BODY_CNT;++j){
			Body a=ALL_BODIES[i];
			Body b=ALL_BODIES[j];
			if(is_node_pair(a,b)){
				continue;
			}
			auto ev=classify(a,set.at(a).lon,b,set.at(b).lon,orbs);
			if(ev){
				out.push_back(*ev);
			}
		}
	}
	return out;
}

std::vector<AspectEvent> scan_window(EphProvider&prov,const PosSet&natal,
									 double start_jd,double end_jd,Frame frame,
									 const OrbTbl&orbs,double step_days){
	if(!std::isfinite(start_jd)||!std::isfinite(end_jd)||end_jd<start_jd){
		throw std::invalid_argument("transit window end precedes start");
	}
	if(!std::isfinite(step_days)||step_days<=0.0){
		throw std::invalid_argument("transit step must be positive");
	}
	if(natal.frame!=frame){
		throw std::invalid_argument("natal positions are in the "+
									frame_name(natal.frame)+" frame");
	}
	orbs.validate();
	chk_era(start_jd);
	chk_era(end_jd);

	const std::vector<Track> tracks=mk_tracks();
	std::vector<AspectEvent> exact;
	std::set<std::tuple<int,int,int>> hit;

	auto add_exact=[&](const Track&tr,double jd){
		PosSet ps=prov.positions(jd,frame);
		AspectEvent ev=mk_event(tr.t,ps.at(tr.t).lon,tr.n,natal.at(tr.n).lon,
								tr.type,orbs);
		ev.exact_jd=jd;
		exact.push_back(ev);
		hit.insert(std::make_tuple(static_cast<int>(tr.t),static_cast<int>(tr.n),
								   static_cast<int>(tr.type)));
	};

	PosSet first=prov.positions(start_jd,frame);
	std::vector<double> g_prev(tracks.size());
	for(std::size_t k=0;k<tracks.size();++k){
		g_prev[k]=track_dev(tracks[k],first,natal);
		if(g_prev[k]==0.0){
			add_exact(tracks[k],start_jd);
		}
	}

	double t0=start_jd;
	while(t0<end_jd){
		double t1=std::min(end_jd,t0+step_days);
		PosSet cur=prov.positions(t1,frame);
		for(std::size_t k=0;k<tracks.size();++k){
			const Track&tr=tracks[k];
			double g1=track_dev(tr,cur,natal);
			if(g1==0.0){
				add_exact(tr,t1);
			}else if(crosses(g_prev[k],g1)){
				double lo=t0;
				double hi=t1;
				double glo=g_prev[k];
				while((hi-lo)*SEC_DAY>1.0){
					double mid=0.5*(lo+hi);
					double gm=track_dev(tr,prov.positions(mid,frame),natal);
					if(gm==0.0){
						lo=hi=mid;
						break;
					}
					if((gm<0.0)==(glo<0.0)){
						lo=mid;
						glo=gm;
					}else{
						hi=mid;
					}
				}
				add_exact(tr,0.5*(lo+hi));
			}
			g_prev[k]=g1;
		}
		t0=t1;
	}

	std::vector<AspectEvent> out;
	for(const auto&ev : find_aspects(first,natal,orbs)){
		auto key=std::make_tuple(static_cast<int>(ev.a),static_cast<int>(ev.b),
								 static_cast<int>(ev.type));
		if(hit.count(key)==0){
			out.push_back(ev);
		}
	}
	std::stable_sort(exact.begin(),exact.end(),
					 [](const AspectEvent&x,const AspectEvent&y){
						 return *x.exact_jd<*y.exact_jd;
					 });
	out.insert(out.end(),exact.begin(),exact.end());
	return out;
}

Pulse pulse(const std::vector<AspectEvent>&events,const PulseCfg&cfg){
	Pulse p;
	for(const auto&ev : events){
		if(is_harmonious(ev.type)){
			p.harmonious+=ev.tight;
			++p.n_harm;
		}else if(is_challenging(ev.type)){
			p.challenging+=ev.tight;
			++p.n_chal;
		}else{
			p.amplifier+=ev.tight;
			++p.n_conj;
		}
	}
	p.net=p.harmonious-p.challenging;

	if(events.empty()){
		p.label="grounded";
		p.score=50;
	}else if(p.harmonious>0.0&&p.harmonious>cfg.flow_ratio*p.challenging){
		p.label="flowing";
		p.score=std::min(80,55+5*p.n_harm);
	}else if(p.net>0.0){
		p.label="electric";
		p.score=std::min(70,50+4*p.n_harm);
	}else if(p.net<0.0){
		p.label="friction";
		p.score=std::max(35,55-4*p.n_chal);
	}else{
		p.label="magnetic";
		double total=p.harmonious+p.challenging+p.amplifier;
		p.score=std::min(75,55+static_cast<int>(total*5.0));
	}

	std::vector<const AspectEvent*> order;
	for(const auto&ev : events){
		order.push_back(&ev);
	}
	std::stable_sort(order.begin(),order.end(),
					 [](const AspectEvent*x,const AspectEvent*y){
						 return x->tight>y->tight;
					 });
	for(std::size_t i=0;i<order.size()&&i<2;++i){
		p.top.push_back(asp_desc(*order[i]));
	}
	return p;
}

std::vector<DayPulse> daily_pulse(EphProvider&prov,const PosSet&natal,
								  double start_jd,int days,const OrbTbl&orbs,
								  const PulseCfg&cfg){
	if(days<1){
		throw std::invalid_argument("pulse needs at least one day");
	}
	orbs.validate();
	std::vector<DayPulse> out;
	out.reserve(static_cast<std::size_t>(days));
	for(int d=0;d<days;++d){
		double jd=start_jd+d;
		PosSet tr=prov.positions(jd,natal.frame);
		std::vector<AspectEvent> evs;
		for(const auto&ev : find_aspects(tr,natal,orbs)){
			if(is_fast(ev.a)){
				evs.push_back(ev);
			}
		}
		DayPulse dp;
		dp.jd_utc=jd;
		dp.pulse=pulse(evs,cfg);
		dp.intensity=day_intensity(dp.pulse);
		dp.events=std::move(evs);
		out.push_back(std::move(dp));
	}
	return out;
}

std::string day_intensity(const Pulse&p){
	double total=p.harmonious+p.challenging+p.amplifier;
	if(p.n_harm+p.n_chal+p.n_conj==0){
		return "quiet";
	}
	if(total>=1.8&&p.n_harm>=2){
		return "peak";
	}
	if(total>=1.2&&p.n_harm>=1){
		return "elevated";
	}
	if(p.n_chal>p.n_harm){
		return "challenging";
	}
	return "neutral";
}

std::vector<PeakWindow> peak_windows(const std::vector<DayPulse>&days,
									 std::size_t max_cnt){
	std::vector<PeakWindow> out;
	std::size_t run=0;
	auto close=[&](std::size_t end,const char*label){
		if(run>=2&&out.size()<max_cnt){
			PeakWindow pw;
			pw.start_jd=days[end-run].jd_utc;
			pw.end_jd=days[end-1].jd_utc;
			pw.label=label;
			out.push_back(pw);
		}
		run=0;
	};
	for(std::size_t i=0;i<days.size();++i){
		const DayPulse&d=days[i];
		bool hot=(d.intensity=="peak"||d.intensity=="elevated")&&
				 d.pulse.n_harm>0;
		if(hot){
			++run;
		}else{
			close(i,"harmony window");
		}
	}
	close(days.size(),"connection peak");
	return out;
}

Shift next_shift(const std::vector<DayPulse>&days){
	if(days.empty()){
		throw std::invalid_argument("shift needs at least one day");
	}
	auto key=[](const AspectEvent&ev){
		return std::make_tuple(static_cast<int>(ev.a),static_cast<int>(ev.b),
							   static_cast<int>(ev.type));
	};
	for(std::size_t i=1;i<days.size();++i){
		const DayPulse&prev=days[i-1];
		const DayPulse&cur=days[i];
		std::set<std::tuple<int,int,int>> seen;
		for(const auto&ev : prev.events){
			seen.insert(key(ev));
		}
		bool fresh=false;
		for(const auto&ev : cur.events){
			if(ev.tight>=0.7&&seen.count(key(ev))==0){
				fresh=true;
				break;
			}
		}
		long diff=static_cast<long>(cur.events.size())-
				  static_cast<long>(prev.events.size());
		if(!fresh&&std::labs(diff)<2){
			continue;
		}
		Shift sh;
		sh.jd_utc=cur.jd_utc;
		sh.days_away=static_cast<int>(std::lround(cur.jd_utc-days[0].jd_utc));
		sh.found=true;
		if(cur.pulse.n_harm>cur.pulse.n_chal){
			sh.state="flowing";
		}else if(cur.pulse.n_chal>cur.pulse.n_harm){
			sh.state="friction";
		}else{
			sh.state="electric";
		}
		return sh;
	}
	Shift sh;
	sh.jd_utc=days[0].jd_utc+7.0;
	sh.days_away=7;
	sh.state="grounded";
	return sh;
}
