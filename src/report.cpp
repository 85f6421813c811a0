#include "graha/report.hpp"

#include<functional>
#include<initializer_list>
#include<ostream>

#include "graha/cli.hpp"
#include "graha/cli_common.hpp"
#include "graha/ephem.hpp"

using cli_util::fmt_at;
using cli_util::fmt_lon;
using cli_util::fmt_num;

namespace{

std::string pad(const std::string&s,std::size_t w){
	return s.size()>=w?s:s+std::string(w-s.size(),' ');
}

std::string low_name(Body b){ return cli_util::to_low(body_name(b)); }

void dom_json(JsonWriter&w,const std::string&name,const DomainVals&v,
			  int digits){
	w.key(name);
	w.obj_begin();
	for(std::size_t d=0;d<DOMAIN_CNT;++d){
		w.key(domain_name(static_cast<Domain>(d)));
		w.fixed(v[d],digits);
	}
	w.obj_end();
}

std::string dom_txt(const DomainVals&v,int digits){
	std::string out;
	for(std::size_t d=0;d<DOMAIN_CNT;++d){
		if(d>0){
			out+=' ';
		}
		out+=domain_name(static_cast<Domain>(d))+"="+fmt_num(v[d],digits);
	}
	return out;
}

void dasha_walk(const DashaTree&t,const std::function<void(int)>&fn){
	std::function<void(int)> rec=[&](int idx){
		fn(idx);
		const DashaPeriod&p=t.nodes[static_cast<std::size_t>(idx)];
		for(int k=0;k<p.child_cnt;++k){
			rec(p.first_child+k);
		}
	};
	for(std::size_t i=0;i<t.nodes.size()&&t.nodes[i].level==1;++i){
		rec(static_cast<int>(i));
	}
}

}

void txt_head(std::ostream&os,const std::string&type){
	os<<"tool=graha format=txt type="<<type<<"\n";
}

void write_meta(JsonWriter&w,const std::string&type,const std::string&ephem){
	w.key("meta");
	w.obj_begin();
	w.field("tool","graha");
	w.field("version",tool_ver());
	w.field("schema","graha.v1");
	w.field("type",type);
	w.field("ephem",ephem);
	w.obj_end();
}

void pos_txt(std::ostream&os,const PosSet&ps,const std::optional<double>&asc,
			 const std::string&tz){
	os<<"input.time="<<fmt_at(ps.jd_utc,tz)<<"\n";
	os<<"input.jd_utc="<<fmt_num(ps.jd_utc,8)<<"\n";
	os<<"data.frame="<<frame_name(ps.frame)<<"\n";
	os<<"data.accuracy="<<acc_name(ps.acc)<<"\n";
	if(ps.frame==Frame::SIDEREAL){
		os<<"data.ayanamsha="<<fmt_num(ps.ayan)<<"\n";
	}
	if(asc){
		os<<"data.ascendant="<<fmt_num(*asc)<<" ("<<fmt_lon(*asc)<<")\n";
	}else{
		os<<"data.ascendant=unavailable\n";
	}
	for(const auto&p : ps.pos){
		os<<pad(body_name(p.body),8)<<" lon="<<fmt_num(p.lon)<<" ("
		  <<fmt_lon(p.lon)<<") lat="<<fmt_num(p.lat)
		  <<" speed="<<fmt_num(p.speed)<<" retro="<<(p.retro?"1":"0");
		if(asc){
			os<<" house="<<whole_house(p.lon,*asc);
		}
		os<<" acc="<<acc_name(p.acc)<<"\n";
	}
}

void pos_json(JsonWriter&w,const PosSet&ps,const std::optional<double>&asc,
			  const std::string&tz){
	w.obj_begin();
	w.field("time",fmt_at(ps.jd_utc,tz));
	w.field("jd_utc",ps.jd_utc);
	w.field("frame",frame_name(ps.frame));
	w.field("accuracy",acc_name(ps.acc));
	if(ps.frame==Frame::SIDEREAL){
		w.field("ayanamsha",ps.ayan);
	}
	w.opt_field("ascendant",asc);
	w.key("bodies");
	w.obj_begin();
	for(const auto&p : ps.pos){
		w.key(low_name(p.body));
		w.obj_begin();
		w.field("longitude",p.lon);
		w.field("latitude",p.lat);
		w.field("speed",p.speed);
		w.field("retrograde",p.retro);
		w.field("sign",sign_name(sign_of(p.lon)));
		w.key("house");
		if(asc){
			w.value(whole_house(p.lon,*asc));
		}else{
			w.null_val();
		}
		w.field("frame",frame_name(p.frame));
		w.field("accuracy",acc_name(p.acc));
		w.obj_end();
	}
	w.obj_end();
	w.obj_end();
}

void nak_txt(std::ostream&os,const NakInfo&n){
	os<<"data.index="<<n.index<<"\n";
	os<<"data.name="<<n.name<<"\n";
	os<<"data.lord="<<body_name(n.lord)<<"\n";
	os<<"data.pada="<<n.pada<<"\n";
	os<<"data.deg_in="<<fmt_num(n.deg_in)<<"\n";
	os<<"data.elapsed="<<fmt_num(n.elapsed)<<"\n";
	os<<"data.balance_years="
	  <<fmt_num(dasha_years(n.lord)*(1.0-n.elapsed))<<"\n";
}

void nak_json(JsonWriter&w,const NakInfo&n){
	w.obj_begin();
	w.field("index",n.index);
	w.field("name",n.name);
	w.field("lord",body_name(n.lord));
	w.field("pada",n.pada);
	w.field("deg_in",n.deg_in);
	w.field("elapsed",n.elapsed);
	w.field("balance_years",dasha_years(n.lord)*(1.0-n.elapsed));
	w.obj_end();
}

void dasha_txt(std::ostream&os,const DashaTree&t,const std::string&tz){
	os<<"input.birth="<<fmt_at(t.birth,tz)<<"\n";
	os<<"input.until="<<fmt_at(t.until,tz)<<"\n";
	os<<"input.depth="<<t.max_level<<"\n";
	os<<"data.moon_nakshatra="<<t.moon_nak.name<<" pada "<<t.moon_nak.pada
	  <<"\n";
	os<<"data.balance_years="<<fmt_num(t.balance)<<"\n";
	dasha_walk(t,[&](int idx){
		const DashaPeriod&p=t.nodes[static_cast<std::size_t>(idx)];
		os<<std::string(static_cast<std::size_t>(p.level-1)*2,' ')
		  <<pad(body_name(p.lord),8)<<" "<<fmt_at(p.start,tz)<<" .. "
		  <<fmt_at(p.end,tz)<<" years="<<fmt_num(p.years(),4)<<"\n";
	});
}

void dasha_json(JsonWriter&w,const DashaTree&t,const std::string&tz){
	w.obj_begin();
	w.field("birth",fmt_at(t.birth,tz));
	w.field("until",fmt_at(t.until,tz));
	w.field("depth",t.max_level);
	w.key("moon_nakshatra");
	nak_json(w,t.moon_nak);
	w.field("balance_years",t.balance);
	w.key("periods");
	w.arr_begin();
	std::function<void(int)> rec=[&](int idx){
		const DashaPeriod&p=t.nodes[static_cast<std::size_t>(idx)];
		w.obj_begin();
		w.field("lord",body_name(p.lord));
		w.field("level",p.level);
		w.field("level_name",level_name(p.level));
		w.field("start",fmt_at(p.start,tz));
		w.field("end",fmt_at(p.end,tz));
		w.field("start_jd",p.start);
		w.field("end_jd",p.end);
		if(p.child_cnt>0){
			w.key("children");
			w.arr_begin();
			for(int k=0;k<p.child_cnt;++k){
				rec(p.first_child+k);
			}
			w.arr_end();
		}
		w.obj_end();
	};
	for(std::size_t i=0;i<t.nodes.size()&&t.nodes[i].level==1;++i){
		rec(static_cast<int>(i));
	}
	w.arr_end();
	w.obj_end();
}

void trans_txt(std::ostream&os,const std::vector<DashaTrans>&tr,
			   const std::string&tz){
	for(const auto&t : tr){
		std::string pre="active."+level_name(t.level)+".";
		os<<pre<<"lord="<<body_name(t.lord)<<"\n";
		os<<pre<<"end="<<fmt_at(t.end,tz)<<"\n";
		os<<pre<<"days_left="<<fmt_num(t.days_left,2)<<"\n";
		os<<pre<<"next="<<(t.has_next?body_name(t.next_lord):"none")<<"\n";
	}
}

void trans_json(JsonWriter&w,const std::vector<DashaTrans>&tr,
				const std::string&tz){
	w.arr_begin();
	for(const auto&t : tr){
		w.obj_begin();
		w.field("level",t.level);
		w.field("level_name",level_name(t.level));
		w.field("lord",body_name(t.lord));
		w.field("end",fmt_at(t.end,tz));
		w.field("days_left",t.days_left);
		w.key("next_lord");
		if(t.has_next){
			w.value(body_name(t.next_lord));
		}else{
			w.null_val();
		}
		w.obj_end();
	}
	w.arr_end();
}

void impact_txt(std::ostream&os,const ImpactCmp&c){
	for(const DashaImpact*d : {&c.cur,&c.next}){
		std::string pre=d==&c.cur?"impact.current.":"impact.next.";
		os<<pre<<"lord="<<body_name(d->lord)<<"\n";
		os<<pre<<"strength="<<fmt_num(d->strength,2)<<" ("<<d->label<<")\n";
		os<<pre<<"tone="<<d->tone<<"\n";
		os<<pre<<"scores "<<dom_txt(d->impact,1)<<"\n";
	}
	os<<"impact.delta "<<dom_txt(c.delta,1)<<"\n";
	for(const auto&s : c.shifts){
		os<<"impact.shift="<<s<<"\n";
	}
	os<<"impact.summary="<<c.summary<<"\n";
}

void impact_json(JsonWriter&w,const ImpactCmp&c){
	auto one=[&](const DashaImpact&d){
		w.obj_begin();
		w.field("lord",body_name(d.lord));
		w.field("strength",d.strength);
		w.field("strength_label",d.label);
		dom_json(w,"impact_scores",d.impact,1);
		w.field("tone",d.tone);
		w.field("tone_description",d.tone_desc);
		w.str_arr("keywords",d.keywords);
		w.obj_end();
	};
	w.obj_begin();
	w.key("current");
	one(c.cur);
	w.key("next");
	one(c.next);
	dom_json(w,"deltas",c.delta,1);
	w.str_arr("major_shifts",c.shifts);
	w.field("summary",c.summary);
	w.obj_end();
}

void str_txt(std::ostream&os,const StrengthSet&s){
	os<<"data.day_birth="
	  <<(s.day_birth?(*s.day_birth?"1":"0"):"unavailable")<<"\n";
	for(const auto&sc : s.scores){
		os<<pad(body_name(sc.body),8)<<" composite="<<fmt_num(sc.composite,2)
		  <<" label="<<sc.label<<" dignity="<<dig_name(sc.dignity)
		  <<" positional="<<fmt_num(sc.positional,2)<<" directional="
		  <<(sc.directional?fmt_num(*sc.directional,2):"unavailable")
		  <<" temporal="<<fmt_num(sc.temporal,2)<<"\n";
	}
	os<<"aggregate "<<dom_txt(s.aggregate,2)<<"\n";
}

void str_json(JsonWriter&w,const StrengthSet&s){
	w.obj_begin();
	w.key("day_birth");
	if(s.day_birth){
		w.value(*s.day_birth);
	}else{
		w.null_val();
	}
	w.key("bodies");
	w.obj_begin();
	for(const auto&sc : s.scores){
		w.key(low_name(sc.body));
		w.obj_begin();
		w.field("positional",sc.positional);
		w.opt_field("directional",sc.directional);
		w.field("directional_available",sc.directional.has_value());
		w.field("temporal",sc.temporal);
		w.field("composite",sc.composite);
		w.field("dignity",dig_name(sc.dignity));
		w.field("strength_label",sc.label);
		dom_json(w,"impact",sc.impact,2);
		w.obj_end();
	}
	w.obj_end();
	dom_json(w,"aggregate",s.aggregate,2);
	w.obj_end();
}

void asp_txt(std::ostream&os,const std::vector<AspectEvent>&evs,
			 const std::string&tz){
	os<<"data.count="<<evs.size()<<"\n";
	for(const auto&ev : evs){
		os<<pad(asp_desc(ev),30)<<" sep="<<fmt_num(ev.sep,4)
		  <<" dev="<<fmt_num(ev.dev,4)<<" tight="<<fmt_num(ev.tight,3);
		if(ev.exact_jd){
			os<<" exact="<<fmt_at(*ev.exact_jd,tz);
		}
		os<<"\n";
	}
}

void asp_json(JsonWriter&w,const std::vector<AspectEvent>&evs,
			  const std::string&tz){
	w.arr_begin();
	for(const auto&ev : evs){
		w.obj_begin();
		w.field("a",body_name(ev.a));
		w.field("b",body_name(ev.b));
		w.field("aspect",asp_name(ev.type));
		w.field("separation",ev.sep);
		w.field("deviation",ev.dev);
		w.field("tightness",ev.tight);
		w.key("exact");
		if(ev.exact_jd){
			w.value(fmt_at(*ev.exact_jd,tz));
		}else{
			w.null_val();
		}
		w.obj_end();
	}
	w.arr_end();
}

void pulse_txt(std::ostream&os,const Pulse&p,const std::string&prefix){
	os<<prefix<<"label="<<p.label<<"\n";
	os<<prefix<<"score="<<p.score<<"\n";
	os<<prefix<<"net="<<fmt_num(p.net,3)<<" harmonious="
	  <<fmt_num(p.harmonious,3)<<" challenging="<<fmt_num(p.challenging,3)
	  <<" amplifier="<<fmt_num(p.amplifier,3)<<"\n";
	for(const auto&t : p.top){
		os<<prefix<<"top="<<t<<"\n";
	}
}

void pulse_json(JsonWriter&w,const Pulse&p){
	w.obj_begin();
	w.field("label",p.label);
	w.field("score",p.score);
	w.field("net",p.net);
	w.field("harmonious",p.harmonious);
	w.field("challenging",p.challenging);
	w.field("amplifier",p.amplifier);
	w.field("n_harmonious",p.n_harm);
	w.field("n_challenging",p.n_chal);
	w.field("n_conjunction",p.n_conj);
	w.str_arr("top",p.top);
	w.obj_end();
}

void dpulse_txt(std::ostream&os,const std::vector<DayPulse>&days,
				const std::vector<PeakWindow>&peaks,const Shift&sh,
				const std::string&tz){
	for(const auto&d : days){
		os<<fmt_at(d.jd_utc,tz).substr(0,10)<<" "<<pad(d.pulse.label,9)
		  <<" "<<pad(d.intensity,11)<<" score="<<d.pulse.score
		  <<" net="<<fmt_num(d.pulse.net,3);
		if(!d.pulse.top.empty()){
			os<<" top="<<d.pulse.top.front();
		}
		os<<"\n";
	}
	for(const auto&pw : peaks){
		os<<"peak="<<fmt_at(pw.start_jd,tz).substr(0,10)<<".."
		  <<fmt_at(pw.end_jd,tz).substr(0,10)<<" "<<pw.label<<"\n";
	}
	os<<"shift.date="<<fmt_at(sh.jd_utc,tz).substr(0,10)<<"\n";
	os<<"shift.days_away="<<sh.days_away<<"\n";
	os<<"shift.state="<<sh.state<<"\n";
}

void dpulse_json(JsonWriter&w,const std::vector<DayPulse>&days,
				 const std::vector<PeakWindow>&peaks,const Shift&sh,
				 const std::string&tz){
	w.obj_begin();
	w.key("days");
	w.arr_begin();
	for(const auto&d : days){
		w.obj_begin();
		w.field("date",fmt_at(d.jd_utc,tz).substr(0,10));
		w.field("intensity",d.intensity);
		w.key("pulse");
		pulse_json(w,d.pulse);
		w.obj_end();
	}
	w.arr_end();
	w.key("peak_windows");
	w.arr_begin();
	for(const auto&pw : peaks){
		w.obj_begin();
		w.field("start",fmt_at(pw.start_jd,tz).substr(0,10));
		w.field("end",fmt_at(pw.end_jd,tz).substr(0,10));
		w.field("label",pw.label);
		w.obj_end();
	}
	w.arr_end();
	w.key("next_shift");
	w.obj_begin();
	w.field("date",fmt_at(sh.jd_utc,tz).substr(0,10));
	w.field("days_away",sh.days_away);
	w.field("state",sh.state);
	w.field("found",sh.found);
	w.obj_end();
	w.obj_end();
}
