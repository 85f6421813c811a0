#include "graha/strength.hpp"

#include<algorithm>
#include<cmath>
#include<stdexcept>

#include "graha/ephem.hpp"
#include "graha/math.hpp"

namespace{

const char*const DIG_NAMES[DIG_CNT]={
	"exalted","own","friend","neutral","enemy","debilitated",
};

const char*const DOMAIN_NAMES[DOMAIN_CNT]={
	"career","relationship","health","spiritual",
};

// exaltation sign per body, -1 for none; debilitation is opposite
int exalt_sign(Body b){
	switch(b){
	case Body::SUN:
		return 0;
	case Body::MOON:
		return 1;
	case Body::MERCURY:
		return 5;
	case Body::VENUS:
		return 11;
	case Body::MARS:
		return 9;
	case Body::JUPITER:
		return 3;
	case Body::SATURN:
		return 6;
	default:
		return -1;
	}
}

struct RelRow{
	Body body;
	std::vector<Body> friends;
	std::vector<Body> enemies;
};

const std::vector<RelRow>&rel_rows(){
	static const std::vector<RelRow> rows={
		{Body::SUN,{Body::MOON,Body::MARS,Body::JUPITER},
		 {Body::VENUS,Body::SATURN}},
		{Body::MOON,{Body::SUN,Body::MERCURY},{}},
		{Body::MARS,{Body::SUN,Body::MOON,Body::JUPITER},{Body::MERCURY}},
		{Body::MERCURY,{Body::SUN,Body::VENUS},{Body::MOON}},
		{Body::JUPITER,{Body::SUN,Body::MOON,Body::MARS},
		 {Body::MERCURY,Body::VENUS}},
		{Body::VENUS,{Body::MERCURY,Body::SATURN},{Body::SUN,Body::MOON}},
		{Body::SATURN,{Body::MERCURY,Body::VENUS},
		 {Body::SUN,Body::MOON,Body::MARS}},
		{Body::RAHU,{Body::MERCURY,Body::VENUS,Body::SATURN},
		 {Body::SUN,Body::MOON,Body::MARS}},
		{Body::KETU,{Body::MARS,Body::JUPITER},{Body::SUN,Body::MOON}},
	};
	return rows;
}

const RelRow*find_rel(Body b){
	for(const auto&r : rel_rows()){
		if(r.body==b){
			return &r;
		}
	}
	return nullptr;
}

bool has(const std::vector<Body>&v,Body b){
	return std::find(v.begin(),v.end(),b)!=v.end();
}

std::vector<std::string> body_keys(Body b){
	switch(b){
	case Body::SUN:
		return {"authority","vitality","ego","father"};
	case Body::MOON:
		return {"emotions","mother","mind","nurturing"};
	case Body::MARS:
		return {"energy","courage","action","conflict"};
	case Body::MERCURY:
		return {"intellect","communication","learning","commerce"};
	case Body::JUPITER:
		return {"wisdom","expansion","fortune","teaching"};
	case Body::VENUS:
		return {"love","beauty","harmony","luxury"};
	case Body::SATURN:
		return {"discipline","responsibility","restriction","karma"};
	case Body::RAHU:
		return {"ambition","illusion","obsession","foreign"};
	case Body::KETU:
		return {"detachment","spirituality","liberation","moksha"};
	default:
		return {};
	}
}

double house_score(const StrengthTbl&tbl,int house){
	switch(house%3){
	case 1:
		return tbl.angular;
	case 2:
		return tbl.succedent;
	default:
		return tbl.cadent;
	}
}

double temporal_score(const StrengthTbl&tbl,const BodyPos&p,
					  const std::optional<bool>&day){
	double t=tbl.plain;
	if(day){
		bool day_r=p.body==Body::SUN||p.body==Body::JUPITER||
				   p.body==Body::VENUS;
		bool night_r=p.body==Body::MOON||p.body==Body::MARS||
					 p.body==Body::SATURN;
		if(day_r){
			t=*day?tbl.aligned:tbl.opposed;
		}else if(night_r){
			t=*day?tbl.opposed:tbl.aligned;
		}
	}
	if(p.retro&&p.body!=Body::RAHU&&p.body!=Body::KETU){
		t*=tbl.retro_mult;
	}
	return t;
}

void chk_range(double v,double lo,double hi,const std::string&what){
	if(!std::isfinite(v)||v<lo||v>hi){
		throw std::invalid_argument(what+" outside ["+std::to_string(lo)+","+
									std::to_string(hi)+"]");
	}
}

}

std::string dig_name(Dignity d){ return DIG_NAMES[static_cast<std::size_t>(d)]; }

std::string domain_name(Domain d){
	return DOMAIN_NAMES[static_cast<std::size_t>(d)];
}

StrengthTbl::StrengthTbl(){
	// career, relationship, health, spiritual
	affinity[body_idx(Body::SUN)]={0.9,0.4,0.8,0.6};
	affinity[body_idx(Body::MOON)]={0.3,0.8,0.7,0.7};
	affinity[body_idx(Body::MERCURY)]={0.8,0.7,0.5,0.5};
	affinity[body_idx(Body::VENUS)]={0.6,0.9,0.6,0.5};
	affinity[body_idx(Body::MARS)]={0.7,0.5,0.9,0.4};
	affinity[body_idx(Body::JUPITER)]={0.7,0.7,0.6,0.9};
	affinity[body_idx(Body::SATURN)]={0.8,0.4,0.5,0.7};
	affinity[body_idx(Body::URANUS)]={0.0,0.0,0.0,0.0};
	affinity[body_idx(Body::NEPTUNE)]={0.0,0.0,0.0,0.0};
	affinity[body_idx(Body::PLUTO)]={0.0,0.0,0.0,0.0};
	affinity[body_idx(Body::RAHU)]={0.8,0.6,0.3,0.6};
	affinity[body_idx(Body::KETU)]={0.3,0.3,0.4,0.9};
}

void StrengthTbl::validate() const{
	chk_range(w_pos,0.0,1.0,"w.pos");
	chk_range(w_dir,0.0,1.0,"w.dir");
	chk_range(w_temp,0.0,1.0,"w.temp");
	if(std::fabs(w_pos+w_dir+w_temp-1.0)>1e-9){
		throw std::invalid_argument("strength weights must sum to 1.0");
	}
	if(w_pos+w_temp<=0.0){
		throw std::invalid_argument(
			"strength weights leave nothing without a birth time");
	}
	chk_range(retro_mult,0.0,1.0,"retro_mult");
	for(double d : dig){
		chk_range(d,0.0,100.0,"dignity score");
	}
	chk_range(angular,0.0,100.0,"angular");
	chk_range(succedent,0.0,100.0,"succedent");
	chk_range(cadent,0.0,100.0,"cadent");
	for(const auto&row : affinity){
		for(double a : row){
			chk_range(a,0.0,1.0,"affinity");
		}
	}
}

Dignity dignity_of(Body b,int sign){
	int ex=exalt_sign(b);
	if(ex>=0){
		if(sign==ex){
			return Dignity::EXALTED;
		}
		if(sign==(ex+6)%12){
			return Dignity::DEBILITATED;
		}
	}
	Body lord=sign_lord(sign);
	if(lord==b){
		return Dignity::OWN;
	}
	const RelRow*rel=find_rel(b);
	if(rel==nullptr){
		return Dignity::NEUTRAL;
	}
	if(has(rel->friends,lord)){
		return Dignity::FRIEND;
	}
	if(has(rel->enemies,lord)){
		return Dignity::ENEMY;
	}
	return Dignity::NEUTRAL;
}

std::string strength_label(double composite){
	if(composite>=75.0){
		return "very_strong";
	}
	if(composite>=60.0){
		return "strong";
	}
	if(composite>=40.0){
		return "moderate";
	}
	return "weak";
}

bool is_day_birth(double sun_lon,double asc){
	return norm_deg(sun_lon-asc)>180.0;
}

StrengthSet score(const PosSet&ps,const ChartCtx&ctx,const StrengthTbl&tbl){
	tbl.validate();
	StrengthSet out;
	if(ctx.asc){
		out.day_birth=is_day_birth(ps.at(Body::SUN).lon,*ctx.asc);
	}

	for(Body b : ALL_BODIES){
		const BodyPos&p=ps.at(b);
		StrengthScore s;
		s.body=b;
		s.dignity=dignity_of(b,sign_of(p.lon));
		s.positional=tbl.dig[static_cast<std::size_t>(s.dignity)];
		if(ctx.asc){
			s.directional=house_score(tbl,whole_house(p.lon,*ctx.asc));
		}
		s.temporal=temporal_score(tbl,p,out.day_birth);

		double c;
		if(s.directional){
			c=tbl.w_pos*s.positional+tbl.w_dir**s.directional+
			  tbl.w_temp*s.temporal;
		}else{
			c=(tbl.w_pos*s.positional+tbl.w_temp*s.temporal)/
			  (tbl.w_pos+tbl.w_temp);
		}
		s.composite=std::min(100.0,std::max(0.0,c));
		s.label=strength_label(s.composite);
		for(std::size_t d=0;d<DOMAIN_CNT;++d){
			s.impact[d]=tbl.affinity[body_idx(b)][d]*s.composite/10.0;
		}
		out.scores[body_idx(b)]=s;
	}

	for(std::size_t d=0;d<DOMAIN_CNT;++d){
		double num=0.0;
		double den=0.0;
		for(Body b : ALL_BODIES){
			double a=tbl.affinity[body_idx(b)][d];
			if(a<=0.0){
				continue;
			}
			num+=a*out.at(b).composite;
			den+=a;
		}
		out.aggregate[d]=den>0.0?num/den:0.0;
	}
	return out;
}

DashaImpact dasha_impact(Body lord,const StrengthSet&set,
						 const StrengthTbl&tbl){
	const StrengthScore&s=set.at(lord);
	DashaImpact out;
	out.lord=lord;
	out.strength=s.composite;
	out.label=s.label;
	for(std::size_t d=0;d<DOMAIN_CNT;++d){
		out.impact[d]=tbl.affinity[body_idx(lord)][d]*s.composite/10.0;
	}

	double f=s.composite/100.0;
	if(f>=0.75){
		out.tone="supportive";
		out.tone_desc="Strong, favorable period with good results";
	}else if(f>=0.60){
		out.tone="positive";
		out.tone_desc="Generally positive with steady progress";
	}else if(f>=0.40){
		out.tone="mixed";
		out.tone_desc="Mixed results, requires effort and patience";
	}else if(f>=0.25){
		out.tone="challenging";
		out.tone_desc="Challenging period, obstacles may arise";
	}else{
		out.tone="transformative";
		out.tone_desc="Difficult but transformative, lessons to learn";
	}
	out.keywords=body_keys(lord);
	return out;
}

ImpactCmp cmp_impact(Body cur,Body next,const StrengthSet&set,
					 const StrengthTbl&tbl){
	ImpactCmp out;
	out.cur=dasha_impact(cur,set,tbl);
	out.next=dasha_impact(next,set,tbl);
	for(std::size_t d=0;d<DOMAIN_CNT;++d){
		out.delta[d]=out.next.impact[d]-out.cur.impact[d];
		if(std::fabs(out.delta[d])>=2.0){
			out.shifts.push_back(
				domain_name(static_cast<Domain>(d))+
				(out.delta[d]>0.0?" increases":" decreases")+" significantly");
		}
	}
	out.summary="Shifting from "+out.cur.tone+" "+body_name(cur)+" to "+
				out.next.tone+" "+body_name(next);
	return out;
}
