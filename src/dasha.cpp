#include "graha/dasha.hpp"

#include<cmath>
#include<cstddef>
#include<stdexcept>

namespace{

std::size_t cyc_pos(Body lord){
	for(std::size_t i=0;i<DASHA_ORDER.size();++i){
		if(DASHA_ORDER[i]==lord){
			return i;
		}
	}
	throw std::invalid_argument(body_name(lord)+" has no dasha period");
}

bool overlaps(const DashaPeriod&p,double from,double to){
	return p.end>from&&p.start<=to;
}

// true when no later period follows p at its level
bool last_of_cycle(const DashaTree&t,const DashaPeriod&p){
	if(p.parent<0){
		return p.end>=t.birth+DASHA_CYCLE_YEARS*JUL_YEAR;
	}
	const DashaPeriod&up=t.nodes[static_cast<std::size_t>(p.parent)];
	return p.end==up.end&&last_of_cycle(t,up);
}

Body next_lord(const DashaTree&t,const DashaPeriod&p){
	if(p.parent<0){
		return cyc_next(p.lord);
	}
	const DashaPeriod&up=t.nodes[static_cast<std::size_t>(p.parent)];
	if(p.end==up.end){
		return next_lord(t,up);
	}
	return cyc_next(p.lord);
}

}

std::vector<int> DashaTree::level(int lv) const{
	std::vector<int> out;
	for(std::size_t i=0;i<nodes.size();++i){
		if(nodes[i].level==lv){
			out.push_back(static_cast<int>(i));
		}
	}
	return out;
}

std::string level_name(int level){
	switch(level){
	case 1:
		return "mahadasha";
	case 2:
		return "antardasha";
	case 3:
		return "pratyantardasha";
	case 4:
		return "sookshma";
	case 5:
		return "prana";
	default:
		throw std::invalid_argument("dasha level outside 1..5: "+
									std::to_string(level));
	}
}

Body cyc_next(Body lord){
	return DASHA_ORDER[(cyc_pos(lord)+1)%DASHA_ORDER.size()];
}

std::vector<DashaPeriod> subdivide(const DashaPeriod&p){
	std::vector<DashaPeriod> out;
	if(p.level>=DASHA_MAX_LEVEL){
		return out;
	}
	out.reserve(DASHA_ORDER.size());
	std::size_t k0=cyc_pos(p.lord);
	double span=p.end-p.start;
	int cum=0;
	double t0=p.start;
	for(std::size_t i=0;i<DASHA_ORDER.size();++i){
		Body lord=DASHA_ORDER[(k0+i)%DASHA_ORDER.size()];
		cum+=dasha_years(lord);
		double t1=i+1==DASHA_ORDER.size()?
					  p.end:
					  p.start+span*static_cast<double>(cum)/DASHA_CYCLE_YEARS;
		if(t1>t0){
			DashaPeriod c;
			c.lord=lord;
			c.level=p.level+1;
			c.start=t0;
			c.end=t1;
			out.push_back(c);
		}
		t0=t1;
	}
	return out;
}

DashaTree assemble(double birth_jd,double moon_sid,double until_jd,
				   int max_level){
	if(!std::isfinite(birth_jd)||!std::isfinite(until_jd)){
		throw std::invalid_argument("dasha instants must be finite");
	}
	if(!std::isfinite(moon_sid)){
		throw std::invalid_argument("moon longitude is not finite");
	}
	if(until_jd<birth_jd){
		throw std::invalid_argument("dasha end precedes birth");
	}
	if(max_level<1||max_level>DASHA_MAX_LEVEL){
		throw std::invalid_argument("dasha depth outside 1..5: "+
									std::to_string(max_level));
	}

	DashaTree t;
	t.birth=birth_jd;
	t.until=until_jd;
	t.max_level=max_level;
	t.moon_nak=nakshatra(moon_sid);

	Body first=t.moon_nak.lord;
	double yrs0=dasha_years(first);
	t.balance=yrs0*(1.0-t.moon_nak.elapsed);

	// level 1: balance, eight full periods, then the consumed part of the
	// starting lord; cumulative years keep the total at exactly 120
	std::size_t k0=cyc_pos(first);
	double cum=0.0;
	for(std::size_t i=0;i<=DASHA_ORDER.size();++i){
		Body lord=DASHA_ORDER[(k0+i)%DASHA_ORDER.size()];
		double y;
		if(i==0){
			y=t.balance;
		}else if(i==DASHA_ORDER.size()){
			y=DASHA_CYCLE_YEARS-cum;
		}else{
			y=dasha_years(lord);
		}
		double c1=cum+y;
		DashaPeriod p;
		p.lord=lord;
		p.level=1;
		p.start=birth_jd+cum*JUL_YEAR;
		p.end=i==DASHA_ORDER.size()?birth_jd+DASHA_CYCLE_YEARS*JUL_YEAR:
									 birth_jd+c1*JUL_YEAR;
		cum=c1;
		if(p.end<=p.start||!overlaps(p,birth_jd,until_jd)){
			continue;
		}
		t.nodes.push_back(p);
	}

	// breadth first: children of each node land next to each other
	for(std::size_t i=0;i<t.nodes.size();++i){
		if(t.nodes[i].level>=max_level){
			continue;
		}
		std::vector<DashaPeriod> kids=subdivide(t.nodes[i]);
		int first_idx=static_cast<int>(t.nodes.size());
		int cnt=0;
		for(auto&c : kids){
			if(!overlaps(c,birth_jd,until_jd)){
				continue;
			}
			c.parent=static_cast<int>(i);
			t.nodes.push_back(c);
			++cnt;
		}
		if(cnt>0){
			t.nodes[i].first_child=first_idx;
			t.nodes[i].child_cnt=cnt;
		}
	}
	return t;
}

std::vector<int> active_chain(const DashaTree&tree,double jd){
	std::vector<int> chain;
	int lo=0;
	int cnt=0;
	for(const auto&p : tree.nodes){
		if(p.level!=1){
			break;
		}
		++cnt;
	}
	while(cnt>0){
		int hit=-1;
		for(int i=lo;i<lo+cnt;++i){
			if(tree.nodes[static_cast<std::size_t>(i)].contains(jd)){
				hit=i;
				break;
			}
		}
		if(hit<0){
			break;
		}
		chain.push_back(hit);
		const DashaPeriod&p=tree.nodes[static_cast<std::size_t>(hit)];
		lo=p.first_child;
		cnt=p.child_cnt;
	}
	return chain;
}

std::vector<DashaTrans> transitions(const DashaTree&tree,double jd){
	std::vector<DashaTrans> out;
	for(int idx : active_chain(tree,jd)){
		const DashaPeriod&p=tree.nodes[static_cast<std::size_t>(idx)];
		DashaTrans tr;
		tr.level=p.level;
		tr.lord=p.lord;
		tr.end=p.end;
		tr.days_left=p.end-jd;
		tr.has_next=!last_of_cycle(tree,p);
		if(tr.has_next){
			tr.next_lord=next_lord(tree,p);
		}
		out.push_back(tr);
	}
	return out;
}
