#include "graha/nakshatra.hpp"

#include<cmath>
#include<stdexcept>

#include "graha/math.hpp"

namespace{

const char*const NAK_NAMES[NAK_CNT]={
	"Ashwini","Bharani","Krittika","Rohini","Mrigashira","Ardra",
	"Punarvasu","Pushya","Ashlesha","Magha","Purva Phalguni",
	"Uttara Phalguni","Hasta","Chitra","Swati","Vishakha","Anuradha",
	"Jyeshtha","Mula","Purva Ashadha","Uttara Ashadha","Shravana",
	"Dhanishta","Shatabhisha","Purva Bhadrapada","Uttara Bhadrapada",
	"Revati",
};

}

const std::array<Body,9> DASHA_ORDER={
	Body::KETU,Body::VENUS,Body::SUN,Body::MOON,Body::MARS,
	Body::RAHU,Body::JUPITER,Body::SATURN,Body::MERCURY,
};

int dasha_years(Body lord){
	switch(lord){
	case Body::KETU:
		return 7;
	case Body::VENUS:
		return 20;
	case Body::SUN:
		return 6;
	case Body::MOON:
		return 10;
	case Body::MARS:
		return 7;
	case Body::RAHU:
		return 18;
	case Body::JUPITER:
		return 16;
	case Body::SATURN:
		return 19;
	case Body::MERCURY:
		return 17;
	default:
		return 0;
	}
}

std::string nak_name(int index){
	if(index<1||index>NAK_CNT){
		throw std::out_of_range("nakshatra index out of range");
	}
	return NAK_NAMES[index-1];
}

Body nak_lord(int index){
	if(index<1||index>NAK_CNT){
		throw std::out_of_range("nakshatra index out of range");
	}
	return DASHA_ORDER[static_cast<std::size_t>((index-1)%9)];
}

NakInfo nakshatra(double sid_lon){
	if(!std::isfinite(sid_lon)){
		throw std::invalid_argument("longitude is not finite");
	}
	double lon=norm_deg(sid_lon);
	// index and pada from one quarter count, so exact pada starts
	// do not round down into the previous pada
	int q=static_cast<int>(std::floor(lon*(NAK_CNT*4)/360.0+1e-9));
	if(q>NAK_CNT*4-1){
		q=NAK_CNT*4-1;
	}
	int idx=q/4;
	NakInfo n;
	n.index=idx+1;
	n.name=NAK_NAMES[idx];
	n.lord=nak_lord(n.index);
	n.deg_in=lon-idx*NAK_SPAN;
	if(n.deg_in<0.0){
		n.deg_in=0.0;
	}
	n.elapsed=n.deg_in/NAK_SPAN;
	if(n.elapsed>=1.0){
		n.elapsed=std::nextafter(1.0,0.0);
	}
	n.pada=q%4+1;
	return n;
}
