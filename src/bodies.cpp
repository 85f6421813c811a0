#include "graha/bodies.hpp"

#include<cmath>
#include<stdexcept>

#include "graha/math.hpp"

namespace{

const char*const B_NAMES[BODY_CNT]={
	"Sun","Moon","Mercury","Venus","Mars","Jupiter",
	"Saturn","Uranus","Neptune","Pluto","Rahu","Ketu",
};

const char*const SIGNS[12]={
	"Aries","Taurus","Gemini","Cancer","Leo","Virgo",
	"Libra","Scorpio","Sagittarius","Capricorn","Aquarius","Pisces",
};

const char*const V_SIGNS[12]={
	"Mesha","Vrishabha","Mithuna","Karka","Simha","Kanya",
	"Tula","Vrischika","Dhanu","Makara","Kumbha","Meena",
};

const Body LORDS[12]={
	Body::MARS,Body::VENUS,Body::MERCURY,Body::MOON,
	Body::SUN,Body::MERCURY,Body::VENUS,Body::MARS,
	Body::JUPITER,Body::SATURN,Body::SATURN,Body::JUPITER,
};

std::string low(std::string s){
	for(char&c : s){
		if(c>='A'&&c<='Z'){
			c=static_cast<char>(c-'A'+'a');
		}
	}
	return s;
}

}

const std::array<Body,BODY_CNT> ALL_BODIES={
	Body::SUN,Body::MOON,Body::MERCURY,Body::VENUS,
	Body::MARS,Body::JUPITER,Body::SATURN,Body::URANUS,
	Body::NEPTUNE,Body::PLUTO,Body::RAHU,Body::KETU,
};

std::string body_name(Body b){ return B_NAMES[body_idx(b)]; }

Body parse_body(const std::string&name){
	std::string key=low(name);
	for(Body b : ALL_BODIES){
		if(low(B_NAMES[body_idx(b)])==key){
			return b;
		}
	}
	if(key=="north_node"){
		return Body::RAHU;
	}
	if(key=="south_node"){
		return Body::KETU;
	}
	throw std::invalid_argument("unknown body: "+name);
}

std::string frame_name(Frame f){
	return f==Frame::TROPICAL?"tropical":"sidereal";
}

Frame parse_frame(const std::string&name){
	std::string key=low(name);
	if(key=="tropical"||key=="western"){
		return Frame::TROPICAL;
	}
	if(key=="sidereal"||key=="vedic"){
		return Frame::SIDEREAL;
	}
	throw std::invalid_argument("unknown frame: "+name);
}

std::string acc_name(Accuracy a){
	return a==Accuracy::PRECISE?"precise":"approximate";
}

bool is_fast(Body b){
	switch(b){
	case Body::SUN:
	case Body::MOON:
	case Body::MERCURY:
	case Body::VENUS:
	case Body::MARS:
		return true;
	default:
		return false;
	}
}

int sign_of(double lon){
	int s=static_cast<int>(std::floor(norm_deg(lon)/30.0));
	return s>11?11:s;
}

std::string sign_name(int sign){
	if(sign<0||sign>11){
		throw std::out_of_range("sign index out of range");
	}
	return SIGNS[sign];
}

std::string vedic_sign(int sign){
	if(sign<0||sign>11){
		throw std::out_of_range("sign index out of range");
	}
	return V_SIGNS[sign];
}

Body sign_lord(int sign){
	if(sign<0||sign>11){
		throw std::out_of_range("sign index out of range");
	}
	return LORDS[sign];
}
