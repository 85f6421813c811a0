#include "graha/mean_eph.hpp"

#include<cmath>
#include<stdexcept>

namespace{

// Standish mean elements, valid 1800-2050 and usable well beyond at reduced
// accuracy.
const KepElem ELEM[9]={
	// Mercury
	{0.38709927,0.20563593,7.00497902,252.25032350,77.45779628,48.33076593,
	 0.00000037,0.00001906,-0.00594749,149472.67411175,0.16047689,-0.12534081},
	// Venus
	{0.72333566,0.00677672,3.39467605,181.97909950,131.60246718,76.67984255,
	 0.00000390,-0.00004107,-0.00078890,58517.81538729,0.00268329,-0.27769418},
	// Earth-Moon barycentre
	{1.00000261,0.01671123,-0.00001531,100.46457166,102.93768193,0.0,
	 0.00000562,-0.00004392,-0.01294668,35999.37244981,0.32327364,0.0},
	// Mars
	{1.52371034,0.09339410,1.84969142,-4.55343205,-23.94362959,49.55953891,
	 0.00001847,0.00007882,-0.00813131,19140.30268499,0.44441088,-0.29257343},
	// Jupiter
	{5.20288700,0.04838624,1.30439695,34.39644051,14.72847983,100.47390909,
	 -0.00011607,-0.00013253,-0.00183714,3034.74612775,0.21252668,0.20469106},
	// Saturn
	{9.53667594,0.05386179,2.48599187,49.95424423,92.59887831,113.66242448,
	 -0.00125060,-0.00050991,0.00193609,1222.49362201,-0.41897216,-0.28867794},
	// Uranus
	{19.18916464,0.04725744,0.77263783,313.23810451,170.95427630,74.01692503,
	 -0.00196176,-0.00004397,-0.00242939,428.48202785,0.40805281,0.04240589},
	// Neptune
	{30.06992276,0.00859048,1.77004347,-55.12002969,44.96476227,131.78422574,
	 0.00026291,0.00005105,0.00035372,218.45945325,-0.32241464,-0.00508664},
	// Pluto
	{39.48211675,0.24882730,17.14001206,238.92903833,224.06891629,110.30393684,
	 -0.00031596,0.00005170,0.00004818,145.20780515,-0.04062942,-0.01183482},
};

constexpr int EMB_ROW=2;

int elem_row(Body b){
	switch(b){
	case Body::MERCURY:
		return 0;
	case Body::VENUS:
		return 1;
	case Body::MARS:
		return 3;
	case Body::JUPITER:
		return 4;
	case Body::SATURN:
		return 5;
	case Body::URANUS:
		return 6;
	case Body::NEPTUNE:
		return 7;
	case Body::PLUTO:
		return 8;
	default:
		throw std::invalid_argument("no mean elements for "+body_name(b));
	}
}

Vec3 elem_pos(const KepElem&k,double jd_tdb){
	double T=jcent(jd_tdb);
	double a=k.a+k.a_dot*T;
	double e=k.e+k.e_dot*T;
	double I=(k.incl+k.incl_dot*T)*D2R;
	double L=k.L+k.L_dot*T;
	double peri=k.peri+k.peri_dot*T;
	double node=k.node+k.node_dot*T;

	double w=(peri-node)*D2R;
	double M=norm_deg(L-peri);
	if(M>180.0){
		M-=360.0;
	}
	double E=MeanOrb::kepler(M*D2R,e);

	double xp=a*(std::cos(E)-e);
	double yp=a*std::sqrt(1.0-e*e)*std::sin(E);

	double cw=std::cos(w),sw=std::sin(w);
	double cO=std::cos(node*D2R),sO=std::sin(node*D2R);
	double cI=std::cos(I),sI=std::sin(I);

	return Vec3((cw*cO-sw*sO*cI)*xp+(-sw*cO-cw*sO*cI)*yp,
				(cw*sO+sw*cO*cI)*xp+(-sw*sO+cw*cO*cI)*yp,
				(sw*sI)*xp+(cw*sI)*yp);
}

// Lunar periodic terms: multiples of D, M, M', F and the coefficient in
// 1e-6 degrees.
struct LunTerm{
	int d,m,mp,f;
	double c;
};

const LunTerm LON_TERMS[]={
	{0,0,1,0,6288774},{2,0,-1,0,1274027},{2,0,0,0,658314},
	{0,0,2,0,213618},{0,1,0,0,-185116},{0,0,0,2,-114332},
	{2,0,-2,0,58793},{2,-1,-1,0,57066},{2,0,1,0,53322},
	{2,-1,0,0,45758},{0,1,-1,0,-40923},{1,0,0,0,-34720},
	{0,1,1,0,-30383},{2,0,0,-2,15327},{0,0,1,2,-12528},
	{0,0,1,-2,10980},{4,0,-1,0,10675},{0,0,3,0,10034},
	{4,0,-2,0,8548},{2,1,-1,0,-7888},{2,1,0,0,-6766},
	{1,0,-1,0,-5163},{1,1,0,0,4987},{2,-1,1,0,4036},
	{2,0,2,0,3994},
};

const LunTerm LAT_TERMS[]={
	{0,0,0,1,5128122},{0,0,1,1,280602},{0,0,1,-1,277693},
	{2,0,0,-1,173237},{2,0,-1,1,55413},{2,0,-1,-1,46271},
	{2,0,0,1,32573},{0,0,2,1,17198},{2,0,1,-1,9266},
	{0,0,2,-1,8822},{2,-1,0,-1,8216},{2,0,-2,-1,4324},
	{2,0,1,1,4200},
};

// tropical apparent position of date without the rate
void app_lonlat(Body b,double jd_tdb,double&lon,double&lat){
	double dpsi=PrecNut::nut_ang(jd_tdb).first*R2D;

	if(b==Body::MOON){
		MeanOrb::moon_mean(jd_tdb,lon,lat);
		lon=norm_deg(lon+dpsi);
		return;
	}
	if(b==Body::RAHU||b==Body::KETU){
		lon=MeanOrb::mean_node(jd_tdb)+dpsi;
		if(b==Body::KETU){
			lon+=180.0;
		}
		lon=norm_deg(lon);
		lat=0.0;
		return;
	}

	Vec3 earth=MeanOrb::helio_emb(jd_tdb);
	Vec3 geo;
	if(b==Body::SUN){
		geo=Vec3()-earth;
	}else{
		// one light-time pass is enough at this accuracy
		geo=MeanOrb::helio(b,jd_tdb)-earth;
		double tau=geo.norm()/C_AUDAY;
		geo=MeanOrb::helio(b,jd_tdb-tau)-earth;
	}

	// J2000 ecliptic -> J2000 equator -> true ecliptic of date
	Mat3 R=PrecNut::ecl_mat(jd_tdb)*CoordTf::R1(-84381.406*AS2R);
	EclSph s=to_sph(R*geo);
	lon=s.lon*R2D;
	lat=s.lat*R2D;
	if(b==Body::SUN){
		// annual aberration
		lon-=20.4898/3600.0/s.dist;
	}
	lon=norm_deg(lon);
}

}

double MeanOrb::kepler(double M,double e){
	double E=M+e*std::sin(M);
	for(int i=0;i<30;++i){
		double dE=(E-e*std::sin(E)-M)/(1.0-e*std::cos(E));
		E-=dE;
		if(std::fabs(dE)<1e-12){
			break;
		}
	}
	return E;
}

Vec3 MeanOrb::helio(Body b,double jd_tdb){
	return elem_pos(ELEM[elem_row(b)],jd_tdb);
}

Vec3 MeanOrb::helio_emb(double jd_tdb){
	return elem_pos(ELEM[EMB_ROW],jd_tdb);
}

void MeanOrb::moon_mean(double jd_tdb,double&lon,double&lat){
	double T=jcent(jd_tdb);
	double T2=T*T,T3=T2*T,T4=T3*T;

	double Lp=norm_deg(218.3164477+481267.88123421*T-0.0015786*T2+
					   T3/538841.0-T4/65194000.0);
	double D=norm_deg(297.8501921+445267.1114034*T-0.0018819*T2+
					  T3/545868.0-T4/113065000.0);
	double M=norm_deg(357.5291092+35999.0502909*T-0.0001536*T2+
					  T3/24490000.0);
	double Mp=norm_deg(134.9633964+477198.8675055*T+0.0087414*T2+
					   T3/69699.0-T4/14712000.0);
	double F=norm_deg(93.2720950+483202.0175233*T-0.0036539*T2-
					  T3/3526000.0+T4/863310000.0);
	double A1=norm_deg(119.75+131.849*T);
	double A2=norm_deg(53.09+479264.290*T);
	double A3=norm_deg(313.45+481266.484*T);
	double Ecc=1.0-0.002516*T-0.0000074*T2;

	auto ecc_fac=[&](int m){
		int am=m<0?-m:m;
		return am==1?Ecc:(am==2?Ecc*Ecc:1.0);
	};

	double sl=0.0;
	for(const auto&t : LON_TERMS){
		double arg=(t.d*D+t.m*M+t.mp*Mp+t.f*F)*D2R;
		sl+=t.c*ecc_fac(t.m)*std::sin(arg);
	}
	sl+=3958.0*std::sin(A1*D2R)+1962.0*std::sin((Lp-F)*D2R)+
		318.0*std::sin(A2*D2R);

	double sb=0.0;
	for(const auto&t : LAT_TERMS){
		double arg=(t.d*D+t.m*M+t.mp*Mp+t.f*F)*D2R;
		sb+=t.c*ecc_fac(t.m)*std::sin(arg);
	}
	sb+=-2235.0*std::sin(Lp*D2R)+382.0*std::sin(A3*D2R)+
		175.0*std::sin((A1-F)*D2R)+175.0*std::sin((A1+F)*D2R)+
		127.0*std::sin((Lp-Mp)*D2R)-115.0*std::sin((Lp+Mp)*D2R);

	lon=norm_deg(Lp+sl/1.0e6);
	lat=sb/1.0e6;
}

double MeanOrb::mean_node(double jd_tdb){
	double T=jcent(jd_tdb);
	return norm_deg(125.0445479-1934.1362891*T+0.0020754*T*T+
					T*T*T/467441.0-T*T*T*T/60616000.0);
}

double MeanOrb::node_rate(double jd_tdb){
	double T=jcent(jd_tdb);
	return (-1934.1362891+2.0*0.0020754*T+3.0*T*T/467441.0-
			4.0*T*T*T/60616000.0)/
		   JUL_CENT;
}

MeanPos mean_pos(Body b,double jd_tdb){
	MeanPos out;
	app_lonlat(b,jd_tdb,out.lon,out.lat);

	if(b==Body::RAHU||b==Body::KETU){
		out.speed=MeanOrb::node_rate(jd_tdb);
		return out;
	}

	// the Moon moves fast enough that a short step matters
	const double h=b==Body::MOON?0.05:0.5;
	double l0=0.0,l1=0.0,tmp=0.0;
	app_lonlat(b,jd_tdb-h,l0,tmp);
	app_lonlat(b,jd_tdb+h,l1,tmp);
	out.speed=diff_deg(l1,l0)/(2.0*h);
	return out;
}
