#include "graha/frames.hpp"

#include<cmath>

#ifdef USE_ERFA
extern "C"{
#include "erfa.h"
}
#endif

const PrecModel PREC_MODEL=PrecModel::AUTO;
// years from J2000 beyond which the long-term model takes over
const double LONG_THR=10.0;

Mat3 CoordTf::R1(double angle){
	double c=std::cos(angle);
	double s=std::sin(angle);
	Mat3 R;
	R.m[0][0]=1.0;
	R.m[1][1]=c;
	R.m[1][2]=s;
	R.m[2][1]=-s;
	R.m[2][2]=c;
	return R;
}

Mat3 CoordTf::R3(double angle){
	double c=std::cos(angle);
	double s=std::sin(angle);
	Mat3 R;
	R.m[0][0]=c;
	R.m[0][1]=s;
	R.m[1][0]=-s;
	R.m[1][1]=c;
	R.m[2][2]=1.0;
	return R;
}

Mat3 CoordTf::bias_mat(){
	Mat3 B;
	B.m[0][0]=0.9999999999999942;
	B.m[0][1]=-7.078279744199198e-8;
	B.m[0][2]=8.056148940257979e-8;

	B.m[1][0]=7.078279477857338e-8;
	B.m[1][1]=0.9999999999999969;
	B.m[1][2]=3.306041454222136e-8;

	B.m[2][0]=-8.056149173973727e-8;
	B.m[2][1]=-3.306040883980552e-8;
	B.m[2][2]=0.9999999999999962;
	return B;
}

Mat3 PrecNut::prec_mat(double jd_tdb){
#ifdef USE_ERFA
	double epj=2000.0+(jd_tdb-J2000)/JUL_YEAR;
	if(PREC_MODEL==PrecModel::VONDRAK||
	   (PREC_MODEL==PrecModel::AUTO&&std::fabs(epj-2000.0)>=LONG_THR)){
		Mat3 R;
		eraLtp(epj,R.m);
		return R;
	}

	double d1=std::floor(jd_tdb);
	double d2=jd_tdb-d1;
	Mat3 R;
	eraPmat06(d1,d2,R.m);
	return R;
#else
	double T=jcent(jd_tdb);
	double psi_A=(5038.481507*T-1.0790069*T*T-0.00114045*T*T*T+
				  0.000132851*std::pow(T,4)-0.0000000951*std::pow(T,5))*
				 AS2R;
	double omega_A=(84381.406-0.025754*T+0.0512623*T*T-
					0.00772503*std::pow(T,3)-0.000000467*std::pow(T,4)+
					0.0000000337*std::pow(T,5))*
				   AS2R;
	double chi_A=(10.556403*T-2.3814292*T*T-0.00121197*T*T*T+
				  0.000170663*std::pow(T,4)-0.0000000560*std::pow(T,5))*
				 AS2R;
	double eps0=84381.406*AS2R;

	return CoordTf::R3(chi_A)*CoordTf::R1(-omega_A)*CoordTf::R3(-psi_A)*
		   CoordTf::R1(eps0);
#endif
}

double PrecNut::mean_obl(double jd_tdb){
#ifdef USE_ERFA
	double d1=std::floor(jd_tdb);
	double d2=jd_tdb-d1;
	return eraObl06(d1,d2);
#else
	double T=jcent(jd_tdb);
	return (84381.406-46.836769*T-0.0001831*T*T+0.00200340*std::pow(T,3)-
			0.000000576*std::pow(T,4)-0.0000000434*std::pow(T,5))*
		   AS2R;
#endif
}

double PrecNut::true_obl(double jd_tdb){
	return mean_obl(jd_tdb)+nut_ang(jd_tdb).second;
}

std::pair<double,double> PrecNut::nut_ang(double jd_tdb){
#ifdef USE_ERFA
	double d1=std::floor(jd_tdb);
	double d2=jd_tdb-d1;
	double dpsi=0.0;
	double deps=0.0;
	eraNut00a(d1,d2,&dpsi,&deps);
	return {dpsi,deps};
#else
	// four leading IAU 1980 terms, good to about 0.5"
	double T=jcent(jd_tdb);
	double Om=(125.04452-1934.136261*T+0.0020708*T*T+T*T*T/450000.0)*D2R;
	double Ls=(280.4665+36000.7698*T)*D2R;
	double Lm=(218.3165+481267.8813*T)*D2R;

	double dpsi=(-17.20*std::sin(Om)-1.32*std::sin(2.0*Ls)-
				 0.23*std::sin(2.0*Lm)+0.21*std::sin(2.0*Om))*
				AS2R;
	double deps=(9.20*std::cos(Om)+0.57*std::cos(2.0*Ls)+
				 0.10*std::cos(2.0*Lm)-0.09*std::cos(2.0*Om))*
				AS2R;
	return {dpsi,deps};
#endif
}

Mat3 PrecNut::nut_mat(double jd_tdb){
#ifdef USE_ERFA
	double d1=std::floor(jd_tdb);
	double d2=jd_tdb-d1;
	Mat3 N;
	eraNum06a(d1,d2,N.m);
	return N;
#else
	auto nd=nut_ang(jd_tdb);
	double epsA=mean_obl(jd_tdb);
	double eps=epsA+nd.second;
	return CoordTf::R1(-eps)*CoordTf::R3(-nd.first)*CoordTf::R1(epsA);
#endif
}

Mat3 PrecNut::ecl_mat(double jd_tdb){
	return CoordTf::R1(true_obl(jd_tdb))*nut_mat(jd_tdb)*prec_mat(jd_tdb)*
		   CoordTf::bias_mat();
}

EclSph to_sph(const Vec3&v){
	EclSph s;
	s.dist=v.norm();
	s.lon=std::atan2(v.y,v.x);
	if(s.lon<0.0){
		s.lon+=TWO_PI;
	}
	double rxy=std::sqrt(v.x*v.x+v.y*v.y);
	s.lat=std::atan2(v.z,rxy);
	return s;
}

double lon_rate(const Vec3&p,const Vec3&v){
	double denom=p.x*p.x+p.y*p.y;
	if(denom==0.0){
		return 0.0;
	}
	return (p.x*v.y-p.y*v.x)/denom;
}
