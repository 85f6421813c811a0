#include "graha/ayanamsha.hpp"

#include "graha/math.hpp"

// The model runs on the UTC Julian day: using TT instead moves the result by
// under 1e-6 arcsec but would inherit the steps of the Delta-T table.
double Ayanamsha::gen_prec(double jd){
	double T=jcent(jd);
	return (5028.796195*T+1.1054348*T*T)/3600.0;
}

double Ayanamsha::value(double jd_utc){
	return AYAN_REF_DEG+gen_prec(jd_utc)-gen_prec(AYAN_REF_JD);
}

double Ayanamsha::rate(double jd_utc){
	double T=jcent(jd_utc);
	return (5028.796195+2.0*1.1054348*T)/3600.0/100.0;
}

double Ayanamsha::to_sidereal(double trop_lon,double jd_utc){
	return norm_deg(trop_lon-value(jd_utc));
}

double Ayanamsha::to_tropical(double sid_lon,double jd_utc){
	return norm_deg(sid_lon+value(jd_utc));
}
