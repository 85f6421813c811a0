#include "graha/time_scale.hpp"

#include<cmath>
#include<cstddef>

#ifdef USE_ERFA
extern "C"{
#include "erfa.h"
}
#endif

namespace{

constexpr double TT_TAI=32.184;
// last year covered by the leap second table below
constexpr double LEAP_END=2026.0;

// Morrison-Stephenson long-term parabola, seconds.
double ms_parab(double year){
	double t=(year-1820.0)/100.0;
	return -20.0+32.0*t*t;
}

struct DtNode{
	double year;
	double dt;
};

const DtNode DT_TAB[]={
	{1620.0,124.0},{1650.0,50.0},{1700.0,9.0},{1750.0,13.0},
	{1800.0,13.7},{1850.0,7.1},{1870.0,1.6},{1880.0,-5.4},
	{1890.0,-5.9},{1900.0,-2.8},{1910.0,10.4},{1920.0,21.2},
	{1930.0,24.0},{1940.0,24.3},{1950.0,29.1},{1960.0,33.2},
	{1970.0,40.2},{1980.0,50.5},{1990.0,56.9},{2000.0,63.8},
	{2010.0,66.1},{2020.0,69.4},{2026.0,69.2},
};

}

double TimeScale::dec_year(double jd){ return 2000.0+(jd-2451544.5)/365.2425; }

double TimeScale::delta_t(double year){
	const std::size_t n=sizeof(DT_TAB)/sizeof(DT_TAB[0]);
	if(year<DT_TAB[0].year){
		return ms_parab(year);
	}
	if(year>DT_TAB[n-1].year){
		// blend into the parabola over the next century and a quarter
		const double y1=2150.0;
		if(year>=y1){
			return ms_parab(year);
		}
		double f=(year-DT_TAB[n-1].year)/(y1-DT_TAB[n-1].year);
		return DT_TAB[n-1].dt+f*(ms_parab(y1)-DT_TAB[n-1].dt);
	}
	for(std::size_t i=1;i<n;++i){
		if(year<=DT_TAB[i].year){
			const DtNode&a=DT_TAB[i-1];
			const DtNode&b=DT_TAB[i];
			double f=(year-a.year)/(b.year-a.year);
			return a.dt+f*(b.dt-a.dt);
		}
	}
	return DT_TAB[n-1].dt;
}

int TimeScale::leap_sec(double jd_utc){
	struct Entry{
		double jd;
		int leaps;
	};
	static const Entry table[]={
		{2441317.5,10},{2441499.5,11},{2441683.5,12},{2442048.5,13},
		{2442413.5,14},{2442778.5,15},{2443144.5,16},{2443509.5,17},
		{2443874.5,18},{2444239.5,19},{2444786.5,20},{2445151.5,21},
		{2445516.5,22},{2446247.5,23},{2447161.5,24},{2447892.5,25},
		{2448257.5,26},{2448804.5,27},{2449169.5,28},{2449534.5,29},
		{2450083.5,30},{2450630.5,31},{2451179.5,32},{2453736.5,33},
		{2454832.5,34},{2456109.5,35},{2457204.5,36},{2457754.5,37},
	};
	int leaps=0;
	for(const auto&e : table){
		if(jd_utc>=e.jd){
			leaps=e.leaps;
		}else{
			break;
		}
	}
	return leaps;
}

double TimeScale::utc_to_tt(double jd_utc){
	double year=dec_year(jd_utc);
	if(year<1972.0||year>LEAP_END){
		return jd_utc+delta_t(year)/SEC_DAY;
	}
	int leaps=leap_sec(jd_utc);
	return jd_utc+(static_cast<double>(leaps)+TT_TAI)/SEC_DAY;
}

// TDB-TT stays below 2 ms, under the resolution of the position cache.
double TimeScale::utc_to_tdb(double jd_utc){ return utc_to_tt(jd_utc); }

double TimeScale::gmst(double jd_utc){
	double jd_tt=utc_to_tt(jd_utc);
#ifdef USE_ERFA
	double ut1=std::floor(jd_utc);
	double tt1=std::floor(jd_tt);
	return eraGmst06(ut1,jd_utc-ut1,tt1,jd_tt-tt1);
#else
	double T=jcent(jd_tt);
	double du=jd_utc-J2000;
	// IAU 2006 GMST as ERA plus the polynomial part
	double era=TWO_PI*(0.7790572732640+1.00273781191135448*du);
	double poly=(0.014506+4612.156534*T+1.3915817*T*T-0.00000044*T*T*T-
				 0.000029956*T*T*T*T)*
				AS2R;
	double g=std::fmod(era+poly,TWO_PI);
	if(g<0.0){
		g+=TWO_PI;
	}
	return g;
#endif
}
