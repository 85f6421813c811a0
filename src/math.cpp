#include "graha/math.hpp"

#include<cmath>

double norm_deg(double deg){
	double r=std::fmod(deg,360.0);
	if(r<0.0){
		r+=360.0;
	}
	if(r>=360.0){
		r-=360.0;
	}
	return r;
}

double diff_deg(double a,double b){
	double d=norm_deg(a-b);
	if(d>180.0){
		d-=360.0;
	}
	return d;
}

double sep_deg(double a,double b){ return std::fabs(diff_deg(a,b)); }

double greg2jd(int year,int month,int day,int hour,int minute,double second){
	int Y=year;
	int M=month;
	if(M<=2){
		Y-=1;
		M+=12;
	}
	// floor division keeps years before 0 on the proleptic Gregorian grid
	int A=static_cast<int>(std::floor(Y/100.0));
	int B=2-A+static_cast<int>(std::floor(A/4.0));

	double day_frac=(hour+(minute+second/60.0)/60.0)/24.0;

	double JD=std::floor(365.25*(Y+4716))+std::floor(30.6001*(M+1))+day+B-
			  1524.5+day_frac;
	return JD;
}

void jd2greg(double jd,int&year,int&month,int&day,int&hour,int&minute,
			 double&second){
	double Z_d=std::floor(jd+0.5);
	double F=(jd+0.5)-Z_d;
	long Z=static_cast<long>(Z_d);
	long alpha=static_cast<long>(std::floor((Z-1867216.25)/36524.25));
	long A=Z+1+alpha-static_cast<long>(std::floor(alpha/4.0));
	long B=A+1524;
	long C=static_cast<long>(std::floor((B-122.1)/365.25));
	long D=static_cast<long>(std::floor(365.25*C));
	long E=static_cast<long>(std::floor((B-D)/30.6001));

	double day_d=B-D-std::floor(30.6001*E)+F;
	day=static_cast<int>(std::floor(day_d));
	double frac_day=day_d-day;

	if(E<14){
		month=static_cast<int>(E-1);
	}else{
		month=static_cast<int>(E-13);
	}

	if(month>2){
		year=static_cast<int>(C-4716);
	}else{
		year=static_cast<int>(C-4715);
	}

	double tot_secs=frac_day*SEC_DAY;
	if(tot_secs<0){
		tot_secs=0;
	}
	hour=static_cast<int>(tot_secs/3600.0);
	tot_secs-=hour*3600.0;
	minute=static_cast<int>(tot_secs/60.0);
	second=tot_secs-minute*60.0;

	if(second>=59.9995){
		second=0.0;
		minute+=1;
		if(minute>=60){
			minute=0;
			hour+=1;
			if(hour>=24){
				hour=0;
				jd2greg(jd+1.0,year,month,day,hour,minute,second);
			}
		}
	}
}

bool valid_date(int year,int month,int day){
	if(month<1||month>12||day<1){
		return false;
	}
	static const int mdays[]={31,28,31,30,31,30,31,31,30,31,30,31};
	int lim=mdays[month-1];
	bool leap=(year%4==0&&year%100!=0)||year%400==0;
	if(month==2&&leap){
		lim=29;
	}
	return day<=lim;
}
