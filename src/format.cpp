#include "graha/format.hpp"

#include<cctype>
#include<cmath>
#include<cstdlib>
#include<ctime>
#include<filesystem>
#include<iomanip>
#include<mutex>
#include<sstream>
#include<stdexcept>

#include "graha/math.hpp"

namespace{

const char*const ZONE_DIR="/usr/share/zoneinfo";

std::mutex&tz_mutex(){
	static std::mutex mtx;
	return mtx;
}

bool is_digit(char c){ return std::isdigit(static_cast<unsigned char>(c))!=0; }

int parse_fix(const std::string&s,std::size_t pos,std::size_t count,
			  const std::string&label){
	if(pos+count>s.size()){
		throw std::invalid_argument("invalid datetime: missing "+label);
	}
	int value=0;
	for(std::size_t i=0;i<count;++i){
		char c=s[pos+i];
		if(!is_digit(c)){
			throw std::invalid_argument("invalid datetime: bad "+label);
		}
		value=value*10+static_cast<int>(c-'0');
	}
	return value;
}

void chk_zone(const std::string&tz){
	if(tz.empty()||tz[0]=='/'||tz.find("..")!=std::string::npos){
		throw std::invalid_argument("invalid timezone: "+tz);
	}
	std::error_code ec;
	std::filesystem::path p=std::filesystem::path(ZONE_DIR)/tz;
	if(!std::filesystem::is_regular_file(p,ec)){
		throw std::invalid_argument("unknown timezone: "+tz);
	}
}

// Runs fn with TZ switched to the zone; the C time zone state is process
// global, so callers are serialized and the previous value restored.
template<class Fn> auto with_zone(const std::string&tz,Fn fn){
	chk_zone(tz);
	std::lock_guard<std::mutex> lock(tz_mutex());
	const char*old=std::getenv("TZ");
	std::string saved=old?old:"";
	bool had=old!=nullptr;
	setenv("TZ",tz.c_str(),1);
	tzset();
	auto restore=[&](){
		if(had){
			setenv("TZ",saved.c_str(),1);
		}else{
			unsetenv("TZ");
		}
		tzset();
	};
	try{
		auto r=fn();
		restore();
		return r;
	}catch(...){
		restore();
		throw;
	}
}

constexpr double UNIX_JD=2440587.5;

}

bool is_fixed_tz(const std::string&tz){
	if(tz=="Z"||tz=="z"||tz=="UTC"){
		return true;
	}
	return tz.size()==6&&(tz[0]=='+'||tz[0]=='-')&&tz[3]==':';
}

int parse_tz(const std::string&tz){
	if(tz=="Z"||tz=="z"||tz=="UTC"){
		return 0;
	}
	if(!is_fixed_tz(tz)){
		throw std::invalid_argument(
			"invalid timezone suffix, expected Z or +HH:MM/-HH:MM");
	}
	int hh=parse_fix(tz,1,2,"timezone hour");
	int mm=parse_fix(tz,4,2,"timezone minute");
	if(hh>23||mm>59){
		throw std::invalid_argument("timezone suffix out of range");
	}
	int total=hh*60+mm;
	if(tz[0]=='-'){
		total=-total;
	}
	return total;
}

std::string fmt_tz(int off_min){
	if(off_min==0){
		return "Z";
	}
	int mins=off_min;
	char sign='+';
	if(mins<0){
		sign='-';
		mins=-mins;
	}
	std::ostringstream oss;
	oss<<sign<<std::setfill('0')<<std::setw(2)<<mins/60<<":"<<std::setw(2)
	   <<mins%60;
	return oss.str();
}

int zone_off(const std::string&tz,double jd_utc){
	if(is_fixed_tz(tz)){
		return parse_tz(tz);
	}
	return with_zone(tz,[&](){
		std::time_t t=
			static_cast<std::time_t>(std::floor((jd_utc-UNIX_JD)*SEC_DAY));
		std::tm loc{};
		if(localtime_r(&t,&loc)==nullptr){
			throw std::out_of_range("instant outside the zone database range");
		}
		return static_cast<int>(loc.tm_gmtoff/60);
	});
}

double loc2utc(int year,int month,int day,int hour,int minute,double second,
			   const std::string&tz){
	if(!valid_date(year,month,day)){
		throw std::invalid_argument("invalid date value");
	}
	if(hour<0||hour>23||minute<0||minute>59||second<0.0||second>=60.0){
		throw std::invalid_argument("invalid time value");
	}
	double jd_local=greg2jd(year,month,day,hour,minute,second);
	if(is_fixed_tz(tz)){
		return jd_local-static_cast<double>(parse_tz(tz))/1440.0;
	}
	double whole=std::floor(second);
	double off_min=with_zone(tz,[&](){
		std::tm tmv{};
		tmv.tm_year=year-1900;
		tmv.tm_mon=month-1;
		tmv.tm_mday=day;
		tmv.tm_hour=hour;
		tmv.tm_min=minute;
		tmv.tm_sec=static_cast<int>(whole);
		tmv.tm_isdst=-1;
		std::time_t t=std::mktime(&tmv);
		if(t==static_cast<std::time_t>(-1)){
			throw std::invalid_argument("local time cannot be resolved in "+
										tz);
		}
		return static_cast<double>(tmv.tm_gmtoff)/60.0;
	});
	return jd_local-off_min/1440.0;
}

IsoTime parse_iso(const std::string&text,const std::string&default_tz){
	if(text.empty()){
		throw std::invalid_argument("datetime text is empty");
	}

	IsoTime out;
	int year=parse_fix(text,0,4,"year");
	if(text.size()<10||text[4]!='-'||text[7]!='-'){
		throw std::invalid_argument("invalid datetime, expected YYYY-MM-DD");
	}
	int month=parse_fix(text,5,2,"month");
	int day=parse_fix(text,8,2,"day");
	if(!valid_date(year,month,day)){
		throw std::invalid_argument("invalid date value: "+text.substr(0,10));
	}

	int hour=0;
	int minute=0;
	double second=0.0;

	std::size_t pos=10;
	std::string zone=default_tz;
	if(pos<text.size()&&(text[pos]=='T'||text[pos]=='t'||text[pos]==' ')){
		++pos;
		out.has_time=true;
		hour=parse_fix(text,pos,2,"hour");
		pos+=2;
		if(pos>=text.size()||text[pos]!=':'){
			throw std::invalid_argument(
				"invalid datetime, expected ':' after hour");
		}
		++pos;
		minute=parse_fix(text,pos,2,"minute");
		pos+=2;

		int sec_int=0;
		int frac_d=0;
		int frac_value=0;
		if(pos<text.size()&&text[pos]==':'){
			++pos;
			sec_int=parse_fix(text,pos,2,"second");
			pos+=2;
			if(pos<text.size()&&text[pos]=='.'){
				++pos;
				std::size_t frac_start=pos;
				while(pos<text.size()&&is_digit(text[pos])){
					if(frac_d<9){
						frac_value=frac_value*10+static_cast<int>(text[pos]-'0');
						++frac_d;
					}
					++pos;
				}
				if(pos==frac_start){
					throw std::invalid_argument(
						"invalid datetime, expected digits after decimal point");
				}
			}
		}

		if(hour>23||minute>59||sec_int>59){
			throw std::invalid_argument("invalid time value");
		}
		second=static_cast<double>(sec_int);
		if(frac_d>0){
			second+=static_cast<double>(frac_value)/std::pow(10.0,frac_d);
		}
	}
	if(pos<text.size()){
		zone=text.substr(pos);
		parse_tz(zone);
		out.has_tz=true;
	}

	out.tz=zone;
	out.jd_utc=loc2utc(year,month,day,hour,minute,second,zone);
	out.tz_off=zone_off(zone,out.jd_utc);
	return out;
}

std::string fmt_iso(double jd_utc,int off_min,bool with_ms){
	const double off_days=static_cast<double>(off_min)/1440.0;
	double jd_disp=jd_utc+off_days;
	const double round_days=with_ms?(0.5/(1000.0*SEC_DAY)):(0.5/SEC_DAY);
	jd_disp+=round_days;

	int year=0;
	int month=0;
	int day=0;
	int hour=0;
	int minute=0;
	double second=0.0;
	jd2greg(jd_disp,year,month,day,hour,minute,second);

	int second_i=static_cast<int>(std::floor(second+1e-12));
	if(second_i<0){
		second_i=0;
	}
	if(second_i>59){
		second_i=59;
	}

	std::ostringstream oss;
	oss<<std::setfill('0')<<std::setw(4)<<year<<"-"<<std::setw(2)<<month<<"-"
	   <<std::setw(2)<<day<<"T"<<std::setw(2)<<hour<<":"<<std::setw(2)<<minute
	   <<":"<<std::setw(2)<<second_i;

	if(with_ms){
		int ms=static_cast<int>(std::floor((second-second_i)*1000.0+1e-9));
		if(ms<0){
			ms=0;
		}
		if(ms>999){
			ms=999;
		}
		oss<<"."<<std::setw(3)<<ms;
	}

	oss<<fmt_tz(off_min);
	return oss.str();
}

std::string fmt_date(double jd_utc,int off_min){
	return fmt_iso(jd_utc,off_min,false).substr(0,10);
}
