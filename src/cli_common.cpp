#include "graha/cli_common.hpp"

#include<cctype>
#include<cmath>
#include<iomanip>
#include<iostream>
#include<sstream>
#include<stdexcept>

#include "graha/bodies.hpp"
#include "graha/format.hpp"
#include "graha/math.hpp"

namespace cli_util{

bool is_opt(const std::string&s){
	// negative numbers are values, not options
	return s.size()>1&&s[0]=='-'&&
		   !(std::isdigit(static_cast<unsigned char>(s[1]))||s[1]=='.');
}

std::string to_low(std::string s){
	for(char&c : s){
		c=static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}
	return s;
}

int parse_int(const std::string&text,const std::string&label){
	std::size_t pos=0;
	int v=0;
	try{
		v=std::stoi(text,&pos);
	}catch(const std::exception&){
		throw std::invalid_argument("invalid "+label+": "+text);
	}
	if(pos!=text.size()){
		throw std::invalid_argument("invalid "+label+": "+text);
	}
	return v;
}

double parse_num(const std::string&text,const std::string&label){
	std::size_t pos=0;
	double v=0.0;
	try{
		v=std::stod(text,&pos);
	}catch(const std::exception&){
		throw std::invalid_argument("invalid "+label+": "+text);
	}
	if(pos!=text.size()||!std::isfinite(v)){
		throw std::invalid_argument("invalid "+label+": "+text);
	}
	return v;
}

bool parse_bool01(const std::string&text,const std::string&label){
	if(text=="0"){
		return false;
	}
	if(text=="1"){
		return true;
	}
	throw std::invalid_argument(label+" must be 0 or 1");
}

std::string req_val(const std::vector<std::string>&args,std::size_t&idx,
					const std::string&opt){
	if(idx+1>=args.size()){
		throw std::invalid_argument("missing value for option: "+opt);
	}
	++idx;
	return args[idx];
}

OutTgt open_out(const std::string&path){
	OutTgt out;
	if(path.empty()){
		out.stream=&std::cout;
		return out;
	}
	out.file.open(path,std::ios::binary);
	if(!out.file){
		throw std::runtime_error("failed to open output file: "+path);
	}
	return out;
}

void note_out(const std::string&path,bool quiet){
	if(!path.empty()&&!quiet){
		std::cerr<<"written: "<<path<<std::endl;
	}
}

void chk_fmt(const std::string&format,const std::set<std::string>&allowed,
			 const std::string&ctx){
	if(allowed.find(format)==allowed.end()){
		throw std::invalid_argument("invalid --format for "+ctx+": "+format);
	}
}

std::string fmt_lon(double lon){
	double l=norm_deg(lon);
	int sign=sign_of(l);
	double in=l-sign*30.0;
	long total=std::lround(in*3600.0);
	if(total>=30L*3600L){
		total=30L*3600L-1;
	}
	std::ostringstream oss;
	oss<<sign_name(sign)<<' '<<std::setfill('0')<<std::setw(2)<<total/3600
	   <<'d'<<std::setw(2)<<(total/60)%60<<'\''<<std::setw(2)<<total%60<<'"';
	return oss.str();
}

std::string fmt_num(double v,int digits){
	if(!std::isfinite(v)){
		return "nan";
	}
	std::ostringstream oss;
	oss<<std::fixed<<std::setprecision(digits)<<v;
	return oss.str();
}

std::string fmt_at(double jd_utc,const std::string&tz){
	return fmt_iso(jd_utc,zone_off(tz,jd_utc),false);
}

} // namespace cli_util
