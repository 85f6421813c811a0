#include "graha/config.hpp"

#include<cctype>
#include<cmath>
#include<cstdlib>
#include<fstream>
#include<iomanip>
#include<sstream>
#include<stdexcept>

#include "graha/format.hpp"
#include "graha/math.hpp"

const std::string CFG_FILE="graha.cfg";

namespace{

double parse_num(const std::string&text,const std::string&key){
	std::size_t pos=0;
	double v=0.0;
	try{
		v=std::stod(text,&pos);
	}catch(const std::exception&){
		throw std::invalid_argument("invalid number for "+key+": "+text);
	}
	if(pos!=text.size()||!std::isfinite(v)){
		throw std::invalid_argument("invalid number for "+key+": "+text);
	}
	return v;
}

bool parse_flag(const std::string&text,const std::string&key){
	if(text=="1"||text=="true"||text=="yes"){
		return true;
	}
	if(text=="0"||text=="false"||text=="no"){
		return false;
	}
	throw std::invalid_argument(key+" must be 0 or 1");
}

std::string num_str(double v){
	std::ostringstream oss;
	oss<<std::setprecision(12)<<v;
	return oss.str();
}

// orb.<aspect>.fast / orb.<aspect>.slow
bool set_orb(GrahaCfg&cfg,const std::string&key,const std::string&value){
	if(key.compare(0,4,"orb.")!=0){
		return false;
	}
	std::size_t dot=key.rfind('.');
	if(dot<=4){
		return false;
	}
	AspectType t=parse_aspect(key.substr(4,dot-4));
	std::string col=key.substr(dot+1);
	double v=parse_num(value,key);
	if(col=="fast"){
		cfg.orbs.fast[static_cast<std::size_t>(t)]=v;
	}else if(col=="slow"){
		cfg.orbs.slow[static_cast<std::size_t>(t)]=v;
	}else{
		return false;
	}
	return true;
}

}

std::string cfg_path(){
	const char*env=std::getenv("GRAHA_CFG");
	if(env!=nullptr&&*env!='\0'){
		return env;
	}
	return CFG_FILE;
}

std::string trim(const std::string&s){
	std::size_t start=0;
	while(start<s.size()&&std::isspace(static_cast<unsigned char>(s[start]))){
		++start;
	}
	std::size_t end=s.size();
	while(end>start&&std::isspace(static_cast<unsigned char>(s[end-1]))){
		--end;
	}
	return s.substr(start,end-start);
}

void set_key(GrahaCfg&cfg,const std::string&key,const std::string&value){
	if(key=="ephem"){
		cfg.ephem=value;
	}else if(key=="cache_size"){
		double v=parse_num(value,key);
		if(v<0.0||v!=std::floor(v)){
			throw std::invalid_argument("cache_size must be a whole number");
		}
		cfg.cache_size=static_cast<std::size_t>(v);
	}else if(key=="cache_res_sec"){
		double v=parse_num(value,key);
		if(v<=0.0){
			throw std::invalid_argument("cache_res_sec must be positive");
		}
		cfg.cache_res_sec=v;
	}else if(key=="default_tz"){
		if(is_fixed_tz(value)){
			parse_tz(value);
		}else{
			zone_off(value,J2000);
		}
		cfg.default_tz=value;
	}else if(key=="def_fmt"){
		if(value!="txt"&&value!="json"){
			throw std::invalid_argument("def_fmt must be txt or json");
		}
		cfg.def_fmt=value;
	}else if(key=="def_pretty"){
		cfg.def_pretty=parse_flag(value,key);
	}else if(key=="w.pos"){
		cfg.strength.w_pos=parse_num(value,key);
	}else if(key=="w.dir"){
		cfg.strength.w_dir=parse_num(value,key);
	}else if(key=="w.temp"){
		cfg.strength.w_temp=parse_num(value,key);
	}else if(key=="retro_mult"){
		cfg.strength.retro_mult=parse_num(value,key);
	}else if(key=="pulse.flow_ratio"){
		double v=parse_num(value,key);
		if(v<1.0){
			throw std::invalid_argument("pulse.flow_ratio must be >= 1");
		}
		cfg.pulse.flow_ratio=v;
	}else if(!set_orb(cfg,key,value)){
		throw std::invalid_argument("unknown config key: "+key);
	}
}

void chk_cfg(const GrahaCfg&cfg){
	cfg.strength.validate();
	cfg.orbs.validate();
}

bool load_cfg(GrahaCfg&cfg,const std::string&path){
	std::ifstream ifs(path);
	if(!ifs){
		return false;
	}
	std::string line;
	int line_no=0;
	while(std::getline(ifs,line)){
		++line_no;
		std::string body=trim(line);
		if(body.empty()||body[0]=='#'){
			continue;
		}
		auto pos=body.find('=');
		if(pos==std::string::npos){
			throw std::invalid_argument(path+":"+std::to_string(line_no)+
										": expected key=value");
		}
		try{
			set_key(cfg,trim(body.substr(0,pos)),trim(body.substr(pos+1)));
		}catch(const std::invalid_argument&ex){
			throw std::invalid_argument(path+":"+std::to_string(line_no)+": "+
										ex.what());
		}
	}
	chk_cfg(cfg);
	return true;
}

bool save_cfg(const GrahaCfg&cfg,const std::string&path){
	std::ofstream ofs(path);
	if(!ofs){
		return false;
	}
	ofs<<"# graha configuration\n";
	for(const auto&kv : cfg_items(cfg)){
		ofs<<kv.first<<"="<<kv.second<<"\n";
	}
	return static_cast<bool>(ofs);
}

std::vector<std::pair<std::string,std::string>> cfg_items(const GrahaCfg&cfg){
	std::vector<std::pair<std::string,std::string>> out;
	out.emplace_back("ephem",cfg.ephem);
	out.emplace_back("cache_size",std::to_string(cfg.cache_size));
	out.emplace_back("cache_res_sec",num_str(cfg.cache_res_sec));
	out.emplace_back("default_tz",cfg.default_tz);
	out.emplace_back("def_fmt",cfg.def_fmt);
	out.emplace_back("def_pretty",cfg.def_pretty?"1":"0");
	for(AspectType t : ALL_ASPECTS){
		std::size_t i=static_cast<std::size_t>(t);
		out.emplace_back("orb."+asp_name(t)+".fast",num_str(cfg.orbs.fast[i]));
		out.emplace_back("orb."+asp_name(t)+".slow",num_str(cfg.orbs.slow[i]));
	}
	out.emplace_back("w.pos",num_str(cfg.strength.w_pos));
	out.emplace_back("w.dir",num_str(cfg.strength.w_dir));
	out.emplace_back("w.temp",num_str(cfg.strength.w_temp));
	out.emplace_back("retro_mult",num_str(cfg.strength.retro_mult));
	out.emplace_back("pulse.flow_ratio",num_str(cfg.pulse.flow_ratio));
	return out;
}
