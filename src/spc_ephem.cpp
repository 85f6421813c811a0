#include "graha/spc_ephem.hpp"

#include<filesystem>
#include<stdexcept>

extern "C"{
#include "SpiceUsr.h"
}

namespace fs=std::filesystem;

std::mutex&spice_mutex(){
	static std::mutex mtx;
	return mtx;
}

EphRead::EphRead(const std::string&path){
	filepath=path;
	if(filepath.empty()){
		throw std::runtime_error("ephemeris path is empty");
	}
	SSB=0;
	SUN=10;
	EMB=3;
	EARTH=399;
	MOON=301;

	id_name[SSB]="SOLAR SYSTEM BARYCENTER";
	id_name[1]="MERCURY BARYCENTER";
	id_name[2]="VENUS BARYCENTER";
	id_name[EMB]="EARTH BARYCENTER";
	id_name[4]="MARS BARYCENTER";
	id_name[5]="JUPITER BARYCENTER";
	id_name[6]="SATURN BARYCENTER";
	id_name[7]="URANUS BARYCENTER";
	id_name[8]="NEPTUNE BARYCENTER";
	id_name[9]="PLUTO BARYCENTER";
	id_name[SUN]="SUN";
	id_name[EARTH]="EARTH";
	id_name[MOON]="MOON";

	cfg_spice();
	load_kern();
	try{
		load_cov();
	}catch(...){
		std::lock_guard<std::mutex> lock(spice_mutex());
		unload_c(filepath.c_str());
		reset_c();
		throw;
	}
}

EphRead::~EphRead(){
	std::lock_guard<std::mutex> lock(spice_mutex());
	unload_c(filepath.c_str());
	if(failed_c()){
		reset_c();
	}
}

void EphRead::load_kern(){
	if(!fs::exists(filepath)){
		throw std::runtime_error("ephemeris file not found: "+filepath);
	}

	std::error_code ec;
	auto fsize=fs::file_size(filepath,ec);
	if(ec||fsize==0){
		throw std::runtime_error("ephemeris file is not readable or empty: "+
								 filepath);
	}

	std::lock_guard<std::mutex> lock(spice_mutex());
	furnsh_c(filepath.c_str());
	chk_spice("Failed to load ephemeris kernel");

	SpiceInt count=0;
	ktotal_c("SPK",&count);
	chk_spice("Failed to query loaded SPK kernels");
	if(count==0){
		throw std::runtime_error(
			"No SPK kernels are loaded; expected ephemeris "+filepath);
	}
}

void EphRead::load_cov(){
	std::lock_guard<std::mutex> lock(spice_mutex());
	SPICEDOUBLE_CELL(win,2000);
	scard_c(0,&win);
	spkcov_c(filepath.c_str(),EARTH,&win);
	chk_spice("Failed to read kernel coverage of "+filepath);

	SpiceInt n=wncard_c(&win);
	for(SpiceInt i=0;i<n;++i){
		SpiceDouble b=0.0;
		SpiceDouble e=0.0;
		wnfetd_c(&win,i,&b,&e);
		cover.emplace_back(b,e);
	}
	chk_spice("Failed to read kernel coverage of "+filepath);
	if(cover.empty()){
		throw std::runtime_error("kernel has no Earth segment: "+filepath);
	}
}

std::string EphRead::to_name(int code) const{
	auto it=id_name.find(code);
	if(it==id_name.end()){
		throw std::runtime_error("Unknown target/observer code");
	}
	return it->second;
}

double EphRead::et_fromjd(double jd_tdb){ return (jd_tdb-J2000)*SEC_DAY; }

bool EphRead::covers(double jd_tdb) const{
	// light time to Pluto is under a day
	const double margin=SEC_DAY;
	double et=et_fromjd(jd_tdb);
	for(const auto&w : cover){
		if(et>=w.first+margin&&et<=w.second-margin){
			return true;
		}
	}
	return false;
}

std::pair<Vec3,Vec3> EphRead::get_state(int target,int observer,double jd_tdb){
	double et=et_fromjd(jd_tdb);
	SpiceDouble state[6];
	SpiceDouble lt;
	{
		std::lock_guard<std::mutex> lock(spice_mutex());
		spkez_c(target,et,"J2000","NONE",observer,state,&lt);
		chk_spice("spkez_c failed for target "+to_name(target)+" observer "+
				  to_name(observer));
	}
	Vec3 pos(state[0]/AU_KM,state[1]/AU_KM,state[2]/AU_KM);
	Vec3 vel(state[3]*(SEC_DAY/AU_KM),state[4]*(SEC_DAY/AU_KM),
			 state[5]*(SEC_DAY/AU_KM));
	return {pos,vel};
}

Vec3 EphRead::get_pos(int target,int observer,double jd_tdb){
	return get_state(target,observer,jd_tdb).first;
}

Vec3 EphRead::get_vel(int target,int observer,double jd_tdb){
	return get_state(target,observer,jd_tdb).second;
}

// Callers hold spice_mutex().
void chk_spice(const std::string&context){
	if(!failed_c()){
		return;
	}

	SpiceChar msg[1841];
	getmsg_c("LONG",sizeof(msg),msg);
	reset_c();
	throw std::runtime_error(context+": "+std::string(msg));
}

void cfg_spice(){
	static std::once_flag flag;
	std::call_once(flag,[](){
		std::lock_guard<std::mutex> lock(spice_mutex());
		SpiceChar action[]="RETURN";
		SpiceChar detail[]="SHORT,EXPLAIN";
		erract_c("SET",0,action);
		errprt_c("SET",0,detail);
	});
}
