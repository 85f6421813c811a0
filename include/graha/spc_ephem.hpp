#pragma once

#include<map>
#include<mutex>
#include<string>
#include<utility>
#include<vector>

#include "graha/math.hpp"

void cfg_spice();
void chk_spice(const std::string&context);

// The CSPICE kernel pool and error state are process global.
std::mutex&spice_mutex();

// One loaded SPK kernel; unloaded again when the reader goes away.
struct EphRead{
	std::string filepath;
	int SSB;
	int SUN;
	int EMB;
	int EARTH;
	int MOON;
	std::map<int,std::string> id_name;
	// coverage of the Earth segment, TDB seconds past J2000
	std::vector<std::pair<double,double>> cover;

	explicit EphRead(const std::string&path);
	~EphRead();

	EphRead(const EphRead&)=delete;
	EphRead&operator=(const EphRead&)=delete;

	std::string to_name(int code) const;

	static double et_fromjd(double jd_tdb);

	bool covers(double jd_tdb) const;

	// position and velocity in AU and AU/day, J2000 axes
	std::pair<Vec3,Vec3> get_state(int target,int observer,double jd_tdb);

	Vec3 get_pos(int target,int observer,double jd_tdb);

	Vec3 get_vel(int target,int observer,double jd_tdb);

  private:
	void load_kern();
	void load_cov();
};
