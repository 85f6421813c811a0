#pragma once

#include<cstddef>
#include<string>
#include<utility>
#include<vector>

#include "graha/aspects.hpp"
#include "graha/strength.hpp"

struct GrahaCfg{
	// SPK kernel; empty selects the approximate model
	std::string ephem;
	std::size_t cache_size=256;
	double cache_res_sec=1.0;
	std::string default_tz="Z";
	std::string def_fmt="txt";
	bool def_pretty=true;
	OrbTbl orbs;
	StrengthTbl strength;
	PulseCfg pulse;
};

extern const std::string CFG_FILE;

// $GRAHA_CFG when set, CFG_FILE otherwise.
std::string cfg_path();

std::string trim(const std::string&s);

// Applies one key. Throws std::invalid_argument for unknown keys or values.
void set_key(GrahaCfg&cfg,const std::string&key,const std::string&value);

// Cross-key checks (weights summing to 1, orb ranges).
void chk_cfg(const GrahaCfg&cfg);

// false when the file does not exist; malformed lines throw
// std::invalid_argument naming the line.
bool load_cfg(GrahaCfg&cfg,const std::string&path);

bool save_cfg(const GrahaCfg&cfg,const std::string&path);

// Every key with its effective value, in file order.
std::vector<std::pair<std::string,std::string>> cfg_items(const GrahaCfg&cfg);
