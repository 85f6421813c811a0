#pragma once

#include<iosfwd>
#include<memory>
#include<string>
#include<vector>

#include "graha/config.hpp"

class EphProvider;

// Options accepted before or after any command.
struct GlobalOpts{
	std::string ephem;
	bool has_ephem=false;
	bool quiet=false;
};

// Removes --ephem/--quiet from args and returns them.
GlobalOpts take_global(std::vector<std::string>&args);

// Configuration plus the lazily opened ephemeris of one CLI run.
class AppCtx{
  public:
	explicit AppCtx(const GlobalOpts&g);
	~AppCtx();

	GrahaCfg cfg;
	std::string cfg_file;
	bool quiet=false;

	std::ostream*log() const;

	EphProvider&prov();

	std::string ephem_label() const;

  private:
	std::unique_ptr<EphProvider> prov_;
};

struct PosArgs{
	std::string time_raw;
	std::string frame="tropical";
	bool has_loc=false;
	double lat=0.0;
	double lon=0.0;
	std::string tz;
	std::string format;
	std::string out;
	bool pretty=true;
	std::string input_file;
	int jobs=1;
};

void cli_pos(AppCtx&app,const PosArgs&args);

struct DashaArgs{
	std::string birth_raw;
	double lat=0.0;
	double lon=0.0;
	bool has_lat=false;
	bool has_lon=false;
	std::string tz;
	std::string until;
	int depth=2;
	std::string at;
	std::string format;
	std::string out;
	bool pretty=true;
};

void cli_dasha(AppCtx&app,const DashaArgs&args);

struct StrArgs{
	std::string birth_raw;
	double lat=0.0;
	double lon=0.0;
	bool has_lat=false;
	bool has_lon=false;
	std::string tz;
	std::string frame="sidereal";
	std::string format;
	std::string out;
	bool pretty=true;
};

void cli_str(AppCtx&app,const StrArgs&args);

struct AspArgs{
	std::vector<std::string> times;
	std::string frame="tropical";
	std::string tz;
	std::string format;
	std::string out;
	bool pretty=true;
};

void cli_asp(AppCtx&app,const AspArgs&args);

struct TransArgs{
	std::string birth_raw;
	std::string from;
	std::string to;
	double step=1.0;
	std::string frame="tropical";
	std::string tz;
	std::string format;
	std::string out;
	bool pretty=true;
};

void cli_trans(AppCtx&app,const TransArgs&args);

struct PulseArgs{
	std::string birth_raw;
	std::string from;
	int days=7;
	std::string frame="tropical";
	std::string tz;
	std::string format;
	std::string out;
	bool pretty=true;
};

void cli_pulse(AppCtx&app,const PulseArgs&args);

int cmd_pos(AppCtx&app,const std::vector<std::string>&args);
int cmd_nak(AppCtx&app,const std::vector<std::string>&args);
int cmd_dasha(AppCtx&app,const std::vector<std::string>&args);
int cmd_str(AppCtx&app,const std::vector<std::string>&args);
int cmd_asp(AppCtx&app,const std::vector<std::string>&args);
int cmd_trans(AppCtx&app,const std::vector<std::string>&args);
int cmd_pulse(AppCtx&app,const std::vector<std::string>&args);
int cmd_cfg(AppCtx&app,const std::vector<std::string>&args);

// Dispatches one command line (without the program name).
int run_cli(std::vector<std::string> args);

// run_cli with errors reported on err: 2 argument error, 3 range error,
// 1 any other failure.
int run_main(const std::vector<std::string>&args,std::ostream&err);

std::string tool_ver();

void use_main();
void use_pos();
void use_nak();
void use_dasha();
void use_str();
void use_asp();
void use_trans();
void use_pulse();
void use_cfg();
