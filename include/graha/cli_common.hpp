#pragma once

#include<cstddef>
#include<fstream>
#include<set>
#include<string>
#include<vector>

namespace cli_util{

// stdout unless a file was opened
struct OutTgt{
	std::ofstream file;
	std::ostream*stream=nullptr;

	std::ostream&os(){ return file.is_open()?file:*stream; }
};

bool is_opt(const std::string&s);

std::string to_low(std::string s);

int parse_int(const std::string&text,const std::string&label);

double parse_num(const std::string&text,const std::string&label);

bool parse_bool01(const std::string&text,const std::string&label);

std::string req_val(const std::vector<std::string>&args,std::size_t&idx,
					const std::string&opt);

OutTgt open_out(const std::string&path);

void note_out(const std::string&path,bool quiet);

void chk_fmt(const std::string&format,const std::set<std::string>&allowed,
			 const std::string&ctx);

// 123.4567 -> "Leo 03d27'24""
std::string fmt_lon(double lon);

// fixed-point with the given number of decimals
std::string fmt_num(double v,int digits=6);

// ISO time in the display zone at that instant
std::string fmt_at(double jd_utc,const std::string&tz);

} // namespace cli_util
