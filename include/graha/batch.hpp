#pragma once

#include<atomic>
#include<cstddef>
#include<string>
#include<vector>

#include "graha/bodies.hpp"

class EphProvider;

struct PosTask{
	int line_no=0;
	std::string raw;
	double jd_utc=0.0;
};

struct BatchCtx{
	EphProvider*prov;
	Frame frame;
	const std::vector<PosTask>*tasks;
	std::vector<PosSet>*results;
	std::vector<std::string>*errors;
	std::atomic<std::size_t>*cursor;
};

void run_wkr(BatchCtx*ctx);

// Position sets for every task on up to jobs threads. A failed task leaves
// its error message in errors and a default PosSet in results.
void run_batch(EphProvider&prov,Frame frame,const std::vector<PosTask>&tasks,
			   std::vector<PosSet>&results,std::vector<std::string>&errors,
			   int jobs);
