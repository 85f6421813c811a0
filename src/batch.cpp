#include "graha/batch.hpp"

#include<algorithm>
#include<exception>
#include<stdexcept>
#include<thread>

#include "graha/ephem.hpp"

void run_wkr(BatchCtx*ctx){
	std::size_t idx;
	while((idx=ctx->cursor->fetch_add(1))<ctx->tasks->size()){
		const auto&task=ctx->tasks->at(idx);
		try{
			ctx->results->at(idx)=ctx->prov->positions(task.jd_utc,ctx->frame);
		}catch(const std::exception&ex){
			ctx->errors->at(idx)=ex.what();
		}
	}
}

void run_batch(EphProvider&prov,Frame frame,const std::vector<PosTask>&tasks,
			   std::vector<PosSet>&results,std::vector<std::string>&errors,
			   int jobs){
	if(jobs<1){
		throw std::invalid_argument("--jobs must be >= 1");
	}
	results.assign(tasks.size(),PosSet());
	errors.assign(tasks.size(),std::string());

	std::atomic<std::size_t> cursor(0);
	BatchCtx ctx{&prov,frame,&tasks,&results,&errors,&cursor};

	std::size_t wk_count=std::min<std::size_t>(static_cast<std::size_t>(jobs),
											   tasks.size());
	if(wk_count<=1){
		run_wkr(&ctx);
		return;
	}

	std::vector<std::thread> workers;
	workers.reserve(wk_count);
	for(std::size_t i=0;i<wk_count;++i){
		workers.emplace_back(run_wkr,&ctx);
	}
	for(auto&th : workers){
		th.join();
	}
}
