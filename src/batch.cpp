#include "astro/batch.hpp"

#include<algorithm>
#include<cmath>
#include<exception>
#include<memory>
#include<ostream>
#include<sstream>
#include<stdexcept>
#include<thread>

#include "astro/errors.hpp"

namespace{

constexpr int kMaxJobs=64;

}

void run_bwkr(BatchCtx*ctx){
	std::size_t idx;
	while((idx=ctx->cursor->fetch_add(1))<ctx->instants->size()){
		BatchItem&item=ctx->results->at(idx);
		item.jd_utc=ctx->instants->at(idx);
		std::ostringstream buf;
		try{
			item.snap=ctx->engine->build(item.jd_utc,ctx->log?&buf:nullptr);
			item.ok=true;
		}catch(const std::exception&ex){
			item.ok=false;
			item.error=ex.what();
			buf<<"[error] jd "<<item.jd_utc<<": "<<ex.what()<<"\n";
		}
		if(ctx->log&&!buf.str().empty()){
			std::lock_guard<std::mutex> lk(*ctx->log_mx);
			(*ctx->log)<<buf.str()<<std::flush;
		}
	}
}

std::vector<BatchItem> run_batch(const ProviderFactory&factory,
								 const SnapCfg&cfg,
								 const std::vector<double>&instants,int jobs,
								 std::ostream*log){
	if(jobs<1||jobs>kMaxJobs){
		throw std::invalid_argument("jobs must be within [1,64]");
	}
	std::vector<BatchItem> results(instants.size());
	if(instants.empty()){
		return results;
	}
	std::size_t n=std::min<std::size_t>(static_cast<std::size_t>(jobs),
										instants.size());

	std::vector<std::unique_ptr<EphemProvider>> providers;
	std::vector<std::unique_ptr<SnapAsm>> engines;
	for(std::size_t i=0;i<n;++i){
		providers.push_back(factory());
		if(!providers.back()){
			throw std::runtime_error("provider factory returned null");
		}
		engines.push_back(std::make_unique<SnapAsm>(*providers.back(),cfg));
	}

	std::atomic<std::size_t> cursor(0);
	std::mutex log_mx;
	std::vector<BatchCtx> ctxs(n);
	for(std::size_t i=0;i<n;++i){
		ctxs[i]={engines[i].get(),&instants,&results,&cursor,log,&log_mx};
	}

	if(n==1){
		run_bwkr(&ctxs[0]);
		return results;
	}

	std::vector<std::thread> pool;
	pool.reserve(n);
	for(std::size_t i=0;i<n;++i){
		pool.emplace_back(run_bwkr,&ctxs[i]);
	}
	for(auto&t : pool){
		t.join();
	}
	return results;
}

std::vector<double> day_range(double jd_start,double jd_end,double step_days){
	if(!std::isfinite(jd_start)||!std::isfinite(jd_end)){
		throw InvalidInstant("range bounds are not finite");
	}
	if(!(step_days>0.0)||!std::isfinite(step_days)){
		throw std::invalid_argument("step must be a positive number of days");
	}
	if(jd_end<jd_start){
		throw InvalidInstant("range end precedes start");
	}
	double count=std::floor((jd_end-jd_start)/step_days+1e-9)+1.0;
	if(count>static_cast<double>(MAX_RANGE)){
		throw std::invalid_argument("range expands to more than "+
									std::to_string(MAX_RANGE)+" instants");
	}
	std::vector<double> out;
	out.reserve(static_cast<std::size_t>(count));
	for(long i=0;;++i){
		double jd=jd_start+static_cast<double>(i)*step_days;
		if(jd>jd_end+1e-9){
			break;
		}
		out.push_back(jd);
	}
	return out;
}
