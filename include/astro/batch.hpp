#pragma once

#include<atomic>
#include<cstddef>
#include<iosfwd>
#include<mutex>
#include<string>
#include<vector>

#include "astro/ephem.hpp"
#include "astro/snapshot.hpp"

struct BatchItem{
	double jd_utc=0.0;
	bool ok=false;
	DailySnapshot snap;
	std::string error;
};

struct BatchCtx{
	const SnapAsm*engine;
	const std::vector<double>*instants;
	std::vector<BatchItem>*results;
	std::atomic<std::size_t>*cursor;
	std::ostream*log;
	std::mutex*log_mx;
};

void run_bwkr(BatchCtx*ctx);

// One provider per worker, created up front from the factory.
// Results keep input order; instant-level failures land in BatchItem::error.
std::vector<BatchItem> run_batch(const ProviderFactory&factory,
								 const SnapCfg&cfg,
								 const std::vector<double>&instants,int jobs,
								 std::ostream*log=nullptr);

// upper bound on instants one range may expand to
constexpr std::size_t MAX_RANGE=1000000;

std::vector<double> day_range(double jd_start,double jd_end,
							  double step_days=1.0);
