#pragma once

#include<set>
#include<string>
#include<utility>

#include "astro/body.hpp"
#include "astro/math.hpp"

void cfg_spice();
void chk_spice(const std::string&context);

constexpr int NAIF_SSB=0;
constexpr int NAIF_EARTH=399;

int naif_id(Body body);

// SPICE name for a NAIF code handled by this tool
std::string naif_name(int code);

// One loaded SPK file. CSPICE keeps kernels in a process-wide pool,
// so every call is serialized on a shared lock.
class SpkKernel{
  public:
	explicit SpkKernel(const std::string&path);

	const std::string&path() const{ return path_; }

	static double et_fromjd(double jd_tdb){ return (jd_tdb-J2000_JD)*SEC_DAY; }

	// J2000 position (au) and velocity (au/day) of target wrt observer
	std::pair<Vec3,Vec3> get_state(int target,int observer,double jd_tdb);

  private:
	void load_kern();

	std::string path_;
	static std::set<std::string> load_paths_;
};
