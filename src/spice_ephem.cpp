#include "astro/spice_ephem.hpp"

#include<stdexcept>

#include "astro/angle.hpp"
#include "astro/errors.hpp"
#include "astro/time_scale.hpp"

SpiceEphem::SpiceEphem(const std::string&bsp,PrecModel model)
	: kern_(bsp),ecl_(kern_,model){}

BodyState SpiceEphem::state(double jd_utc,Body body){
	double jd_tdb=TimeScale::utc_to_tdb(jd_utc);
	try{
		auto r=ecl_.calc(naif_id(body),jd_tdb);
		BodyState st;
		st.longitude=norm_deg(r.first*RAD2DEG);
		st.speed=r.second*RAD2DEG;
		return st;
	}catch(const std::runtime_error&ex){
		throw BodyUnavailable(body,ex.what());
	}
}

std::string SpiceEphem::describe() const{ return "spice:"+kern_.path(); }

ProviderFactory spice_factory(const std::string&bsp){
	return [bsp](){ return std::make_unique<SpiceEphem>(bsp); };
}
