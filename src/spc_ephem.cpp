#include "astro/spc_ephem.hpp"

#include<filesystem>
#include<mutex>
#include<stdexcept>

extern "C"{
#include "SpiceUsr.h"
}

namespace fs=std::filesystem;

namespace{

std::mutex&spice_mx(){
	static std::mutex mx;
	return mx;
}

}

std::set<std::string> SpkKernel::load_paths_;

int naif_id(Body body){
	switch(body){
	case Body::SUN:
		return 10;
	case Body::MOON:
		return 301;
	case Body::MERCURY:
		return 1;
	case Body::VENUS:
		return 2;
	case Body::MARS:
		return 4;
	case Body::JUPITER:
		return 5;
	case Body::SATURN:
		return 6;
	case Body::URANUS:
		return 7;
	case Body::NEPTUNE:
		return 8;
	case Body::PLUTO:
		return 9;
	}
	throw std::invalid_argument("body has no NAIF code");
}

std::string naif_name(int code){
	switch(code){
	case NAIF_SSB:
		return "SOLAR SYSTEM BARYCENTER";
	case 1:
		return "MERCURY BARYCENTER";
	case 2:
		return "VENUS BARYCENTER";
	case 4:
		return "MARS BARYCENTER";
	case 5:
		return "JUPITER BARYCENTER";
	case 6:
		return "SATURN BARYCENTER";
	case 7:
		return "URANUS BARYCENTER";
	case 8:
		return "NEPTUNE BARYCENTER";
	case 9:
		return "PLUTO BARYCENTER";
	case 10:
		return "SUN";
	case 301:
		return "MOON";
	case NAIF_EARTH:
		return "EARTH";
	default:
		break;
	}
	throw std::runtime_error("unknown NAIF code "+std::to_string(code));
}

SpkKernel::SpkKernel(const std::string&path) : path_(path){
	if(path_.empty()){
		throw std::runtime_error("ephemeris path is empty");
	}
	load_kern();
}

void SpkKernel::load_kern(){
	std::error_code ec;
	if(!fs::exists(path_,ec)){
		throw std::runtime_error("ephemeris file not found: "+path_);
	}
	auto fsize=fs::file_size(path_,ec);
	if(ec||fsize==0){
		throw std::runtime_error("ephemeris file is not readable or empty: "+
								 path_);
	}

	std::lock_guard<std::mutex> lock(spice_mx());
	cfg_spice();
	if(load_paths_.count(path_)!=0){
		return;
	}
	furnsh_c(path_.c_str());
	chk_spice("failed to load ephemeris kernel "+path_);

	SpiceInt count=0;
	ktotal_c("SPK",&count);
	chk_spice("failed to query loaded SPK kernels");
	if(count==0){
		throw std::runtime_error("no SPK kernels loaded from "+path_);
	}
	load_paths_.insert(path_);
}

std::pair<Vec3,Vec3> SpkKernel::get_state(int target,int observer,double jd_tdb){
	std::string tname=naif_name(target);
	std::string oname=naif_name(observer);
	SpiceDouble st[6];
	SpiceDouble lt=0.0;
	{
		std::lock_guard<std::mutex> lock(spice_mx());
		spkezr_c(tname.c_str(),et_fromjd(jd_tdb),"J2000","NONE",oname.c_str(),
				 st,&lt);
		chk_spice("spkezr_c failed for "+tname+" wrt "+oname);
	}
	const double vs=SEC_DAY/AU_KM;
	Vec3 pos(st[0]/AU_KM,st[1]/AU_KM,st[2]/AU_KM);
	Vec3 vel(st[3]*vs,st[4]*vs,st[5]*vs);
	return {pos,vel};
}

// caller holds spice_mx()
void chk_spice(const std::string&context){
	if(!failed_c()){
		return;
	}
	SpiceChar msg[1841];
	getmsg_c("LONG",sizeof(msg),msg);
	reset_c();
	throw std::runtime_error(context+": "+std::string(msg));
}

void cfg_spice(){
	static std::once_flag flag;
	std::call_once(flag,[](){
		SpiceChar action[]="RETURN";
		SpiceChar detail[]="SHORT,EXPLAIN";
		erract_c("SET",0,action);
		errprt_c("SET",0,detail);
	});
}
