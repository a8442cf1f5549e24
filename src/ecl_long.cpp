#include "astro/ecl_long.hpp"

#include<algorithm>
#include<cmath>

RetProp AberCorr::geo_prop(SpkKernel&kern,int target,double jd_tdb,
						   int max_iter){
	auto earth=kern.get_state(NAIF_EARTH,NAIF_SSB,jd_tdb);

	double tr=jd_tdb;
	auto tgt=kern.get_state(target,NAIF_SSB,tr);
	for(int i=0;i<max_iter;++i){
		double tr_new=jd_tdb-lightday(tgt.first-earth.first);
		if(std::fabs(tr_new-tr)<1e-12){
			break;
		}
		tr=tr_new;
		tgt=kern.get_state(target,NAIF_SSB,tr);
	}
	return {tgt.first-earth.first,tgt.second-earth.second,tr};
}

Vec3 AberCorr::aberrate(const Vec3&X,const Vec3&vel_obs){
	double r=X.norm();
	if(r==0.0){
		return X;
	}
	Vec3 n=X/r;
	Vec3 beta=vel_obs/C_AUDAY;
	double beta2=Vec3::dot(beta,beta);
	double gamma_inv=std::sqrt(std::max(0.0,1.0-beta2));
	double nb=Vec3::dot(n,beta);

	Vec3 n_app=(gamma_inv*n+beta+(nb*beta)/(1.0+gamma_inv))/(1.0+nb);
	double len=n_app.norm();
	if(len==0.0){
		return X;
	}
	return (n_app/len)*r;
}

EclLong::EclLong(SpkKernel&kern,PrecModel model)
	: kern_(kern),model_(model),rot_ok_(false),rot_jd_(0.0){}

Mat3 EclLong::rot_mat(double jd_tdb){
	if(!rot_ok_||rot_jd_!=jd_tdb){
		rot_cache_=PrecNut::ecl_mat(jd_tdb,model_);
		rot_jd_=jd_tdb;
		rot_ok_=true;
	}
	return rot_cache_;
}

std::pair<double,double> EclLong::calc(int target,double jd_tdb){
	RetProp st=AberCorr::geo_prop(kern_,target,jd_tdb);
	Vec3 vE=kern_.get_state(NAIF_EARTH,NAIF_SSB,jd_tdb).second;
	Vec3 X=AberCorr::aberrate(st.X,vE);

	Mat3 R=rot_mat(jd_tdb);
	Vec3 Xec=R*X;
	Vec3 Vdot=R*st.V;

	double lam=std::atan2(Xec.y,Xec.x);
	if(lam<0){
		lam+=TWO_PI;
	}
	double denom=Xec.x*Xec.x+Xec.y*Xec.y;
	double lam_dot=0.0;
	if(denom!=0.0){
		lam_dot=(Xec.x*Vdot.y-Xec.y*Vdot.x)/denom;
	}
	return {lam,lam_dot};
}
