#include "astro/frames.hpp"

#include<cmath>

extern "C"{
#include "erfa.h"
}

const double LONG_THR=10.0;

namespace{

void split_jd(double jd,double&d1,double&d2){
	d1=std::floor(jd);
	d2=jd-d1;
}

}

Mat3 CoordTf::R1(double angle){
	double c=std::cos(angle);
	double s=std::sin(angle);
	Mat3 R=Mat3::identity();
	R.m[1][1]=c;
	R.m[1][2]=s;
	R.m[2][1]=-s;
	R.m[2][2]=c;
	return R;
}

Mat3 CoordTf::bias_mat(){
	Mat3 rb;
	Mat3 rp;
	Mat3 rbp;
	eraBp06(J2000_JD,0.0,rb.m,rp.m,rbp.m);
	return rb;
}

Mat3 PrecNut::prec_mat(double jd_tdb,PrecModel model){
	double epj=2000.0+(jd_tdb-J2000_JD)/365.25;
	bool long_term=model==PrecModel::VONDRAK||
				   (model==PrecModel::AUTO&&std::fabs(epj-2000.0)>=LONG_THR);
	if(long_term){
		Mat3 P;
		eraLtp(epj,P.m);
		return P*CoordTf::bias_mat();
	}
	double d1=0.0;
	double d2=0.0;
	split_jd(jd_tdb,d1,d2);
	Mat3 BP;
	eraPmat06(d1,d2,BP.m);
	return BP;
}

double PrecNut::mean_obl(double jd_tdb){
	double d1=0.0;
	double d2=0.0;
	split_jd(jd_tdb,d1,d2);
	return eraObl06(d1,d2);
}

std::pair<double,double> PrecNut::nut_ang(double jd_tdb){
	double d1=0.0;
	double d2=0.0;
	split_jd(jd_tdb,d1,d2);
	double dpsi=0.0;
	double deps=0.0;
	eraNut00a(d1,d2,&dpsi,&deps);
	return {dpsi,deps};
}

Mat3 PrecNut::nut_mat(double jd_tdb){
	double d1=0.0;
	double d2=0.0;
	split_jd(jd_tdb,d1,d2);
	Mat3 N;
	eraNum06a(d1,d2,N.m);
	return N;
}

double PrecNut::true_obl(double jd_tdb){
	return mean_obl(jd_tdb)+nut_ang(jd_tdb).second;
}

Mat3 PrecNut::ecl_mat(double jd_tdb,PrecModel model){
	return CoordTf::R1(true_obl(jd_tdb))*nut_mat(jd_tdb)*prec_mat(jd_tdb,model);
}
