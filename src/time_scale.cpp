#include "astro/time_scale.hpp"

#include<cmath>

namespace{

// last year the leap-second table is trusted
constexpr double LEAP_END=2027.0;

double poly(const double*c,int n,double t){
	double s=0.0;
	for(int i=n-1;i>=0;--i){
		s=s*t+c[i];
	}
	return s;
}

}

int TimeScale::leap_sec(double jd_utc){
	struct Entry{
		double jd;
		int leaps;
	};
	static const Entry table[]={
		{2441317.5,10},{2441499.5,11},{2441683.5,12},{2442048.5,13},
		{2442413.5,14},{2442778.5,15},{2443144.5,16},{2443509.5,17},
		{2443874.5,18},{2444239.5,19},{2444786.5,20},{2445151.5,21},
		{2445516.5,22},{2446247.5,23},{2447161.5,24},{2447892.5,25},
		{2448257.5,26},{2448804.5,27},{2449169.5,28},{2449534.5,29},
		{2450083.5,30},{2450630.5,31},{2451179.5,32},{2453736.5,33},
		{2454832.5,34},{2456109.5,35},{2457204.5,36},{2457754.5,37},
	};
	int leaps=0;
	for(const auto&e : table){
		if(jd_utc<e.jd){
			break;
		}
		leaps=e.leaps;
	}
	return leaps;
}

// Piecewise polynomials of Espenak and Meeus; long-term parabola elsewhere.
double TimeScale::delta_t(double year){
	double y=year;
	if(y<1500.0||y>=2150.0){
		double u=(y-1820.0)/100.0;
		return -20.0+32.0*u*u;
	}
	if(y<1600.0){
		static const double c[]={1574.2,-556.01,71.23472,0.319781,-0.8503463,
								 -0.005050998,0.0083572073};
		return poly(c,7,(y-1000.0)/100.0);
	}
	if(y<1700.0){
		double t=y-1600.0;
		return 120.0-0.9808*t-0.01532*t*t+t*t*t/7129.0;
	}
	if(y<1800.0){
		double t=y-1700.0;
		return 8.83+0.1603*t-0.0059285*t*t+0.00013336*t*t*t-
			   t*t*t*t/1174000.0;
	}
	if(y<1860.0){
		static const double c[]={13.72,-0.332447,0.0068612,0.0041116,
								 -0.00037436,0.0000121272,-0.0000001699,
								 0.000000000875};
		return poly(c,8,y-1800.0);
	}
	if(y<1900.0){
		static const double c[]={7.62,0.5737,-0.251754,0.01680668,
								 -0.0004473624,1.0/233174.0};
		return poly(c,6,y-1860.0);
	}
	if(y<1920.0){
		static const double c[]={-2.79,1.494119,-0.0598939,0.0061966,-0.000197};
		return poly(c,5,y-1900.0);
	}
	if(y<1941.0){
		static const double c[]={21.20,0.84493,-0.076100,0.0020936};
		return poly(c,4,y-1920.0);
	}
	if(y<1961.0){
		double t=y-1950.0;
		return 29.07+0.407*t-t*t/233.0+t*t*t/2547.0;
	}
	if(y<1986.0){
		double t=y-1975.0;
		return 45.45+1.067*t-t*t/260.0-t*t*t/718.0;
	}
	if(y<2005.0){
		static const double c[]={63.86,0.3345,-0.060374,0.0017275,0.000651814,
								 0.00002373599};
		return poly(c,6,y-2000.0);
	}
	if(y<2050.0){
		double t=y-2000.0;
		return 62.92+0.32217*t+0.005589*t*t;
	}
	double u=(y-1820.0)/100.0;
	return -20.0+32.0*u*u-0.5628*(2150.0-y);
}

double TimeScale::tt_minus_utc(double jd_utc){
	double year=jd2year(jd_utc);
	if(year>=1972.0&&year<LEAP_END){
		return static_cast<double>(leap_sec(jd_utc))+32.184;
	}
	return delta_t(year);
}

double TimeScale::tdb_minus_tt(double jd_tt){
	double g=(357.53+0.98560028*(jd_tt-J2000_JD))*DEG2RAD;
	return 0.001657*std::sin(g)+0.000014*std::sin(2.0*g);
}

double TimeScale::utc_to_tt(double jd_utc){
	return jd_utc+tt_minus_utc(jd_utc)/SEC_DAY;
}

double TimeScale::utc_to_tdb(double jd_utc){
	double jd_tt=utc_to_tt(jd_utc);
	return jd_tt+tdb_minus_tt(jd_tt)/SEC_DAY;
}
