#include "astro/math.hpp"

#include<cmath>

double greg2jd(int year,int month,int day,int hour,int minute,double second){
	int Y=year;
	int M=month;
	if(M<=2){
		Y-=1;
		M+=12;
	}
	int A=Y/100;
	int B=2-A+(A/4);

	double day_frac=(hour+(minute+second/60.0)/60.0)/24.0;

	return std::floor(365.25*(Y+4716))+std::floor(30.6001*(M+1))+day+B-1524.5+
		   day_frac;
}

void jd2greg(double jd,int&year,int&month,int&day,int&hour,int&minute,
			 double&second){
	double Z_d=std::floor(jd+0.5);
	double F=(jd+0.5)-Z_d;
	long Z=static_cast<long>(Z_d);
	long alpha=static_cast<long>((Z-1867216.25)/36524.25);
	long A=Z+1+alpha-alpha/4;
	long B=A+1524;
	long C=static_cast<long>((B-122.1)/365.25);
	long D=static_cast<long>(365.25*C);
	long E=static_cast<long>((B-D)/30.6001);

	double day_d=B-D-std::floor(30.6001*E)+F;
	day=static_cast<int>(std::floor(day_d));
	double frac_day=day_d-day;

	month=static_cast<int>(E<14?E-1:E-13);
	year=static_cast<int>(month>2?C-4716:C-4715);

	double secs=frac_day*SEC_DAY;
	if(secs<0){
		secs=0;
	}
	hour=static_cast<int>(secs/3600.0);
	secs-=hour*3600.0;
	minute=static_cast<int>(secs/60.0);
	second=secs-minute*60.0;

	if(second>=59.9995){
		second=0.0;
		minute+=1;
		if(minute>=60){
			minute=0;
			hour+=1;
			if(hour>=24){
				hour=0;
				jd2greg(jd+1.0,year,month,day,hour,minute,second);
			}
		}
	}
}
