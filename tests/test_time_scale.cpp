#include<gtest/gtest.h>

#include<cmath>

#include "astro/time_scale.hpp"

TEST(TimeScale,LeapSeconds){
	EXPECT_EQ(TimeScale::leap_sec(2441317.0),0);
	EXPECT_EQ(TimeScale::leap_sec(2441317.5),10);
	EXPECT_EQ(TimeScale::leap_sec(2451545.0),32);
	EXPECT_EQ(TimeScale::leap_sec(2457754.5),37);
	EXPECT_EQ(TimeScale::leap_sec(2460000.0),37);
}

TEST(TimeScale,TtAtJ2000){
	double tt=TimeScale::utc_to_tt(J2000_JD);
	EXPECT_NEAR((tt-J2000_JD)*SEC_DAY,64.184,1e-6);
}

TEST(TimeScale,TdbCloseToTt){
	for(double jd=2440000.0;jd<2470000.0;jd+=997.0){
		EXPECT_LT(std::fabs(TimeScale::tdb_minus_tt(jd)),0.0017);
	}
}

TEST(TimeScale,DeltaTOutsideLeapEra){
	EXPECT_NEAR(TimeScale::delta_t(1700.0),8.83,1e-9);
	EXPECT_NEAR(TimeScale::delta_t(1900.0),-2.79,1e-9);
	// 1550 lies in the 1500-1600 polynomial, roughly three minutes
	double d1550=TimeScale::delta_t(1550.0);
	EXPECT_GT(d1550,100.0);
	EXPECT_LT(d1550,250.0);
	// long-term parabola keeps growing
	EXPECT_GT(TimeScale::delta_t(2600.0),TimeScale::delta_t(2300.0));
}

TEST(TimeScale,TdbIsMonotonic){
	double prev=TimeScale::utc_to_tdb(greg2jd(1550,1,1));
	for(int y=1560;y<=2650;y+=10){
		double cur=TimeScale::utc_to_tdb(greg2jd(y,1,1));
		EXPECT_GT(cur,prev);
		prev=cur;
	}
}
