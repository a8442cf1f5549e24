#include<gtest/gtest.h>

#include<stdexcept>

#include "astro/format.hpp"
#include "astro/math.hpp"

TEST(ParseTz,Offsets){
	EXPECT_EQ(parse_tz("Z"),0);
	EXPECT_EQ(parse_tz("+08:00"),480);
	EXPECT_EQ(parse_tz("-05:00"),-300);
	EXPECT_EQ(parse_tz("+05:30"),330);
	EXPECT_THROW(parse_tz("+8"),std::invalid_argument);
	EXPECT_THROW(parse_tz("+24:00"),std::invalid_argument);
	EXPECT_EQ(fmt_tz(-300),"-05:00");
	EXPECT_EQ(fmt_tz(0),"Z");
}

TEST(ParseIso,UtcNoon){
	IsoTime t=parse_iso("2000-01-01T12:00:00Z","+08:00");
	EXPECT_DOUBLE_EQ(t.jd_utc,2451545.0);
	EXPECT_TRUE(t.has_tz);
	EXPECT_EQ(t.tz_off,0);
}

TEST(ParseIso,DefaultZoneAppliesWithoutSuffix){
	IsoTime t=parse_iso("2000-01-01","+08:00");
	EXPECT_NEAR(t.jd_utc,2451544.5-8.0/24.0,1e-9);
	EXPECT_FALSE(t.has_tz);
	EXPECT_EQ(t.tz_off,480);
}

TEST(ParseIso,SeparatorsAndFractions){
	double a=parse_iso("2025-06-01T09:30:15.5-05:00","Z").jd_utc;
	double b=parse_iso("2025-06-01 14:30:15.5Z","Z").jd_utc;
	EXPECT_NEAR(a,b,1e-9);
	double c=parse_iso("2025-06-01T14:30","Z").jd_utc;
	EXPECT_NEAR(b-c,15.5/86400.0,1e-9);
}

TEST(ParseIso,RejectsMalformed){
	EXPECT_THROW(parse_iso("","Z"),std::invalid_argument);
	EXPECT_THROW(parse_iso("yesterday","Z"),std::invalid_argument);
	EXPECT_THROW(parse_iso("2023-02-29","Z"),std::invalid_argument);
	EXPECT_THROW(parse_iso("2025-04-31","Z"),std::invalid_argument);
	EXPECT_THROW(parse_iso("2025-01-01T25:00","Z"),std::invalid_argument);
	EXPECT_THROW(parse_iso("2025-01-01T10","Z"),std::invalid_argument);
	EXPECT_THROW(parse_iso("2025-01-01T10:00+0800","Z"),std::invalid_argument);
	EXPECT_NO_THROW(parse_iso("2024-02-29","Z"));
}

TEST(FmtIso,RendersAtOffset){
	EXPECT_EQ(fmt_iso(2451545.0,0,false),"2000-01-01T12:00:00Z");
	EXPECT_EQ(fmt_iso(2451545.0,480,false),"2000-01-01T20:00:00+08:00");
	EXPECT_EQ(fmt_iso(2451545.0,0,true),"2000-01-01T12:00:00.000Z");
}

TEST(FmtDate,LocalCalendarDay){
	EXPECT_EQ(fmt_date(2451545.0),"2000-01-01");
	// 2000-01-02T00:30Z is still Jan 1 in New York
	double jd=2451545.5+0.5/24.0;
	EXPECT_EQ(fmt_date(jd,0),"2000-01-02");
	EXPECT_EQ(fmt_date(jd,-300),"2000-01-01");
}

TEST(Calendar,GregorianRoundTrip){
	int y=0;
	int m=0;
	int d=0;
	int hh=0;
	int mi=0;
	double ss=0.0;
	jd2greg(greg2jd(1582,10,15,6,30,0.0),y,m,d,hh,mi,ss);
	EXPECT_EQ(y,1582);
	EXPECT_EQ(m,10);
	EXPECT_EQ(d,15);
	EXPECT_EQ(hh,6);
	EXPECT_EQ(mi,30);
	EXPECT_NEAR(ss,0.0,1e-3);
}
