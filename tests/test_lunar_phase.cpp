#include<gtest/gtest.h>

#include "astro/lunar_phase.hpp"

TEST(ClassifyPhase,OctantBoundaries){
	EXPECT_EQ(classify_phase(0.0),PhaseName::NEW);
	EXPECT_EQ(classify_phase(44.999),PhaseName::NEW);
	EXPECT_EQ(classify_phase(45.0),PhaseName::WAXING_CRESCENT);
	EXPECT_EQ(classify_phase(90.0),PhaseName::FIRST_QUARTER);
	EXPECT_EQ(classify_phase(135.0),PhaseName::WAXING_GIBBOUS);
	EXPECT_EQ(classify_phase(180.0),PhaseName::FULL);
	EXPECT_EQ(classify_phase(225.0),PhaseName::WANING_GIBBOUS);
	EXPECT_EQ(classify_phase(270.0),PhaseName::LAST_QUARTER);
	EXPECT_EQ(classify_phase(315.0),PhaseName::WANING_CRESCENT);
	EXPECT_EQ(classify_phase(359.999),PhaseName::WANING_CRESCENT);
}

TEST(ClassifyPhase,NormalizesInput){
	EXPECT_EQ(classify_phase(-10.0),PhaseName::WANING_CRESCENT);
	EXPECT_EQ(classify_phase(360.0),PhaseName::NEW);
	EXPECT_EQ(classify_phase(540.0),PhaseName::FULL);
}

TEST(PhaseAngle,MoonMinusSun){
	EXPECT_DOUBLE_EQ(phase_angle(350.0,10.0),20.0);
	EXPECT_DOUBLE_EQ(phase_angle(10.0,350.0),340.0);
}

TEST(Illumination,LinearInAngle){
	EXPECT_DOUBLE_EQ(illum_pct(0.0),0.0);
	EXPECT_DOUBLE_EQ(illum_pct(90.0),50.0);
	EXPECT_DOUBLE_EQ(illum_pct(180.0),100.0);
	EXPECT_DOUBLE_EQ(illum_pct(270.0),50.0);
}

TEST(CalcPhase,OppositionIsFull){
	LunarPhase lp=calc_phase(100.0,280.0);
	EXPECT_DOUBLE_EQ(lp.angle,180.0);
	EXPECT_TRUE(lp.is_full());
	EXPECT_FALSE(lp.is_new());
	EXPECT_DOUBLE_EQ(lp.illum,100.0);
}

TEST(CalcPhase,ConjunctionIsNew){
	LunarPhase lp=calc_phase(200.0,203.0);
	EXPECT_TRUE(lp.is_new());
	EXPECT_STREQ(phase_name(lp.name),"new");
	EXPECT_STREQ(phase_title(lp.name),"New Moon");
}
