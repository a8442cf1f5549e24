#include<gtest/gtest.h>

#include "astro/direction.hpp"

TEST(ClassifyDir,StationaryWhenRelativeSpeedTiny){
	EXPECT_EQ(classify_dir(0.0,1.0,90.0,1.005,90.0),Direction::STATIONARY);
	EXPECT_EQ(classify_dir(0.0,0.0,180.0,0.0,180.0),Direction::STATIONARY);
}

TEST(ClassifyDir,ApplyingConjunction){
	// faster body behind the slower one
	EXPECT_EQ(classify_dir(0.0,1.0,5.0,0.0,0.0),Direction::APPLYING);
}

TEST(ClassifyDir,SeparatingConjunction){
	EXPECT_EQ(classify_dir(5.0,1.0,0.0,0.0,0.0),Direction::SEPARATING);
}

TEST(ClassifyDir,ConjunctionAcrossAriesPoint){
	EXPECT_EQ(classify_dir(358.0,1.0,2.0,0.0,0.0),Direction::APPLYING);
	EXPECT_EQ(classify_dir(2.0,1.0,358.0,0.0,0.0),Direction::SEPARATING);
}

TEST(ClassifyDir,SquareWithFastMoon){
	// Sun 0 -> 1, Moon 80 -> 93: separation 80 -> 92
	EXPECT_EQ(classify_dir(0.0,1.0,80.0,13.0,90.0),Direction::APPLYING);
	// Moon 85 -> 98: separation 85 -> 97
	EXPECT_EQ(classify_dir(0.0,1.0,85.0,13.0,90.0),Direction::SEPARATING);
}

TEST(ClassifyDir,RetrogradeBodyReversesSense){
	EXPECT_EQ(classify_dir(10.0,-0.5,0.0,0.0,0.0),Direction::APPLYING);
}

TEST(ClassifyDir,CustomEpsilon){
	EXPECT_EQ(classify_dir(0.0,0.2,5.0,0.0,0.0,0.5),Direction::STATIONARY);
	EXPECT_EQ(classify_dir(0.0,0.2,5.0,0.0,0.0,0.1),Direction::APPLYING);
}

TEST(DirName,Names){
	EXPECT_STREQ(dir_name(Direction::APPLYING),"applying");
	EXPECT_STREQ(dir_name(Direction::SEPARATING),"separating");
	EXPECT_STREQ(dir_name(Direction::STATIONARY),"stationary");
}
