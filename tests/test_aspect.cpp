#include<gtest/gtest.h>

#include<stdexcept>
#include<vector>

#include "astro/aspect.hpp"
#include "astro/errors.hpp"

namespace{

std::vector<BodyPosition> two(Body a,double la,double sa,Body b,double lb,
							  double sb){
	return {mk_pos(a,la,sa),mk_pos(b,lb,sb)};
}

}

TEST(DetectAspects,ExactOpposition){
	auto pos=two(Body::SUN,100.0,0.9856,Body::MOON,280.0,13.18);
	auto out=detect_aspects(pos,AspectCfg());
	ASSERT_EQ(out.size(),1u);
	const AspectRecord&a=out[0];
	EXPECT_EQ(a.type,AspectType::OPPOSITION);
	EXPECT_DOUBLE_EQ(a.separation,180.0);
	EXPECT_DOUBLE_EQ(a.delta,0.0);
	EXPECT_DOUBLE_EQ(a.exactness,1.0);
	EXPECT_TRUE(a.within);
	EXPECT_TRUE(a.exact);
	EXPECT_EQ(aspect_label(a),"Sun opposition Moon");
}

TEST(DetectAspects,ExactnessScalesWithOrb){
	auto pos=two(Body::SUN,0.0,1.0,Body::MARS,93.0,0.5);
	auto out=detect_aspects(pos,AspectCfg());
	ASSERT_EQ(out.size(),1u);
	EXPECT_EQ(out[0].type,AspectType::SQUARE);
	EXPECT_DOUBLE_EQ(out[0].delta,3.0);
	EXPECT_DOUBLE_EQ(out[0].orb_lim,8.0);
	EXPECT_DOUBLE_EQ(out[0].exactness,1.0-3.0/8.0);
	EXPECT_FALSE(out[0].exact);
}

TEST(DetectAspects,NothingOutsideOrbs){
	auto pos=two(Body::SUN,0.0,1.0,Body::MOON,40.0,13.0);
	EXPECT_TRUE(detect_aspects(pos,AspectCfg()).empty());
}

TEST(DetectAspects,KeepsClosestAspectPerPair){
	AspectCfg cfg;
	for(AspectType t : all_aspects()){
		cfg.set_orb(t,30.0);
	}
	// 69 deg: sextile is 9 off, square 21 off
	auto pos=two(Body::VENUS,0.0,1.0,Body::JUPITER,69.0,0.1);
	auto out=detect_aspects(pos,cfg);
	ASSERT_EQ(out.size(),1u);
	EXPECT_EQ(out[0].type,AspectType::SEXTILE);
	EXPECT_DOUBLE_EQ(out[0].delta,9.0);
}

TEST(DetectAspects,CanonicalBodyOrder){
	auto pos=two(Body::MOON,280.0,13.0,Body::SUN,100.0,1.0);
	auto out=detect_aspects(pos,AspectCfg());
	ASSERT_EQ(out.size(),1u);
	EXPECT_EQ(out[0].body_a,Body::SUN);
	EXPECT_EQ(out[0].body_b,Body::MOON);
}

TEST(DetectAspects,AtMostOnePerPair){
	std::vector<BodyPosition> pos;
	double lon=0.0;
	for(Body b : all_bodies()){
		pos.push_back(mk_pos(b,lon,1.0));
		lon+=30.0;
	}
	auto out=detect_aspects(pos,AspectCfg());
	EXPECT_LE(out.size(),BODY_COUNT*(BODY_COUNT-1)/2);
	for(std::size_t i=0;i<out.size();++i){
		EXPECT_LT(body_rank(out[i].body_a),body_rank(out[i].body_b));
		EXPECT_LE(out[i].delta,out[i].orb_lim);
		for(std::size_t j=i+1;j<out.size();++j){
			bool same=out[i].body_a==out[j].body_a&&out[i].body_b==out[j].body_b;
			EXPECT_FALSE(same);
		}
	}
}

TEST(DetectAspects,ExactThresholdFollowsConfig){
	AspectCfg cfg;
	cfg.exact_eps=0.5;
	auto pos=two(Body::SUN,0.0,1.0,Body::SATURN,120.3,0.03);
	auto out=detect_aspects(pos,cfg);
	ASSERT_EQ(out.size(),1u);
	EXPECT_EQ(out[0].type,AspectType::TRINE);
	EXPECT_TRUE(out[0].exact);

	cfg.exact_eps=0.1;
	EXPECT_FALSE(detect_aspects(pos,cfg)[0].exact);
}

TEST(ApplyDir,FillsDirectionFromSpeeds){
	auto pos=two(Body::SUN,0.0,1.0,Body::MOON,80.0,13.0);
	auto out=detect_aspects(pos,AspectCfg());
	ASSERT_EQ(out.size(),1u);
	EXPECT_EQ(out[0].dir,Direction::STATIONARY);
	apply_dir(out,pos);
	EXPECT_EQ(out[0].dir,Direction::APPLYING);
}

TEST(ApplyDir,MissingBodyIsLogicError){
	auto pos=two(Body::SUN,0.0,1.0,Body::MOON,80.0,13.0);
	auto out=detect_aspects(pos,AspectCfg());
	pos.pop_back();
	EXPECT_THROW(apply_dir(out,pos),std::logic_error);
}

TEST(AspectCfg,RejectsBadOrbs){
	AspectCfg cfg;
	EXPECT_NO_THROW(cfg.validate());
	cfg.set_orb(AspectType::TRINE,31.0);
	EXPECT_THROW(cfg.validate(),ConfigError);
	cfg.set_orb(AspectType::TRINE,-1.0);
	EXPECT_THROW(cfg.validate(),ConfigError);

	AspectCfg eps;
	eps.exact_eps=-0.1;
	EXPECT_THROW(eps.validate(),ConfigError);
}

TEST(AspectNames,ParseAndAngles){
	EXPECT_EQ(parse_aspect("Trine"),AspectType::TRINE);
	EXPECT_THROW(parse_aspect("quincunx"),std::invalid_argument);
	EXPECT_DOUBLE_EQ(aspect_angle(AspectType::SEXTILE),60.0);
	EXPECT_DOUBLE_EQ(aspect_angle(AspectType::OPPOSITION),180.0);
}
