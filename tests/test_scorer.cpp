#include<gtest/gtest.h>

#include<algorithm>
#include<string>
#include<vector>

#include "astro/errors.hpp"
#include "astro/scorer.hpp"

namespace{

AspectRecord mk_asp(Body a,Body b,AspectType t,double delta,double lim=8.0,
					bool exact=false){
	AspectRecord r;
	r.body_a=a;
	r.body_b=b;
	r.type=t;
	r.separation=aspect_angle(t)+delta;
	r.delta=delta;
	r.orb_lim=lim;
	r.exactness=lim>0.0?1.0-delta/lim:1.0;
	r.within=delta<=lim;
	r.exact=exact;
	return r;
}

bool has_event(const std::vector<std::string>&ev,const std::string&s){
	return std::find(ev.begin(),ev.end(),s)!=ev.end();
}

}

TEST(ScoreDay,BaselineWithoutAspects){
	ScoreResult r=score_day({},nullptr,ScoreCfg());
	EXPECT_DOUBLE_EQ(r.score,50.0);
	EXPECT_EQ(r.outlook,Outlook::NEUTRAL);
	EXPECT_FALSE(r.volatile_flag);
	EXPECT_TRUE(r.events.empty());
}

TEST(ScoreDay,ExactOppositionUnderFullMoon){
	std::vector<AspectRecord> asp={
		mk_asp(Body::SUN,Body::MOON,AspectType::OPPOSITION,0.0,8.0,true)};
	LunarPhase full=calc_phase(100.0,280.0);
	ScoreResult r=score_day(asp,&full,ScoreCfg());
	EXPECT_TRUE(r.volatile_flag);
	EXPECT_DOUBLE_EQ(r.adjust,-13.0);
	EXPECT_DOUBLE_EQ(r.score,37.0);
	EXPECT_EQ(r.outlook,Outlook::VOLATILE);
	EXPECT_TRUE(has_event(r.events,"Sun opposition Moon"));
	EXPECT_TRUE(has_event(r.events,"Full Moon"));
}

TEST(ScoreDay,MinorAspectsDoNotMoveScore){
	std::vector<AspectRecord> asp={
		mk_asp(Body::VENUS,Body::JUPITER,AspectType::TRINE,0.0),
		mk_asp(Body::MARS,Body::SATURN,AspectType::SEXTILE,1.0,6.0)};
	ScoreResult r=score_day(asp,nullptr,ScoreCfg());
	EXPECT_DOUBLE_EQ(r.score,50.0);
}

TEST(ScoreDay,WeightTimesExactness){
	std::vector<AspectRecord> asp={
		mk_asp(Body::SUN,Body::VENUS,AspectType::CONJUNCTION,2.0),
		mk_asp(Body::MARS,Body::PLUTO,AspectType::SQUARE,4.0)};
	ScoreResult r=score_day(asp,nullptr,ScoreCfg());
	// 6*0.75 - 6*0.5
	EXPECT_NEAR(r.adjust,1.5,1e-12);
	EXPECT_NEAR(r.score,51.5,1e-12);
}

TEST(ScoreDay,AspectsOutsideOrbIgnored){
	AspectRecord far=mk_asp(Body::SUN,Body::MARS,AspectType::OPPOSITION,9.0);
	ASSERT_FALSE(far.within);
	ScoreResult r=score_day({far},nullptr,ScoreCfg());
	EXPECT_DOUBLE_EQ(r.score,50.0);
}

TEST(ScoreDay,ClampedToRange){
	ScoreCfg cfg;
	cfg.base=97.0;
	std::vector<AspectRecord> asp={
		mk_asp(Body::SUN,Body::JUPITER,AspectType::CONJUNCTION,0.0)};
	ScoreResult hi=score_day(asp,nullptr,cfg);
	EXPECT_DOUBLE_EQ(hi.score,100.0);
	EXPECT_EQ(hi.outlook,Outlook::BULLISH);

	cfg.base=3.0;
	std::vector<AspectRecord> hard={
		mk_asp(Body::SUN,Body::SATURN,AspectType::OPPOSITION,0.0)};
	ScoreResult lo=score_day(hard,nullptr,cfg);
	EXPECT_DOUBLE_EQ(lo.score,0.0);
	EXPECT_EQ(lo.outlook,Outlook::BEARISH);
}

TEST(ScoreDay,NewMoonWithNoAspectsLifts){
	LunarPhase nm=calc_phase(10.0,12.0);
	ScoreResult r=score_day({},&nm,ScoreCfg());
	EXPECT_TRUE(r.volatile_flag);
	EXPECT_DOUBLE_EQ(r.score,55.0);
	EXPECT_EQ(r.outlook,Outlook::VOLATILE);
	EXPECT_TRUE(has_event(r.events,"New Moon"));
}

TEST(ScoreDay,QuarterMoonIsNotVolatile){
	LunarPhase q=calc_phase(0.0,95.0);
	ScoreResult r=score_day({},&q,ScoreCfg());
	EXPECT_FALSE(r.volatile_flag);
	EXPECT_TRUE(r.events.empty());
}

TEST(ScoreDay,UsesConfiguredMajors){
	ScoreCfg cfg;
	cfg.major[static_cast<std::size_t>(AspectType::TRINE)]=true;
	std::vector<AspectRecord> asp={
		mk_asp(Body::VENUS,Body::JUPITER,AspectType::TRINE,0.0)};
	EXPECT_DOUBLE_EQ(score_day(asp,nullptr,cfg).score,56.0);
}

TEST(SigEvents,NotableOrbAndDedup){
	std::vector<AspectRecord> asp={
		mk_asp(Body::SUN,Body::MERCURY,AspectType::CONJUNCTION,0.5),
		mk_asp(Body::SUN,Body::MERCURY,AspectType::CONJUNCTION,0.4),
		mk_asp(Body::MARS,Body::URANUS,AspectType::SQUARE,2.0),
		mk_asp(Body::MOON,Body::NEPTUNE,AspectType::TRINE,0.05,8.0,true)};
	auto ev=sig_events(asp,nullptr,ScoreCfg());
	ASSERT_EQ(ev.size(),2u);
	EXPECT_EQ(ev[0],"Sun conjunction Mercury");
	EXPECT_EQ(ev[1],"Moon trine Neptune");
}

TEST(PickOutlook,Thresholds){
	ScoreCfg cfg;
	EXPECT_EQ(pick_outlook(65.0,false,cfg),Outlook::BULLISH);
	EXPECT_EQ(pick_outlook(64.9,false,cfg),Outlook::NEUTRAL);
	EXPECT_EQ(pick_outlook(35.0,false,cfg),Outlook::BEARISH);
	EXPECT_EQ(pick_outlook(50.0,true,cfg),Outlook::VOLATILE);
	EXPECT_EQ(pick_outlook(80.0,true,cfg),Outlook::BULLISH);
}

TEST(ScoreCfg,Validation){
	ScoreCfg cfg;
	EXPECT_NO_THROW(cfg.validate());
	cfg.bearish_at=70.0;
	EXPECT_THROW(cfg.validate(),ConfigError);

	ScoreCfg base;
	base.base=120.0;
	EXPECT_THROW(base.validate(),ConfigError);

	ScoreCfg bonus;
	bonus.phase_bonus=-1.0;
	EXPECT_THROW(bonus.validate(),ConfigError);
}
