#pragma once

#include<functional>
#include<iosfwd>
#include<map>
#include<memory>
#include<string>

#include "astro/body.hpp"
#include "astro/math.hpp"

// Geocentric ecliptic longitude (deg) and its rate (deg/day) per body.
// Implementations throw BodyUnavailable for bodies they cannot resolve.
// Instances are not assumed to be safe for concurrent use.
class EphemProvider{
  public:
	virtual ~EphemProvider()=default;

	virtual BodyState state(double jd_utc,Body body)=0;

	virtual std::string describe() const=0;
};

using ProviderFactory=std::function<std::unique_ptr<EphemProvider>()>;

// Deterministic linear-motion ephemeris:
// longitude(t)=lon0+speed*(t-epoch).
class TableEphem : public EphemProvider{
  public:
	explicit TableEphem(double epoch_jd=J2000_JD);

	void set(Body body,double lon0,double speed);
	void fail(Body body,const std::string&reason="no data");

	bool has(Body body) const;

	double epoch() const{ return epoch_; }

	// TSV rows: body<TAB>longitude<TAB>speed, or body<TAB>fail.
	// "epoch<TAB><jd>" sets the reference epoch. '#' starts a comment.
	static TableEphem load_tsv(const std::string&path);
	static TableEphem parse_tsv(std::istream&is,const std::string&src);

	BodyState state(double jd_utc,Body body) override;

	std::string describe() const override;

  private:
	double epoch_;
	std::map<Body,BodyState> rows_;
	std::map<Body,std::string> fails_;
};
