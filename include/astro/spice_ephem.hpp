#pragma once

#include<string>

#include "astro/ecl_long.hpp"
#include "astro/ephem.hpp"

// EphemProvider backed by a JPL SPK kernel. Construction loads the kernel
// and throws std::runtime_error when it cannot.
class SpiceEphem : public EphemProvider{
  public:
	explicit SpiceEphem(const std::string&bsp,PrecModel model=PrecModel::AUTO);

	BodyState state(double jd_utc,Body body) override;

	std::string describe() const override;

  private:
	SpkKernel kern_;
	EclLong ecl_;
};

ProviderFactory spice_factory(const std::string&bsp);
