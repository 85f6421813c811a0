#pragma once

#include<atomic>
#include<cstddef>
#include<iosfwd>
#include<memory>
#include<string>
#include<utility>

#include "graha/bodies.hpp"
#include "graha/instant.hpp"
#include "graha/lru_cache.hpp"

struct EphRead;

constexpr double MAX_ERA_YEARS=6000.0;

// Throws std::out_of_range outside the supported era.
void chk_era(double jd_utc);

// One way of producing apparent geocentric tropical positions of date.
class EphSrc{
  public:
	virtual ~EphSrc()=default;

	virtual std::string name() const=0;

	virtual Accuracy accuracy() const=0;

	virtual bool covers(double jd_tdb) const=0;

	// lon/lat/speed of all bodies, tropical frame; jd_utc already validated
	virtual PosSet tropical(double jd_utc)=0;
};

// JPL kernel through CSPICE.
class SpiceEph : public EphSrc{
  public:
	explicit SpiceEph(const std::string&kernel);
	~SpiceEph() override;

	std::string name() const override;
	Accuracy accuracy() const override{ return Accuracy::PRECISE; }
	bool covers(double jd_tdb) const override;
	PosSet tropical(double jd_utc) override;

	// coverage of the kernel as UTC Julian days (approximate)
	std::pair<double,double> span() const;

  private:
	std::unique_ptr<EphRead> eph_;
};

// Mean elements and truncated lunar theory; covers every supported instant.
class MeanEph : public EphSrc{
  public:
	std::string name() const override{ return "mean-elements"; }
	Accuracy accuracy() const override{ return Accuracy::APPROXIMATE; }
	bool covers(double) const override{ return true; }
	PosSet tropical(double jd_utc) override;
};

struct EphOpts{
	std::string kernel;
	std::size_t cache_size=256;
	double cache_res_sec=1.0;
};

class EphProvider{
  public:
	// fallback may be null when primary covers everything
	EphProvider(std::unique_ptr<EphSrc> primary,std::unique_ptr<EphSrc> fallback,
				std::size_t cache_size,double cache_res_sec,
				std::ostream*log=nullptr);

	EphProvider(const EphProvider&)=delete;
	EphProvider&operator=(const EphProvider&)=delete;

	PosSet positions(double jd_utc,Frame frame);

	PosSet positions(const Instant&in,Frame frame){
		return positions(in.jd_utc,frame);
	}

	double ascendant(const Instant&in,Frame frame) const;

	const EphSrc&primary() const{ return *primary_; }

	bool has_fallback() const{ return fallback_!=nullptr; }

	CacheStats cache_stats() const{ return cache_.stats(); }

	double round_jd(double jd_utc) const;

  private:
	using Key=std::pair<long long,int>;

	std::unique_ptr<EphSrc> primary_;
	std::unique_ptr<EphSrc> fallback_;
	double res_sec_;
	std::ostream*log_;
	std::atomic<bool> noted_{false};
	LruCache<Key,PosSet> cache_;

	PosSet compute(double jd_utc,Frame frame);
};

// Precise source with mean-element fallback when the kernel loads, mean
// elements alone otherwise.
std::unique_ptr<EphProvider> open_src(const EphOpts&opts,std::ostream*log);

// Whole-sign house of a longitude, 1..12.
int whole_house(double lon,double asc);

// Tropical ascendant for a UTC instant and place, degrees.
double calc_asc(double jd_utc,double lat,double lon);
