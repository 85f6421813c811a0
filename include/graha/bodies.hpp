#pragma once

#include<array>
#include<cstddef>
#include<string>

enum class Body{
	SUN,
	MOON,
	MERCURY,
	VENUS,
	MARS,
	JUPITER,
	SATURN,
	URANUS,
	NEPTUNE,
	PLUTO,
	RAHU,
	KETU
};

constexpr std::size_t BODY_CNT=12;

extern const std::array<Body,BODY_CNT> ALL_BODIES;

enum class Frame{ TROPICAL,SIDEREAL };

enum class Accuracy{ PRECISE,APPROXIMATE };

std::string body_name(Body b);

// Case-insensitive; throws std::invalid_argument for unknown names.
Body parse_body(const std::string&name);

std::string frame_name(Frame f);

Frame parse_frame(const std::string&name);

std::string acc_name(Accuracy a);

inline std::size_t body_idx(Body b){ return static_cast<std::size_t>(b); }

// Fast movers use the tighter orb column.
bool is_fast(Body b);

struct BodyPos{
	Body body=Body::SUN;
	double lon=0.0;
	double lat=0.0;
	double speed=0.0;
	bool retro=false;
	Frame frame=Frame::TROPICAL;
	Accuracy acc=Accuracy::PRECISE;
};

struct PosSet{
	double jd_utc=0.0;
	Frame frame=Frame::TROPICAL;
	Accuracy acc=Accuracy::PRECISE;
	double ayan=0.0;
	std::array<BodyPos,BODY_CNT> pos;

	const BodyPos&at(Body b) const{ return pos[body_idx(b)]; }
	BodyPos&at(Body b){ return pos[body_idx(b)]; }
};

// Zodiac signs, 0=Aries .. 11=Pisces.
int sign_of(double lon);

std::string sign_name(int sign);

std::string vedic_sign(int sign);

Body sign_lord(int sign);
