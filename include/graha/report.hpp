#pragma once

#include<iosfwd>
#include<optional>
#include<string>
#include<vector>

#include "graha/aspects.hpp"
#include "graha/bodies.hpp"
#include "graha/dasha.hpp"
#include "graha/js_writer.hpp"
#include "graha/nakshatra.hpp"
#include "graha/strength.hpp"

// Text (key=value lines) and JSON renderings of the computation results.

void txt_head(std::ostream&os,const std::string&type);

void write_meta(JsonWriter&w,const std::string&type,const std::string&ephem);

void pos_txt(std::ostream&os,const PosSet&ps,const std::optional<double>&asc,
			 const std::string&tz);
void pos_json(JsonWriter&w,const PosSet&ps,const std::optional<double>&asc,
			  const std::string&tz);

void nak_txt(std::ostream&os,const NakInfo&n);
void nak_json(JsonWriter&w,const NakInfo&n);

void dasha_txt(std::ostream&os,const DashaTree&t,const std::string&tz);
void dasha_json(JsonWriter&w,const DashaTree&t,const std::string&tz);

void trans_txt(std::ostream&os,const std::vector<DashaTrans>&tr,
			   const std::string&tz);
void trans_json(JsonWriter&w,const std::vector<DashaTrans>&tr,
				const std::string&tz);

void impact_txt(std::ostream&os,const ImpactCmp&c);
void impact_json(JsonWriter&w,const ImpactCmp&c);

void str_txt(std::ostream&os,const StrengthSet&s);
void str_json(JsonWriter&w,const StrengthSet&s);

void asp_txt(std::ostream&os,const std::vector<AspectEvent>&evs,
			 const std::string&tz);
void asp_json(JsonWriter&w,const std::vector<AspectEvent>&evs,
			  const std::string&tz);

void pulse_txt(std::ostream&os,const Pulse&p,const std::string&prefix);
void pulse_json(JsonWriter&w,const Pulse&p);

void dpulse_txt(std::ostream&os,const std::vector<DayPulse>&days,
				const std::vector<PeakWindow>&peaks,const Shift&sh,
				const std::string&tz);
void dpulse_json(JsonWriter&w,const std::vector<DayPulse>&days,
				 const std::vector<PeakWindow>&peaks,const Shift&sh,
				 const std::string&tz);
