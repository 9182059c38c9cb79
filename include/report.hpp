#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "geo_data.hpp"
#include "facing_analyzer.hpp"

static constexpr const char* REPORT_HEADER = "PID,Address,RoadID,Distance,Facing,Status";

std::string csv_escape(const std::string& field);
std::vector<std::string> split_csv_line(const std::string& line);

void write_report_csv(const std::vector<FacingResult>& results, DistanceUnits units, std::ostream& out);
std::string report_csv_string(const std::vector<FacingResult>& results, DistanceUnits units);

// Properties table with at least the columns PID, Address, Latitude and
// Longitude, in any order. Throws std::runtime_error naming the offending line.
std::vector<Property> read_properties_csv(std::istream& in);
std::vector<Property> load_properties_csv(const std::string& path);
