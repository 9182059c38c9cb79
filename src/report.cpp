#include "report.hpp"
#include "geometry.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;

    std::string escaped = "\"";
    for (char c : field) {
        if (c == '"') escaped += '"';
        escaped += c;
    }
    escaped += '"';
    return escaped;
}

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;

    for (size_t i = 0; i < line.size(); i++) {
        char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field += '"';
                    i++;
                } else {
                    quoted = false;
                }
            } else {
                field += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(std::move(field));
            field.clear();
        } else if (c != '\r') {
            field += c;
        }
    }

    if (quoted) throw std::runtime_error("unterminated quoted field");
    fields.push_back(std::move(field));
    return fields;
}

void write_report_csv(const std::vector<FacingResult>& results, DistanceUnits units, std::ostream& out) {
    out << REPORT_HEADER << "\n";
    out << std::fixed << std::setprecision(units == DistanceUnits::Degrees ? 8 : 2);

    for (const auto& result : results) {
        out << csv_escape(result.pid) << ","
            << csv_escape(result.address) << ",";

        if (result.status == FacingStatus::NoRoadFound) {
            out << ",,,";
        } else {
            out << csv_escape(result.road_id) << ","
                << result.distance << ","
                << result.label << ",";
        }
        out << facing_status_name(result.status) << "\n";
    }
}

std::string report_csv_string(const std::vector<FacingResult>& results, DistanceUnits units) {
    std::ostringstream out;
    write_report_csv(results, units, out);
    return out.str();
}

static double parse_coordinate(const std::string& value, const char* column, size_t line_number) {
    const char* begin = value.c_str();
    char* end = nullptr;
    errno = 0;
    double result = std::strtod(begin, &end);

    if (end == begin || *end != '\0' || errno == ERANGE || !std::isfinite(result)) {
        throw std::runtime_error("Line " + std::to_string(line_number) + ": invalid " + column + " '" + value + "'");
    }
    return result;
}

std::vector<Property> read_properties_csv(std::istream& in) {
    std::vector<Property> properties;
    std::string line;
    size_t line_number = 0;

    if (!std::getline(in, line)) return properties;
    line_number++;

    std::unordered_map<std::string, size_t> columns;
    std::vector<std::string> header = split_csv_line(line);
    for (size_t i = 0; i < header.size(); i++) {
        columns[header[i]] = i;
    }

    const char* required[] = {"PID", "Address", "Latitude", "Longitude"};
    for (const char* name : required) {
        if (!columns.count(name)) {
            throw std::runtime_error(std::string("Properties table is missing column ") + name);
        }
    }
    const size_t pid_col = columns["PID"];
    const size_t address_col = columns["Address"];
    const size_t lat_col = columns["Latitude"];
    const size_t lon_col = columns["Longitude"];

    while (std::getline(in, line)) {
        line_number++;
        if (line.empty() || line == "\r") continue;

        std::vector<std::string> fields;
        try {
            fields = split_csv_line(line);
        } catch (const std::runtime_error& e) {
            throw std::runtime_error("Line " + std::to_string(line_number) + ": " + e.what());
        }
        if (fields.size() != header.size()) {
            throw std::runtime_error("Line " + std::to_string(line_number) + ": expected " +
                                     std::to_string(header.size()) + " fields, got " + std::to_string(fields.size()));
        }

        double lat = parse_coordinate(fields[lat_col], "latitude", line_number);
        double lon = parse_coordinate(fields[lon_col], "longitude", line_number);
        if (!is_valid_coordinate(lat, lon)) {
            throw std::runtime_error("Line " + std::to_string(line_number) + ": coordinate out of range");
        }

        properties.emplace_back(fields[pid_col], fields[address_col], LatLon(lat, lon));
    }

    return properties;
}

std::vector<Property> load_properties_csv(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Cannot open properties file " + path);
    }
    return read_properties_csv(ifs);
}
