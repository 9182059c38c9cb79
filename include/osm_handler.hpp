#pragma once

#include <optional>
#include <string>

#include <osmium/handler.hpp>
#include <osmium/io/any_input.hpp>
#include <osmium/osm/area.hpp>

#include "idataset.hpp"
#include "geo_data.hpp"

class OSMHandler : public osmium::handler::Handler {
    public:
        explicit OSMHandler(IDataset& dataset);

        static bool is_building(const osmium::TagList& tags);
        static bool is_road(const osmium::TagList& tags);

        static const char* get_street_name(const osmium::TagList& tags);
        static std::optional<std::string> get_address(const osmium::TagList& tags);

        void node(const osmium::Node& node);
        void way(const osmium::Way& way);
        void area(const osmium::Area& area);

    private:
        IDataset& _dataset;

        std::optional<LatLon> compute_centroid(const osmium::Area& area);
};
