#pragma once

#include <string>
#include <vector>

#include "geo_data.hpp"

class IDataset {
    public:
        virtual ~IDataset() {}
        virtual void add_property(std::string pid, std::string address, LatLon location) = 0;
        virtual void add_road(std::string id, std::vector<LatLon> points) = 0;
        virtual size_t num_properties() const = 0;
        virtual size_t num_roads() const = 0;
};

class Dataset : public IDataset {
    public:
        void add_property(std::string pid, std::string address, LatLon location) override;
        void add_road(std::string id, std::vector<LatLon> points) override;
        size_t num_properties() const override;
        size_t num_roads() const override;

        const std::vector<Property>& properties() const;
        const std::vector<Road>& roads() const;

        void set_properties(std::vector<Property> properties);

    private:
        std::vector<Property> _properties;
        std::vector<Road> _roads;
};
