#include "swg/types.hpp"
#include <algorithm>
#include <cmath>

#ifndef SWG_PI
constexpr double SWG_PI = 3.14159265358979323846;
#endif

namespace swg {

const char* status_name(Status s){
    switch (s)
    {
    case Status::Ok: return "ok";
    case Status::SensorUnavailable: return "sensor unavailable";
    case Status::InvalidState: return "invalid state";
    default: return "?";
    }
}

double distance_m(const GeoPoint& a, const GeoPoint& b){
    constexpr double R = 6371000.0;     //mean earth radius (m)
    const double to_rad = SWG_PI / 180.0;

    const double dlat = (b.lat - a.lat) * to_rad;
    const double dlon = (b.lon - a.lon) * to_rad;
    const double s1 = std::sin(dlat * 0.5);
    const double s2 = std::sin(dlon * 0.5);

    //haversine
    double h = s1*s1 + std::cos(a.lat*to_rad) * std::cos(b.lat*to_rad) * s2*s2;
    h = std::min(1.0, std::max(0.0, h));
    return 2.0 * R * std::asin(std::sqrt(h));
}

}   //namespace swg
