#pragma once            // includes this header only once per compilation (prevents redef)
#include <cstdint>      // fixed-width int types
#include <cmath>

namespace swg{          // this will help avoid conflicts

//Struct of 3D vector for accel (G) and rotation rate (rad/s)
struct Vec3 {
    float x=0, y=0, z=0;
};

inline float norm(const Vec3& v) {return std::sqrt(v.x*v.x + v.y*v.y + v.z*v.z);}

// one sensor tick, timestamps stay as delivered by the hardware
struct MotionSample {
    uint64_t t_us = 0;      // timestamp (microsecs)
    Vec3 acc;               // user acceleration (G)
    Vec3 rot;               // rotation rate (rad/s)

    float magnitude() const {return norm(acc);}
    float rotation_magnitude() const {return norm(rot);}
};

// result codes for the operations that can fail
enum class Status : uint8_t {
    Ok = 0,
    SensorUnavailable = 1,
    InvalidState = 2
};

const char* status_name(Status s);

// errors reported by the sensor stream alongside samples
struct SensorError {
    enum class Kind : uint8_t {Transient, Fault} kind = Kind::Fault;
    int code = 0;
};

struct GeoPoint {
    double lat = 0.0;
    double lon = 0.0;
};

// great circle distance in meters
double distance_m(const GeoPoint& a, const GeoPoint& b);

inline double us_to_s(uint64_t us) {return double(us) / 1e6;}
inline uint64_t s_to_us(double s) {return s <= 0.0 ? 0 : static_cast<uint64_t>(s * 1e6 + 0.5);}

} // namespace swg
