#include "physics/environment/standard_atmosphere.hpp"
#include <cmath>

namespace std_atmosphere {
namespace environment {

const std::vector<AtmosphereLayer> StandardAtmosphere::kLayers = {
    // z_base [ft], z_top [ft], T law, T_base [R], lapse [R/ft], lnP law, a, b, c
    {      0.0,    36151.725, TemperatureLaw::Linear,   518.0,   -0.003559996,
       PressureLaw::Logarithmic,  7.657389,  5.2561258,      -6.8634634e-6},   // troposphere
    {  36151.725,  82344.678, TemperatureLaw::Constant, 389.988,  0.0,
       PressureLaw::Linear,       6.158411, -4.77916918e-5,   0.0},            // tropopause
    {  82344.678, 155347.756, TemperatureLaw::Linear,   389.988,  0.0016273286,
       PressureLaw::Logarithmic,  3.950775, -11.3882724,      4.17276598e-6},  // stratosphere
    { 155347.756, 175346.171, TemperatureLaw::Constant, 508.788,  0.0,
       PressureLaw::Linear,       0.922461, -3.62635373e-5,   0.0},            // stratopause
    { 175346.171, 249000.304, TemperatureLaw::Linear,   508.788, -0.0020968273,
       PressureLaw::Logarithmic,  0.197235,  8.7602095,      -4.12122002e-6},  // mesosphere
    { 249000.304, 299515.564, TemperatureLaw::Constant, 354.348,  0.0,
       PressureLaw::Linear,      -2.971785, -5.1533546650e-5, 0.0}             // mesopause
};

double AtmosphereLayer::temperature(double altitude_ft) const {
    if (temperature_law == TemperatureLaw::Constant) {
        return base_temperature;
    }
    return base_temperature + lapse_rate * (altitude_ft - base_altitude);
}

double AtmosphereLayer::log_pressure(double altitude_ft) const {
    double dz = altitude_ft - base_altitude;
    if (pressure_law == PressureLaw::Linear) {
        return log_pressure_base + log_pressure_slope * dz;
    }
    return log_pressure_base + log_pressure_slope * std::log(1.0 + log_pressure_scale * dz);
}

std::size_t StandardAtmosphere::layer_index(double altitude_ft) {
    // Last layer whose base is <= z; the top layer also covers extrapolation
    std::size_t idx = 0;
    for (std::size_t i = 0; i + 1 < kLayers.size(); ++i) {
        if (altitude_ft >= kLayers[i + 1].base_altitude) idx = i + 1; else break;
    }
    return idx;
}

double StandardAtmosphere::temperature(double altitude_ft) {
    return kLayers[layer_index(altitude_ft)].temperature(altitude_ft);
}

double StandardAtmosphere::pressure(double altitude_ft) {
    return std::exp(kLayers[layer_index(altitude_ft)].log_pressure(altitude_ft));
}

} // namespace environment
} // namespace std_atmosphere
