#ifndef __PROXNET_PROXIMITY_H__
#define __PROXNET_PROXIMITY_H__

#include "basic.hpp"



namespace ProxNet
{


// Mean earth radius used by all great-circle calculations
extern const Distance EARTH_RADIUS_METERS;


// Great-circle distance between two points using the Haversine formula.
Distance HaversineDistanceMeters(const GpsLocation &one, const GpsLocation &other);


// Rough distance from a received signal strength with a log-distance path loss model
// (reference power 0 dBm, path loss exponent 2), clamped into [0.1m, 100m].
// Advisory only, it never influences candidate selection.
Distance EstimateBluetoothDistanceMeters(int32_t rssiDbm);


} // namespace ProxNet


#endif // __PROXNET_PROXIMITY_H__
