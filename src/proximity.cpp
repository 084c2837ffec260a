#include <algorithm>
#include <cmath>

#include "proximity.hpp"

using namespace std;



namespace ProxNet
{


const Distance EARTH_RADIUS_METERS = 6371000.;

static const double PI = 3.14159265358979323846;

static const double   BLUETOOTH_TX_POWER_DBM    = 0.;
static const double   BLUETOOTH_PATH_LOSS_EXP   = 2.;
static const Distance BLUETOOTH_MIN_DISTANCE    = 0.1;
static const Distance BLUETOOTH_MAX_DISTANCE    = 100.;


static double ToRadians(GpsCoordinate degrees)
    { return degrees * PI / 180.; }


Distance HaversineDistanceMeters(const GpsLocation &one, const GpsLocation &other)
{
    double lat1 = ToRadians( one.latitude() );
    double lat2 = ToRadians( other.latitude() );
    double deltaLat = lat2 - lat1;
    double deltaLon = ToRadians( other.longitude() - one.longitude() );

    double sinHalfLat = sin(deltaLat / 2);
    double sinHalfLon = sin(deltaLon / 2);
    double a = sinHalfLat * sinHalfLat +
               cos(lat1) * cos(lat2) * sinHalfLon * sinHalfLon;
    // Rounding may push a slightly above 1 for antipodal points
    a = min(1., max(0., a));
    double c = 2 * atan2( sqrt(a), sqrt(1 - a) );
    return EARTH_RADIUS_METERS * c;
}


Distance EstimateBluetoothDistanceMeters(int32_t rssiDbm)
{
    Distance estimate = pow( 10., (BLUETOOTH_TX_POWER_DBM - rssiDbm) / (10. * BLUETOOTH_PATH_LOSS_EXP) );
    return min( BLUETOOTH_MAX_DISTANCE, max(BLUETOOTH_MIN_DISTANCE, estimate) );
}


} // namespace ProxNet
