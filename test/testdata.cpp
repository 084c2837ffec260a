#include "testdata.hpp"

using namespace std;



namespace ProxNet
{


static UserDisplayInfo Display(const string &username, const string &firstName,
                               const string &lastName, uint16_t age)
{
    UserDisplayInfo result;
    result.username         = username;
    result.firstName        = firstName;
    result.lastName         = lastName;
    result.profilePicture   = "https://img.example.com/" + username + ".png";
    result.bio              = "Hi, I am " + firstName;
    result.interests        = { "hiking", "music" };
    result.age              = age;
    result.isOnline         = true;
    result.lastSeen         = FromUnixMillis(1700000000000);
    return result;
}


GpsLocation TestData::NewYork(40.7128, -74.0060);
GpsLocation TestData::NearNewYork(40.7300, -74.0000);
GpsLocation TestData::FarNewYork(40.7800, -73.9700);
GpsLocation TestData::London(51.5074, -0.1278);

DeviceId TestData::HomeNetwork("AA:BB:CC:DD:EE:01");
DeviceId TestData::OfficeNetwork("AA:BB:CC:DD:EE:02");
DeviceId TestData::AlicePhone("11:22:33:44:55:01");
DeviceId TestData::BobPhone("11:22:33:44:55:02");
DeviceId TestData::CarolPhone("11:22:33:44:55:03");

Timestamp TestData::Now( FromUnixMillis(1700000000000) );

UserRecord TestData::Alice( "alice", Display("alice", "Alice", "Smith", 28),
    DiscoverabilityProfile( true, true, 5000, PrivacySettings(true, true, true) ) );
UserRecord TestData::Bob( "bob", Display("bob", "Bob", "Jones", 31),
    DiscoverabilityProfile( true, true, 5000, PrivacySettings(true, true, true) ) );
UserRecord TestData::Carol( "carol", Display("carol", "Carol", "White", 25),
    DiscoverabilityProfile( true, true, 5000, PrivacySettings(false, false, false) ) );
UserRecord TestData::Dave( "dave", Display("dave", "Dave", "Brown", 40),
    DiscoverabilityProfile( false, true, 5000, PrivacySettings(true, true, true) ) );
UserRecord TestData::Erin( "erin", Display("erin", "Erin", "Green", 0),
    DiscoverabilityProfile( true, false, 5000, PrivacySettings(true, true, true) ) );


} // namespace ProxNet
