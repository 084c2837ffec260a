#include <algorithm>
#include <thread>
#include <easylogging++.h>

#include "proximity.hpp"
#include "testimpls.hpp"

using namespace std;



namespace ProxNet
{


string TestConfig::ExecPath("UNINITIALIZED");

bool TestConfig::isTestMode() const             { return testMode; }
const std::string& TestConfig::logPath() const  { return _logPath; }
const std::string& TestConfig::dbPath() const   { return _dbPath; }
TcpPort TestConfig::servicePort() const         { return port; }
size_t TestConfig::threadCount() const          { return 1; }

size_t TestConfig::rateLimitMaxRequests() const             { return rateLimit; }
std::chrono::milliseconds TestConfig::queryTimeout() const  { return chrono::seconds(2); }



TestClock::TestClock(Timestamp start) : _now( make_shared<Timestamp>(start) ) {}

Clock TestClock::clock() const
{
    shared_ptr<Timestamp> now = _now;
    return [now] { return *now; };
}

Timestamp TestClock::now() const
    { return *_now; }

void TestClock::advance(chrono::milliseconds elapsed)
    { *_now += elapsed; }



static bool IsCandidate(const UserRecord &user, const UserId &excludedId)
{
    return user.id() != excludedId &&
        user.discovery().isDiscoverable() && user.discovery().isActive();
}


void InMemorySignalStore::Store(const UserRecord &user)
{
    _users.erase( user.id() );
    _users.emplace( user.id(), user );
}


shared_ptr<UserRecord> InMemorySignalStore::Load(const UserId &userId) const
{
    ++loadCount;
    auto it = _users.find(userId);
    if ( it == _users.end() )
        { return shared_ptr<UserRecord>(); }
    return make_shared<UserRecord>(it->second);
}


static UserRecord& FindExisting(map<UserId, UserRecord> &users, const UserId &userId)
{
    auto it = users.find(userId);
    if ( it == users.end() )
        { throw ProximityError(ErrorCode::ERROR_NOT_FOUND, "Unknown user " + userId); }
    return it->second;
}


void InMemorySignalStore::UpdateGpsSignal(const UserId &userId, const GpsSignal &signal)
{
    UserRecord &user = FindExisting(_users, userId);
    user.gpsSignal( make_shared<GpsSignal>(signal) );
    user.lastSeen( signal.updatedAt() );
}

void InMemorySignalStore::UpdateWifiSignal(const UserId &userId, const WifiSignal &signal)
{
    UserRecord &user = FindExisting(_users, userId);
    user.wifiSignal( make_shared<WifiSignal>(signal) );
    user.lastSeen( signal.updatedAt() );
}

void InMemorySignalStore::UpdateBluetoothSignal(const UserId &userId, const BluetoothSignal &signal)
{
    UserRecord &user = FindExisting(_users, userId);
    user.bluetoothSignal( make_shared<BluetoothSignal>(signal) );
    user.lastSeen( signal.updatedAt() );
}

void InMemorySignalStore::UpdateDiscoverability(const UserId &userId, bool discoverable, uint32_t rangeMeters)
{
    UserRecord &user = FindExisting(_users, userId);
    user.discovery().discoverable(discoverable);
    user.discovery().rangeMeters(rangeMeters);
}


vector<UserRecord> InMemorySignalStore::GetUsersNearLocation(const GpsLocation &center,
    Distance radiusMeters, const UserId &excludedId, size_t maxCount) const
{
    ++candidateQueries;
    vector< pair<Distance, UserRecord> > found;
    for (const auto &entry : _users)
    {
        const UserRecord &user = entry.second;
        if ( ! IsCandidate(user, excludedId) || ! user.gpsSignal() )
            { continue; }
        Distance distance = HaversineDistanceMeters( center, user.gpsSignal()->location() );
        if (distance <= radiusMeters)
            { found.push_back( make_pair(distance, user) ); }
    }

    stable_sort( found.begin(), found.end(),
        [] (const pair<Distance, UserRecord> &one, const pair<Distance, UserRecord> &other)
            { return one.first < other.first; } );

    vector<UserRecord> result;
    for (size_t idx = 0; idx < found.size() && idx < maxCount; ++idx)
        { result.push_back( found[idx].second ); }
    return result;
}


static vector<UserRecord> LatestFirst(vector<UserRecord> &&users, Channel channel, size_t maxCount)
{
    stable_sort( users.begin(), users.end(), [channel] (const UserRecord &one, const UserRecord &other)
        { return *other.signalUpdatedAt(channel) < *one.signalUpdatedAt(channel); } );
    if ( users.size() > maxCount )
        { users.erase( users.begin() + maxCount, users.end() ); }
    return users;
}


vector<UserRecord> InMemorySignalStore::GetUsersOnNetwork(const DeviceId &networkId,
    Timestamp freshSince, const UserId &excludedId, size_t maxCount) const
{
    ++candidateQueries;
    vector<UserRecord> found;
    for (const auto &entry : _users)
    {
        const UserRecord &user = entry.second;
        shared_ptr<WifiSignal> wifi = user.wifiSignal();
        if ( IsCandidate(user, excludedId) && wifi && wifi->id() == networkId && wifi->updatedAt() >= freshSince )
            { found.push_back(user); }
    }
    return LatestFirst( move(found), Channel::Wifi, maxCount );
}


vector<UserRecord> InMemorySignalStore::GetUsersWithDevices(const vector<DeviceId> &deviceIds,
    Timestamp freshSince, const UserId &excludedId, size_t maxCount) const
{
    ++candidateQueries;
    vector<UserRecord> found;
    for (const auto &entry : _users)
    {
        const UserRecord &user = entry.second;
        shared_ptr<BluetoothSignal> bluetooth = user.bluetoothSignal();
        if ( IsCandidate(user, excludedId) && bluetooth && bluetooth->updatedAt() >= freshSince &&
             find( deviceIds.begin(), deviceIds.end(), bluetooth->id() ) != deviceIds.end() )
            { found.push_back(user); }
    }
    return LatestFirst( move(found), Channel::Bluetooth, maxCount );
}



void InMemoryRelationshipOracle::AddFriendship(const UserId &one, const UserId &other)
{
    _friendships.insert( make_pair(one, other) );
    _friendships.insert( make_pair(other, one) );
}

void InMemoryRelationshipOracle::AddFriendRequest(const UserId &senderId, const UserId &receiverId)
    { _pendingRequests.insert( make_pair(senderId, receiverId) ); }

bool InMemoryRelationshipOracle::IsFriend(const UserId &requesterId, const UserId &candidateId) const
    { return _friendships.find( make_pair(requesterId, candidateId) ) != _friendships.end(); }

bool InMemoryRelationshipOracle::HasPendingRequest(const UserId &senderId, const UserId &receiverId) const
    { return _pendingRequests.find( make_pair(senderId, receiverId) ) != _pendingRequests.end(); }



static ProximityError Unreachable()
    { return ProximityError(ErrorCode::ERROR_UPSTREAM, "Database is locked: /var/lib/proxnet/users.sqlite"); }

shared_ptr<UserRecord> FailingSignalStore::Load(const UserId&) const
    { throw Unreachable(); }

void FailingSignalStore::UpdateGpsSignal(const UserId&, const GpsSignal&)
    { throw Unreachable(); }
void FailingSignalStore::UpdateWifiSignal(const UserId&, const WifiSignal&)
    { throw Unreachable(); }
void FailingSignalStore::UpdateBluetoothSignal(const UserId&, const BluetoothSignal&)
    { throw Unreachable(); }
void FailingSignalStore::UpdateDiscoverability(const UserId&, bool, uint32_t)
    { throw Unreachable(); }

vector<UserRecord> FailingSignalStore::GetUsersNearLocation(const GpsLocation&,
    Distance, const UserId&, size_t) const
    { throw Unreachable(); }
vector<UserRecord> FailingSignalStore::GetUsersOnNetwork(const DeviceId&,
    Timestamp, const UserId&, size_t) const
    { throw Unreachable(); }
vector<UserRecord> FailingSignalStore::GetUsersWithDevices(const vector<DeviceId>&,
    Timestamp, const UserId&, size_t) const
    { throw Unreachable(); }




DelayedResponseDispatcher::DelayedResponseDispatcher(chrono::milliseconds delay) :
    _delay(delay) {}

unique_ptr<proxnet::protocol::Response> DelayedResponseDispatcher::Dispatch(unique_ptr<proxnet::protocol::Request> &&)
{
    this_thread::sleep_for(_delay);
    return unique_ptr<proxnet::protocol::Response>( new proxnet::protocol::Response() );
}


} // namespace ProxNet
