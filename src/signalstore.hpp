#ifndef __PROXNET_SIGNAL_STORE_H__
#define __PROXNET_SIGNAL_STORE_H__

#include <chrono>
#include <memory>
#include <mutex>
#include <sqlite3.h>
#include <vector>

#include "userdata.hpp"



namespace ProxNet
{



// Durable per-user storage of the latest positioning signals and discoverability settings.
// Signal updates are single-row overwrites, last write wins.
// Candidate queries only return users that are discoverable, active and not the excluded requester.
class ISignalStore
{
public:

    virtual ~ISignalStore() {}

    virtual std::shared_ptr<UserRecord> Load(const UserId &userId) const = 0;

    // Overwrite the signal of a single channel and refresh lastSeen of the user.
    // Throw ERROR_NOT_FOUND if the user does not exist.
    virtual void UpdateGpsSignal(const UserId &userId, const GpsSignal &signal) = 0;
    virtual void UpdateWifiSignal(const UserId &userId, const WifiSignal &signal) = 0;
    virtual void UpdateBluetoothSignal(const UserId &userId, const BluetoothSignal &signal) = 0;
    virtual void UpdateDiscoverability(const UserId &userId, bool discoverable, uint32_t rangeMeters) = 0;

    // Point-radius lookup, may return users slightly beyond the radius
    // but never misses one inside it. Ordered by distance from center.
    virtual std::vector<UserRecord> GetUsersNearLocation(const GpsLocation &center,
        Distance radiusMeters, const UserId &excludedId, size_t maxCount) const = 0;

    // Exact network id match with a WiFi signal not older than freshSince, latest first.
    virtual std::vector<UserRecord> GetUsersOnNetwork(const DeviceId &networkId,
        Timestamp freshSince, const UserId &excludedId, size_t maxCount) const = 0;

    // Bluetooth device id within the given set with a signal not older than freshSince, latest first.
    virtual std::vector<UserRecord> GetUsersWithDevices(const std::vector<DeviceId> &deviceIds,
        Timestamp freshSince, const UserId &excludedId, size_t maxCount) const = 0;
};



// Read-only view of the social graph owned by another service.
class IRelationshipOracle
{
public:

    virtual ~IRelationshipOracle() {}

    // True if requesterId is in the friend list of candidateId
    virtual bool IsFriend(const UserId &requesterId, const UserId &candidateId) const = 0;
    // Directional: true if senderId has a pending friend request sent to receiverId
    virtual bool HasPendingRequest(const UserId &senderId, const UserId &receiverId) const = 0;
};



// Signal store and relationship oracle implementation that uses the SpatiaLite embedded SQL engine.
// All operations are serialized on a single connection and bounded by a query deadline.
class SpatiaLiteUserDatabase : public ISignalStore, public IRelationshipOracle
{
    sqlite3     *_dbHandle;
    void        *_spatialiteConnection;

    std::chrono::milliseconds _queryTimeout;
    mutable std::chrono::steady_clock::time_point _deadline;
    mutable std::mutex _mutex;

    static int DeadlineProgressHandler(void *context);
    void ArmDeadline() const;

    sqlite3_stmt* PrepareStatement(const std::string &sql) const;
    void RunStatement(sqlite3_stmt *statement, const std::string &operation) const;
    std::vector<UserRecord> QueryUsers(sqlite3_stmt *statement) const;
    bool QueryExists(const std::string &sql, const std::string &first, const std::string &second) const;
    void UpdateRadioSignal(const std::string &idColumn, const std::string &timeColumn,
                           const UserId &userId, const RadioSignal &signal);
    void InsertPair(const std::string &sql, const std::string &first, const std::string &second);

public:

    static const std::string IN_MEMORY_DB;

    SpatiaLiteUserDatabase(const std::string &dbPath, std::chrono::milliseconds queryTimeout);
    virtual ~SpatiaLiteUserDatabase();

    std::shared_ptr<UserRecord> Load(const UserId &userId) const override;

    void UpdateGpsSignal(const UserId &userId, const GpsSignal &signal) override;
    void UpdateWifiSignal(const UserId &userId, const WifiSignal &signal) override;
    void UpdateBluetoothSignal(const UserId &userId, const BluetoothSignal &signal) override;
    void UpdateDiscoverability(const UserId &userId, bool discoverable, uint32_t rangeMeters) override;

    std::vector<UserRecord> GetUsersNearLocation(const GpsLocation &center,
        Distance radiusMeters, const UserId &excludedId, size_t maxCount) const override;
    std::vector<UserRecord> GetUsersOnNetwork(const DeviceId &networkId,
        Timestamp freshSince, const UserId &excludedId, size_t maxCount) const override;
    std::vector<UserRecord> GetUsersWithDevices(const std::vector<DeviceId> &deviceIds,
        Timestamp freshSince, const UserId &excludedId, size_t maxCount) const override;

    bool IsFriend(const UserId &requesterId, const UserId &candidateId) const override;
    bool HasPendingRequest(const UserId &senderId, const UserId &receiverId) const override;

    // Profile and social graph data is owned by other services, these are used
    // to import their data and to create test fixtures.
    void Store(const UserRecord &user);
    void AddFriendship(const UserId &one, const UserId &other);
    void AddFriendRequest(const UserId &senderId, const UserId &receiverId);
};



} // namespace ProxNet


#endif // __PROXNET_SIGNAL_STORE_H__
