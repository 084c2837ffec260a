#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>

#include <easylogging++.h>
#include <sqlite3.h>
#include <spatialite.h>

#include "proximity.hpp"
#include "signalstore.hpp"

using namespace std;



namespace ProxNet
{


const string SpatiaLiteUserDatabase::IN_MEMORY_DB = ":memory:";

// Number of virtual machine instructions between two deadline checks
static const int PROGRESS_HANDLER_PERIOD = 1000;

// SpatiaLite measures on the WGS84 ellipsoid while candidates are matched with
// the spherical Haversine formula, the two differ by less than 1%
static const double PREFILTER_TOLERANCE = 1.01;
static const double BOUNDING_BOX_TOLERANCE = 1.02;
static const double DEGREES_PER_RADIAN = 180. / 3.14159265358979323846;

const vector<string> DatabaseInitCommands = {
"BEGIN TRANSACTION;",
    "SELECT InitSpatialMetadata();",

    "CREATE TABLE IF NOT EXISTS metainfo ( "
    "  key   TEXT PRIMARY KEY, "
    "  value TEXT NOT NULL "
    ");",

    "INSERT OR IGNORE INTO metainfo (key, value) "
    "  VALUES ('version', '1');",

    "CREATE TABLE IF NOT EXISTS users ( "
    "  id                 TEXT PRIMARY KEY, "
    "  username           TEXT NOT NULL, "
    "  firstName          TEXT NOT NULL DEFAULT '', "
    "  lastName           TEXT NOT NULL DEFAULT '', "
    "  profilePicture     TEXT NOT NULL DEFAULT '', "
    "  bio                TEXT NOT NULL DEFAULT '', "
    "  interests          TEXT NOT NULL DEFAULT '', " // newline separated list
    "  age                INT NOT NULL DEFAULT 0, "
    "  isOnline           INT NOT NULL DEFAULT 0, "
    "  lastSeen           INT NOT NULL DEFAULT 0, "   // all timestamps are Unix time in milliseconds
    "  isDiscoverable     INT NOT NULL DEFAULT 1, "
    "  isActive           INT NOT NULL DEFAULT 1, "
    "  discoveryRange     INT NOT NULL DEFAULT 5000, "
    "  showAge            INT NOT NULL DEFAULT 1, "
    "  showLocation       INT NOT NULL DEFAULT 1, "
    "  showLastSeen       INT NOT NULL DEFAULT 1, "
    "  gpsLocation        POINT, "
    "  gpsLatitude        REAL, "
    "  gpsLongitude       REAL, "
    "  gpsUpdatedAt       INT, "
    "  wifiNetworkId      TEXT, "
    "  wifiUpdatedAt      INT, "
    "  bluetoothDeviceId  TEXT, "
    "  bluetoothUpdatedAt INT "
    ");",

    "CREATE INDEX IF NOT EXISTS users_gps ON users (gpsLatitude, gpsLongitude);",
    "CREATE INDEX IF NOT EXISTS users_wifi ON users (wifiNetworkId, wifiUpdatedAt);",
    "CREATE INDEX IF NOT EXISTS users_bluetooth ON users (bluetoothDeviceId, bluetoothUpdatedAt);",

    "CREATE TABLE IF NOT EXISTS friendships ( "
    "  userId       TEXT NOT NULL, "
    "  friendId     TEXT NOT NULL, "
    "  PRIMARY KEY(userId, friendId) "
    ");",

    "CREATE TABLE IF NOT EXISTS friend_requests ( "
    "  senderId     TEXT NOT NULL, "
    "  receiverId   TEXT NOT NULL, "
    "  PRIMARY KEY(senderId, receiverId) "
    ");",

"END TRANSACTION;" };


static const string USER_COLUMNS =
    "id, username, firstName, lastName, profilePicture, bio, interests, age, isOnline, lastSeen, "
    "isDiscoverable, isActive, discoveryRange, showAge, showLocation, showLastSeen, "
    "gpsLatitude, gpsLongitude, gpsUpdatedAt, wifiNetworkId, wifiUpdatedAt, "
    "bluetoothDeviceId, bluetoothUpdatedAt ";

static const string DISCOVERABLE_CONDITION =
    "isDiscoverable = 1 AND isActive = 1 ";



bool FileExist(const string &fileName)
{
    ifstream fileStream(fileName);
    return fileStream.good();
}


void ExecuteSql(sqlite3 *dbHandle, const string &sql)
{
    char *errorMessage = nullptr;
    int execResult = sqlite3_exec( dbHandle, sql.c_str(), nullptr, nullptr, &errorMessage );
    scope_exit freeMsg( [&errorMessage] { sqlite3_free(errorMessage); } );
    if (execResult != SQLITE_OK)
    {
        LOG(ERROR) << "Failed to execute command: " << sql;
        LOG(ERROR) << "Error was: " << ( errorMessage ? errorMessage : "unknown" );
        throw ProximityError(ErrorCode::ERROR_INTERNAL, "Failed to initialize signal store");
    }
}


// Timeouts and engine failures are reported as upstream problems, the caller may retry.
ProximityError StoreFailure(sqlite3 *dbHandle, int resultCode, const string &operation)
{
    if (resultCode == SQLITE_INTERRUPT)
    {
        LOG(WARNING) << "Deadline expired while running " << operation;
        return ProximityError(ErrorCode::ERROR_UPSTREAM, "Signal store query timed out");
    }

    LOG(ERROR) << "Failed to run " << operation << ", error code " << resultCode
               << ": " << sqlite3_errmsg(dbHandle);
    return ProximityError(ErrorCode::ERROR_UPSTREAM, "Failed to run " + operation);
}


string JoinInterests(const vector<string> &interests)
{
    string result;
    for (const auto &interest : interests)
    {
        if ( ! result.empty() )
            { result += '\n'; }
        result += interest;
    }
    return result;
}

vector<string> SplitInterests(const string &joined)
{
    vector<string> result;
    istringstream stream(joined);
    string interest;
    while ( getline(stream, interest) )
    {
        if ( ! interest.empty() )
            { result.push_back(interest); }
    }
    return result;
}


string ColumnText(sqlite3_stmt *statement, int column)
{
    const unsigned char *text = sqlite3_column_text(statement, column);
    return text == nullptr ? string() : string( reinterpret_cast<const char*>(text) );
}

bool ColumnIsNull(sqlite3_stmt *statement, int column)
    { return sqlite3_column_type(statement, column) == SQLITE_NULL; }

bool BindRadioSignal(sqlite3_stmt *statement, int idIndex, int timeIndex, shared_ptr<RadioSignal> signal)
{
    if (! signal)
    {
        return sqlite3_bind_null(statement, idIndex)   == SQLITE_OK &&
               sqlite3_bind_null(statement, timeIndex) == SQLITE_OK;
    }
    return sqlite3_bind_text(  statement, idIndex, signal->id().c_str(), -1, SQLITE_STATIC )  == SQLITE_OK &&
           sqlite3_bind_int64( statement, timeIndex, ToUnixMillis( signal->updatedAt() ) )   == SQLITE_OK;
}



// SpatiaLite initialization/shutdown sequence is documented here:
// https://groups.google.com/forum/#!msg/spatialite-users/83SOajOJ2JU/sgi5fuYAVVkJ
SpatiaLiteUserDatabase::SpatiaLiteUserDatabase(const string &dbPath, chrono::milliseconds queryTimeout) :
    _dbHandle(nullptr), _spatialiteConnection(nullptr), _queryTimeout(queryTimeout),
    _deadline( chrono::steady_clock::time_point::max() ), _mutex()
{
    _spatialiteConnection = spatialite_alloc_connection();
    scope_error cleanupOnError( [this] { spatialite_cleanup_ex(_spatialiteConnection); } );

    bool creatingDb = dbPath == IN_MEMORY_DB || ! FileExist(dbPath);

    // NOTE SQLITE_OPEN_FULLMUTEX performs operations sequentially using a mutex,
    //      we also hold our own lock during whole statements to arm the query deadline.
    int openResult = sqlite3_open_v2 ( dbPath.c_str(), &_dbHandle,
         SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_URI, nullptr); // nullptr: no vFS module to use
    scope_error closeDbOnError( [this] { sqlite3_close(_dbHandle); } );
    if (openResult != SQLITE_OK)
    {
        LOG(ERROR) << "Failed to open/create SpatiaLite database file " << dbPath;
        throw ProximityError(ErrorCode::ERROR_UPSTREAM, "Failed to open signal store");
    }

    spatialite_init_ex(_dbHandle, _spatialiteConnection, 0);

    // Waiting for locks and running statements are both bounded by the query deadline
    sqlite3_busy_timeout( _dbHandle, static_cast<int>( _queryTimeout.count() ) );
    sqlite3_progress_handler(_dbHandle, PROGRESS_HANDLER_PERIOD, DeadlineProgressHandler, this);

    LOG(TRACE) << "SQLite version: " << sqlite3_libversion();
    LOG(TRACE) << "SpatiaLite version: " << spatialite_version();

    if (creatingDb)
    {
        LOG(INFO) << "No SpatiaLite database found, generating: " << dbPath;
        for (const string &command : DatabaseInitCommands)
            { ExecuteSql(_dbHandle, command); }
        LOG(INFO) << "Database initialized";
    }
    LOG(DEBUG) << "Signal store ready with query timeout " << _queryTimeout.count() << "ms";
}


SpatiaLiteUserDatabase::~SpatiaLiteUserDatabase()
{
    sqlite3_close (_dbHandle);
    spatialite_cleanup_ex(_spatialiteConnection);
}



int SpatiaLiteUserDatabase::DeadlineProgressHandler(void *context)
{
    // Called only from statements running under _mutex
    const SpatiaLiteUserDatabase *database = static_cast<const SpatiaLiteUserDatabase*>(context);
    return chrono::steady_clock::now() > database->_deadline ? 1 : 0;
}


void SpatiaLiteUserDatabase::ArmDeadline() const
{
    _deadline = _queryTimeout.count() > 0 ?
        chrono::steady_clock::now() + _queryTimeout :
        chrono::steady_clock::time_point::max();
}


sqlite3_stmt* SpatiaLiteUserDatabase::PrepareStatement(const string &sql) const
{
    sqlite3_stmt *statement = nullptr;
    int prepResult = sqlite3_prepare_v2( _dbHandle, sql.c_str(), -1, &statement, nullptr );
    if (prepResult != SQLITE_OK)
    {
        sqlite3_finalize(statement);
        LOG(ERROR) << "Failed to prepare statement: " << sql;
        LOG(ERROR) << "Error was: " << sqlite3_errmsg(_dbHandle);
        throw ProximityError(ErrorCode::ERROR_INTERNAL, "Failed to prepare store statement");
    }
    return statement;
}


void SpatiaLiteUserDatabase::RunStatement(sqlite3_stmt *statement, const string &operation) const
{
    int execResult = sqlite3_step(statement);
    if (execResult != SQLITE_DONE)
        { throw StoreFailure(_dbHandle, execResult, operation); }
}



vector<UserRecord> SpatiaLiteUserDatabase::QueryUsers(sqlite3_stmt *statement) const
{
    vector<UserRecord> result;
    int stepResult;
    while ( ( stepResult = sqlite3_step(statement) ) == SQLITE_ROW )
    {
        UserDisplayInfo display;
        display.username        = ColumnText(statement, 1);
        display.firstName       = ColumnText(statement, 2);
        display.lastName        = ColumnText(statement, 3);
        display.profilePicture  = ColumnText(statement, 4);
        display.bio             = ColumnText(statement, 5);
        display.interests       = SplitInterests( ColumnText(statement, 6) );
        display.age             = static_cast<uint16_t>( sqlite3_column_int(statement, 7) );
        display.isOnline        = sqlite3_column_int(statement, 8) != 0;
        display.lastSeen        = FromUnixMillis( sqlite3_column_int64(statement, 9) );

        PrivacySettings privacy( sqlite3_column_int(statement, 13) != 0,
                                 sqlite3_column_int(statement, 14) != 0,
                                 sqlite3_column_int(statement, 15) != 0 );
        DiscoverabilityProfile discovery( sqlite3_column_int(statement, 10) != 0,
                                          sqlite3_column_int(statement, 11) != 0,
                                          static_cast<uint32_t>( sqlite3_column_int(statement, 12) ),
                                          privacy );

        UserRecord user( ColumnText(statement, 0), display, discovery );

        if ( ! ColumnIsNull(statement, 18) )
        {
            GpsLocation location( sqlite3_column_double(statement, 16), sqlite3_column_double(statement, 17) );
            user.gpsSignal( make_shared<GpsSignal>( location,
                FromUnixMillis( sqlite3_column_int64(statement, 18) ) ) );
        }
        if ( ! ColumnIsNull(statement, 20) )
        {
            user.wifiSignal( make_shared<WifiSignal>( ColumnText(statement, 19),
                FromUnixMillis( sqlite3_column_int64(statement, 20) ) ) );
        }
        if ( ! ColumnIsNull(statement, 22) )
        {
            user.bluetoothSignal( make_shared<BluetoothSignal>( ColumnText(statement, 21),
                FromUnixMillis( sqlite3_column_int64(statement, 22) ) ) );
        }

        result.push_back(user);
    }

    if (stepResult != SQLITE_DONE)
        { throw StoreFailure(_dbHandle, stepResult, "user query"); }
    return result;
}



shared_ptr<UserRecord> SpatiaLiteUserDatabase::Load(const UserId &userId) const
{
    lock_guard<mutex> lock(_mutex);
    ArmDeadline();

    sqlite3_stmt *statement = PrepareStatement(
        "SELECT " + USER_COLUMNS + "FROM users WHERE id=?" );
    scope_exit finalizeStmt( [statement] { sqlite3_finalize(statement); } );

    if ( sqlite3_bind_text( statement, 1, userId.c_str(), -1, SQLITE_STATIC ) != SQLITE_OK )
    {
        LOG(ERROR) << "Failed to bind load query user id param";
        throw ProximityError(ErrorCode::ERROR_INTERNAL, "Failed to bind load query user id param");
    }

    vector<UserRecord> users = QueryUsers(statement);
    if ( users.empty() )
        { return shared_ptr<UserRecord>(); }
    return make_shared<UserRecord>( users.front() );
}



void SpatiaLiteUserDatabase::UpdateGpsSignal(const UserId &userId, const GpsSignal &signal)
{
    lock_guard<mutex> lock(_mutex);
    ArmDeadline();

    sqlite3_stmt *statement = PrepareStatement(
        "UPDATE users SET "
        "  gpsLocation = MakePoint(?1, ?2, 4326), gpsLongitude = ?1, gpsLatitude = ?2, "
        "  gpsUpdatedAt = ?3, lastSeen = ?3 "
        "WHERE id = ?4" );
    scope_exit finalizeStmt( [statement] { sqlite3_finalize(statement); } );

    if ( sqlite3_bind_double( statement, 1, signal.location().longitude() )          != SQLITE_OK ||
         sqlite3_bind_double( statement, 2, signal.location().latitude() )           != SQLITE_OK ||
         sqlite3_bind_int64(  statement, 3, ToUnixMillis( signal.updatedAt() ) )     != SQLITE_OK ||
         sqlite3_bind_text(   statement, 4, userId.c_str(), -1, SQLITE_STATIC )      != SQLITE_OK )
    {
        LOG(ERROR) << "Failed to bind GPS signal update params";
        throw ProximityError(ErrorCode::ERROR_INTERNAL, "Failed to bind GPS signal update params");
    }

    RunStatement(statement, "GPS signal update");

    int affectedRows = sqlite3_changes(_dbHandle);
    if (affectedRows != 1)
        { throw ProximityError(ErrorCode::ERROR_NOT_FOUND, "Unknown user " + userId); }
}


void SpatiaLiteUserDatabase::UpdateRadioSignal(const string &idColumn, const string &timeColumn,
                                               const UserId &userId, const RadioSignal &signal)
{
    lock_guard<mutex> lock(_mutex);
    ArmDeadline();

    // NOTE column names are internal constants, no user input, so no SQL injection vulnerability
    sqlite3_stmt *statement = PrepareStatement(
        "UPDATE users SET " + idColumn + " = ?1, " + timeColumn + " = ?2, lastSeen = ?2 "
        "WHERE id = ?3" );
    scope_exit finalizeStmt( [statement] { sqlite3_finalize(statement); } );

    if ( sqlite3_bind_text(   statement, 1, signal.id().c_str(), -1, SQLITE_STATIC ) != SQLITE_OK ||
         sqlite3_bind_int64(  statement, 2, ToUnixMillis( signal.updatedAt() ) )     != SQLITE_OK ||
         sqlite3_bind_text(   statement, 3, userId.c_str(), -1, SQLITE_STATIC )      != SQLITE_OK )
    {
        LOG(ERROR) << "Failed to bind " << idColumn << " update params";
        throw ProximityError(ErrorCode::ERROR_INTERNAL, "Failed to bind signal update params");
    }

    RunStatement(statement, idColumn + " update");

    int affectedRows = sqlite3_changes(_dbHandle);
    if (affectedRows != 1)
        { throw ProximityError(ErrorCode::ERROR_NOT_FOUND, "Unknown user " + userId); }
}


void SpatiaLiteUserDatabase::UpdateWifiSignal(const UserId &userId, const WifiSignal &signal)
    { UpdateRadioSignal("wifiNetworkId", "wifiUpdatedAt", userId, signal); }

void SpatiaLiteUserDatabase::UpdateBluetoothSignal(const UserId &userId, const BluetoothSignal &signal)
    { UpdateRadioSignal("bluetoothDeviceId", "bluetoothUpdatedAt", userId, signal); }



void SpatiaLiteUserDatabase::UpdateDiscoverability(const UserId &userId, bool discoverable, uint32_t rangeMeters)
{
    lock_guard<mutex> lock(_mutex);
    ArmDeadline();

    sqlite3_stmt *statement = PrepareStatement(
        "UPDATE users SET isDiscoverable = ?1, discoveryRange = ?2 WHERE id = ?3" );
    scope_exit finalizeStmt( [statement] { sqlite3_finalize(statement); } );

    if ( sqlite3_bind_int(  statement, 1, discoverable ? 1 : 0 )                  != SQLITE_OK ||
         sqlite3_bind_int64(statement, 2, rangeMeters )                           != SQLITE_OK ||
         sqlite3_bind_text( statement, 3, userId.c_str(), -1, SQLITE_STATIC )     != SQLITE_OK )
    {
        LOG(ERROR) << "Failed to bind discoverability update params";
        throw ProximityError(ErrorCode::ERROR_INTERNAL, "Failed to bind discoverability update params");
    }

    RunStatement(statement, "discoverability update");

    int affectedRows = sqlite3_changes(_dbHandle);
    if (affectedRows != 1)
        { throw ProximityError(ErrorCode::ERROR_NOT_FOUND, "Unknown user " + userId); }
}



vector<UserRecord> SpatiaLiteUserDatabase::GetUsersNearLocation(const GpsLocation &center,
    Distance radiusMeters, const UserId &excludedId, size_t maxCount) const
{
    // Bounding box on plain coordinate columns to use the index before measuring distances.
    // Boxes reaching a pole or the antimeridian fall back to the full longitude range.
    double deltaLat = radiusMeters * BOUNDING_BOX_TOLERANCE / EARTH_RADIUS_METERS * DEGREES_PER_RADIAN;
    double minLat = center.latitude() - deltaLat;
    double maxLat = center.latitude() + deltaLat;
    double minLon = -180.;
    double maxLon = 180.;
    if ( -90. < minLat && maxLat < 90. )
    {
        double widestLat = max( abs(minLat), abs(maxLat) );
        double deltaLon = deltaLat / cos(widestLat / DEGREES_PER_RADIAN);
        if ( -180. < center.longitude() - deltaLon && center.longitude() + deltaLon < 180. )
        {
            minLon = center.longitude() - deltaLon;
            maxLon = center.longitude() + deltaLon;
        }
    }

    lock_guard<mutex> lock(_mutex);
    ArmDeadline();

    sqlite3_stmt *statement = PrepareStatement(
        "SELECT " + USER_COLUMNS + "FROM users "
        "WHERE " + DISCOVERABLE_CONDITION + "AND id != ?1 AND gpsLocation IS NOT NULL "
        "  AND gpsLatitude BETWEEN ?2 AND ?3 AND gpsLongitude BETWEEN ?4 AND ?5 "
        "  AND Distance(gpsLocation, MakePoint(?6, ?7, 4326), 1) <= ?8 "
        "ORDER BY Distance(gpsLocation, MakePoint(?6, ?7, 4326), 1) "
        "LIMIT ?9" );
    scope_exit finalizeStmt( [statement] { sqlite3_finalize(statement); } );

    if ( sqlite3_bind_text(   statement, 1, excludedId.c_str(), -1, SQLITE_STATIC )       != SQLITE_OK ||
         sqlite3_bind_double( statement, 2, minLat )                                      != SQLITE_OK ||
         sqlite3_bind_double( statement, 3, maxLat )                                      != SQLITE_OK ||
         sqlite3_bind_double( statement, 4, minLon )                                      != SQLITE_OK ||
         sqlite3_bind_double( statement, 5, maxLon )                                      != SQLITE_OK ||
         sqlite3_bind_double( statement, 6, center.longitude() )                          != SQLITE_OK ||
         sqlite3_bind_double( statement, 7, center.latitude() )                           != SQLITE_OK ||
         sqlite3_bind_double( statement, 8, radiusMeters * PREFILTER_TOLERANCE )          != SQLITE_OK ||
         sqlite3_bind_int64(  statement, 9, static_cast<sqlite3_int64>(maxCount) )        != SQLITE_OK )
    {
        LOG(ERROR) << "Failed to bind radius query params";
        throw ProximityError(ErrorCode::ERROR_INTERNAL, "Failed to bind radius query params");
    }

    return QueryUsers(statement);
}



vector<UserRecord> SpatiaLiteUserDatabase::GetUsersOnNetwork(const DeviceId &networkId,
    Timestamp freshSince, const UserId &excludedId, size_t maxCount) const
{
    lock_guard<mutex> lock(_mutex);
    ArmDeadline();

    sqlite3_stmt *statement = PrepareStatement(
        "SELECT " + USER_COLUMNS + "FROM users "
        "WHERE wifiNetworkId = ?1 AND wifiUpdatedAt >= ?2 AND id != ?3 AND " + DISCOVERABLE_CONDITION +
        "ORDER BY wifiUpdatedAt DESC, id "
        "LIMIT ?4" );
    scope_exit finalizeStmt( [statement] { sqlite3_finalize(statement); } );

    if ( sqlite3_bind_text(   statement, 1, networkId.c_str(), -1, SQLITE_STATIC )        != SQLITE_OK ||
         sqlite3_bind_int64(  statement, 2, ToUnixMillis(freshSince) )                    != SQLITE_OK ||
         sqlite3_bind_text(   statement, 3, excludedId.c_str(), -1, SQLITE_STATIC )       != SQLITE_OK ||
         sqlite3_bind_int64(  statement, 4, static_cast<sqlite3_int64>(maxCount) )        != SQLITE_OK )
    {
        LOG(ERROR) << "Failed to bind network query params";
        throw ProximityError(ErrorCode::ERROR_INTERNAL, "Failed to bind network query params");
    }

    return QueryUsers(statement);
}



vector<UserRecord> SpatiaLiteUserDatabase::GetUsersWithDevices(const vector<DeviceId> &deviceIds,
    Timestamp freshSince, const UserId &excludedId, size_t maxCount) const
{
    if ( deviceIds.empty() )
        { return vector<UserRecord>(); }

    string placeholders;
    for (size_t idx = 0; idx < deviceIds.size(); ++idx)
    {
        if (idx > 0)
            { placeholders += ", "; }
        placeholders += "?" + to_string(idx + 4);
    }

    lock_guard<mutex> lock(_mutex);
    ArmDeadline();

    sqlite3_stmt *statement = PrepareStatement(
        "SELECT " + USER_COLUMNS + "FROM users "
        "WHERE bluetoothDeviceId IN (" + placeholders + ") "
        "  AND bluetoothUpdatedAt >= ?1 AND id != ?2 AND " + DISCOVERABLE_CONDITION +
        "ORDER BY bluetoothUpdatedAt DESC, id "
        "LIMIT ?3" );
    scope_exit finalizeStmt( [statement] { sqlite3_finalize(statement); } );

    if ( sqlite3_bind_int64(  statement, 1, ToUnixMillis(freshSince) )                    != SQLITE_OK ||
         sqlite3_bind_text(   statement, 2, excludedId.c_str(), -1, SQLITE_STATIC )       != SQLITE_OK ||
         sqlite3_bind_int64(  statement, 3, static_cast<sqlite3_int64>(maxCount) )        != SQLITE_OK )
    {
        LOG(ERROR) << "Failed to bind device query params";
        throw ProximityError(ErrorCode::ERROR_INTERNAL, "Failed to bind device query params");
    }
    for (size_t idx = 0; idx < deviceIds.size(); ++idx)
    {
        if ( sqlite3_bind_text( statement, static_cast<int>(idx + 4),
                deviceIds[idx].c_str(), -1, SQLITE_STATIC ) != SQLITE_OK )
        {
            LOG(ERROR) << "Failed to bind device id param " << idx;
            throw ProximityError(ErrorCode::ERROR_INTERNAL, "Failed to bind device query params");
        }
    }

    return QueryUsers(statement);
}



bool SpatiaLiteUserDatabase::QueryExists(const string &sql, const string &first, const string &second) const
{
    lock_guard<mutex> lock(_mutex);
    ArmDeadline();

    sqlite3_stmt *statement = PrepareStatement(sql);
    scope_exit finalizeStmt( [statement] { sqlite3_finalize(statement); } );

    if ( sqlite3_bind_text( statement, 1, first.c_str(),  -1, SQLITE_STATIC ) != SQLITE_OK ||
         sqlite3_bind_text( statement, 2, second.c_str(), -1, SQLITE_STATIC ) != SQLITE_OK )
    {
        LOG(ERROR) << "Failed to bind relationship query params";
        throw ProximityError(ErrorCode::ERROR_INTERNAL, "Failed to bind relationship query params");
    }

    int stepResult = sqlite3_step(statement);
    if (stepResult == SQLITE_ROW)
        { return true; }
    if (stepResult == SQLITE_DONE)
        { return false; }
    throw StoreFailure(_dbHandle, stepResult, "relationship query");
}


bool SpatiaLiteUserDatabase::IsFriend(const UserId &requesterId, const UserId &candidateId) const
{
    return QueryExists( "SELECT 1 FROM friendships WHERE userId = ? AND friendId = ? LIMIT 1",
                        candidateId, requesterId );
}

bool SpatiaLiteUserDatabase::HasPendingRequest(const UserId &senderId, const UserId &receiverId) const
{
    return QueryExists( "SELECT 1 FROM friend_requests WHERE senderId = ? AND receiverId = ? LIMIT 1",
                        senderId, receiverId );
}



void SpatiaLiteUserDatabase::Store(const UserRecord &user)
{
    lock_guard<mutex> lock(_mutex);
    ArmDeadline();

    sqlite3_stmt *statement = PrepareStatement(
        "INSERT INTO users "
        "(id, username, firstName, lastName, profilePicture, bio, interests, age, isOnline, lastSeen, "
        " isDiscoverable, isActive, discoveryRange, showAge, showLocation, showLastSeen, "
        " gpsLocation, gpsLongitude, gpsLatitude, gpsUpdatedAt, wifiNetworkId, wifiUpdatedAt, "
        " bluetoothDeviceId, bluetoothUpdatedAt) VALUES "
        "(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15, ?16, "
        " MakePoint(?17, ?18, 4326), ?17, ?18, ?19, ?20, ?21, ?22, ?23)" );
    scope_exit finalizeStmt( [statement] { sqlite3_finalize(statement); } );

    const UserDisplayInfo &display = user.display();
    const DiscoverabilityProfile &discovery = user.discovery();
    const PrivacySettings &privacy = discovery.privacy();
    string interests = JoinInterests(display.interests);

    bool bindOk =
        sqlite3_bind_text(  statement,  1, user.id().c_str(), -1, SQLITE_STATIC )              == SQLITE_OK &&
        sqlite3_bind_text(  statement,  2, display.username.c_str(), -1, SQLITE_STATIC )       == SQLITE_OK &&
        sqlite3_bind_text(  statement,  3, display.firstName.c_str(), -1, SQLITE_STATIC )      == SQLITE_OK &&
        sqlite3_bind_text(  statement,  4, display.lastName.c_str(), -1, SQLITE_STATIC )       == SQLITE_OK &&
        sqlite3_bind_text(  statement,  5, display.profilePicture.c_str(), -1, SQLITE_STATIC ) == SQLITE_OK &&
        sqlite3_bind_text(  statement,  6, display.bio.c_str(), -1, SQLITE_STATIC )            == SQLITE_OK &&
        sqlite3_bind_text(  statement,  7, interests.c_str(), -1, SQLITE_STATIC )              == SQLITE_OK &&
        sqlite3_bind_int(   statement,  8, display.age )                                       == SQLITE_OK &&
        sqlite3_bind_int(   statement,  9, display.isOnline ? 1 : 0 )                          == SQLITE_OK &&
        sqlite3_bind_int64( statement, 10, ToUnixMillis(display.lastSeen) )                    == SQLITE_OK &&
        sqlite3_bind_int(   statement, 11, discovery.isDiscoverable() ? 1 : 0 )                == SQLITE_OK &&
        sqlite3_bind_int(   statement, 12, discovery.isActive() ? 1 : 0 )                      == SQLITE_OK &&
        sqlite3_bind_int64( statement, 13, discovery.rangeMeters() )                           == SQLITE_OK &&
        sqlite3_bind_int(   statement, 14, privacy.showAge() ? 1 : 0 )                         == SQLITE_OK &&
        sqlite3_bind_int(   statement, 15, privacy.showLocation() ? 1 : 0 )                    == SQLITE_OK &&
        sqlite3_bind_int(   statement, 16, privacy.showLastSeen() ? 1 : 0 )                    == SQLITE_OK &&
        BindRadioSignal( statement, 20, 21, user.wifiSignal() ) &&
        BindRadioSignal( statement, 22, 23, user.bluetoothSignal() );

    shared_ptr<GpsSignal> gps = user.gpsSignal();
    if (gps)
    {
        bindOk = bindOk &&
            sqlite3_bind_double( statement, 17, gps->location().longitude() )  == SQLITE_OK &&
            sqlite3_bind_double( statement, 18, gps->location().latitude() )   == SQLITE_OK &&
            sqlite3_bind_int64(  statement, 19, ToUnixMillis( gps->updatedAt() ) ) == SQLITE_OK;
    }
    else
    {
        bindOk = bindOk &&
            sqlite3_bind_null( statement, 17 ) == SQLITE_OK &&
            sqlite3_bind_null( statement, 18 ) == SQLITE_OK &&
            sqlite3_bind_null( statement, 19 ) == SQLITE_OK;
    }

    if (! bindOk)
    {
        LOG(ERROR) << "Failed to bind user store statement params";
        throw ProximityError(ErrorCode::ERROR_INTERNAL, "Failed to bind user store statement params");
    }

    RunStatement(statement, "user store");
    LOG(TRACE) << "Stored " << user;
}



void SpatiaLiteUserDatabase::InsertPair(const string &sql, const string &first, const string &second)
{
    lock_guard<mutex> lock(_mutex);
    ArmDeadline();

    sqlite3_stmt *statement = PrepareStatement(sql);
    scope_exit finalizeStmt( [statement] { sqlite3_finalize(statement); } );

    if ( sqlite3_bind_text( statement, 1, first.c_str(),  -1, SQLITE_STATIC ) != SQLITE_OK ||
         sqlite3_bind_text( statement, 2, second.c_str(), -1, SQLITE_STATIC ) != SQLITE_OK )
    {
        LOG(ERROR) << "Failed to bind relationship store params";
        throw ProximityError(ErrorCode::ERROR_INTERNAL, "Failed to bind relationship store params");
    }

    RunStatement(statement, "relationship store");
}


void SpatiaLiteUserDatabase::AddFriendship(const UserId &one, const UserId &other)
{
    static const string sql = "INSERT OR IGNORE INTO friendships (userId, friendId) VALUES (?, ?)";
    InsertPair(sql, one, other);
    InsertPair(sql, other, one);
}

void SpatiaLiteUserDatabase::AddFriendRequest(const UserId &senderId, const UserId &receiverId)
{
    InsertPair( "INSERT OR IGNORE INTO friend_requests (senderId, receiverId) VALUES (?, ?)",
                senderId, receiverId );
}



} // namespace ProxNet
