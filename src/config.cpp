#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <pwd.h>

#include <ezOptionParser.hpp>

#include "config.hpp"

using namespace std;



namespace ProxNet
{


static const uint16_t VERSION_MAJOR = 1;
static const uint16_t VERSION_MINOR = 0;
static const uint16_t VERSION_PATCH = 0;
static const string   RELEASE_STATE = "beta";

static const string PROXNET_VERSION = to_string(VERSION_MAJOR) + "." +
    to_string(VERSION_MINOR) + "." + to_string(VERSION_PATCH) + "-" + RELEASE_STATE;

static const size_t   MAX_RESULT_COUNT      = 50;
static const size_t   MAX_OBSERVED_DEVICES  = 50;
static const Distance DEFAULT_RADIUS_METERS = 5000;
static const Distance MIN_RADIUS_METERS     = 100;
static const Distance MAX_RADIUS_METERS     = 50000;

static const chrono::seconds WIFI_FRESHNESS_WINDOW      = chrono::hours(24);
static const chrono::seconds BLUETOOTH_FRESHNESS_WINDOW = chrono::hours(24 * 7);
static const chrono::milliseconds RATE_LIMIT_WINDOW     = chrono::minutes(1);



Config::Config() {}

const string& Config::version() const
    { return PROXNET_VERSION; }

chrono::milliseconds Config::rateLimitWindow() const
    { return RATE_LIMIT_WINDOW; }

size_t Config::maxResultCount() const
    { return MAX_RESULT_COUNT; }

size_t Config::maxObservedDevices() const
    { return MAX_OBSERVED_DEVICES; }

Distance Config::defaultRadiusMeters() const
    { return DEFAULT_RADIUS_METERS; }

Distance Config::minRadiusMeters() const
    { return MIN_RADIUS_METERS; }

Distance Config::maxRadiusMeters() const
    { return MAX_RADIUS_METERS; }

chrono::seconds Config::wifiFreshnessWindow() const
    { return WIFI_FRESHNESS_WINDOW; }

chrono::seconds Config::bluetoothFreshnessWindow() const
    { return BLUETOOTH_FRESHNESS_WINDOW; }



string GetPosixHomeDirectory()
{
    const char *home = getenv("HOME");
    if ( home == nullptr || strlen(home) == 0 )
    {
        const passwd *userEntry = getpwuid( getuid() );
        if (userEntry == nullptr)
            { throw ProximityError(ErrorCode::ERROR_INTERNAL, "Failed to determine home directory"); }
        home = userEntry->pw_dir;
    }
    return home;
}


static const string APPLICATION_DIRECTORY_RELATIVE_NAME = "proxnet";

// Mac: ~/Library/Application Support/proxnet
// Unix: ~/.proxnet
string GetApplicationDataDirectory()
{
#ifdef MAC_OSX
    string result = GetPosixHomeDirectory() + "/Library/Application Support/" + APPLICATION_DIRECTORY_RELATIVE_NAME + "/";
#else
    string result = GetPosixHomeDirectory() + "/." + APPLICATION_DIRECTORY_RELATIVE_NAME + "/";
#endif
    if ( mkdir( result.c_str(), 0700 ) != 0 && errno != EEXIST )
        { throw ProximityError(ErrorCode::ERROR_INTERNAL, "Failed to create directory " + result); }
    return result;
}




static const TcpPort DefaultServicePort     = 16990;
static const size_t  DefaultThreadCount     = 4;
static const size_t  DefaultRateLimit       = 10;
static const size_t  DefaultQueryTimeoutMs  = 2000;

static const string DESC_OPTIONAL_DEFAULT = "Optional, default value: ";


static const char *OPTNAME_HELP         = "--help";
static const char *OPTNAME_VERSION      = "--version";
static const char *OPTNAME_CONFIGFILE   = "--configfile";
static const char *OPTNAME_PORT         = "--port";
static const char *OPTNAME_THREADS      = "--threads";
static const char *OPTNAME_RATELIMIT    = "--ratelimit";
static const char *OPTNAME_QUERYTIMEOUT = "--querytimeout";

static const char *OPTNAME_DBPATH       = "--dbpath";
static const char *OPTNAME_LOGPATH      = "--logpath";
static const char *OPTNAME_TESTMODE     = "--test";



EzParserConfig::EzParserConfig() :
    _queryTimeout(DefaultQueryTimeoutMs) {}


bool EzParserConfig::Initialize(int argc, const char *argv[])
{
    const string appDir          = GetApplicationDataDirectory();
    const string defaultConfig   = appDir + "proxnet.cfg";
    const string defaultDbPath   = appDir + "proxnet.sqlite";
    const string defaultLogPath  = appDir + "debug.log";
    const string defaultPort     = to_string(DefaultServicePort);
    const string defaultThreads  = to_string(DefaultThreadCount);
    const string defaultLimit    = to_string(DefaultRateLimit);
    const string defaultTimeout  = to_string(DefaultQueryTimeoutMs);

    ez::ezOptionParser _optParser;

    _optParser.overview = "Proximity discovery service: find nearby users by GPS, WiFi or Bluetooth";
    _optParser.syntax   = "proxnetd [--option value]";

    // Set up all option details
    _optParser.add(
        "",             // Default value
        false,          // Is this a mandatory option?
        0,              // Number of expected values
        0,              // Delimiter character if expecting multiple values
        "Show usage",   // Help message for this option
        OPTNAME_HELP, "-h" // Flag names
    );

    _optParser.add("", false, 0, 0, "Print version information.", OPTNAME_VERSION, "-v");
    _optParser.add("", false, 0, 0, "Run in test mode: trust identities asserted by any peer. "
        "Never use this in production.", OPTNAME_TESTMODE);

    _optParser.add(defaultConfig.c_str(), false, 1, 0, ( "Path to config file to load options from. " +
        DESC_OPTIONAL_DEFAULT + defaultConfig ).c_str(), OPTNAME_CONFIGFILE);
    _optParser.add(defaultPort.c_str(), false, 1, 0, ( "TCP port to serve client requests. " +
        DESC_OPTIONAL_DEFAULT + defaultPort ).c_str(), OPTNAME_PORT);
    _optParser.add(defaultThreads.c_str(), false, 1, 0, ( "Number of worker threads serving requests. " +
        DESC_OPTIONAL_DEFAULT + defaultThreads ).c_str(), OPTNAME_THREADS);
    _optParser.add(defaultLimit.c_str(), false, 1, 0, ( "Discovery requests allowed per user and channel "
        "in a minute. " + DESC_OPTIONAL_DEFAULT + defaultLimit ).c_str(), OPTNAME_RATELIMIT);
    _optParser.add(defaultTimeout.c_str(), false, 1, 0, ( "Deadline of a single store query in milliseconds. " +
        DESC_OPTIONAL_DEFAULT + defaultTimeout ).c_str(), OPTNAME_QUERYTIMEOUT);

    _optParser.add(defaultLogPath.c_str(), false, 1, 0, ( "Path to log file. " +
        DESC_OPTIONAL_DEFAULT + defaultLogPath ).c_str(), OPTNAME_LOGPATH);
    _optParser.add(defaultDbPath.c_str(), false, 1, 0, ( "Path to db file. " +
        DESC_OPTIONAL_DEFAULT + defaultDbPath ).c_str(), OPTNAME_DBPATH);

    // Perform parsing, first from command line ...
    _optParser.parse(argc, argv);

    if ( _optParser.isSet(OPTNAME_TESTMODE) )
        { _testMode = true; }

    // ... then from config file if present (will not overwrite existing values)
    string filename;
    _optParser.get(OPTNAME_CONFIGFILE)->getString(filename);
    if ( _optParser.importFile( filename.c_str() ) )
        { cout << "Processed config file " << filename << endl; }
    else { if (! isTestMode() )
        { cout << "Config file '" << filename << "' not found, using command line values only" << endl; } }

    // Check for missing mandatory options
    vector<string> badOptions;
    bool validateRequiredPassed = _optParser.gotRequired(badOptions);
    if( ! validateRequiredPassed &&
        ! ( _optParser.isSet(OPTNAME_HELP) || _optParser.isSet(OPTNAME_VERSION) ) )
    {
        for(size_t idx = 0; idx < badOptions.size(); ++idx)
            { cerr << "Missing required option " << badOptions[idx] << endl; }
    }

    if ( ! _optParser.isSet(OPTNAME_VERSION) &&
         ( _optParser.isSet(OPTNAME_HELP) || ! validateRequiredPassed ) )
    {
        string usage;
        _optParser.getUsage(usage);
        cerr << endl << usage;
        return false;
    }

    // Fetch extracted option values from parser
    _versionRequested = _optParser.isSet(OPTNAME_VERSION);
    _optParser.get(OPTNAME_LOGPATH)->getString(_logPath);
    _optParser.get(OPTNAME_DBPATH)->getString(_dbPath);

    unsigned long servicePort;
    _optParser.get(OPTNAME_PORT)->getULong(servicePort);
    if ( servicePort == 0 || servicePort > 65535 )
    {
        cerr << "Invalid port number " << servicePort << endl;
        return false;
    }
    _servicePort = static_cast<TcpPort>(servicePort);

    unsigned long threadCount;
    _optParser.get(OPTNAME_THREADS)->getULong(threadCount);
    _threadCount = threadCount > 0 ? threadCount : 1;

    unsigned long rateLimit;
    _optParser.get(OPTNAME_RATELIMIT)->getULong(rateLimit);
    _rateLimitMaxRequests = rateLimit;

    unsigned long queryTimeoutMs;
    _optParser.get(OPTNAME_QUERYTIMEOUT)->getULong(queryTimeoutMs);
    _queryTimeout = chrono::milliseconds(queryTimeoutMs);

    return true;
}



bool EzParserConfig::versionRequested() const
    { return _versionRequested; }

bool EzParserConfig::isTestMode() const
    { return _testMode; }

const string& EzParserConfig::logPath() const
    { return _logPath; }

const string& EzParserConfig::dbPath() const
    { return _dbPath; }

TcpPort EzParserConfig::servicePort() const
    { return _servicePort; }

size_t EzParserConfig::threadCount() const
    { return _threadCount; }

size_t EzParserConfig::rateLimitMaxRequests() const
    { return _rateLimitMaxRequests; }

chrono::milliseconds EzParserConfig::queryTimeout() const
    { return _queryTimeout; }


} // namespace ProxNet
