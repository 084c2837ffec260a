#ifndef __PROXNET_CONFIG_H__
#define __PROXNET_CONFIG_H__

#include <chrono>
#include <memory>
#include <vector>

#include "basic.hpp"


namespace ProxNet
{



// Abstract base class for project configuration.
// Fixed protocol constants are implemented here, deployment specific values by subclasses.
class Config
{
protected:

    Config();
    Config(const Config &other) = delete;
    Config& operator=(const Config &other) = delete;

public:

    virtual ~Config() {}

    virtual const std::string& version() const;

    virtual bool isTestMode() const = 0;
    virtual const std::string& logPath() const = 0;
    virtual const std::string& dbPath() const = 0;
    virtual TcpPort servicePort() const = 0;
    virtual size_t threadCount() const = 0;

    virtual size_t rateLimitMaxRequests() const = 0;
    virtual std::chrono::milliseconds rateLimitWindow() const;
    virtual std::chrono::milliseconds queryTimeout() const = 0;

    virtual size_t maxResultCount() const;
    virtual size_t maxObservedDevices() const;
    virtual Distance defaultRadiusMeters() const;
    virtual Distance minRadiusMeters() const;
    virtual Distance maxRadiusMeters() const;
    virtual std::chrono::seconds wifiFreshnessWindow() const;
    virtual std::chrono::seconds bluetoothFreshnessWindow() const;
};



// The currently preferred Config implementation using the ezOptionParser library
// to parse options from the command line and/or config files.
class EzParserConfig : public Config
{
    bool            _testMode = false;
    bool            _versionRequested = false;
    TcpPort         _servicePort = 0;
    size_t          _threadCount = 0;
    size_t          _rateLimitMaxRequests = 0;
    std::chrono::milliseconds _queryTimeout;
    std::string     _logPath;
    std::string     _dbPath;

public:

    EzParserConfig();

    bool Initialize(int argc, const char *argv[]);
    bool versionRequested() const;

    bool isTestMode() const override;
    const std::string& logPath() const override;
    const std::string& dbPath() const override;
    TcpPort servicePort() const override;
    size_t threadCount() const override;

    size_t rateLimitMaxRequests() const override;
    std::chrono::milliseconds queryTimeout() const override;
};



} // namespace ProxNet


#endif // __PROXNET_CONFIG_H__
