#include <algorithm>
#include <csignal>
#include <iostream>
#include <thread>
#include <vector>

#include "config.hpp"
#include "ratelimit.hpp"
#include "server.hpp"
#include "signalstore.hpp"

#include <easylogging++.h>

INITIALIZE_EASYLOGGINGPP

using namespace std;
using namespace ProxNet;



function<void(int)> mySignalHandlerFunc;

void signalHandler(int signal)
    { mySignalHandlerFunc(signal); }



int main(int argc, const char *argv[])
{
    try
    {
        shared_ptr<EzParserConfig> ezConfig( new EzParserConfig() );
        bool configCreated = ezConfig->Initialize(argc, argv);
        if (! configCreated)
            { return 1; }

        if ( ezConfig->versionRequested() )
        {
            cout << "ProxNet proximity discovery service " << ezConfig->version() << endl;
            return 0;
        }
        shared_ptr<Config> config(ezConfig);

        el::Loggers::reconfigureAllLoggers(el::ConfigurationType::Format, "%datetime %level %msg (%fbase:%line)");
        el::Loggers::reconfigureAllLoggers(el::ConfigurationType::Filename, config->logPath());
        el::Loggers::reconfigureAllLoggers(el::Level::Trace, el::ConfigurationType::ToStandardOutput, "false");

        // Initialize server components
        LOG(INFO) << "Initializing proximity service version " << config->version()
                  << ( config->isTestMode() ? " in test mode" : "" );

        shared_ptr<SpatiaLiteUserDatabase> database( new SpatiaLiteUserDatabase(
            config->dbPath(), config->queryTimeout() ) );
        shared_ptr<IRateLimiter> rateLimiter( new FixedWindowRateLimiter(
            config->rateLimitMaxRequests(), config->rateLimitWindow(), SystemClock() ) );
        shared_ptr<IProximityMethods> engine( new ProximityEngine(
            config, database, database, rateLimiter ) );
        shared_ptr<IAuthenticator> authenticator(
            new TrustedFrontendAuthenticator( config->isTestMode() ) );

        LOG(INFO) << "Serving proximity requests on port " << config->servicePort();
        shared_ptr<IBlockingRequestDispatcherFactory> dispatcherFactory(
            new ProximityDispatcherFactory(config, engine, authenticator) );
        shared_ptr<DispatchingTcpServer> tcpServer = DispatchingTcpServer::Create(
            config->servicePort(), dispatcherFactory );
        tcpServer->StartListening();

        // Set up signal handlers to stop on Ctrl-C and further events
        mySignalHandlerFunc = [] (int) { Reactor::Instance().Shutdown(); };
        signal(SIGINT,  signalHandler);
        signal(SIGTERM, signalHandler);

        size_t threadCount = max( config->threadCount(), static_cast<size_t>(1) );
        vector<thread> reactorThreads;
        for (size_t idx = 0; idx < threadCount; ++idx)
        {
            string threadName = "Reactor" + to_string(idx);
            reactorThreads.emplace_back( [threadName] { Reactor::Instance().RunWorker(threadName); } );
        }
        for (auto &reactorThread : reactorThreads)
            { reactorThread.join(); }

        LOG(INFO) << "Shutting down proximity service";
        return 0;
    }
    catch (exception &e)
    {
        LOG(ERROR) << "Failed with exception: " << e.what();
        cerr << "Failed with exception: " << e.what() << endl;
        return 1;
    }
}
