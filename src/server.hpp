#ifndef __PROXNET_SERVER_H__
#define __PROXNET_SERVER_H__

#include <future>
#include <mutex>
#include <unordered_map>

#include "config.hpp"
#include "network.hpp"
#include "messaging.hpp"



namespace ProxNet
{


// Interface of an asynchronous channel that allows sending and receiving protobuf messages.
// NOTE just messages, requests and responses are not distinguished here.
class IProtoBufChannel
{
public:

    typedef void ReceivedMessageCallback( std::unique_ptr<proxnet::protocol::Message> &&receivedMessage );
    typedef void SentMessageCallback();

    virtual ~IProtoBufChannel() {}

    virtual const SessionId& id() const = 0;
    virtual const Address& remoteAddress() const = 0;

    virtual void ReceiveMessage( std::function<ReceivedMessageCallback> callback ) = 0;
    virtual std::future< std::unique_ptr<proxnet::protocol::Message> > ReceiveMessage(asio::use_future_t<>) = 0;

    virtual void SendMessage( std::unique_ptr<proxnet::protocol::Message> &&message, std::function<SentMessageCallback> callback ) = 0;
    virtual std::future<void> SendMessage(std::unique_ptr<proxnet::protocol::Message> &&message, asio::use_future_t<>) = 0;
};



// ProtoBuf message channel that sends messages through an async TCP network connection.
class AsyncProtoBufTcpChannel : public IProtoBufChannel
{
    std::shared_ptr<asio::ip::tcp::socket>  _socket;
    SessionId                               _id;
    Address                                 _remoteAddress;
    std::shared_ptr<AsyncFrameStream>       _frames;

public:

    // Server connection to client with accepted socket
    AsyncProtoBufTcpChannel(std::shared_ptr<asio::ip::tcp::socket> socket);
    // Client connection to server, endpoint resolution to be done
    AsyncProtoBufTcpChannel(const NetworkEndpoint &endpoint);
    ~AsyncProtoBufTcpChannel();

    const SessionId& id() const override;
    const Address& remoteAddress() const override;

    void ReceiveMessage( std::function<ReceivedMessageCallback> callback ) override;
    std::future< std::unique_ptr<proxnet::protocol::Message> > ReceiveMessage(asio::use_future_t<>) override;
    void SendMessage( std::unique_ptr<proxnet::protocol::Message> &&message, std::function<SentMessageCallback> callback ) override;
    std::future<void> SendMessage(std::unique_ptr<proxnet::protocol::Message> &&message, asio::use_future_t<>) override;
};



class ProtoBufClientSession : public std::enable_shared_from_this<ProtoBufClientSession>
{
public:

    typedef void IncomingRequestHandler( std::unique_ptr<proxnet::protocol::Message> &&incomingRequest );

private:

    std::shared_ptr<IProtoBufChannel> _messageChannel;

    uint32_t _nextMessageId;
    std::unordered_map< uint32_t, std::promise< std::unique_ptr<proxnet::protocol::Response> > > _pendingRequests;
    mutable std::mutex _pendingRequestsMutex;

    static void AsyncMessageLoopHandler( std::weak_ptr<ProtoBufClientSession> sessionWeakRef,
                                         const std::string &sessionId,
                                         std::function<IncomingRequestHandler> requestHandler );

    ProtoBufClientSession(std::shared_ptr<IProtoBufChannel> connection);

public:

    static std::shared_ptr<ProtoBufClientSession> Create(std::shared_ptr<IProtoBufChannel> connection);

    virtual ~ProtoBufClientSession();

    virtual const SessionId& id() const;
    virtual std::shared_ptr<IProtoBufChannel> messageChannel();

    virtual void StartMessageLoop( std::function<IncomingRequestHandler> requestHandler = std::function<IncomingRequestHandler>() );
    // Message id assigned to the request is returned in messageId if given
    virtual std::future< std::unique_ptr<proxnet::protocol::Response> > SendRequest(
        std::unique_ptr<proxnet::protocol::Message> &&requestMessage, uint32_t *messageId = nullptr );
    // Forget a request nobody waits for anymore, its late response will be dropped
    virtual void CancelRequest(uint32_t messageId);
    virtual void ResponseArrived( std::unique_ptr<proxnet::protocol::Message> &&responseMessage);

    size_t pendingRequestCount() const;
};



// Factory interface to create a dispatcher object for a session.
// Needed because served requests are authenticated by the remote address of the session.
class IBlockingRequestDispatcherFactory
{
public:

    virtual ~IBlockingRequestDispatcherFactory() {}

    virtual std::shared_ptr<IBlockingRequestDispatcher> Create(
        std::shared_ptr<ProtoBufClientSession> session ) = 0;
};



// Tcp server implementation that serves protobuf requests for accepted clients.
class DispatchingTcpServer : public TcpServer
{
protected:

    std::shared_ptr<IBlockingRequestDispatcherFactory> _dispatcherFactory;

    DispatchingTcpServer( TcpPort portNumber,
        std::shared_ptr<IBlockingRequestDispatcherFactory> dispatcherFactory );

public:

    static std::shared_ptr<DispatchingTcpServer> Create( TcpPort portNumber,
        std::shared_ptr<IBlockingRequestDispatcherFactory> dispatcherFactory );

    static void AsyncServeMessageHandler( std::unique_ptr<proxnet::protocol::Message> &&receivedMessage,
                                          std::shared_ptr<ProtoBufClientSession> session,
                                          std::shared_ptr<IBlockingRequestDispatcher> dispatcher );

protected:

    void ServeClient( std::shared_ptr<asio::ip::tcp::socket> socket ) override;
};



// Creates a dispatcher for every session that serves requests with the proximity engine
// after authenticating them by the remote address of the session.
class ProximityDispatcherFactory : public IBlockingRequestDispatcherFactory
{
    std::shared_ptr<Config>             _config;
    std::shared_ptr<IProximityMethods>  _iProximity;
    std::shared_ptr<IAuthenticator>     _authenticator;

public:

    ProximityDispatcherFactory( std::shared_ptr<Config> config,
        std::shared_ptr<IProximityMethods> iProximity, std::shared_ptr<IAuthenticator> authenticator );

    std::shared_ptr<IBlockingRequestDispatcher> Create(
        std::shared_ptr<ProtoBufClientSession> session ) override;
};



// Dispatcher factory that ignores the session and returns a simple dispatcher
class StaticBlockingDispatcherFactory : public IBlockingRequestDispatcherFactory
{
    std::shared_ptr<IBlockingRequestDispatcher> _dispatcher;

public:

    StaticBlockingDispatcherFactory(std::shared_ptr<IBlockingRequestDispatcher> dispatcher);

    std::shared_ptr<IBlockingRequestDispatcher> Create(
        std::shared_ptr<ProtoBufClientSession> session ) override;
};



// A protobuf request dispatcher that delivers requests through a network session
// and reads response messages from it.
class NetworkDispatcher : public IBlockingRequestDispatcher
{
    std::shared_ptr<ProtoBufClientSession>  _session;
    std::chrono::milliseconds               _requestTimeout;

public:

    NetworkDispatcher( std::shared_ptr<ProtoBufClientSession> session,
                       std::chrono::milliseconds requestTimeout );
    virtual ~NetworkDispatcher() {}

    std::unique_ptr<proxnet::protocol::Response> Dispatch(std::unique_ptr<proxnet::protocol::Request> &&request) override;
};



// Connect to a server and return a client interface that transparently sends requests to it.
std::shared_ptr<IProximityMethods> ConnectTo( const NetworkEndpoint &endpoint,
    std::chrono::milliseconds requestTimeout = std::chrono::seconds(10) );



} // namespace ProxNet


#endif // __PROXNET_SERVER_H__
