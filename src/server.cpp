#include <chrono>
#include <easylogging++.h>

#include "server.hpp"

using namespace std;
using namespace asio::ip;



namespace ProxNet
{



// Storage and implementation problems are logged but never exposed to clients
static const string UPSTREAM_ERROR_DETAILS = "Service is temporarily unavailable, please try again later";
static const string INTERNAL_ERROR_DETAILS = "Internal server error";



static string ClientErrorDetails(ErrorCode code, const string &reason)
{
    switch (code)
    {
        case ErrorCode::ERROR_UPSTREAM: return UPSTREAM_ERROR_DETAILS;
        case ErrorCode::ERROR_INTERNAL: return INTERNAL_ERROR_DETAILS;
        default:                        return reason;
    }
}



shared_ptr<DispatchingTcpServer> DispatchingTcpServer::Create(
        TcpPort portNumber, shared_ptr<IBlockingRequestDispatcherFactory> dispatcherFactory )
    { return shared_ptr<DispatchingTcpServer>( new DispatchingTcpServer(portNumber, dispatcherFactory) ); }


DispatchingTcpServer::DispatchingTcpServer( TcpPort portNumber,
        shared_ptr<IBlockingRequestDispatcherFactory> dispatcherFactory ) :
    TcpServer(portNumber), _dispatcherFactory(dispatcherFactory)
{
    if (_dispatcherFactory == nullptr) {
        throw ProximityError(ErrorCode::ERROR_INTERNAL, "No dispatcher factory instantiated");
    }
}


void DispatchingTcpServer::ServeClient(shared_ptr<tcp::socket> socket)
{
    shared_ptr<IProtoBufChannel> connection( new AsyncProtoBufTcpChannel(socket) );
    shared_ptr<ProtoBufClientSession> session( ProtoBufClientSession::Create(connection) );
    shared_ptr<IBlockingRequestDispatcher> dispatcher( _dispatcherFactory->Create(session) );

    LOG(INFO) << "Starting server message loop for connection " << connection->id();

    connection->ReceiveMessage( [session, dispatcher] ( unique_ptr<proxnet::protocol::Message> &&incomingMessage )
        { AsyncServeMessageHandler( move(incomingMessage), session, dispatcher); } );
}


void DispatchingTcpServer::AsyncServeMessageHandler( unique_ptr<proxnet::protocol::Message> &&receivedMessage,
    shared_ptr<ProtoBufClientSession> session, shared_ptr<IBlockingRequestDispatcher> dispatcher )
{
    // Connection was closed or failed to read a complete message, end of session
    if (! receivedMessage)
    {
        LOG(INFO) << "Server message loop ended for session " << session->id();
        return;
    }

    bool sendResponse = true;
    uint32_t messageId = receivedMessage->id();
    unique_ptr<proxnet::protocol::Response> response;
    try
    {
        // If incoming response, connect it with the sent out request and skip further processing
        if ( receivedMessage->has_response() )
        {
            LOG(TRACE) << "Received response message, delivering it to requestor";
            session->ResponseArrived( move(receivedMessage) );
            sendResponse = false;
        }
        else
        {
            if ( ! receivedMessage->has_request() )
                { throw ProximityError(ErrorCode::ERROR_BAD_REQUEST, "Missing request"); }

            LOG(TRACE) << "Serving request";
            unique_ptr<proxnet::protocol::Request> request( receivedMessage->release_request() );
            response = dispatcher->Dispatch( move(request) );
            response->set_status(proxnet::protocol::Status::STATUS_OK);
        }
    }
    catch (ProximityError &pex)
    {
        if ( pex.code() == ErrorCode::ERROR_UPSTREAM || pex.code() == ErrorCode::ERROR_INTERNAL )
        {
            LOG(ERROR) << "Failed to serve request with code "
                << static_cast<uint32_t>( pex.code() ) << ": " << pex.what();
        }
        else
        {
            LOG(WARNING) << "Failed to serve request with code "
                << static_cast<uint32_t>( pex.code() ) << ": " << pex.what();
        }
        response.reset( new proxnet::protocol::Response() );
        response->set_status( Converter::ToProtoBuf( pex.code() ) );
        response->set_details( ClientErrorDetails( pex.code(), pex.what() ) );
    }
    catch (exception &ex)
    {
        LOG(ERROR) << "Failed to serve request: " << ex.what();
        response.reset( new proxnet::protocol::Response() );
        response->set_status(proxnet::protocol::Status::ERROR_INTERNAL);
        response->set_details(INTERNAL_ERROR_DETAILS);
    }

    if (sendResponse)
    {
        LOG(TRACE) << "Sending response";
        unique_ptr<proxnet::protocol::Message> responseMsg( new proxnet::protocol::Message() );
        responseMsg->set_allocated_response( response.release() );
        responseMsg->set_id(messageId);

        try { session->messageChannel()->SendMessage( move(responseMsg), [] {} ); }
        catch (exception &ex)
        {
            LOG(WARNING) << "Failed to send response, ending session " << session->id() << ": " << ex.what();
            return;
        }
    }

    // Schedule next message loop iteration
    session->messageChannel()->ReceiveMessage( [session, dispatcher]
        ( unique_ptr<proxnet::protocol::Message> &&incomingMessage )
        { AsyncServeMessageHandler( move(incomingMessage), session, dispatcher); } );
}



AsyncProtoBufTcpChannel::AsyncProtoBufTcpChannel(shared_ptr<tcp::socket> socket) :
    _socket(socket), _id(), _remoteAddress(), _frames()
{
    if (! _socket)
        { throw ProximityError(ErrorCode::ERROR_INTERNAL, "No socket instantiated"); }

    _remoteAddress = socket->remote_endpoint().address().to_string();
    _id = _remoteAddress + ":" + to_string( socket->remote_endpoint().port() );
    _frames = AsyncFrameStream::Create(_socket, _id);
}


AsyncProtoBufTcpChannel::AsyncProtoBufTcpChannel(const NetworkEndpoint &endpoint) :
    _socket( new tcp::socket( Reactor::Instance().AsioService() ) ),
    _id( endpoint.address() + ":" + to_string( endpoint.port() ) ),
    _remoteAddress( endpoint.address() ),
    _frames()
{
    tcp::resolver resolver( Reactor::Instance().AsioService() );
    asio::error_code error;
    tcp::resolver::results_type addresses = resolver.resolve(
        endpoint.address(), to_string( endpoint.port() ), error );
    if (! error)
        { asio::connect(*_socket, addresses, error); }
    if (error)
    {
        throw ProximityError(ErrorCode::ERROR_UPSTREAM, "Failed connecting to " +
            endpoint.address() + ":" + to_string( endpoint.port() ) + " with error: " + error.message() );
    }
    _frames = AsyncFrameStream::Create(_socket, _id);
    LOG(DEBUG) << "Connected to " << endpoint;
}

AsyncProtoBufTcpChannel::~AsyncProtoBufTcpChannel()
{
    asio::error_code error;
    _socket->close(error);
    LOG(DEBUG) << "Connection closed to " << id();
}


const SessionId& AsyncProtoBufTcpChannel::id() const
    { return _id; }

const Address& AsyncProtoBufTcpChannel::remoteAddress() const
    { return _remoteAddress; }


void AsyncProtoBufTcpChannel::ReceiveMessage( function<ReceivedMessageCallback> callback )
{
    string connectionId = id();
    _frames->ReadFrame( [callback, connectionId] ( unique_ptr<string> &&frame )
    {
        // Connection closed, failed or sent an oversized frame
        if (! frame)
        {
            callback( unique_ptr<proxnet::protocol::Message>() );
            return;
        }

        // Deserialize message from receive buffer, avoid leaks for failing cases with RAII-based unique_ptr
        unique_ptr<proxnet::protocol::MessageWithHeader> message( new proxnet::protocol::MessageWithHeader() );
        if ( ! message->ParseFromString(*frame) || ! message->has_body() )
        {
            LOG(WARNING) << "Connection " << connectionId << " received malformed message";
            callback( unique_ptr<proxnet::protocol::Message>() );
            return;
        }

        string msgDebugStr;
        google::protobuf::TextFormat::PrintToString(*message, &msgDebugStr);
        LOG(TRACE) << "Connection " << connectionId << " received message " << msgDebugStr;

        callback( unique_ptr<proxnet::protocol::Message>( message->release_body() ) );
    } );
}


future< unique_ptr<proxnet::protocol::Message> > AsyncProtoBufTcpChannel::ReceiveMessage(asio::use_future_t<>)
{
    shared_ptr< promise< unique_ptr<proxnet::protocol::Message> > > result(
        new promise< unique_ptr<proxnet::protocol::Message> >() );

    ReceiveMessage( [result] ( unique_ptr<proxnet::protocol::Message> &&receivedMessage )
        { result->set_value( move(receivedMessage) ); } );

    return result->get_future();
}



void AsyncProtoBufTcpChannel::SendMessage( unique_ptr<proxnet::protocol::Message> &&messagePtr,
                                           function<SentMessageCallback> callback )
{
    if ( ! _socket->is_open() )
        { throw ProximityError(ErrorCode::ERROR_PROTOCOL_VIOLATION,
            "Session " + id() + " socket is already closed, cannot write message"); }

    if (! messagePtr)
        { throw ProximityError(ErrorCode::ERROR_INTERNAL, "Got empty message argument to send"); }

    proxnet::protocol::MessageWithHeader message;
    message.set_allocated_body( messagePtr.release() );

    // A nonzero placeholder makes the header serialized with its final size
    message.set_header(1);
    message.set_header( static_cast<uint32_t>( message.ByteSizeLong() - FRAME_HEADER_SIZE ) );
    if (message.header() > MAX_FRAME_BODY_SIZE)
    {
        throw ProximityError( ErrorCode::ERROR_PROTOCOL_VIOLATION, "Message of " +
            to_string( message.header() ) + " bytes is over the size limit" );
    }

    string msgDebugStr;
    google::protobuf::TextFormat::PrintToString(message, &msgDebugStr);
    LOG(TRACE) << "Connection " << id() << " sending message " << msgDebugStr;

    unique_ptr<string> serializedMessage( new string( message.SerializeAsString() ) );
    string connectionId = id();
    _frames->WriteFrame( move(serializedMessage), [callback, connectionId] (bool succeeded)
    {
        if (! succeeded)
            { LOG(DEBUG) << "Message to " << connectionId << " was not delivered"; }
        callback();
    } );
}



future<void> AsyncProtoBufTcpChannel::SendMessage(unique_ptr<proxnet::protocol::Message> &&messagePtr, asio::use_future_t<>)
{
    shared_ptr< promise<void> > result( new promise<void>() );
    SendMessage( move(messagePtr), [result] { result->set_value(); } );
    return result->get_future();
}



shared_ptr<ProtoBufClientSession> ProtoBufClientSession::Create(
        std::shared_ptr<IProtoBufChannel> connection)
    { return shared_ptr<ProtoBufClientSession>( new ProtoBufClientSession(connection) ); }

ProtoBufClientSession::ProtoBufClientSession(shared_ptr<IProtoBufChannel> connection) :
    _messageChannel(connection), _nextMessageId(1)
{
    if (_messageChannel == nullptr)
        { throw ProximityError(ErrorCode::ERROR_INTERNAL, "No connection instantiated"); }
}


void ProtoBufClientSession::AsyncMessageLoopHandler(
    weak_ptr<ProtoBufClientSession> sessionWeakRef, const string &sessionId,
    std::function<IncomingRequestHandler> requestHandler )
{
    shared_ptr<ProtoBufClientSession> sessionPtr = sessionWeakRef.lock();
    if (! sessionPtr) // Session has been closed and destroyed, stop
    {
        LOG(DEBUG) << "Session " << sessionId << " was closed, stopping message loop";
        return;
    }

    sessionPtr->_messageChannel->ReceiveMessage(
        [sessionWeakRef, sessionId, requestHandler] ( unique_ptr<proxnet::protocol::Message> &&incomingMsg )
    {
        try
        {
            if (! incomingMsg)
                { throw ProximityError(ErrorCode::ERROR_PROTOCOL_VIOLATION, "No message received"); }

            if ( incomingMsg->has_request() )
            {
                if (requestHandler)
                    { requestHandler( move(incomingMsg) ); }
            }
            else
            {
                if ( ! incomingMsg->has_response() )
                    { throw ProximityError(ErrorCode::ERROR_PROTOCOL_VIOLATION, "Response message is expected"); }

                shared_ptr<ProtoBufClientSession> sessionPtr = sessionWeakRef.lock();
                if (! sessionPtr)
                    { throw ProximityError(ErrorCode::ERROR_PROTOCOL_VIOLATION, "Session is closed for " + sessionId); }

                LOG(TRACE) << "Dispatching incoming response to request sender";
                sessionPtr->ResponseArrived( move(incomingMsg) );
            }

            asio::post( Reactor::Instance().AsioService(), [sessionWeakRef, sessionId, requestHandler]
                { AsyncMessageLoopHandler(sessionWeakRef, sessionId, requestHandler); } );
        }
        catch (exception &ex)
            { LOG(WARNING) << "Failed to dispatch response, stopping message loop: " << ex.what(); }
    } );
}


void ProtoBufClientSession::StartMessageLoop( std::function<IncomingRequestHandler> requestHandler )
{
    shared_ptr<ProtoBufClientSession> session = shared_from_this();
    string sessionId = session->id();
    weak_ptr<ProtoBufClientSession> sessionWeakRef(session);
    asio::post( Reactor::Instance().AsioService(), [sessionWeakRef, sessionId, requestHandler]
        { AsyncMessageLoopHandler(sessionWeakRef, sessionId, requestHandler); } );
}


ProtoBufClientSession::~ProtoBufClientSession()
{
    // NOTE destruction of the promise<> values of the map will trigger sending a broken_promise exception to related future<> objects, no need to do this manually
}


const SessionId& ProtoBufClientSession::id() const
    { return _messageChannel->id(); }

shared_ptr<IProtoBufChannel> ProtoBufClientSession::messageChannel()
    { return _messageChannel; }

future< unique_ptr<proxnet::protocol::Response> > ProtoBufClientSession::SendRequest(
    unique_ptr<proxnet::protocol::Message> &&requestMessage, uint32_t *messageIdResult )
{
    if (! requestMessage->has_request() )
        { throw ProximityError(ErrorCode::ERROR_INTERNAL, "Attempt to send non-request message"); }

    unique_lock<mutex> pendingRequestGuard(_pendingRequestsMutex);
    uint32_t messageId = _nextMessageId++;
    auto emplaceResult = _pendingRequests.emplace(messageId, promise< unique_ptr<proxnet::protocol::Response> >());
    if (! emplaceResult.second)
        { throw ProximityError(ErrorCode::ERROR_INTERNAL, "Failed to store pending request"); }

    auto result = emplaceResult.first->second.get_future();
    pendingRequestGuard.unlock();

    requestMessage->set_id(messageId);
    if (messageIdResult)
        { *messageIdResult = messageId; }

    try { _messageChannel->SendMessage( move(requestMessage), [] {} ); }
    catch (exception &)
    {
        CancelRequest(messageId);
        throw;
    }

    return result;
}


void ProtoBufClientSession::CancelRequest(uint32_t messageId)
{
    lock_guard<mutex> pendingRequestGuard(_pendingRequestsMutex);
    if ( _pendingRequests.erase(messageId) > 0 )
        { LOG(DEBUG) << "Session " << id() << " cancelled request " << messageId; }
}


size_t ProtoBufClientSession::pendingRequestCount() const
{
    lock_guard<mutex> pendingRequestGuard(_pendingRequestsMutex);
    return _pendingRequests.size();
}


void ProtoBufClientSession::ResponseArrived(unique_ptr<proxnet::protocol::Message> &&responseMessage)
{
    if (! responseMessage)
        { throw ProximityError(ErrorCode::ERROR_INTERNAL, "Implementation error: received null response"); }
    if (! responseMessage->has_response() )
        { throw ProximityError(ErrorCode::ERROR_INTERNAL, "Attempt to receive non-response message"); }

    lock_guard<mutex> pendingRequestGuard(_pendingRequestsMutex);
    LOG(TRACE) << "Looking up request for response message id " << responseMessage->id()
               << " between " << _pendingRequests.size() << " pending requests";

    auto requestIter = _pendingRequests.find( responseMessage->id() );
    if ( requestIter == _pendingRequests.end() )
    {
        // Requests are forgotten when their wait timed out
        LOG(WARNING) << "Session " << id() << " dropped response for unknown or cancelled request "
                     << responseMessage->id();
        return;
    }

    requestIter->second.set_value( unique_ptr<proxnet::protocol::Response>(
        responseMessage->release_response() ) );
    _pendingRequests.erase(requestIter);

    LOG(TRACE) << "Response was dispatched, " << _pendingRequests.size() << " pending requests remain";
}



NetworkDispatcher::NetworkDispatcher( shared_ptr<ProtoBufClientSession> session,
                                      chrono::milliseconds requestTimeout ) :
    _session(session), _requestTimeout(requestTimeout)
{
    if (_session == nullptr)
        { throw ProximityError(ErrorCode::ERROR_INTERNAL, "No session instantiated"); }
}


unique_ptr<proxnet::protocol::Response> NetworkDispatcher::Dispatch(unique_ptr<proxnet::protocol::Request> &&request)
{
    unique_ptr<proxnet::protocol::Message> requestMessage( new proxnet::protocol::Message() );
    requestMessage->set_allocated_request( request.release() );

    uint32_t messageId = 0;
    future< unique_ptr<proxnet::protocol::Response> > futureResponse =
        _session->SendRequest( move(requestMessage), &messageId );
    if ( futureResponse.wait_for(_requestTimeout) != future_status::ready )
    {
        LOG(WARNING) << "Session " << _session->id() << " received no response, timed out";
        _session->CancelRequest(messageId);
        throw ProximityError( ErrorCode::ERROR_UPSTREAM, "Timeout waiting for response of dispatched request" );
    }
    unique_ptr<proxnet::protocol::Response> result( futureResponse.get() );
    if ( result && result->status() != proxnet::protocol::Status::STATUS_OK )
    {
        LOG(DEBUG) << "Session " << _session->id() << " received response code " << result->status()
                   << ", error details: " << result->details();
    }
    return result;
}



shared_ptr<IProximityMethods> ConnectTo(const NetworkEndpoint &endpoint, chrono::milliseconds requestTimeout)
{
    LOG(DEBUG) << "Connecting to " << endpoint;
    shared_ptr<IProtoBufChannel> connection( new AsyncProtoBufTcpChannel(endpoint) );
    shared_ptr<ProtoBufClientSession> session( ProtoBufClientSession::Create(connection) );
    shared_ptr<IBlockingRequestDispatcher> dispatcher( new NetworkDispatcher(session, requestTimeout) );
    shared_ptr<IProximityMethods> result( new ProximityMethodsProtoBufClient(dispatcher) );
    session->StartMessageLoop();
    return result;
}



ProximityDispatcherFactory::ProximityDispatcherFactory( shared_ptr<Config> config,
        shared_ptr<IProximityMethods> iProximity, shared_ptr<IAuthenticator> authenticator ) :
    _config(config), _iProximity(iProximity), _authenticator(authenticator)
{
    if (_config == nullptr)
        { throw ProximityError(ErrorCode::ERROR_INTERNAL, "No config instantiated"); }
    if (_iProximity == nullptr)
        { throw ProximityError(ErrorCode::ERROR_INTERNAL, "No proximity logic instantiated"); }
    if (_authenticator == nullptr)
        { throw ProximityError(ErrorCode::ERROR_INTERNAL, "No authenticator instantiated"); }
}

shared_ptr<IBlockingRequestDispatcher> ProximityDispatcherFactory::Create(shared_ptr<ProtoBufClientSession> session)
{
    return shared_ptr<IBlockingRequestDispatcher>( new IncomingRequestDispatcher( _iProximity, _authenticator,
        session->messageChannel()->remoteAddress(), _config->defaultRadiusMeters() ) );
}



StaticBlockingDispatcherFactory::StaticBlockingDispatcherFactory(shared_ptr<IBlockingRequestDispatcher> dispatcher) :
    _dispatcher(dispatcher) {}

shared_ptr<IBlockingRequestDispatcher> StaticBlockingDispatcherFactory::Create(shared_ptr<ProtoBufClientSession>)
    { return _dispatcher; }



} // namespace ProxNet
