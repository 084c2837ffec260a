#include "network.hpp"

// NOTE on Windows this includes <winsock(2).h> so must be after asio includes in "network.hpp"
#include <easylogging++.h>

using namespace std;
using namespace asio::ip;



namespace ProxNet
{



bool NetworkEndpoint::isLoopback() const
{
    asio::error_code error;
    address parsedAddress = make_address(_address, error);
    if (error)
    {
        LOG(DEBUG) << "Failed to parse address " << _address << ": " << error.message();
        return false;
    }
    return parsedAddress.is_loopback();
}



uint32_t DecodeFrameBodySize(const string &header)
{
    if ( header.size() < FRAME_HEADER_SIZE )
        { throw ProximityError(ErrorCode::ERROR_PROTOCOL_VIOLATION, "Truncated frame header"); }

    const uint8_t *data = reinterpret_cast<const uint8_t*>( header.data() + FRAME_SIZE_OFFSET );
    return static_cast<uint32_t>( data[0] )         | ( static_cast<uint32_t>( data[1] ) << 8 ) |
         ( static_cast<uint32_t>( data[2] ) << 16 ) | ( static_cast<uint32_t>( data[3] ) << 24 );
}



Reactor Reactor::_instance;

Reactor::Reactor(): _asioService(), _keepRunning( asio::make_work_guard(_asioService) ) {}

Reactor& Reactor::Instance() { return _instance; }
asio::io_context& Reactor::AsioService() { return _asioService; }

bool Reactor::IsShutdown() const { return _asioService.stopped(); }

void Reactor::Shutdown()
{
    LOG(DEBUG) << "Shutting down reactor";
    _keepRunning.reset();
    _asioService.stop();
}


void Reactor::RunWorker(const string &workerName)
{
    LOG(DEBUG) << "Worker " << workerName << " started";
    while ( ! IsShutdown() )
    {
        try
        {
            // The work guard keeps run_one() blocking even without pending tasks
            _asioService.run_one();
        }
        catch (exception &ex)
        {
            LOG(WARNING) << "Worker " << workerName << " failed at a single task: " << ex.what();
        }
    }
    LOG(DEBUG) << "Worker " << workerName << " shut down";
}



shared_ptr<AsyncFrameStream> AsyncFrameStream::Create( weak_ptr<tcp::socket> socket,
        const SessionId &connectionId, size_t maxBodySize )
    { return shared_ptr<AsyncFrameStream>( new AsyncFrameStream(socket, connectionId, maxBodySize) ); }

AsyncFrameStream::AsyncFrameStream( weak_ptr<tcp::socket> socket,
                                    const SessionId &connectionId, size_t maxBodySize ) :
    _socket(socket), _connectionId(connectionId), _maxBodySize(maxBodySize) {}


void AsyncFrameStream::ReadFrame( function<FrameReadCallback> callback )
{
    unique_ptr<string> header( new string(FRAME_HEADER_SIZE, 0) );
    shared_ptr<AsyncFrameStream> self = shared_from_this();
    ReadRemaining( move(header), 0, [self, callback] ( unique_ptr<string> &&headerRead )
    {
        if (! headerRead)
        {
            callback( unique_ptr<string>() );
            return;
        }

        uint32_t bodySize = DecodeFrameBodySize(*headerRead);
        if (bodySize > self->_maxBodySize)
        {
            LOG(WARNING) << "Connection " << self->_connectionId << " sent a frame of "
                         << bodySize << " bytes over the limit, dropping it";
            callback( unique_ptr<string>() );
            return;
        }

        // Header and body are parsed together, read the body right after the header
        unique_ptr<string> frame( move(headerRead) );
        frame->resize(FRAME_HEADER_SIZE + bodySize, 0);
        self->ReadRemaining( move(frame), FRAME_HEADER_SIZE, callback );
    } );
}


void AsyncFrameStream::ReadRemaining( unique_ptr<string> &&buffer, size_t offset,
                                      function<FrameReadCallback> completionCallback )
{
    // Nothing more to read, e.g. frame with an empty body
    if ( offset == buffer->size() )
    {
        completionCallback( move(buffer) );
        return;
    }

    shared_ptr<tcp::socket> socket = _socket.lock();
    if ( ! socket || ! socket->is_open() )
    {
        LOG(DEBUG) << "Connection " << _connectionId << " is closed, stop reading";
        completionCallback( unique_ptr<string>() );
        return;
    }

    // Keep the buffer alive until completion, asio only sees its raw memory
    shared_ptr<string> pending( buffer.release() );
    shared_ptr<AsyncFrameStream> self = shared_from_this();
    socket->async_read_some( asio::buffer( &pending->operator[](offset), pending->size() - offset ),
        [self, pending, offset, completionCallback] (const asio::error_code &error, size_t bytesRead)
    {
        if (error)
        {
            if (error == asio::error::eof)
                 { LOG(DEBUG) << "Connection " << self->_connectionId << " closed by peer"; }
            else { LOG(WARNING) << "Failed to read from " << self->_connectionId << ": " << error.message(); }
            completionCallback( unique_ptr<string>() );
            return;
        }
        self->ReadRemaining( unique_ptr<string>( new string( move(*pending) ) ),
                             offset + bytesRead, completionCallback );
    } );
}



void AsyncFrameStream::WriteFrame( unique_ptr<string> &&frame, function<FrameWrittenCallback> callback )
{
    if (! frame)
        { throw ProximityError(ErrorCode::ERROR_INTERNAL, "Got empty frame to write"); }
    if ( frame->size() < FRAME_HEADER_SIZE || frame->size() - FRAME_HEADER_SIZE > _maxBodySize )
    {
        throw ProximityError( ErrorCode::ERROR_INTERNAL, "Invalid frame size " +
            to_string( frame->size() ) + " to write" );
    }

    WriteRemaining( shared_ptr<string>( frame.release() ), 0, callback );
}


void AsyncFrameStream::WriteRemaining( shared_ptr<string> buffer, size_t offset,
                                       function<FrameWrittenCallback> completionCallback )
{
    if ( offset == buffer->size() )
    {
        LOG(TRACE) << "Frame was written to " << _connectionId;
        completionCallback(true);
        return;
    }

    shared_ptr<tcp::socket> socket = _socket.lock();
    if ( ! socket || ! socket->is_open() )
    {
        LOG(DEBUG) << "Connection " << _connectionId << " is closed, stop writing";
        completionCallback(false);
        return;
    }

    shared_ptr<AsyncFrameStream> self = shared_from_this();
    socket->async_write_some( asio::buffer( &buffer->operator[](offset), buffer->size() - offset ),
        [self, buffer, offset, completionCallback] (const asio::error_code &error, size_t bytesWritten)
    {
        if (error)
        {
            LOG(WARNING) << "Failed to write to " << self->_connectionId << ": " << error.message();
            completionCallback(false);
            return;
        }
        self->WriteRemaining( buffer, offset + bytesWritten, completionCallback );
    } );
}



TcpServer::TcpServer(TcpPort portNumber) :
    _acceptor( Reactor::Instance().AsioService() )
{
    tcp::endpoint endpoint( tcp::v4(), portNumber );
    _acceptor.open( endpoint.protocol() );
    _acceptor.set_option( tcp::acceptor::reuse_address(true) );
    _acceptor.bind(endpoint);
}

TcpServer::~TcpServer()
{
    asio::error_code error;
    _acceptor.close(error);
}


void TcpServer::StartListening()
{
    LOG(DEBUG) << "Accepting connections on port " << _acceptor.local_endpoint().port();
    _acceptor.listen();
    AcceptNext();
}


void TcpServer::AcceptNext()
{
    shared_ptr<tcp::socket> socket( new tcp::socket( Reactor::Instance().AsioService() ) );
    weak_ptr<TcpServer> self = shared_from_this();
    _acceptor.async_accept( *socket, [self, socket] (const asio::error_code &ec)
    {
        shared_ptr<TcpServer> server = self.lock();
        if (server) { server->AsyncAcceptHandler(socket, ec); }
    } );
}


void TcpServer::AsyncAcceptHandler(shared_ptr<tcp::socket> socket, const asio::error_code &ec)
{
    if (ec)
    {
        // Closing the acceptor cancels the pending accept, stop silently then
        if (ec != asio::error::operation_aborted)
            { LOG(ERROR) << "Failed to accept connection: " << ec.message(); }
        return;
    }

    asio::error_code error;
    tcp::endpoint remote = socket->remote_endpoint(error);
    if (error)
        { LOG(DEBUG) << "Accepted client disconnected immediately: " << error.message(); }
    else { LOG(DEBUG) << "Connection accepted from " << remote.address().to_string() << ":" << remote.port(); }

    AcceptNext();
    if (! error)
        { ServeClient(socket); }
}



} // namespace ProxNet
