#ifndef __PROXNET_ASIO_NETWORK_H__
#define __PROXNET_ASIO_NETWORK_H__

#include <functional>
#include <memory>

#include "asio.hpp"
#include "asio/use_future.hpp"
#include "basic.hpp"



namespace ProxNet
{



// Frame layout on the wire: one tag byte, a 4 byte little endian body size, then the body.
const size_t FRAME_HEADER_SIZE      = 5;
const size_t FRAME_SIZE_OFFSET      = 1;
const size_t MAX_FRAME_BODY_SIZE    = 1024 * 1024;

// Body size announced by a frame header, throws ERROR_PROTOCOL_VIOLATION for truncated headers
uint32_t DecodeFrameBodySize(const std::string &header);



// Single io_context shared by servers, client sessions and the worker threads serving them.
class Reactor
{
    static Reactor _instance;

    asio::io_context _asioService;
    asio::executor_work_guard<asio::io_context::executor_type> _keepRunning;

protected:

    Reactor();
    Reactor(const Reactor &other) = delete;
    Reactor& operator=(const Reactor &other) = delete;

public:

    static Reactor& Instance();

    // Serve queued tasks on the calling thread until Shutdown(), failing tasks are logged and skipped
    void RunWorker(const std::string &workerName);
    void Shutdown();
    bool IsShutdown() const;

    asio::io_context& AsioService();
};



// Reads and writes whole frames asynchronously on a socket owned by someone else.
// Read callbacks get the complete frame including its header, or a null pointer
// if the peer closed the connection, the socket failed or the frame is over the size limit.
class AsyncFrameStream : public std::enable_shared_from_this<AsyncFrameStream>
{
public:

    typedef void FrameReadCallback( std::unique_ptr<std::string> &&frame );
    typedef void FrameWrittenCallback( bool succeeded );

private:

    std::weak_ptr<asio::ip::tcp::socket>    _socket;
    SessionId                               _connectionId;
    size_t                                  _maxBodySize;

    AsyncFrameStream( std::weak_ptr<asio::ip::tcp::socket> socket,
                      const SessionId &connectionId, size_t maxBodySize );

    void ReadRemaining( std::unique_ptr<std::string> &&buffer, size_t offset,
                        std::function<FrameReadCallback> completionCallback );
    void WriteRemaining( std::shared_ptr<std::string> buffer, size_t offset,
                         std::function<FrameWrittenCallback> completionCallback );

public:

    static std::shared_ptr<AsyncFrameStream> Create( std::weak_ptr<asio::ip::tcp::socket> socket,
        const SessionId &connectionId, size_t maxBodySize = MAX_FRAME_BODY_SIZE );

    void ReadFrame( std::function<FrameReadCallback> callback );
    void WriteFrame( std::unique_ptr<std::string> &&frame, std::function<FrameWrittenCallback> callback );
};



// TCP server accepting clients asynchronously on a port, concrete services decide how to serve a client.
class TcpServer: public std::enable_shared_from_this<TcpServer>
{
    asio::ip::tcp::acceptor _acceptor;

    void AcceptNext();
    void AsyncAcceptHandler( std::shared_ptr<asio::ip::tcp::socket> socket, const asio::error_code &ec );

protected:

    virtual void ServeClient( std::shared_ptr<asio::ip::tcp::socket> socket ) = 0;

public:

    TcpServer(TcpPort portNumber);
    virtual ~TcpServer();

    void StartListening();
};



} // namespace ProxNet


#endif // __PROXNET_ASIO_NETWORK_H__
