#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>

#include "core/Response.hpp"

class Connection;
class RequestContext;

// How handlers answer. Either one send(), or beginStream() + writeChunk()* +
// endStream(). Every call returns false once the client is gone.
class ResponseWriter {
public:
    virtual ~ResponseWriter() = default;

    virtual bool send(const Response& res) = 0;

    virtual bool beginStream(int status, const std::unordered_map<std::string, std::string>& headers) = 0;
    virtual bool writeChunk(const char* data, std::size_t len) = 0;
    virtual bool endStream() = 0;

    // status line already written
    virtual bool committed() const = 0;

    // status sent to the client, 0 while not committed
    virtual int status() const = 0;

    // Polls the client without writing. Once false, stays false.
    virtual bool connected() = 0;
};

// Writes HTTP/1.1 to a Connection; streams use chunked transfer encoding.
// HEAD requests get the head only.
class ConnectionResponseWriter : public ResponseWriter {
public:
    ConnectionResponseWriter(Connection& conn, RequestContext& ctx);

    bool send(const Response& res) override;

    bool beginStream(int status, const std::unordered_map<std::string, std::string>& headers) override;
    bool writeChunk(const char* data, std::size_t len) override;
    bool endStream() override;

    bool committed() const override { return sentStatus != 0; }
    int status() const override { return sentStatus; }

    bool connected() override;

private:
    bool emit(const std::string& data);
    bool emit(const char* data, std::size_t len);

    Connection& conn;
    RequestContext& ctx;
    bool headOnly;
    bool streaming = false;
    int sentStatus = 0;
};
