#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

class NetdumpError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// TCP session could not be established, or a send/recv on it failed.
class ConnectionError : public NetdumpError
{
public:
    using NetdumpError::NetdumpError;
};

// Magic or version mismatch, or a frame that would desynchronize the stream.
class FramingError : public NetdumpError
{
public:
    using NetdumpError::NetdumpError;
};

// Malformed fixed-field payload.
class DecodeError : public NetdumpError
{
public:
    using NetdumpError::NetdumpError;
};

// Local output failure.
class SinkError : public NetdumpError
{
public:
    using NetdumpError::NetdumpError;
};

#endif
