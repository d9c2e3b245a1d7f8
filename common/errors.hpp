#pragma once

// ============================================================
// errors.hpp -- Exception types shared by transports and sessions
//
//   TransportError   base of every failure that ends a transfer
//     ConnectionLost peer closed/reset the stream, or the stream
//                    violated framing (line too long)
//     TimeoutError   ARQ retry budget or idle period exhausted
//   FilesystemError  storage could not be read/written
//
// Protocol errors (bad command, bad reply) are not exceptions:
// they are answered with an "ERROR: <reason>" line.
// ============================================================

#include <stdexcept>
#include <string>

class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

class ConnectionLost : public TransportError {
public:
    explicit ConnectionLost(const std::string& what) : TransportError(what) {}
};

class TimeoutError : public TransportError {
public:
    explicit TimeoutError(const std::string& what) : TransportError(what) {}
};

class FilesystemError : public std::runtime_error {
public:
    explicit FilesystemError(const std::string& what) : std::runtime_error(what) {}
};
