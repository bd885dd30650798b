#pragma once

#include <stdexcept>
#include <string>

namespace gnss_rtk_bridge {

// Root of everything the library throws on its own behalf.
class GnssError : public std::runtime_error {
public:
    explicit GnssError(const std::string &what) : std::runtime_error(what) {}
};

// Malformed NMEA sentence or RTCM field. Affects one unit only.
class ParseError : public GnssError {
public:
    explicit ParseError(const std::string &what) : GnssError(what) {}
};

// Bit cursor ran past the end of an RTCM payload.
class FieldBoundsError : public ParseError {
public:
    explicit FieldBoundsError(const std::string &what) : ParseError(what) {}
};

class ChecksumError : public ParseError {
public:
    explicit ChecksumError(const std::string &what) : ParseError(what) {}
};

// RTCM3 frame failed CRC-24Q. The decoder reports it as RtcmFrameError::Crc.
class CrcError : public ParseError {
public:
    explicit CrcError(const std::string &what) : ParseError(what) {}
};

class ConvergenceError : public GnssError {
public:
    explicit ConvergenceError(const std::string &what) : GnssError(what) {}
};

// Transport level failure; the NTRIP client retries these.
class ConnectionError : public GnssError {
public:
    explicit ConnectionError(const std::string &what) : GnssError(what) {}
};

// Caster rejected the credentials. Never retried.
class AuthenticationError : public GnssError {
public:
    explicit AuthenticationError(const std::string &what) : GnssError(what) {}
};

// Caster does not serve the mountpoint. Never retried.
class NotFoundError : public GnssError {
public:
    explicit NotFoundError(const std::string &what) : GnssError(what) {}
};

class TimeoutError : public GnssError {
public:
    explicit TimeoutError(const std::string &what) : GnssError(what) {}
};

class OperationCancelled : public GnssError {
public:
    OperationCancelled() : GnssError("operation cancelled") {}
};

} // namespace gnss_rtk_bridge
