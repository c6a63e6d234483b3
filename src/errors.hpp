#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>

#include <boost/system/error_code.hpp>

namespace clouddrop {

enum class Errc {
    ok = 0,
    no_shared_key = 1,
    authentication_failed,
    key_import_error,
    connect_failed,
    channel_timeout,
    encryption_key_timeout,
    relay_unavailable,
    transport_closed
};

const boost::system::error_category& error_category() noexcept;

boost::system::error_code make_error_code(Errc e) noexcept;

// Base for every synchronous failure raised by this library.
class Error : public std::runtime_error {
public:
    Error(Errc code, const std::string& what);

    boost::system::error_code code() const noexcept { return make_error_code(code_); }
    Errc errc() const noexcept { return code_; }

private:
    Errc code_;
};

class NoSharedKey final : public Error {
public:
    explicit NoSharedKey(const std::string& peer);
};

// Tag verification failed: the data was corrupted or tampered with.
class AuthenticationFailed final : public Error {
public:
    explicit AuthenticationFailed(const std::string& peer);
};

class KeyImportError final : public Error {
public:
    KeyImportError(const std::string& peer, const std::string& reason);
};

} // namespace clouddrop

namespace boost {
namespace system {

template <>
struct is_error_code_enum<clouddrop::Errc> : std::true_type {};

} // namespace system
} // namespace boost
