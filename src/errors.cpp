#include "errors.hpp"

namespace clouddrop {
namespace {

class Category final : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "clouddrop"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::ok: return "success";
            case Errc::no_shared_key: return "no shared key for peer";
            case Errc::authentication_failed: return "authentication tag mismatch";
            case Errc::key_import_error: return "malformed peer public key";
            case Errc::connect_failed: return "direct connection could not be established";
            case Errc::channel_timeout: return "timed out waiting for data channel";
            case Errc::encryption_key_timeout: return "timed out waiting for encryption key";
            case Errc::relay_unavailable: return "relay carrier is not available";
            case Errc::transport_closed: return "direct channel closed";
        }
        return "unknown clouddrop error";
    }
};

} // namespace

const boost::system::error_category& error_category() noexcept {
    static const Category kCategory;
    return kCategory;
}

boost::system::error_code make_error_code(Errc e) noexcept {
    return boost::system::error_code(static_cast<int>(e), error_category());
}

Error::Error(Errc code, const std::string& what) : std::runtime_error(what), code_(code) {}

NoSharedKey::NoSharedKey(const std::string& peer)
    : Error(Errc::no_shared_key, "no shared key for peer: " + peer) {}

AuthenticationFailed::AuthenticationFailed(const std::string& peer)
    : Error(Errc::authentication_failed, "authentication failed for data from peer: " + peer) {}

KeyImportError::KeyImportError(const std::string& peer, const std::string& reason)
    : Error(Errc::key_import_error, "cannot import key of peer " + peer + ": " + reason) {}

} // namespace clouddrop
