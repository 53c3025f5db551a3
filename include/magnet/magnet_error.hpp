#ifndef MAGENC_MAGNET_ERROR_HPP
#define MAGENC_MAGNET_ERROR_HPP

#include <stdexcept>
#include <string>

namespace magenc::magnet {

class MagnetError : public std::runtime_error {
public:
    explicit MagnetError(const std::string& message)
        : std::runtime_error(message) {}
};

class MissingIdentifier : public MagnetError {
public:
    MissingIdentifier()
        : MagnetError("Magnet link: no CID-bearing parameter") {}
};

class InvalidParameter : public MagnetError {
public:
    InvalidParameter(const std::string& key, const std::string& reason)
        : MagnetError("Magnet link: invalid parameter '" + key + "': " + reason)
        , key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

} // namespace magenc::magnet

#endif // MAGENC_MAGNET_ERROR_HPP
