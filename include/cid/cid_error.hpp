#ifndef MAGENC_CID_ERROR_HPP
#define MAGENC_CID_ERROR_HPP

#include <stdexcept>
#include <string>

namespace magenc::cid {

class CidError : public std::runtime_error {
public:
    explicit CidError(const std::string& message)
        : std::runtime_error(message) {}
};

class MalformedCID : public CidError {
public:
    explicit MalformedCID(const std::string& message)
        : CidError("Malformed CID: " + message) {}
};

} // namespace magenc::cid

#endif // MAGENC_CID_ERROR_HPP
