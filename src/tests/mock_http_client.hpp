#ifndef MAGENC_TEST_MOCK_HTTP_CLIENT_HPP
#define MAGENC_TEST_MOCK_HTTP_CLIENT_HPP

#include <string>
#include <gmock/gmock.h>
#include "network/http_client.hpp"

class MockHttpClient : public magenc::network::HttpClient {
public:
    MOCK_METHOD(magenc::network::HttpResult, get, (const std::string& url), (override));
    MOCK_METHOD(magenc::network::HttpResult, head, (const std::string& url), (override));
    MOCK_METHOD(magenc::network::HttpResult, post,
                (const std::string& url, const std::string& body, const magenc::network::Headers& headers),
                (override));
};

inline magenc::network::HttpResult http_ok(const std::string& body) {
    magenc::network::HttpResult result;
    result.status = 200;
    result.body = body;
    return result;
}

inline magenc::network::HttpResult http_status(unsigned status) {
    magenc::network::HttpResult result;
    result.status = status;
    return result;
}

inline magenc::network::HttpResult http_failure(magenc::network::NetworkError error) {
    magenc::network::HttpResult result;
    result.error = error;
    return result;
}

#endif // MAGENC_TEST_MOCK_HTTP_CLIENT_HPP
