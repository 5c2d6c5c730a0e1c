#include "auth.hpp"
#include "errors.hpp"
#include <gtest/gtest.h>

using namespace swiv;

namespace {

Request with_authorization(const std::string& value) {
    return Request("GET", "/", {}, {{"Authorization", value}});
}

} // namespace

TEST(Auth, Base64) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
    EXPECT_EQ(base64_encode("secret"), "c2VjcmV0");
    EXPECT_EQ(base64_encode("user:pa ss"), "dXNlcjpwYSBzcw==");
}

TEST(Auth, EmptySecretDisablesGate) {
    AuthGate gate("");
    EXPECT_FALSE(gate.enabled());
    EXPECT_NO_THROW(gate.authenticate(Request()));
    EXPECT_NO_THROW(gate.authenticate(with_authorization("Basic whatever")));
}

TEST(Auth, MatchingHeaderPasses) {
    AuthGate gate("secret");
    EXPECT_TRUE(gate.enabled());
    EXPECT_NO_THROW(gate.authenticate(with_authorization("Basic c2VjcmV0")));
}

TEST(Auth, HeaderNameIsCaseInsensitive) {
    AuthGate gate("secret");
    Request request("GET", "/", {}, {{"authorization", "Basic c2VjcmV0"}});
    EXPECT_NO_THROW(gate.authenticate(request));
}

TEST(Auth, AnythingElseIsUnauthorized) {
    AuthGate gate("secret");
    EXPECT_THROW(gate.authenticate(Request()), Unauthorized);
    for (const char* value : {"", "Basic", "Basic c2VjcmV0 ", "basic c2VjcmV0",
                              "Basic c2VjcmV1", "Bearer c2VjcmV0", "c2VjcmV0"}) {
        EXPECT_FALSE(gate.accepts(value)) << value;
    }
}

TEST(Auth, UnauthorizedCarriesChallenge) {
    Response r = Unauthorized().response();
    EXPECT_EQ(r.status, 401);
    EXPECT_EQ(r.headers.at("WWW-Authenticate"), "Basic realm=\"swiv\"");
    EXPECT_EQ(r.headers.at("Content-Type"), "text/plain");
    EXPECT_EQ(std::get<std::string>(r.body), "Unauthorized");
}
