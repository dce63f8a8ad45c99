/**
 * @file redfish_client_test.cpp
 * @brief Unit tests for RedfishClient with a mocked transport
 *
 * Covers:
 * - Retry counts for 4xx, 5xx and transport failures
 * - Backoff delays handed to the sleeper (non-decreasing, capped)
 * - Session and basic authentication headers
 * - Header allow-list for get_with_headers
 * - Body decoding fallbacks and URL joining
 * - close() and cancellation behaviour
 */

#include "redfish/redfish_client.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "mocks/mock_transport.hpp"

using namespace rfaccess;
using namespace rfaccess::redfish;
using namespace rfaccess::tests;
using namespace testing;
using std::chrono::milliseconds;

class RedfishClientTest : public Test {
protected:
    void SetUp() override {
        config.address = "10.0.0.5";
        config.port = 443;
        config.username = "admin";
        config.password = "secret";
        config.auth_method = AuthMethod::SESSION;
        config.retry.max_retries = 3;
        config.retry.initial_delay_ms = 100;
        config.retry.max_delay_ms = 1000;
        config.retry.backoff_factor = 2.0;
        config.retry.jitter = false;
    }

    std::unique_ptr<RedfishClient> make_client() {
        auto mock = std::make_unique<NiceMock<MockTransport>>();
        transport = mock.get();
        auto client = std::make_unique<RedfishClient>(config, nullptr, std::move(mock));
        client->set_sleeper([this](milliseconds delay) {
            sleeps.push_back(delay);
            return true;
        });
        return client;
    }

    ClientConfig config;
    MockTransport *transport = nullptr;
    std::vector<milliseconds> sleeps;
};

TEST_F(RedfishClientTest, ServerErrorRetriedUntilExhausted) {
    auto client = make_client();
    EXPECT_CALL(*transport, send(_, _, _)).Times(4).WillRepeatedly(RespondWith(503, "busy"));

    RedfishResponse response;
    Error error;
    EXPECT_FALSE(client->get("/redfish/v1", response, error));
    EXPECT_EQ(error.kind, ErrorKind::PROTOCOL);
    EXPECT_EQ(error.http_status, 503);
    EXPECT_NE(error.message.find("503"), std::string::npos);
    EXPECT_THAT(sleeps, ElementsAre(milliseconds(100), milliseconds(200), milliseconds(400)));
}

TEST_F(RedfishClientTest, ClientErrorNotRetried) {
    auto client = make_client();
    EXPECT_CALL(*transport, send(_, _, _)).Times(1).WillOnce(RespondWith(404, "missing"));

    RedfishResponse response;
    Error error;
    EXPECT_FALSE(client->get("/redfish/v1/Nope", response, error));
    EXPECT_EQ(error.kind, ErrorKind::PROTOCOL);
    EXPECT_EQ(error.http_status, 404);
    EXPECT_NE(error.message.find("missing"), std::string::npos);
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(RedfishClientTest, TransportFailureSurfacesLastError) {
    auto client = make_client();
    int attempt = 0;
    EXPECT_CALL(*transport, send(_, _, _))
        .Times(4)
        .WillRepeatedly([&attempt](const HttpRequest &, HttpResponse &, std::string &error) {
            error = "connection refused #" + std::to_string(++attempt);
            return false;
        });

    RedfishResponse response;
    Error error;
    EXPECT_FALSE(client->get("/redfish/v1", response, error));
    EXPECT_EQ(error.kind, ErrorKind::TRANSPORT);
    EXPECT_EQ(error.message, "connection refused #4");
    EXPECT_EQ(sleeps.size(), 3u);
}

TEST_F(RedfishClientTest, RecoversAfterTransientFailures) {
    auto client = make_client();
    EXPECT_CALL(*transport, send(_, _, _))
        .WillOnce(RespondWith(500, "oops"))
        .WillOnce(FailWith("timeout"))
        .WillOnce(RespondWith(200, R"({"Id":"RootService"})"));

    RedfishResponse response;
    Error error;
    ASSERT_TRUE(client->get("/redfish/v1", response, error)) << error.to_string();
    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(response.data["Id"], "RootService");
    EXPECT_EQ(sleeps.size(), 2u);
}

TEST_F(RedfishClientTest, ZeroRetriesMeansSingleAttempt) {
    config.retry.max_retries = 0;
    auto client = make_client();
    EXPECT_CALL(*transport, send(_, _, _)).Times(1).WillOnce(RespondWith(500, "oops"));

    RedfishResponse response;
    Error error;
    EXPECT_FALSE(client->get("/redfish/v1", response, error));
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(RedfishClientTest, BackoffCappedAndNonDecreasing) {
    config.retry.max_retries = 5;
    config.retry.max_delay_ms = 300;
    config.retry.jitter = true;
    auto client = make_client();
    client->set_jitter_source([] { return 0.99; });
    EXPECT_CALL(*transport, send(_, _, _)).Times(6).WillRepeatedly(FailWith("unreachable"));

    RedfishResponse response;
    Error error;
    EXPECT_FALSE(client->get("/redfish/v1", response, error));

    ASSERT_EQ(sleeps.size(), 5u);
    for (size_t i = 0; i < sleeps.size(); ++i) {
        EXPECT_LE(sleeps[i], milliseconds(300)) << "retry " << i;
        if (i > 0) {
            EXPECT_GE(sleeps[i], sleeps[i - 1]) << "retry " << i;
        }
    }
    EXPECT_EQ(sleeps.back(), milliseconds(300));
}

TEST_F(RedfishClientTest, SessionLoginStoresTokenAndAttachesIt) {
    auto client = make_client();

    HttpRequest login_request;
    HttpRequest get_request;
    EXPECT_CALL(*transport, send(_, _, _))
        .WillOnce([&login_request](const HttpRequest &request, HttpResponse &response, std::string &) {
            login_request = request;
            response.status = 201;
            response.headers.emplace("x-auth-token", "tok123");
            return true;
        })
        .WillOnce([&get_request](const HttpRequest &request, HttpResponse &response, std::string &) {
            get_request = request;
            response.status = 200;
            response.body = "{}";
            return true;
        });

    Error error;
    ASSERT_TRUE(client->login(error)) << error.to_string();
    EXPECT_TRUE(client->is_authenticated());
    EXPECT_EQ(client->session_token(), "tok123");

    EXPECT_EQ(login_request.method, "POST");
    EXPECT_EQ(login_request.path, kSessionsPath);
    auto body = nlohmann::json::parse(login_request.body);
    EXPECT_EQ(body["UserName"], "admin");
    EXPECT_EQ(body["Password"], "secret");

    RedfishResponse response;
    ASSERT_TRUE(client->get("/redfish/v1/Systems", response, error));
    EXPECT_EQ(find_header(get_request.headers, "X-Auth-Token"), "tok123");
    EXPECT_EQ(find_header(get_request.headers, "Accept"), "application/json");
    EXPECT_EQ(find_header(get_request.headers, "Authorization"), "");
}

TEST_F(RedfishClientTest, SessionTokenFromBodyFallback) {
    auto client = make_client();
    EXPECT_CALL(*transport, send(_, _, _)).WillOnce(RespondWith(200, R"({"token":"body-token"})"));

    Error error;
    ASSERT_TRUE(client->login(error)) << error.to_string();
    EXPECT_EQ(client->session_token(), "body-token");
}

TEST_F(RedfishClientTest, SessionLoginWithoutTokenFails) {
    auto client = make_client();
    EXPECT_CALL(*transport, send(_, _, _)).WillOnce(RespondWith(201, R"({"Id":"1"})"));

    Error error;
    EXPECT_FALSE(client->login(error));
    EXPECT_EQ(error.kind, ErrorKind::AUTHENTICATION);
    EXPECT_FALSE(client->is_authenticated());
}

TEST_F(RedfishClientTest, SessionLoginRejectedStatusFails) {
    auto client = make_client();
    EXPECT_CALL(*transport, send(_, _, _)).WillOnce(RespondWith(401, "bad credentials"));

    Error error;
    EXPECT_FALSE(client->login(error));
    EXPECT_EQ(error.kind, ErrorKind::PROTOCOL);
    EXPECT_EQ(error.http_status, 401);
    EXPECT_NE(error.message.find("bad credentials"), std::string::npos);
    EXPECT_TRUE(client->session_token().empty());
}

TEST_F(RedfishClientTest, SessionLoginTransportFailure) {
    auto client = make_client();
    EXPECT_CALL(*transport, send(_, _, _)).WillOnce(FailWith("connection refused"));

    Error error;
    EXPECT_FALSE(client->login(error));
    EXPECT_EQ(error.kind, ErrorKind::TRANSPORT);
    EXPECT_TRUE(client->session_token().empty());
}

TEST_F(RedfishClientTest, BasicAuthSendsCredentialsOnEveryRequest) {
    config.auth_method = AuthMethod::BASIC;
    auto client = make_client();

    std::vector<HttpRequest> requests;
    EXPECT_CALL(*transport, send(_, _, _))
        .Times(2)
        .WillRepeatedly([&requests](const HttpRequest &request, HttpResponse &response, std::string &) {
            requests.push_back(request);
            response.status = 200;
            return true;
        });

    Error error;
    ASSERT_TRUE(client->login(error));
    EXPECT_FALSE(client->is_authenticated());  // No session token in basic mode

    RedfishResponse response;
    ASSERT_TRUE(client->get("/redfish/v1", response, error));
    ASSERT_TRUE(client->get("/redfish/v1/Chassis", response, error));

    ASSERT_EQ(requests.size(), 2u);
    for (const auto &request : requests) {
        // base64("admin:secret")
        EXPECT_EQ(find_header(request.headers, "Authorization"), "Basic YWRtaW46c2VjcmV0");
        EXPECT_EQ(find_header(request.headers, "X-Auth-Token"), "");
    }
}

TEST_F(RedfishClientTest, BasicAuthWithoutPasswordSendsNoHeader) {
    config.auth_method = AuthMethod::BASIC;
    config.password.clear();
    auto client = make_client();

    HttpRequest captured;
    EXPECT_CALL(*transport, send(_, _, _))
        .WillOnce([&captured](const HttpRequest &request, HttpResponse &response, std::string &) {
            captured = request;
            response.status = 200;
            return true;
        });

    RedfishResponse response;
    Error error;
    ASSERT_TRUE(client->get("/redfish/v1", response, error));
    EXPECT_EQ(find_header(captured.headers, "Authorization"), "");
}

TEST_F(RedfishClientTest, GetWithHeadersKeepsOnlyAllowList) {
    auto client = make_client();
    EXPECT_CALL(*transport, send(_, _, _))
        .WillOnce(RespondWith(200, "{}", {{"etag", "W/\"1\""}, {"x-custom", "v"}}));

    RedfishResponse response;
    Error error;
    ASSERT_TRUE(client->get_with_headers("/redfish/v1/Systems/1", response, error));

    ASSERT_EQ(response.headers.size(), 1u);
    ASSERT_EQ(response.headers.count("ETag"), 1u);
    EXPECT_THAT(response.headers["ETag"], ElementsAre("W/\"1\""));
}

TEST_F(RedfishClientTest, GetWithHeadersCanonicalisesAllAllowedNames) {
    auto client = make_client();
    HeaderList headers = {{"ALLOW", "GET"},
                          {"content-type", "application/json"},
                          {"Content-Encoding", "gzip"},
                          {"link", "</redfish/v1/$metadata>"},
                          {"link", "</schemas/Foo.json>"},
                          {"Server", "bmc"}};
    EXPECT_CALL(*transport, send(_, _, _)).WillOnce(RespondWith(200, "{}", headers));

    RedfishResponse response;
    Error error;
    ASSERT_TRUE(client->get_with_headers("/redfish/v1", response, error));

    EXPECT_EQ(response.headers.size(), 4u);
    EXPECT_THAT(response.headers["Allow"], ElementsAre("GET"));
    EXPECT_THAT(response.headers["Content-Type"], ElementsAre("application/json"));
    EXPECT_THAT(response.headers["Content-Encoding"], ElementsAre("gzip"));
    EXPECT_THAT(response.headers["Link"], UnorderedElementsAre("</redfish/v1/$metadata>", "</schemas/Foo.json>"));
    EXPECT_EQ(response.headers.count("Server"), 0u);
}

TEST_F(RedfishClientTest, NonJsonBodyReturnedAsString) {
    auto client = make_client();
    EXPECT_CALL(*transport, send(_, _, _)).WillOnce(RespondWith(200, "plain text"));

    RedfishResponse response;
    Error error;
    ASSERT_TRUE(client->get("/redfish/v1/Logs/1", response, error));
    ASSERT_TRUE(response.data.is_string());
    EXPECT_EQ(response.data.get<std::string>(), "plain text");
}

TEST_F(RedfishClientTest, EmptyBodyDecodesToEmptyString) {
    auto client = make_client();
    EXPECT_CALL(*transport, send(_, _, _)).WillOnce(RespondWith(204, ""));

    RedfishResponse response;
    Error error;
    ASSERT_TRUE(client->del("/redfish/v1/SessionService/Sessions/1", response, error));
    EXPECT_EQ(response.status_code, 204);
    ASSERT_TRUE(response.data.is_string());
    EXPECT_TRUE(response.data.get<std::string>().empty());
}

TEST_F(RedfishClientTest, PathWithoutLeadingSlashIsJoined) {
    auto client = make_client();
    EXPECT_EQ(client->build_url("redfish/v1"), "https://10.0.0.5:443/redfish/v1");
    EXPECT_EQ(client->build_url("/redfish/v1"), "https://10.0.0.5:443/redfish/v1");

    HttpRequest captured;
    EXPECT_CALL(*transport, send(_, _, _))
        .WillOnce([&captured](const HttpRequest &request, HttpResponse &response, std::string &) {
            captured = request;
            response.status = 200;
            return true;
        });

    RedfishResponse response;
    Error error;
    ASSERT_TRUE(client->get("redfish/v1/Systems", response, error));
    EXPECT_EQ(captured.path, "/redfish/v1/Systems");
}

TEST_F(RedfishClientTest, PostAndPatchSerialiseJsonBodies) {
    auto client = make_client();
    std::vector<HttpRequest> requests;
    EXPECT_CALL(*transport, send(_, _, _))
        .Times(2)
        .WillRepeatedly([&requests](const HttpRequest &request, HttpResponse &response, std::string &) {
            requests.push_back(request);
            response.status = 200;
            response.body = R"({"ok":true})";
            return true;
        });

    RedfishResponse response;
    Error error;
    ASSERT_TRUE(client->post("/redfish/v1/Actions/Reset", {{"ResetType", "On"}}, response, error));
    ASSERT_TRUE(client->patch("/redfish/v1/Systems/1", {{"AssetTag", "rack-7"}}, response, error));

    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].method, "POST");
    EXPECT_EQ(nlohmann::json::parse(requests[0].body)["ResetType"], "On");
    EXPECT_EQ(find_header(requests[0].headers, "Content-Type"), "application/json");
    EXPECT_EQ(requests[1].method, "PATCH");
    EXPECT_EQ(nlohmann::json::parse(requests[1].body)["AssetTag"], "rack-7");
    EXPECT_TRUE(response.data["ok"]);
}

TEST_F(RedfishClientTest, LogoutClearsTokenWithoutNetworkCall) {
    auto client = make_client();
    EXPECT_CALL(*transport, send(_, _, _))
        .Times(1)
        .WillOnce(RespondWith(201, "", {{"X-Auth-Token", "tok123"}}));

    Error error;
    ASSERT_TRUE(client->login(error));
    client->logout();
    EXPECT_FALSE(client->is_authenticated());
    client->logout();  // Idempotent
}

TEST_F(RedfishClientTest, CloseWithoutLoginIsSafeAndIdempotent) {
    auto client = make_client();
    EXPECT_CALL(*transport, send(_, _, _)).Times(0);
    EXPECT_CALL(*transport, close()).Times(1);

    client->close();
    client->close();
    client.reset();  // Destructor must not close again
}

TEST_F(RedfishClientTest, InvalidConfigurationFailsWithoutNetwork) {
    config.address.clear();
    auto client = make_client();
    EXPECT_CALL(*transport, send(_, _, _)).Times(0);

    Error error;
    EXPECT_FALSE(client->login(error));
    EXPECT_EQ(error.kind, ErrorKind::CONFIGURATION);

    RedfishResponse response;
    EXPECT_FALSE(client->get("/redfish/v1", response, error));
    EXPECT_EQ(error.kind, ErrorKind::CONFIGURATION);
}

TEST_F(RedfishClientTest, CancelledBeforeRequest) {
    auto client = make_client();
    CancellationToken token;
    token.cancel();
    client->set_cancellation_token(&token);
    EXPECT_CALL(*transport, send(_, _, _)).Times(0);

    RedfishResponse response;
    Error error;
    EXPECT_FALSE(client->get("/redfish/v1", response, error));
    EXPECT_EQ(error.kind, ErrorKind::CANCELLED);
}

TEST_F(RedfishClientTest, CancelledDuringBackoff) {
    auto client = make_client();
    CancellationToken token;
    client->set_cancellation_token(&token);
    client->set_sleeper([&token](milliseconds) {
        token.cancel();
        return false;
    });
    EXPECT_CALL(*transport, send(_, _, _)).Times(1).WillOnce(FailWith("timeout"));

    RedfishResponse response;
    Error error;
    EXPECT_FALSE(client->get("/redfish/v1", response, error));
    EXPECT_EQ(error.kind, ErrorKind::CANCELLED);
}

TEST(RedfishHeaderFilterTest, FilterIsCaseInsensitive) {
    HeaderList headers = {{"eTaG", "1"}, {"LINK", "a"}, {"X-Other", "b"}};
    auto filtered = filter_response_headers(headers);

    EXPECT_EQ(filtered.size(), 2u);
    EXPECT_EQ(filtered.count("ETag"), 1u);
    EXPECT_EQ(filtered.count("Link"), 1u);
}

TEST(RedfishHeaderFilterTest, AllowListContents) {
    EXPECT_THAT(allowed_response_headers(),
                UnorderedElementsAre("Allow", "Content-Type", "Content-Encoding", "ETag", "Link"));
}

TEST(ClientConfigTest, DefaultsMatchProtocolExpectations) {
    ClientConfig config;
    EXPECT_EQ(config.port, 443);
    EXPECT_EQ(config.auth_method, AuthMethod::SESSION);
    EXPECT_FALSE(config.insecure_skip_verify);
    EXPECT_EQ(config.request_timeout_ms, 30000);
    EXPECT_EQ(config.retry.max_retries, 3);
    EXPECT_EQ(config.retry.initial_delay_ms, 1000);
    EXPECT_EQ(config.retry.max_delay_ms, 60000);
    EXPECT_DOUBLE_EQ(config.retry.backoff_factor, 2.0);
    EXPECT_TRUE(config.retry.jitter);
}

TEST(ClientConfigTest, AuthMethodParsing) {
    EXPECT_EQ(parse_auth_method("basic"), AuthMethod::BASIC);
    EXPECT_EQ(parse_auth_method("Session"), AuthMethod::SESSION);
    EXPECT_FALSE(parse_auth_method("oauth").has_value());
}

TEST(ClientConfigTest, BaseUrlBracketsIpv6) {
    ClientConfig config;
    config.address = "fe80::1";
    config.port = 8443;
    EXPECT_EQ(config.base_url(), "https://[fe80::1]:8443");
}
