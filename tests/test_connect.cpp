#include "client_fixture.hpp"

using namespace simq::mqtt;
using namespace simq::mqtt::test;

using ConnectTest = ClientTest;

TEST_F(ConnectTest, MinimalConnectEncoding) {
    auto client = make_client();
    feed_connack();

    EXPECT_FALSE(client->connect(true));

    std::vector<uint8_t> expected = {
        0x10, 0x0F,                         // CONNECT, remaining length 15
        0x00, 0x04, 'M', 'Q', 'T', 'T',     // protocol name
        0x04,                               // protocol level
        0x02,                               // clean session
        0x00, 0x00,                         // keep alive
        0x00, 0x03, 'a', 'b', 'c'           // client id
    };
    EXPECT_EQ(written(), expected);
    EXPECT_TRUE(client->is_connected());
    EXPECT_EQ(state->unread(), 0u);
}

TEST_F(ConnectTest, LastWillSetsFlagsAndPayload) {
    ClientConfig config = make_config();
    config.set_last_will("a", "b", true, QOS_1);
    auto client = make_client(config);
    feed_connack();

    client->connect(true);

    std::vector<uint8_t> out = written();
    ASSERT_GE(out.size(), 10u);
    EXPECT_EQ(out[1], 21);
    EXPECT_EQ(out[9], 0x2E);
    std::vector<uint8_t> tail(out.end() - 6, out.end());
    EXPECT_EQ(tail, (std::vector<uint8_t>{ 0x00, 0x01, 'a', 0x00, 0x01, 'b' }));
}

TEST_F(ConnectTest, CredentialsAndKeepAlive) {
    ClientConfig config = make_config();
    config.username = "u";
    config.password = "pw";
    config.keep_alive = 60;
    auto client = make_client(config);
    feed_connack();

    client->connect(false);

    std::vector<uint8_t> out = written();
    EXPECT_EQ(out[1], 15 + 3 + 4);
    EXPECT_EQ(out[9], 0xC0);
    EXPECT_EQ(out[10], 0x00);
    EXPECT_EQ(out[11], 60);
    std::vector<uint8_t> tail(out.end() - 7, out.end());
    EXPECT_EQ(tail, (std::vector<uint8_t>{ 0x00, 0x01, 'u', 0x00, 0x02, 'p', 'w' }));
}

TEST_F(ConnectTest, PasswordWithoutUsernameIsNotSent) {
    ClientConfig config = make_config();
    config.password = "pw";
    auto client = make_client(config);
    feed_connack();

    client->connect(true);

    std::vector<uint8_t> out = written();
    EXPECT_EQ(out[1], 15);
    EXPECT_EQ(out[9], 0x02);
    EXPECT_EQ(out.size(), 17u);
}

TEST_F(ConnectTest, ReturnsSessionPresent) {
    auto client = make_client();
    feed_connack(0x01);
    EXPECT_TRUE(client->connect(false));
}

TEST_F(ConnectTest, UsesConfiguredHostAndDefaultPort) {
    auto client = make_client();
    feed_connack();
    client->connect();

    EXPECT_EQ(state->host, "broker.test");
    EXPECT_EQ(state->port, 1883);
    EXPECT_FALSE(state->upgraded);
}

TEST_F(ConnectTest, TlsUpgradesAndDefaultsToSecurePort) {
    ClientConfig config = make_config();
    config.use_tls = true;
    auto client = make_client(config);
    feed_connack();
    client->connect();

    EXPECT_EQ(state->port, 8883);
    EXPECT_TRUE(state->upgraded);
}

TEST_F(ConnectTest, ExplicitPortWins) {
    ClientConfig config = make_config();
    config.port = 11883;
    config.use_tls = true;
    EXPECT_EQ(config.effective_port(), 11883);
}

TEST_F(ConnectTest, AppliesSocketTimeout) {
    auto client = make_client();
    feed_connack();
    client->connect(true, Timeout::after(std::chrono::milliseconds(250)));

    ASSERT_FALSE(state->timeouts.empty());
    EXPECT_EQ(state->timeouts.front(), SocketTimeout(std::chrono::milliseconds(250)));
}

TEST_F(ConnectTest, DefaultTimeoutComesFromConfig) {
    auto client = make_client();
    feed_connack();
    client->connect();

    ASSERT_FALSE(state->timeouts.empty());
    EXPECT_EQ(state->timeouts.front(), SocketTimeout(std::chrono::milliseconds(1000)));
}

TEST_F(ConnectTest, RejectionCodesRaiseDistinctErrors) {
    auto expect_rejection = [this](uint8_t code, auto tag) {
        using Expected = decltype(tag);
        auto client = make_client();
        feed_connack(0, code);
        EXPECT_THROW(client->connect(), Expected) << "code " << static_cast<int>(code);
        EXPECT_FALSE(client->is_connected());
    };

    expect_rejection(1, UnacceptableProtocolVersionException());
    expect_rejection(2, IdentifierRejectedException());
    expect_rejection(3, ServerUnavailableException());
    expect_rejection(4, BadCredentialsException());
    expect_rejection(5, NotAuthorizedException());
}

TEST_F(ConnectTest, RejectionCarriesReturnCode) {
    auto client = make_client();
    feed_connack(0, 4);
    try {
        client->connect();
        FAIL() << "connect should have thrown";
    }
    catch (const ConnectRejectedException& e) {
        EXPECT_EQ(e.code(), ConnectReturnCode::BAD_USERNAME_OR_PASSWORD);
        EXPECT_TRUE(e.is_fatal());
    }
}

TEST_F(ConnectTest, UnknownReturnCodeIsGenericConnectError) {
    auto client = make_client();
    feed_connack(0, 0x07);
    try {
        client->connect();
        FAIL() << "connect should have thrown";
    }
    catch (const ConnectRejectedException&) {
        FAIL() << "unknown code mapped to a specific rejection";
    }
    catch (const ConnectException& e) {
        EXPECT_EQ(e.raw_code(), 0x07);
    }
    EXPECT_EQ(state->closes, 1);
}

TEST_F(ConnectTest, MalformedConnackIsProtocolError) {
    auto client = make_client();
    state->feed({ 0x21, 0x02, 0x00, 0x00 });
    EXPECT_THROW(client->connect(), ConnectProtocolException);
    EXPECT_FALSE(client->is_connected());

    state->inbound.clear();
    state->feed({ 0x20, 0x03, 0x00, 0x00 });
    EXPECT_THROW(client->connect(), ConnectProtocolException);
}

TEST_F(ConnectTest, ShortConnackIsFramingError) {
    auto client = make_client();
    state->feed({ 0x20, 0x02 });
    state->peer_closed = true;
    EXPECT_THROW(client->connect(), FramingMismatchException);
}

TEST_F(ConnectTest, ClosedBeforeConnackIsTransportClosed) {
    auto client = make_client();
    state->peer_closed = true;
    EXPECT_THROW(client->connect(), TransportClosedException);
    EXPECT_EQ(state->closes, 1);
}

TEST_F(ConnectTest, TransportFailurePropagates) {
    auto client = make_client();
    state->fail_connect = true;
    EXPECT_THROW(client->connect(), TransportException);
    EXPECT_FALSE(client->is_connected());
    EXPECT_TRUE(written().empty());
}

TEST_F(ConnectTest, WillWithQos2IsRejectedBeforeConnecting) {
    ClientConfig config = make_config();
    config.set_last_will("a", "b", false, QOS_2);
    auto client = make_client(config);

    EXPECT_THROW(client->connect(), UnsupportedQoSException);
    EXPECT_EQ(state->connects, 0);
}

TEST_F(ConnectTest, ConnectTwiceIsPreconditionError) {
    auto client = connected_client();
    EXPECT_THROW(client->connect(), PreconditionException);
    EXPECT_TRUE(client->is_connected());
}

TEST_F(ConnectTest, CleanSessionDiscardsPendingAcks) {
    auto client = connected_client();
    EXPECT_EQ(client->publish("t", "m", false, QOS_1), 1);
    EXPECT_EQ(client->pending_acks().size(), 1u);
    client->disconnect();

    feed_connack();
    client->connect(true);
    EXPECT_TRUE(client->pending_acks().empty());
    EXPECT_EQ(client->publish("t", "m", false, QOS_1), 1);
    EXPECT_TRUE(statuses.empty());
}

TEST_F(ConnectTest, ResumedSessionKeepsPendingAcks) {
    auto client = connected_client();
    client->publish("t", "m", false, QOS_1);
    client->disconnect();

    feed_connack(0x01);
    EXPECT_TRUE(client->connect(false));
    EXPECT_TRUE(client->pending_acks().contains(1));
    EXPECT_EQ(client->publish("t", "m", false, QOS_1), 2);
}

TEST_F(ConnectTest, DisconnectWritesPacketAndCloses) {
    auto client = connected_client();
    client->disconnect();

    EXPECT_EQ(written(), (std::vector<uint8_t>{ 0xE0, 0x00 }));
    EXPECT_FALSE(client->is_connected());
    EXPECT_EQ(state->closes, 1);
}

TEST_F(ConnectTest, OperationsRequireConnection) {
    auto client = make_client();
    EXPECT_THROW(client->publish("t", "m"), PreconditionException);
    EXPECT_THROW(client->subscribe("t"), PreconditionException);
    EXPECT_THROW(client->ping(), PreconditionException);
    EXPECT_THROW(client->disconnect(), PreconditionException);
    EXPECT_THROW(client->wait_msg(), PreconditionException);
    EXPECT_THROW(client->check_msg(), PreconditionException);
}

TEST_F(ConnectTest, InvalidConfigIsRejected) {
    ClientConfig config = make_config();
    config.host.clear();
    EXPECT_THROW(MqttClient(config, scripted_factory(state), clock), PreconditionException);

    ClientConfig will_config = make_config();
    EXPECT_THROW(will_config.set_last_will("", "gone"), PreconditionException);
}

TEST_F(ConnectTest, MessageTimeoutMustFitTickArithmetic) {
    ClientConfig config = make_config();
    config.message_timeout_ms = 0x80000000u;
    EXPECT_THROW(MqttClient(config, scripted_factory(state), clock), PreconditionException);

    config.message_timeout_ms = 0x7FFFFFFFu;
    EXPECT_NO_THROW(MqttClient(config, scripted_factory(state), clock));
}
