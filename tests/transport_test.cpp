// tests/transport_test.cpp
// TLS dialer and client end to end against a loopback gateway.

#include <gtest/gtest.h>
#include "pushgate/client.hpp"
#include "test_gateway.hpp"
#include "transport.hpp"

#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace pushgate {
namespace {

using fakes::PemIdentity;
using fakes::TempFile;
using fakes::TestGateway;
using fakes::make_notification;
using fakes::wait_until;

struct Pki {
    PemIdentity ca = fakes::make_ca();
    PemIdentity server = fakes::make_leaf(ca, "localhost", 2);
    PemIdentity client = fakes::make_leaf(ca, "client.test", 3);
    PemIdentity other_server = fakes::make_leaf(ca, "other.test", 4);
    PemIdentity ip_server = fakes::make_leaf(ca, "127.0.0.1", 5);
};

class TransportTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        pki_ = new Pki();
        ca_file_ = new TempFile(pki_->ca.certificate_pem);
    }

    static void TearDownTestSuite() {
        delete ca_file_;
        delete pki_;
        ca_file_ = nullptr;
        pki_ = nullptr;
    }

    static ClientConfigBuilder config_for(const std::string& gateway) {
        auto builder = ClientConfig::builder(gateway);
        builder.certificate_pem(pki_->client.certificate_pem, pki_->client.key_pem)
               .ca_file(ca_file_->path())
               .network_timeout(std::chrono::milliseconds(2000))
               .logger(fakes::quiet_logger());
        return builder;
    }

    static Pki* pki_;
    static TempFile* ca_file_;
};

Pki* TransportTest::pki_ = nullptr;
TempFile* TransportTest::ca_file_ = nullptr;

// A loopback port with nothing listening on it.
uint16_t closed_port() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    socklen_t len = sizeof(addr);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    ::close(fd);
    return ntohs(addr.sin_port);
}

ErrorKind dial_error(TlsDialer& dialer) {
    try {
        dialer.dial();
    } catch (const PushError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected dial() to throw";
    return ErrorKind::Configuration;
}

// ==================== Dialer ====================

TEST_F(TransportTest, DialerParsesGateway) {
    TlsDialer dialer(config_for("localhost:2195").build());
    EXPECT_EQ(dialer.host(), "localhost");
    EXPECT_EQ(dialer.port(), 2195);
}

TEST_F(TransportTest, WriteReachesGateway) {
    TestGateway gateway(pki_->server, pki_->ca);
    TlsDialer dialer(config_for(gateway.address()).build());

    auto conn = dialer.dial();
    auto frame = make_notification("over tls")->to_bytes();
    ASSERT_TRUE(conn->write_all(frame.data(), frame.size()));

    ASSERT_TRUE(wait_until([&] { return gateway.frames().size() == 1; }));
    EXPECT_EQ(gateway.frames()[0], frame);
    EXPECT_EQ(gateway.handshakes(), 1u);
    conn->close();
}

TEST_F(TransportTest, ReadsErrorResponse) {
    TestGateway gateway(pki_->server, pki_->ca);
    gateway.reject(0, 8);
    TlsDialer dialer(config_for(gateway.address()).build());

    auto conn = dialer.dial();
    auto frame = make_notification()->to_bytes();
    ASSERT_TRUE(conn->write_all(frame.data(), frame.size()));

    uint8_t response[kErrorResponseLength];
    ASSERT_TRUE(conn->read_exact(response, sizeof(response)));
    auto report = encoding::decode_error_response(response);
    EXPECT_EQ(report.command, kErrorResponseCommand);
    EXPECT_EQ(report.status, 8);
    EXPECT_EQ(report.identifier, 0);
    conn->close();
}

TEST_F(TransportTest, CloseUnblocksRead) {
    TestGateway gateway(pki_->server, pki_->ca);
    TlsDialer dialer(config_for(gateway.address()).build());
    auto conn = dialer.dial();

    bool result = true;
    std::thread reader([&] {
        uint8_t buf[kErrorResponseLength];
        result = conn->read_exact(buf, sizeof(buf));
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    conn->close();
    reader.join();
    EXPECT_FALSE(result);

    // Writes fail once closed
    auto frame = make_notification()->to_bytes();
    EXPECT_FALSE(conn->write_all(frame.data(), frame.size()));
}

TEST_F(TransportTest, WriteWhileReaderBlocked) {
    TestGateway gateway(pki_->server, pki_->ca);
    TlsDialer dialer(config_for(gateway.address()).build());
    auto conn = dialer.dial();

    std::thread reader([&] {
        uint8_t buf[kErrorResponseLength];
        conn->read_exact(buf, sizeof(buf));
    });

    for (int i = 0; i < 20; i++) {
        auto frame = make_notification(std::to_string(i))->to_bytes();
        ASSERT_TRUE(conn->write_all(frame.data(), frame.size()));
    }
    EXPECT_TRUE(wait_until([&] { return gateway.frames().size() == 20; }));

    conn->close();
    reader.join();
}

TEST_F(TransportTest, WriteTimesOutWhenGatewayStopsReading) {
    TestGateway gateway(pki_->server, pki_->ca);
    gateway.stall_reads();
    auto config = config_for(gateway.address())
        .network_timeout(std::chrono::milliseconds(200))
        .build();
    TlsDialer dialer(config);
    auto conn = dialer.dial();

    // Fill the socket buffers until a write hits its deadline
    std::vector<uint8_t> chunk(64 * 1024, 0xAB);
    bool ok = true;
    std::chrono::milliseconds last_call{0};
    for (int i = 0; i < 1024 && ok; i++) {
        auto start = std::chrono::steady_clock::now();
        ok = conn->write_all(chunk.data(), chunk.size());
        last_call = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
    }

    EXPECT_FALSE(ok);
    EXPECT_GE(last_call.count(), 150);
    EXPECT_LT(last_call.count(), 2000);
    conn->close();
}

TEST_F(TransportTest, ConnectionRefused) {
    TlsDialer dialer(config_for("127.0.0.1:" + std::to_string(closed_port())).build());
    EXPECT_EQ(dial_error(dialer), ErrorKind::Connect);
}

TEST_F(TransportTest, UntrustedServerRejected) {
    TestGateway gateway(pki_->server, pki_->ca);
    // System trust store does not know the test CA
    auto config = ClientConfig::builder(gateway.address())
        .certificate_pem(pki_->client.certificate_pem, pki_->client.key_pem)
        .network_timeout(std::chrono::milliseconds(2000))
        .logger(fakes::quiet_logger())
        .build();
    TlsDialer dialer(config);
    EXPECT_EQ(dial_error(dialer), ErrorKind::Connect);
}

TEST_F(TransportTest, HostnameMismatchRejected) {
    TestGateway gateway(pki_->other_server, pki_->ca);
    TlsDialer dialer(config_for(gateway.address()).build());
    EXPECT_EQ(dial_error(dialer), ErrorKind::Connect);
}

TEST_F(TransportTest, DialerParsesBracketedIpv6) {
    TlsDialer dialer(config_for("[::1]:2195").build());
    EXPECT_EQ(dialer.host(), "::1");
    EXPECT_EQ(dialer.port(), 2195);
}

TEST_F(TransportTest, IpAddressGatewayVerifiedAgainstIpSan) {
    TestGateway gateway(pki_->ip_server, pki_->ca);
    TlsDialer dialer(config_for("127.0.0.1:" + std::to_string(gateway.port())).build());

    auto conn = dialer.dial();
    auto frame = make_notification()->to_bytes();
    ASSERT_TRUE(conn->write_all(frame.data(), frame.size()));
    EXPECT_TRUE(wait_until([&] { return gateway.frames().size() == 1; }));
    conn->close();
}

TEST_F(TransportTest, IpAddressGatewayRejectsDnsOnlyCertificate) {
    TestGateway gateway(pki_->server, pki_->ca);
    TlsDialer dialer(config_for("127.0.0.1:" + std::to_string(gateway.port())).build());
    EXPECT_EQ(dial_error(dialer), ErrorKind::Connect);
}

TEST_F(TransportTest, MissingCertificate) {
    TestGateway gateway(pki_->server, pki_->ca);
    auto config = ClientConfig::builder(gateway.address())
        .ca_file(ca_file_->path())
        .logger(fakes::quiet_logger())
        .build();
    TlsDialer dialer(config);
    EXPECT_EQ(dial_error(dialer), ErrorKind::Certificate);
    EXPECT_EQ(gateway.handshakes(), 0u);
}

TEST_F(TransportTest, MissingCaFile) {
    auto config = ClientConfig::builder("localhost:2195")
        .certificate_pem(pki_->client.certificate_pem, pki_->client.key_pem)
        .ca_file("/nonexistent/pushgate/ca.pem")
        .logger(fakes::quiet_logger())
        .build();
    TlsDialer dialer(config);
    EXPECT_EQ(dial_error(dialer), ErrorKind::Certificate);
}

// ==================== Client ====================

TEST_F(TransportTest, ClientDeliversNotifications) {
    TestGateway gateway(pki_->server, pki_->ca);
    auto client = Client::create(config_for(gateway.address()).build());

    client->connect();
    for (int i = 0; i < 5; i++) client->send(make_notification(std::to_string(i)));

    ASSERT_TRUE(wait_until([&] { return gateway.received().size() == 5; }));
    EXPECT_EQ(gateway.received(), (std::vector<int32_t>{0, 1, 2, 3, 4}));
    EXPECT_EQ(gateway.handshakes(), 1u);
}

TEST_F(TransportTest, ClientReplaysAfterRejection) {
    TestGateway gateway(pki_->server, pki_->ca);
    // Respond only once all three frames are in, so n2 is already in flight
    gateway.reject(1, 8, 3);

    std::mutex mutex;
    std::vector<DeliveryFailure> failures;
    auto config = config_for(gateway.address())
        .on_failure([&](const DeliveryFailure& f) {
            std::lock_guard<std::mutex> lock(mutex);
            failures.push_back(f);
        })
        .build();
    auto client = Client::create(std::move(config));

    auto n0 = make_notification("zero");
    auto n1 = make_notification("one");
    auto n2 = make_notification("two");
    client->send(n0);
    client->send(n1);
    client->send(n2);

    auto failure_count = [&] {
        std::lock_guard<std::mutex> lock(mutex);
        return failures.size();
    };
    ASSERT_TRUE(wait_until([&] { return failure_count() == 1; }));
    {
        std::lock_guard<std::mutex> lock(mutex);
        EXPECT_EQ(failures[0].notification, n1);
        ASSERT_TRUE(failures[0].report.has_value());
        EXPECT_EQ(failures[0].report->status, 8);
        EXPECT_EQ(failures[0].reason, "Invalid token");
    }

    // n2 arrives again on a new connection under a fresh identifier
    ASSERT_TRUE(wait_until([&] {
        auto ids = gateway.received();
        return std::find(ids.begin(), ids.end(), 3) != ids.end();
    }));
    auto ids = gateway.received();
    EXPECT_EQ(ids, (std::vector<int32_t>{0, 1, 3}));
    EXPECT_EQ(n2->identifier(), 3);
    EXPECT_GE(gateway.handshakes(), 2u);

    client->close();
}

TEST_F(TransportTest, ClientRetriesTimedOutWrite) {
    TestGateway gateway(pki_->server, pki_->ca);
    gateway.stall_reads();

    std::mutex mutex;
    size_t failures = 0;
    auto config = config_for(gateway.address())
        .network_timeout(std::chrono::milliseconds(200))
        .replay_capacity(100)
        .on_failure([&](const DeliveryFailure&) {
            std::lock_guard<std::mutex> lock(mutex);
            failures++;
        })
        .build();
    auto client = Client::create(std::move(config));
    client->connect();

    // Once the first connection's buffers are full, one send waits out the
    // deadline, reconnects and succeeds on the fresh connection.
    const std::string alert(1500, 'x');
    bool retried = false;
    for (int i = 0; i < 50000 && !retried; i++) {
        auto start = std::chrono::steady_clock::now();
        client->send(make_notification(alert));
        retried = std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(150);
    }

    ASSERT_TRUE(retried);
    EXPECT_TRUE(wait_until([&] { return gateway.handshakes() == 2; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    {
        std::lock_guard<std::mutex> lock(mutex);
        EXPECT_EQ(failures, 0u);
    }
    client->close();
}

TEST_F(TransportTest, ClientConnectFailure) {
    auto client = Client::create(config_for("127.0.0.1:" + std::to_string(closed_port())).build());
    try {
        client->send(make_notification());
        FAIL() << "expected PushError";
    } catch (const PushError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Connect);
    }
    EXPECT_TRUE(client->running());
}

TEST_F(TransportTest, ClientCloseStopsSends) {
    TestGateway gateway(pki_->server, pki_->ca);
    auto client = Client::create(config_for(gateway.address()).build());
    client->send(make_notification());
    client->close();

    EXPECT_FALSE(client->running());
    try {
        client->send(make_notification());
        FAIL() << "expected PushError";
    } catch (const PushError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotRunning);
    }
}

} // namespace
} // namespace pushgate
