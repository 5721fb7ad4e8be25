#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "dns_client.h"
#include "dns_errors.h"
#include "dns_request.h"
#include "tst_utils.h"

static const std::string HOST = "127.0.0.1";

// Loopback socket on an ephemeral port, standing in for a nameserver.
class LoopbackServer
{
public:
    LoopbackServer(int type)
        : s(socket(AF_INET, type, 0))
        , port(0)
    {
        sockaddr_in addr = { 0 };
        addr.sin_family = AF_INET;
        addr.sin_port = 0;
        inet_pton(AF_INET, HOST.c_str(), &addr.sin_addr);
        if (s < 0 || bind(s, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0)
        {
            throw std::runtime_error("Can't bind loopback socket");
        }
        socklen_t len = sizeof(addr);
        getsockname(s, reinterpret_cast<sockaddr*>(&addr), &len);
        port = ntohs(addr.sin_port);
        if (type == SOCK_STREAM)
        {
            listen(s, 1);
        }
    }
    ~LoopbackServer()
    {
        if (thread.joinable())
        {
            thread.join();
        }
        close(s);
    }

    // When 'stray' is set it is sent to the client from another port before the real response.
    void answerUdp(const std::vector<uint8_t>& response, const std::vector<uint8_t>& stray = {})
    {
        thread = std::thread{ [this, response, stray]
        {
            std::vector<uint8_t> buf(UDP_SIZE, 0);
            sockaddr_in client = { 0 };
            socklen_t len = sizeof(client);
            ssize_t size = recvfrom(s, reinterpret_cast<char*>(&buf[0]), buf.size(), 0,
                                    reinterpret_cast<sockaddr*>(&client), &len);
            if (size > 0)
            {
                received.assign(buf.begin(), buf.begin() + size);
                if (!stray.empty())
                {
                    int other = socket(AF_INET, SOCK_DGRAM, 0);
                    sendto(other, reinterpret_cast<const char*>(&stray[0]), stray.size(), 0,
                           reinterpret_cast<sockaddr*>(&client), len);
                    close(other);
                }
                sendto(s, reinterpret_cast<const char*>(&response[0]), response.size(), 0,
                       reinterpret_cast<sockaddr*>(&client), len);
            }
        } };
    }

    void answerTcp(const std::vector<uint8_t>& response)
    {
        thread = std::thread{ [this, response]
        {
            int c = accept(s, nullptr, nullptr);
            if (c < 0)
            {
                return;
            }
            uint8_t prefix[2];
            if (recv(c, prefix, sizeof(prefix), MSG_WAITALL) == sizeof(prefix))
            {
                received.resize((prefix[0] << 8) | prefix[1]);
                recv(c, &received[0], received.size(), MSG_WAITALL);
                std::vector<uint8_t> out{ static_cast<uint8_t>(response.size() >> 8),
                                          static_cast<uint8_t>(response.size() & 0xFF) };
                out.insert(out.end(), response.begin(), response.end());
                send(c, &out[0], out.size(), 0);
            }
            close(c);
        } };
    }

    void join()
    {
        thread.join();
    }

public:
    int s;
    int port;
    std::vector<uint8_t> received;

private:
    std::thread thread;
};

TEST(Client, UdpExchange)
{
    LoopbackServer server(SOCK_DGRAM);
    auto query = build_query(555, "domain.com", false);
    auto response = makeResponse(555, FLAG_QR | FLAG_AA, "domain.com", DNSRecordType::A, { rrA("domain.com", "1.1.1.1") });
    server.answerUdp(response);

    DNSClient client(server.port);
    auto result = client.exchange(HOST, query, 5, DNSProtocol::UDP);
    server.join();
    ASSERT_EQ(toHex(response), toHex(result));
    ASSERT_EQ(toHex(query), toHex(server.received));
}

TEST(Client, UdpIgnoresOtherPeers)
{
    LoopbackServer server(SOCK_DGRAM);
    auto query = build_query(556, "domain.com", false);
    auto response = makeResponse(556, FLAG_QR | FLAG_AA, "domain.com", DNSRecordType::A, { rrA("domain.com", "1.1.1.1") });
    auto forged = makeResponse(556, FLAG_QR | FLAG_AA, "domain.com", DNSRecordType::A, { rrA("domain.com", "6.6.6.6") });
    server.answerUdp(response, forged);

    DNSClient client(server.port);
    auto result = client.exchange(HOST, query, 5, DNSProtocol::UDP);
    server.join();
    ASSERT_EQ(toHex(response), toHex(result));
}

TEST(Client, UdpTimeout)
{
    LoopbackServer server(SOCK_DGRAM);
    DNSClient client(server.port);
    ASSERT_THROW(client.exchange(HOST, build_query(1, "domain.com", false), 1, DNSProtocol::UDP), DNSTransportTimeout);
}

TEST(Client, TcpExchange)
{
    LoopbackServer server(SOCK_STREAM);
    auto query = build_query(777, "domain.com", true);
    auto response = makeResponse(777, FLAG_QR | FLAG_AA, "domain.com", DNSRecordType::MX,
                                 { rrMX("domain.com", 10, "mx1.domain.com") });
    server.answerTcp(response);

    DNSClient client(server.port);
    auto result = client.exchange(HOST, query, 5, DNSProtocol::TCP);
    server.join();
    ASSERT_EQ(toHex(response), toHex(result));
    ASSERT_EQ(toHex(query), toHex(server.received));
}

TEST(Client, ServerMustBeAddress)
{
    DNSClient client;
    ASSERT_THROW(client.exchange("a.root-servers.net", build_query(1, "domain.com", false), 1, DNSProtocol::UDP),
                 DNSTransportError);
}
