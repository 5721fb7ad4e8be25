#include "dns_client.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>

#include "dns_buffer.h"
#include "dns_errors.h"
#include "dns_socket.h"
#include "dns_utils.h"

DNSClient::DNSClient(int port)
    : port(port)
{}

void DNSClient::address(const std::string& server, sockaddr_in& addr) const
{
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (!str_to_ipv4(server, reinterpret_cast<uint8_t*>(&addr.sin_addr)))
    {
        throw DNSTransportError("\"" + server + "\" is not an IPv4 address");
    }
}

std::vector<uint8_t> DNSClient::exchange(const std::string& server,
                                         const std::vector<uint8_t>& query,
                                         int timeout,
                                         DNSProtocol protocol)
{
    return protocol == DNSProtocol::TCP ?
        requestTcp(server, query, timeout) :
        requestUdp(server, query, timeout);
}

std::vector<uint8_t> DNSClient::requestUdp(const std::string& server, const std::vector<uint8_t>& query, int timeout)
{
    sockaddr_in addr;
    address(server, addr);

    // Connected, so the kernel drops datagrams from any other peer.
    DNSSocket s(SOCK_DGRAM);
    if (connect(s.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == SOCKET_ERROR)
    {
        throw DNSTransportError("Can't connect to " + server + ": " + strerror(errno));
    }
    ssize_t bytes_sent = send(s.get(), reinterpret_cast<const char*>(&query[0]), query.size(), 0);
    if (bytes_sent < 0 || static_cast<size_t>(bytes_sent) < query.size())
    {
        throw DNSTransportError("Error sending UDP data to " + server);
    }

    if (!s.waitRead(timeout))
    {
        throw DNSTransportTimeout(server);
    }

    std::vector<uint8_t> in_buf(UDP_SIZE, 0);
    ssize_t bytes_received = recv(s.get(), reinterpret_cast<char*>(&in_buf[0]), in_buf.size(), 0);
    if (bytes_received < 0)
    {
        throw DNSTransportError("Error receiving UDP data from " + server + ": " + strerror(errno));
    }
    in_buf.resize(static_cast<size_t>(bytes_received));
    return in_buf;
}

namespace {

void recv_all(DNSSocket& s, const std::string& server, int timeout, uint8_t* data, size_t size)
{
    size_t received = 0;
    while (received < size)
    {
        if (!s.waitRead(timeout))
        {
            throw DNSTransportTimeout(server);
        }
        ssize_t bytes = recv(s.get(), reinterpret_cast<char*>(data + received), size - received, 0);
        if (bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))
        {
            continue;
        }
        if (bytes <= 0)
        {
            throw DNSTransportError("Error receiving TCP data from " + server);
        }
        received += static_cast<size_t>(bytes);
    }
}

}

std::vector<uint8_t> DNSClient::requestTcp(const std::string& server, const std::vector<uint8_t>& query, int timeout)
{
    sockaddr_in addr;
    address(server, addr);

    DNSBuffer buf;
    buf.append(static_cast<uint16_t>(0u));  // SIZE (will be calculated later)
    buf.append(&query[0], query.size());
    buf.overwrite_uint16(0, static_cast<uint16_t>(query.size()));

    DNSSocket s(SOCK_STREAM);
    s.setNonBlocking();
    int result = connect(s.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (result == SOCKET_ERROR && errno != EINPROGRESS)
    {
        throw DNSTransportError("Can't connect to " + server + ": " + strerror(errno));
    }
    if (result == SOCKET_ERROR)
    {
        if (!s.waitWrite(timeout))
        {
            throw DNSTransportTimeout(server);
        }
        int error = 0;
        socklen_t len = sizeof(error);
        if (getsockopt(s.get(), SOL_SOCKET, SO_ERROR, &error, &len) < 0 || error != 0)
        {
            throw DNSTransportError("Can't connect to " + server + ": " + strerror(error));
        }
    }

    size_t bytes_sent = 0;
    while (bytes_sent < buf.result.size())
    {
        if (!s.waitWrite(timeout))
        {
            throw DNSTransportTimeout(server);
        }
        ssize_t bytes = send(s.get(), reinterpret_cast<const char*>(&buf.result[bytes_sent]),
                             buf.result.size() - bytes_sent, 0);
        if (bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))
        {
            continue;
        }
        if (bytes <= 0)
        {
            throw DNSTransportError("Error sending TCP data to " + server);
        }
        bytes_sent += static_cast<size_t>(bytes);
    }

    std::vector<uint8_t> in_buf(sizeof(uint16_t), 0);
    recv_all(s, server, timeout, &in_buf[0], in_buf.size());
    size_t pos = 0;
    uint16_t size = get_uint16(in_buf, pos);
    in_buf.assign(size, 0);
    if (size > 0)
    {
        recv_all(s, server, timeout, &in_buf[0], in_buf.size());
    }
    return in_buf;
}
