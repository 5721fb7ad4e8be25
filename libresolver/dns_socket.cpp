#include "dns_socket.h"

#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <unistd.h>
#include <sys/select.h>
#include <sys/socket.h>

#include "dns_errors.h"

DNSSocket::DNSSocket(int type)
    : s(::socket(AF_INET, type, 0))
{
    if (s == INVALID_SOCKET)
    {
        throw DNSTransportError(std::string("Can't create socket: ") + strerror(errno));
    }
}

DNSSocket::~DNSSocket()
{
    if (s != INVALID_SOCKET)
    {
        ::close(s);
    }
}

void DNSSocket::setNonBlocking()
{
    int flags = fcntl(s, F_GETFL, 0);
    if (flags == -1)
    {
        throw DNSTransportError("setupsocket error: fcntl(F_GETFL)");
    }
    flags = flags | O_NONBLOCK;
    if (fcntl(s, F_SETFL, flags) < 0)
    {
        throw DNSTransportError("setupsocket error: fcntl(F_SETFL)");
    }
}

bool DNSSocket::waitRead(int timeout)
{
    return wait(timeout, false);
}

bool DNSSocket::waitWrite(int timeout)
{
    return wait(timeout, true);
}

bool DNSSocket::wait(int timeout, bool write)
{
    fd_set set;
    FD_ZERO(&set);
    FD_SET(s, &set);

    timeval tv = { 0 };
    tv.tv_sec = timeout;

    int result;
    do
    {
        result = ::select(s + 1, write ? nullptr : &set, write ? &set : nullptr, nullptr, &tv);
    } while (result == SOCKET_ERROR && errno == EINTR);

    if (result == SOCKET_ERROR)
    {
        throw DNSTransportError(std::string("select() failed: ") + strerror(errno));
    }
    return result > 0;
}
