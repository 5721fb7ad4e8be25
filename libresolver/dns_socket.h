#pragma once

typedef int SOCKET;
#define INVALID_SOCKET -1
#define SOCKET_ERROR -1

// Owns one socket descriptor and closes it on every exit path.
class DNSSocket
{
public:
    DNSSocket(int type);
    ~DNSSocket();

    DNSSocket(const DNSSocket&) = delete;
    DNSSocket& operator = (const DNSSocket&) = delete;

    SOCKET get() const { return s; }

    void setNonBlocking();
    bool waitRead(int timeout);
    bool waitWrite(int timeout);

private:
    bool wait(int timeout, bool write);

    SOCKET s;
};
