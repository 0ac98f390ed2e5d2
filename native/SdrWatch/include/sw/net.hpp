#pragma once
// Winsock / POSIX UDP yardımcıları. Sadece .cpp dosyalarından include edilir.
#include <cstdint>

#ifdef _WIN32
  #include <winsock2.h>
  #include <ws2tcpip.h>
  #pragma comment(lib, "Ws2_32.lib")
#else
  #include <unistd.h>
  #include <fcntl.h>
  #include <arpa/inet.h>
  #include <netinet/in.h>
  #include <sys/socket.h>
#endif

namespace sw {
namespace net {

#ifdef _WIN32
using sock_t = SOCKET;
constexpr sock_t kBadSock = INVALID_SOCKET;
using socklen_t = int;

inline void wsainit() {
    static bool started = false;
    if (!started) { WSADATA w; WSAStartup(MAKEWORD(2,2), &w); started = true; }
}
inline void closesock(sock_t s) { if (s != kBadSock) ::closesocket(s); }
inline void set_nonblock(sock_t s) { u_long m=1; ioctlsocket(s, FIONBIO, &m); }
#else
using sock_t = int;
constexpr sock_t kBadSock = -1;
using ::socklen_t;

inline void wsainit() {}
inline void closesock(sock_t s) { if (s >= 0) ::close(s); }
inline void set_nonblock(sock_t s) { int fl=fcntl(s,F_GETFL,0); fcntl(s,F_SETFL, fl|O_NONBLOCK); }
#endif

// IPv4 UDP soketi; hata: kBadSock
inline sock_t udp_socket() {
    wsainit();
    return ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
}

// "a.b.c.d" + port -> sockaddr_in; adres geçersizse false
inline bool ipv4_addr(const char* ip, uint16_t port, sockaddr_in& sa) {
    sa = sockaddr_in{};
    sa.sin_family = AF_INET;
    sa.sin_port   = htons(port);
    return ::inet_pton(AF_INET, ip, &sa.sin_addr) == 1;
}

} // namespace net
} // namespace sw
