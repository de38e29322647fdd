#include "PortProber.h"
#include "../core/Logging.h"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace link_scope {

namespace {
// Closes the descriptor on scope exit.
struct SocketGuard {
    int fd;
    ~SocketGuard(){ if(fd >= 0) close(fd); }
};
}

bool TcpConnectProber::port_open(const std::string& ip, int port) const {
    if(port < 1 || port > 65535) return false;
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if(inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) return false;

    SocketGuard sock{socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0)};
    if(sock.fd < 0){
        Logger::instance().trace(std::string("socket() failed: ") + std::strerror(errno));
        return false;
    }

    int rc = connect(sock.fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if(rc == 0) return true;
    if(errno != EINPROGRESS) return false;

    pollfd pfd{sock.fd, POLLOUT, 0};
    int pr;
    do { pr = poll(&pfd, 1, timeout_ms_); } while(pr < 0 && errno == EINTR);
    if(pr <= 0) return false;

    int err = 0; socklen_t len = sizeof(err);
    if(getsockopt(sock.fd, SOL_SOCKET, SO_ERROR, &err, &len) != 0) return false;
    return err == 0;
}

PortProbeResult TcpConnectProber::probe(const std::string& ip, const std::vector<int>& ports){
    PortProbeResult res;
    for(int port : ports){
        if(port_open(ip, port)) res.open_ports.push_back(port);
    }
    res.active = !res.open_ports.empty();
    if(res.active) Logger::instance().trace(ip + ": " + std::to_string(res.open_ports.size()) + " open port(s)");
    return res;
}

}
