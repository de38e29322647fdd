#pragma once
#include <string>
#include <vector>

namespace link_scope {

struct PortProbeResult {
    bool active = false;
    std::vector<int> open_ports;
};

class PortProber {
public:
    virtual ~PortProber() = default;
    virtual PortProbeResult probe(const std::string& ip, const std::vector<int>& ports) = 0;
};

// Sequential non-blocking TCP connects, one short timeout per port. Socket
// errors count as a closed port.
class TcpConnectProber : public PortProber {
public:
    explicit TcpConnectProber(int connect_timeout_ms) : timeout_ms_(connect_timeout_ms) {}

    PortProbeResult probe(const std::string& ip, const std::vector<int>& ports) override;

    bool port_open(const std::string& ip, int port) const;

private:
    int timeout_ms_;
};

}
