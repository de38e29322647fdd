#include "NetUtil.h"
#include <array>
#include <cctype>
#include <stdexcept>
#include <sstream>
#include <vector>

namespace link_scope {

static std::vector<std::string> split(const std::string& s, char sep){
    std::vector<std::string> parts; std::string cur;
    for(char c : s){ if(c==sep){ parts.push_back(cur); cur.clear(); } else cur.push_back(c); }
    parts.push_back(cur);
    return parts;
}

static bool parse_octet(const std::string& s, int& out){
    if(s.empty() || s.size() > 3) return false;
    // canonical decimal only: "01" and "010" are rejected
    if(s.size() > 1 && s[0] == '0') return false;
    int v = 0;
    for(char c : s){ if(!std::isdigit(static_cast<unsigned char>(c))) return false; v = v*10 + (c-'0'); }
    if(v > 255) return false;
    out = v;
    return true;
}

static bool parse_quad(const std::string& ip, std::array<int,4>& out){
    auto parts = split(ip, '.');
    if(parts.size() != 4) return false;
    for(size_t i=0;i<4;++i) if(!parse_octet(parts[i], out[i])) return false;
    return true;
}

bool is_valid_ipv4(const std::string& ip){
    std::array<int,4> q{};
    return parse_quad(ip, q);
}

IpRange parse_ip_range(const std::string& range){
    std::string base = range;
    int cidr = 24;
    auto slash = range.find('/');
    if(slash != std::string::npos){
        base = range.substr(0, slash);
        std::string bits = range.substr(slash+1);
        if(bits.empty() || bits.size() > 2) throw std::invalid_argument("invalid prefix length in range: " + range);
        for(char c : bits) if(!std::isdigit(static_cast<unsigned char>(c))) throw std::invalid_argument("invalid prefix length in range: " + range);
        cidr = std::stoi(bits);
        if(cidr > 32) throw std::invalid_argument("prefix length out of range: " + range);
    }
    auto parts = split(base, '.');
    if(parts.size() < 3 || parts.size() > 4) throw std::invalid_argument("invalid IPv4 range: " + range);
    int dummy = 0;
    for(const auto& p : parts) if(!parse_octet(p, dummy)) throw std::invalid_argument("invalid IPv4 range: " + range);
    IpRange r;
    r.base_network = parts[0] + "." + parts[1] + "." + parts[2];
    r.cidr = cidr;
    return r;
}

std::optional<std::string> normalize_mac(const std::string& mac){
    if(mac.size() != 17) return std::nullopt;
    std::string out; out.reserve(17);
    for(size_t i=0;i<mac.size();++i){
        char c = mac[i];
        if(i % 3 == 2){
            if(c != ':' && c != '-') return std::nullopt;
            out.push_back(':');
            continue;
        }
        if(!std::isxdigit(static_cast<unsigned char>(c))) return std::nullopt;
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

std::string network_prefix(const std::string& ip){
    std::array<int,4> q{};
    if(!parse_quad(ip, q)) return "";
    std::ostringstream os; os << q[0] << '.' << q[1] << '.' << q[2];
    return os.str();
}

int host_octet(const std::string& ip){
    std::array<int,4> q{};
    if(!parse_quad(ip, q)) return -1;
    return q[3];
}

bool IpLess::operator()(const std::string& a, const std::string& b) const {
    std::array<int,4> qa{}, qb{};
    bool va = parse_quad(a, qa), vb = parse_quad(b, qb);
    if(va && vb) return qa < qb;
    if(va != vb) return va; // valid addresses first
    return a < b;
}

}
