#include "Config.h"
#include <algorithm>

namespace link_scope {

bool parse_command_set(const std::string& name, CommandSetKind& out){
    std::string s=name; std::transform(s.begin(),s.end(),s.begin(),::tolower);
    if(s=="auto") { out = CommandSetKind::Auto; return true; }
    if(s=="posix") { out = CommandSetKind::Posix; return true; }
    if(s=="windows") { out = CommandSetKind::Windows; return true; }
    return false;
}

const char* command_set_name(CommandSetKind kind){
    switch(kind){
        case CommandSetKind::Auto: return "auto";
        case CommandSetKind::Posix: return "posix";
        case CommandSetKind::Windows: return "windows";
    }
    return "auto";
}

}
