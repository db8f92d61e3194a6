#include "JsonUtil.h"
#include <cstdio>

namespace lanprobe {
namespace jsonutil {

std::string escape(const std::string& s){
    std::string out; out.reserve(s.size()+8);
    for(unsigned char c : s){
        switch(c){
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if(c < 0x20){ char buf[8]; std::snprintf(buf, sizeof(buf), "\\u%04x", c); out += buf; }
                else out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

}
}
