#include "JSONWriter.h"
#include "JsonUtil.h"
#include <sstream>
#include <utility>

namespace lanprobe {
namespace {
    using jsonutil::escape;

    // Insertion-ordered document node.
    struct Node {
        enum Type { T_OBJ, T_ARR, T_STR, T_NUM, T_BOOL } type = T_OBJ;
        std::vector<std::pair<std::string, Node>> obj;
        std::vector<Node> arr;
        std::string str; // string value or number / bool token
        Node() = default;
        explicit Node(Type t): type(t) {}
    };

    Node str_node(const std::string& s){ Node n(Node::T_STR); n.str = s; return n; }
    Node num_node(long long v){ Node n(Node::T_NUM); n.str = std::to_string(v); return n; }
    Node bool_node(bool b){ Node n(Node::T_BOOL); n.str = b ? "true" : "false"; return n; }

    void emit(const Node& n, std::ostream& os, bool pretty, int depth);

    void newline(std::ostream& os, bool pretty, int depth){
        if(!pretty) return;
        os << '\n';
        for(int i=0;i<depth;i++) os << "  ";
    }

    void emit_object(const Node& n, std::ostream& os, bool pretty, int depth){
        os << '{';
        bool first = true;
        for(const auto& kv : n.obj){
            if(!first) os << ',';
            first = false;
            newline(os, pretty, depth+1);
            os << '"' << escape(kv.first) << '"' << (pretty ? ": " : ":");
            emit(kv.second, os, pretty, depth+1);
        }
        if(!n.obj.empty()) newline(os, pretty, depth);
        os << '}';
    }

    void emit_array(const Node& n, std::ostream& os, bool pretty, int depth){
        os << '[';
        bool first = true;
        for(const auto& e : n.arr){
            if(!first) os << ',';
            first = false;
            newline(os, pretty, depth+1);
            emit(e, os, pretty, depth+1);
        }
        if(!n.arr.empty()) newline(os, pretty, depth);
        os << ']';
    }

    void emit(const Node& n, std::ostream& os, bool pretty, int depth){
        switch(n.type){
            case Node::T_STR: os << '"' << escape(n.str) << '"'; break;
            case Node::T_NUM:
            case Node::T_BOOL: os << n.str; break;
            case Node::T_ARR: emit_array(n, os, pretty, depth); break;
            case Node::T_OBJ: emit_object(n, os, pretty, depth); break;
        }
    }

    std::string render(const Node& root, bool pretty){
        std::ostringstream os;
        emit(root, os, pretty, 0);
        if(pretty) os << '\n';
        return os.str();
    }
}

std::string JSONWriter::write(const OpenPortResult& result) const {
    Node root(Node::T_OBJ);
    for(const auto& kv : result) root.obj.emplace_back(std::to_string(kv.first), str_node(kv.second.keyword));
    return render(root, pretty_);
}

std::string JSONWriter::write_detailed(const OpenPortResult& result) const {
    Node root(Node::T_ARR);
    for(const auto& kv : result){
        const OpenPort& p = kv.second;
        Node rec(Node::T_OBJ);
        rec.obj.emplace_back("port", num_node(p.port));
        rec.obj.emplace_back("status", str_node("open"));
        rec.obj.emplace_back("known", bool_node(p.known));
        rec.obj.emplace_back("keyword", str_node(p.known ? p.keyword : ""));
        rec.obj.emplace_back("description", str_node(p.description));
        root.arr.push_back(std::move(rec));
    }
    return render(root, pretty_);
}

std::string JSONWriter::write(const HostRecord& record) const {
    Node root(Node::T_OBJ);
    for(const auto& kv : record){
        Node ips(Node::T_ARR);
        for(const auto& ip : kv.second) ips.arr.push_back(str_node(ip));
        root.obj.emplace_back(kv.first, std::move(ips));
    }
    return render(root, pretty_);
}

std::string JSONWriter::write_detailed(const std::vector<DiscoveredHost>& hosts) const {
    Node root(Node::T_ARR);
    for(const auto& h : hosts){
        Node rec(Node::T_OBJ);
        rec.obj.emplace_back("ip", str_node(h.ip));
        rec.obj.emplace_back("mac", str_node(h.mac));
        rec.obj.emplace_back("comment", str_node(h.vendor));
        root.arr.push_back(std::move(rec));
    }
    return render(root, pretty_);
}

std::string JSONWriter::write_error(const std::string& message) const {
    Node root(Node::T_OBJ);
    root.obj.emplace_back("error", str_node(message));
    return render(root, pretty_);
}

}
