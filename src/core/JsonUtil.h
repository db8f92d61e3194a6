#pragma once
#include <string>

namespace lanprobe {
namespace jsonutil {

// Escapes a string for use inside a JSON string literal.
std::string escape(const std::string& s);

}
}
