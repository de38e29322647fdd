#pragma once
#include <string>
#include <chrono>

namespace link_scope {
namespace jsonutil {

// Escape a string for embedding inside JSON double quotes.
std::string escape(const std::string& s);

// UTC timestamp formatted as YYYY-MM-DDTHH:MM:SSZ.
std::string time_to_iso(std::chrono::system_clock::time_point tp);

}
}
