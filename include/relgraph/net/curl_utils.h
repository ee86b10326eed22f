#pragma once

#include <cstddef> // For size_t
#include <string>

namespace relgraph {
namespace net {

// Standard CURL write callback function to append data to a std::string
inline size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* output) {
    size_t total_size = size * nmemb;
    output->append(static_cast<char*>(contents), total_size);
    return total_size;
}

} // namespace net
} // namespace relgraph
