#pragma once
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using json = nlohmann::json;

// protocol.hpp
// One newline-terminated JSON request per connection. A fetch_response
// header line is followed by exactly `size` raw bytes.
inline constexpr std::size_t kMaxHeaderLine = 64 * 1024;
inline constexpr std::size_t kMaxListingLine = 8 * 1024 * 1024;
inline constexpr std::size_t kTransferBufferSize = 64 * 1024;

struct ModListing {
    std::string name;
    uint64_t size = 0;
};

json make_list_request();
json make_list_response(const std::vector<ModListing>& mods);
json make_fetch_request(const std::string& name);
json make_fetch_response(const std::string& name, uint64_t size, const std::string& sha256);
json make_error(const std::string& message);

// Throws std::runtime_error on an error reply, a reply of another type, or
// an entry whose name is not a plain file name.
std::vector<ModListing> parse_list_response(const json& j);
void expect_type(const json& j, const std::string& type);
