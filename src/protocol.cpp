#include "protocol.hpp"

#include <stdexcept>

#include "utils.hpp"

json make_list_request(){
    json j;
    j["type"] = "list_request";
    return j;
}

json make_list_response(const std::vector<ModListing>& mods){
    json arr = json::array();
    for(const auto& mod : mods){
        arr.push_back({{"name", mod.name}, {"size", mod.size}});
    }
    json j;
    j["type"] = "list_response";
    j["mods"] = arr;
    return j;
}

json make_fetch_request(const std::string& name){
    json j;
    j["type"] = "fetch_request";
    j["name"] = name;
    return j;
}

json make_fetch_response(const std::string& name, uint64_t size, const std::string& sha256){
    json j;
    j["type"] = "fetch_response";
    j["name"] = name;
    j["size"] = size;
    j["sha256"] = sha256;
    return j;
}

json make_error(const std::string& message){
    json j;
    j["type"] = "error";
    j["error"] = message;
    return j;
}

void expect_type(const json& j, const std::string& type){
    if(!j.is_object()) throw std::runtime_error("malformed reply");
    const std::string got = j.value("type", "");
    if(got == "error"){
        throw std::runtime_error("server error: " + j.value("error", std::string("unknown")));
    }
    if(got != type){
        throw std::runtime_error("unexpected reply '" + got + "', wanted '" + type + "'");
    }
}

std::vector<ModListing> parse_list_response(const json& j){
    expect_type(j, "list_response");
    std::vector<ModListing> out;
    const auto mods = j.value("mods", json::array());
    if(!mods.is_array()) throw std::runtime_error("list_response without mods array");
    for(const auto& entry : mods){
        ModListing mod;
        mod.name = entry.value("name", "");
        mod.size = entry.value("size", 0ULL);
        if(!is_plain_filename(mod.name)){
            throw std::runtime_error("invalid mod name '" + mod.name + "' in listing");
        }
        out.push_back(std::move(mod));
    }
    return out;
}
