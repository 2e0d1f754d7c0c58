#include "utils.hpp"
#include <openssl/evp.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

struct Sha256Stream::Impl {
    EVP_MD_CTX* ctx = nullptr;
};

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

Sha256Stream::Sha256Stream() : impl_(std::make_unique<Impl>()) {
    impl_->ctx = EVP_MD_CTX_new();
    if(!impl_->ctx || EVP_DigestInit_ex(impl_->ctx, EVP_sha256(), nullptr) != 1){
        EVP_MD_CTX_free(impl_->ctx);
        throw std::runtime_error("sha256 init failed");
    }
}

Sha256Stream::~Sha256Stream(){
    EVP_MD_CTX_free(impl_->ctx);
}

void Sha256Stream::update(const char* data, std::size_t len){
    if(len == 0) return;
    if(EVP_DigestUpdate(impl_->ctx, data, len) != 1){
        throw std::runtime_error("sha256 update failed");
    }
}

std::string Sha256Stream::final_hex(){
    std::vector<unsigned char> out(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if(EVP_DigestFinal_ex(impl_->ctx, out.data(), &len) != 1){
        throw std::runtime_error("sha256 final failed");
    }
    out.resize(len);
    return hex_from_bytes(out);
}

std::string sha256_hex(const std::string &data){
    Sha256Stream sha;
    sha.update(data.data(), data.size());
    return sha.final_hex();
}

std::string sha256_file_hex(const std::filesystem::path& path){
    std::ifstream in(path, std::ios::binary);
    if(!in) throw std::runtime_error("cannot open " + path.string());
    Sha256Stream sha;
    std::vector<char> buf(64 * 1024);
    while(in){
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        sha.update(buf.data(), static_cast<std::size_t>(in.gcount()));
    }
    if(in.bad()) throw std::runtime_error("read error on " + path.string());
    return sha.final_hex();
}

bool is_plain_filename(const std::string& name){
    if(name.empty() || name == "." || name == "..") return false;
    return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}
