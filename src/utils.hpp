#pragma once
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::string sha256_hex(const std::string &data);
std::string sha256_file_hex(const std::filesystem::path& path);

// True for a bare file name: non-empty, no separators, not "." or "..".
bool is_plain_filename(const std::string& name);

// Incremental SHA-256 for data that arrives in pieces.
class Sha256Stream {
public:
    Sha256Stream();
    ~Sha256Stream();
    Sha256Stream(const Sha256Stream&) = delete;
    Sha256Stream& operator=(const Sha256Stream&) = delete;

    void update(const char* data, std::size_t len);
    std::string final_hex();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
