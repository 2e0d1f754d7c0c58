#pragma once
#include <asio.hpp>
#include <filesystem>
#include <memory>
#include <string>
#include "log.hpp"

// Serves the recognized mods of one directory to ServerSource clients.
class ModServer {
public:
    ModServer(asio::io_context& io,
              const std::string& listen_ip,
              unsigned short port,
              std::filesystem::path serve_dir,
              std::string extension,
              std::shared_ptr<Logger> logger = nullptr);

    void start_accept();
    void stop();

    // Bound port; differs from the requested one when that was 0.
    unsigned short port() const { return port_; }
    const std::filesystem::path& serve_dir() const { return serve_dir_; }

private:
    void do_accept();

    asio::ip::tcp::acceptor acceptor_;
    std::filesystem::path serve_dir_;
    std::string extension_;
    std::shared_ptr<Logger> logger_;
    unsigned short port_ = 0;
    bool accepting_ = false;
};
