#include "mod_server.hpp"

#include <algorithm>
#include <fstream>
#include <istream>
#include <vector>

#include "local_inventory.hpp"
#include "protocol.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

// Handles exactly one request, then closes.
class ServerSession : public std::enable_shared_from_this<ServerSession> {
public:
    ServerSession(asio::ip::tcp::socket sock,
                  fs::path serve_dir,
                  std::string extension,
                  std::shared_ptr<Logger> logger)
    : socket_(std::move(sock)),
      read_buf_(kMaxHeaderLine),
      serve_dir_(std::move(serve_dir)),
      extension_(std::move(extension)),
      logger_(std::move(logger)),
      chunk_(kTransferBufferSize)
    {
    }

    void start(){
        auto self = shared_from_this();
        asio::async_read_until(socket_, read_buf_, "\n",
            [this, self](std::error_code ec, std::size_t){
                if(ec){
                    log_debug(logger_.get(), "request read failed: {}", ec.message());
                    close();
                    return;
                }
                std::istream is(&read_buf_);
                std::string line;
                std::getline(is, line);
                handle_line(line);
            });
    }

private:
    void handle_line(const std::string& line){
        json request;
        try{
            request = json::parse(line);
        } catch(const std::exception& ex){
            log_warn(logger_.get(), "Failed to parse request: {}", ex.what());
            send_and_close(make_error("malformed request"));
            return;
        }

        const std::string type = request.value("type", "");
        if(type == "list_request"){
            handle_list();
        } else if(type == "fetch_request"){
            handle_fetch(request.value("name", ""));
        } else {
            send_and_close(make_error("unknown request type '" + type + "'"));
        }
    }

    void handle_list(){
        std::vector<ModListing> mods;
        try{
            auto inventory = LocalInventory::scan(serve_dir_, extension_, true);
            for(const auto& name : inventory->names()){
                mods.push_back(ModListing{name, *inventory->size_of(name)});
            }
        } catch(const std::exception& ex){
            log_error(logger_.get(), "listing {} failed: {}", serve_dir_.string(), ex.what());
            send_and_close(make_error("cannot list mods"));
            return;
        }
        log_info(logger_.get(), "listing {} mods", mods.size());
        send_and_close(make_list_response(mods));
    }

    void handle_fetch(const std::string& name){
        if(!is_plain_filename(name) || !has_artifact_extension(name, extension_)){
            send_and_close(make_error("invalid mod name '" + name + "'"));
            return;
        }
        const auto path = serve_dir_ / name;
        std::error_code ec;
        if(!fs::is_regular_file(path, ec)){
            send_and_close(make_error("no such mod '" + name + "'"));
            return;
        }
        auto size = fs::file_size(path, ec);
        if(ec){
            send_and_close(make_error("cannot stat '" + name + "'"));
            return;
        }

        std::string digest;
        try{
            digest = sha256_file_hex(path);
        } catch(const std::exception& ex){
            log_error(logger_.get(), "hashing {} failed: {}", path.string(), ex.what());
            send_and_close(make_error("cannot read '" + name + "'"));
            return;
        }

        file_.open(path, std::ios::binary);
        if(!file_){
            send_and_close(make_error("cannot open '" + name + "'"));
            return;
        }
        remaining_ = static_cast<uint64_t>(size);
        log_info(logger_.get(), "sending {} ({} bytes)", name, remaining_);

        header_ = make_fetch_response(name, remaining_, digest).dump() + "\n";
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(header_),
            [this, self](std::error_code ec, std::size_t){
                if(ec){
                    log_warn(logger_.get(), "header write failed: {}", ec.message());
                    close();
                    return;
                }
                send_next_chunk();
            });
    }

    void send_next_chunk(){
        if(remaining_ == 0){
            close();
            return;
        }
        auto want = static_cast<std::size_t>(std::min<uint64_t>(remaining_, chunk_.size()));
        file_.read(chunk_.data(), static_cast<std::streamsize>(want));
        auto got = static_cast<std::size_t>(file_.gcount());
        if(got == 0){
            // file shrank under us; the client detects the short body
            log_warn(logger_.get(), "short read with {} bytes outstanding", remaining_);
            close();
            return;
        }
        remaining_ -= got;
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(chunk_.data(), got),
            [this, self](std::error_code ec, std::size_t){
                if(ec){
                    log_warn(logger_.get(), "body write failed: {}", ec.message());
                    close();
                    return;
                }
                send_next_chunk();
            });
    }

    void send_and_close(const json& reply){
        header_ = reply.dump() + "\n";
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(header_),
            [this, self](std::error_code ec, std::size_t){
                if(ec) log_debug(logger_.get(), "reply write failed: {}", ec.message());
                close();
            });
    }

    void close(){
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    asio::ip::tcp::socket socket_;
    asio::streambuf read_buf_;
    fs::path serve_dir_;
    std::string extension_;
    std::shared_ptr<Logger> logger_;
    std::string header_;
    std::ifstream file_;
    std::vector<char> chunk_;
    uint64_t remaining_ = 0;
};

} // namespace

ModServer::ModServer(asio::io_context& io,
                     const std::string& listen_ip,
                     unsigned short port,
                     fs::path serve_dir,
                     std::string extension,
                     std::shared_ptr<Logger> logger)
: acceptor_(io),
  serve_dir_(std::move(serve_dir)),
  extension_(std::move(extension)),
  logger_(std::move(logger))
{
    asio::ip::tcp::endpoint endpoint(asio::ip::make_address(listen_ip), port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    port_ = acceptor_.local_endpoint().port();
}

void ModServer::start_accept(){
    accepting_ = true;
    do_accept();
}

void ModServer::stop(){
    accepting_ = false;
    std::error_code ec;
    acceptor_.close(ec);
}

void ModServer::do_accept(){
    acceptor_.async_accept([this](std::error_code ec, asio::ip::tcp::socket sock){
        if(!accepting_) return;
        if(!ec){
            std::error_code ep_ec;
            auto remote = sock.remote_endpoint(ep_ec);
            log_debug(logger_.get(), "Accepted connection from {}",
                      ep_ec ? std::string("unknown") : remote.address().to_string());
            std::make_shared<ServerSession>(std::move(sock), serve_dir_, extension_, logger_)->start();
        } else {
            log_error(logger_.get(), "accept failed: {}", ec.message());
        }
        do_accept();
    });
}
