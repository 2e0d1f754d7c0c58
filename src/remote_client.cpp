#include "remote_client.hpp"

#include <algorithm>
#include <istream>
#include <stdexcept>
#include <system_error>
#include <vector>

#include "protocol.hpp"
#include "utils.hpp"

using asio::ip::tcp;

namespace {

void connect_socket(asio::io_context& io, tcp::socket& socket,
                    const std::string& host, unsigned short port){
    tcp::resolver resolver(io);
    auto endpoints = resolver.resolve(host, std::to_string(port));
    asio::connect(socket, endpoints);
}

void send_line(tcp::socket& socket, const json& j){
    auto s = j.dump() + "\n";
    asio::write(socket, asio::buffer(s));
}

json read_json_line(tcp::socket& socket, asio::streambuf& buf){
    asio::read_until(socket, buf, "\n");
    std::istream is(&buf);
    std::string line;
    std::getline(is, line);
    try{
        return json::parse(line);
    } catch(const json::parse_error& e){
        throw std::runtime_error(std::string("malformed reply: ") + e.what());
    }
}

} // namespace

ServerSource::ServerSource(std::string host, unsigned short port, std::shared_ptr<Logger> logger)
: host_(std::move(host)), port_(port), logger_(std::move(logger))
{
}

std::unique_ptr<ServerSource> ServerSource::from_address(const std::string& address,
                                                         std::shared_ptr<Logger> logger){
    auto pos = address.rfind(':');
    if(pos == std::string::npos || pos == 0 || pos + 1 >= address.size()){
        throw std::invalid_argument("server address must be host:port (got '" + address + "')");
    }
    auto host = address.substr(0, pos);
    int port = 0;
    try{
        port = std::stoi(address.substr(pos + 1));
    } catch(const std::exception&){
        throw std::invalid_argument("invalid port in '" + address + "'");
    }
    if(port <= 0 || port > 65535){
        throw std::invalid_argument("port out of range in '" + address + "'");
    }
    return std::make_unique<ServerSource>(host, static_cast<unsigned short>(port), std::move(logger));
}

std::string ServerSource::describe() const {
    return "server " + host_ + ":" + std::to_string(port_);
}

RemoteArtifactList ServerSource::list_artifacts(){
    std::vector<ModListing> mods;
    try{
        asio::io_context io;
        tcp::socket socket(io);
        connect_socket(io, socket, host_, port_);
        send_line(socket, make_list_request());

        asio::streambuf buf(kMaxListingLine);
        mods = parse_list_response(read_json_line(socket, buf));
        std::error_code ec;
        socket.close(ec);
    } catch(const std::system_error& e){
        throw std::runtime_error("cannot list mods from " + describe() + ": " + e.what());
    }

    log_debug(logger_.get(), "{} listed {} mods", describe(), mods.size());
    RemoteArtifactList artifacts;
    artifacts.reserve(mods.size());
    for(auto& mod : mods){
        artifacts.push_back(std::make_shared<NetworkArtifact>(host_, port_, std::move(mod.name),
                                                              mod.size, logger_));
    }
    return artifacts;
}

NetworkArtifact::NetworkArtifact(std::string host, unsigned short port, std::string name,
                                 uint64_t size, std::shared_ptr<Logger> logger)
: host_(std::move(host)),
  port_(port),
  name_(std::move(name)),
  size_(size),
  logger_(std::move(logger)),
  socket_(io_)
{
}

uint64_t NetworkArtifact::write_to(std::ostream& sink){
    if(closed()) throw std::logic_error("artifact already closed");

    connect_socket(io_, socket_, host_, port_);
    send_line(socket_, make_fetch_request(name_));

    asio::streambuf buf(kMaxHeaderLine);
    auto header = read_json_line(socket_, buf);
    expect_type(header, "fetch_response");
    const uint64_t announced = header.value("size", 0ULL);
    const std::string expected_sha = header.value("sha256", "");
    if(announced != size_){
        throw std::runtime_error(name_ + " changed on server: listed " + std::to_string(size_) +
                                 " bytes, now " + std::to_string(announced));
    }

    Sha256Stream sha;
    uint64_t received = 0;
    std::vector<char> chunk(kTransferBufferSize);
    auto emit = [&](const char* data, std::size_t n){
        sha.update(data, n);
        sink.write(data, static_cast<std::streamsize>(n));
        if(!sink) throw std::runtime_error("sink rejected data");
        received += n;
    };

    // body bytes that arrived together with the header
    std::istream leftover(&buf);
    while(buf.size() > 0 && received < size_){
        auto want = static_cast<std::size_t>(std::min<uint64_t>(chunk.size(), size_ - received));
        leftover.read(chunk.data(), static_cast<std::streamsize>(want));
        emit(chunk.data(), static_cast<std::size_t>(leftover.gcount()));
    }

    while(received < size_){
        auto want = static_cast<std::size_t>(std::min<uint64_t>(chunk.size(), size_ - received));
        std::error_code ec;
        auto n = socket_.read_some(asio::buffer(chunk.data(), want), ec);
        if(ec == asio::error::eof){
            throw std::runtime_error("connection closed after " + std::to_string(received) +
                                     " of " + std::to_string(size_) + " bytes");
        }
        if(ec) throw std::system_error(ec);
        emit(chunk.data(), n);
    }

    if(!expected_sha.empty() && sha.final_hex() != expected_sha){
        throw std::runtime_error("checksum mismatch for " + name_);
    }
    log_debug(logger_.get(), "received {} ({} bytes)", name_, received);
    return received;
}

void NetworkArtifact::do_close(){
    std::error_code ec;
    socket_.close(ec);
}
