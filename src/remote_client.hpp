#pragma once
#include <asio.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include "log.hpp"
#include "remote_source.hpp"

// RemoteSource backed by a ModServer. Listing uses one short connection;
// every artifact opens its own connection when it is written out, so
// artifacts can be transferred from different threads at once.
class ServerSource : public RemoteSource {
public:
    ServerSource(std::string host, unsigned short port, std::shared_ptr<Logger> logger = nullptr);

    // Parses "host:port". Throws std::invalid_argument.
    static std::unique_ptr<ServerSource> from_address(const std::string& address,
                                                      std::shared_ptr<Logger> logger = nullptr);

    RemoteArtifactList list_artifacts() override;
    std::string describe() const override;

    const std::string& host() const { return host_; }
    unsigned short port() const { return port_; }

private:
    std::string host_;
    unsigned short port_;
    std::shared_ptr<Logger> logger_;
};

class NetworkArtifact : public RemoteArtifact {
public:
    NetworkArtifact(std::string host, unsigned short port, std::string name, uint64_t size,
                    std::shared_ptr<Logger> logger = nullptr);

    const std::string& name() const override { return name_; }
    uint64_t size() const override { return size_; }

    // Fails if the server reports a different size than it listed, the body
    // ends early, or the SHA-256 of the received bytes does not match.
    uint64_t write_to(std::ostream& sink) override;

protected:
    void do_close() override;

private:
    std::string host_;
    unsigned short port_;
    std::string name_;
    uint64_t size_;
    std::shared_ptr<Logger> logger_;
    asio::io_context io_;
    asio::ip::tcp::socket socket_;
};
