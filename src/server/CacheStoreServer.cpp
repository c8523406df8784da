#include "server/CacheStoreServer.hpp"
#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>

namespace svclink {

namespace {

std::string hostOf(const std::string& listenAddress) {
    const auto colon = listenAddress.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == listenAddress.size()) {
        throw std::invalid_argument {"Cache server address must be host:port, got '" + listenAddress + "'"};
    }
    return listenAddress.substr(0, colon);
}

} // namespace

CacheStoreServer::CacheStoreServer(const std::string& listenAddress, CacheStore& store, std::chrono::milliseconds grace)
    : service {store},
      shutdownGrace {grace} {
    const auto host = hostOf(listenAddress);
    grpc::ServerBuilder sb {};
    // A second server on a taken port must fail instead of sharing it.
    sb.AddChannelArgument(GRPC_ARG_ALLOW_REUSEPORT, 0);
    sb.AddListeningPort(listenAddress, grpc::InsecureServerCredentials(), &boundPort);
    sb.RegisterService(&service);
    server = sb.BuildAndStart();
    if (!server || boundPort == 0) {
        server.reset();
        throw std::runtime_error {"Failed to bind cache server on " + listenAddress};
    }
    boundAddress = host + ":" + std::to_string(boundPort);
    spdlog::info("Cache server listening on {}", boundAddress);
    serverThread = std::thread([this]() { server->Wait(); });
}

CacheStoreServer::~CacheStoreServer() {
    shutdown();
}

void CacheStoreServer::shutdown() {
    const std::lock_guard lock {m};
    if (!server) {
        return;
    }
    server->Shutdown(std::chrono::system_clock::now() + shutdownGrace);
    if (serverThread.joinable()) {
        serverThread.join();
    }
    server.reset();
    spdlog::info("Cache server on {} stopped", boundAddress);
}

int CacheStoreServer::port() const {
    return boundPort;
}

const std::string& CacheStoreServer::address() const {
    return boundAddress;
}

bool CacheStoreServer::running() const {
    const std::lock_guard lock {m};
    return server != nullptr;
}

} // namespace svclink
