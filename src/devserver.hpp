#pragma once

#include <string>
#include <thread>

// Libs
#include <httplib.h>
#include <spdlog/spdlog.h>

// parts
#include "config.hpp"
#include "resolver.hpp"

#include "common.hpp"

class DevServer {
  public:
    explicit DevServer(ServerConfig config);
    ~DevServer();

    // Binds the socket and starts the listener thread.
    // Returns false when the host/port cannot be bound.
    bool Start();
    void Stop();

    int GetPort() const {
        return m_Port;
    }
    const ServerConfig &GetConfig() const {
        return m_Config;
    }

  private:
    void InitServer();
    void HandleRequest(const httplib::Request &req, httplib::Response &res);
    void Respond(const Resolution &resolution, httplib::Response &res);

  private:
    ServerConfig m_Config;
    PathResolver m_Resolver;

    // Server
    httplib::Server m_Server;
    std::thread m_Thread;
    int m_Port = -1;
};
