#include "devserver.hpp"
#include "mime.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <fstream>
#include <utility>

namespace {
// also matches decoded paths that contain line breaks
const char *kAnyPath = R"([\s\S]*)";

const char *StatusText(int status) {
    switch (status) {
    case 400:
        return "Bad Request";
    case 404:
        return "Not Found";
    case 405:
        return "Method Not Allowed";
    case 413:
        return "Payload Too Large";
    case 414:
        return "URI Too Long";
    case 500:
        return "Internal Server Error";
    case 501:
        return "Not Implemented";
    default:
        return "Error";
    }
}

void SetError(httplib::Response &res, int status, const std::string &message) {
    res.status = status;
    res.set_content(message, "text/plain");
}
} // namespace

// ─────────────────────────────────────
DevServer::DevServer(ServerConfig config)
    : m_Config(std::move(config)), m_Resolver(m_Config.root) {

    if (m_Config.log_level == LOG_DEBUG) {
        spdlog::set_level(spdlog::level::debug);
    } else if (m_Config.log_level == LOG_INFO) {
        spdlog::set_level(spdlog::level::info);
    } else if (m_Config.log_level == LOG_OFF) {
        spdlog::set_level(spdlog::level::off);
    }

    InitServer();
}

// ─────────────────────────────────────
DevServer::~DevServer() {
    Stop();
}

// ─────────────────────────────────────
void DevServer::InitServer() {
    m_Server.set_read_timeout(5, 0);
    m_Server.set_write_timeout(5, 0);

    // GET; httplib routes HEAD here too and drops the body
    m_Server.Get(kAnyPath, [this](const httplib::Request &req, httplib::Response &res) {
        HandleRequest(req, res);
    });

    auto unsupported = [](const httplib::Request &req, httplib::Response &res) {
        SetError(res, 501, "Unsupported method ('" + req.method + "')");
    };
    m_Server.Post(kAnyPath, unsupported);
    m_Server.Put(kAnyPath, unsupported);
    m_Server.Patch(kAnyPath, unsupported);
    m_Server.Delete(kAnyPath, unsupported);
    m_Server.Options(kAnyPath, unsupported);

    m_Server.set_error_handler([](const httplib::Request &, httplib::Response &res) {
        if (res.body.empty()) {
            res.set_content(std::to_string(res.status) + " " + StatusText(res.status),
                            "text/plain");
        }
    });

    m_Server.set_exception_handler(
        [](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
            std::string what = "unknown exception";
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception &e) {
                what = e.what();
            } catch (...) {
                what = "unknown exception";
            }
            spdlog::error("[SERVER] {} {} failed: {}", req.method, req.target, what);
            SetError(res, 500, "500 Internal Server Error");
        });

    m_Server.set_logger([](const httplib::Request &req, const httplib::Response &res) {
        spdlog::info("\"{} {} {}\" {} {}", req.method, req.target, req.version, res.status,
                     res.body.size());
    });
}

// ─────────────────────────────────────
bool DevServer::Start() {
    if (m_Thread.joinable()) {
        return true;
    }

    if (m_Config.port == 0) {
        m_Port = m_Server.bind_to_any_port(m_Config.host);
    } else if (m_Server.bind_to_port(m_Config.host, m_Config.port)) {
        m_Port = m_Config.port;
    } else {
        m_Port = -1;
    }

    if (m_Port < 0) {
        spdlog::error("Cannot bind {}:{}", m_Config.host, m_Config.port);
        return false;
    }

    m_Thread = std::thread([this] {
        if (!m_Server.listen_after_bind()) {
            spdlog::warn("Listener on {}:{} stopped on an accept error", m_Config.host, m_Port);
        }
    });
    m_Server.wait_until_ready();

    spdlog::info("SPA dev server running at http://{}:{}", m_Config.host, m_Port);
    spdlog::info("    Serving directory: {}", m_Config.root.string());
    spdlog::info("    SPA fallback enabled (unknown routes -> {})", SPASERVE_INDEX_DOCUMENT);
    return true;
}

// ─────────────────────────────────────
void DevServer::Stop() {
    m_Server.stop();
    if (m_Thread.joinable()) {
        m_Thread.join();
    }
}

// ─────────────────────────────────────
void DevServer::HandleRequest(const httplib::Request &req, httplib::Response &res) {
    const std::string &target = req.target.empty() ? req.path : req.target;
    const Resolution resolution = m_Resolver.Resolve(target);
    spdlog::debug("[{}] {} -> {} ({}) -> {}", req.method, resolution.request_path,
                  resolution.effective_path, ResponseModeName(resolution.mode),
                  resolution.file.string());
    Respond(resolution, res);
}

// ─────────────────────────────────────
void DevServer::Respond(const Resolution &resolution, httplib::Response &res) {
    if (resolution.status == RESOLVE_NOT_FOUND) {
        SetError(res, 404, "File not found");
        return;
    }
    if (resolution.status == RESOLVE_IO_ERROR) {
        SetError(res, 500, "500 Internal Server Error");
        return;
    }

    std::ifstream file(resolution.file, std::ios::binary);
    if (!file) {
        const int err = errno;
        spdlog::warn("Cannot open {}: {}", resolution.file.string(), std::strerror(err));
        SetError(res, 500, "500 Internal Server Error");
        return;
    }

    std::string body((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    res.status = 200;
    res.set_content(std::move(body), GuessContentType(resolution.file));
}
