// End-to-end tests: DevServer on an ephemeral port, queried with httplib::Client
#include <criterion/criterion.h>

#include <httplib.h>

#include <memory>
#include <string>

#include "devserver.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;

namespace {
struct Site {
    TempDir tmp;
    fs::path root;
    std::unique_ptr<DevServer> server;

    explicit Site(bool with_index = true) {
        root = tmp.Path() / "site";
        if (with_index) {
            WriteFile(root / "index.html", "HOME");
        }
        WriteFile(root / "app.js", "console.log(1)");
        WriteFile(root / "docs" / "index.html", "DOCS");
        WriteFile(tmp.Path() / "secret.txt", "SECRET");

        ServerConfig config;
        config.host = "127.0.0.1";
        config.port = 0;
        config.root = root;
        config.log_level = LOG_OFF;
        server = std::make_unique<DevServer>(config);
        cr_assert(server->Start(), "server failed to start");
        cr_assert_gt(server->GetPort(), 0);
        cr_assert(server->GetConfig().root == root);
    }

    httplib::Client Client() const {
        httplib::Client cli("127.0.0.1", server->GetPort());
        cli.set_connection_timeout(2, 0);
        cli.set_read_timeout(5, 0);
        return cli;
    }
};
} // namespace

Test(DevServer, serves_existing_file) {
    Site site;
    auto cli = site.Client();

    auto res = cli.Get("/app.js");
    cr_assert(res, "request failed");
    cr_assert_eq(res->status, 200);
    cr_assert(res->body == "console.log(1)", "got '%s'", res->body.c_str());
    cr_assert(res->get_header_value("Content-Type") == "application/javascript");
}

Test(DevServer, unknown_route_serves_fallback_with_200) {
    Site site;
    auto cli = site.Client();

    auto res = cli.Get("/dashboard/settings");
    cr_assert(res, "request failed");
    cr_assert_eq(res->status, 200);
    cr_assert(res->body == "HOME", "got '%s'", res->body.c_str());
    cr_assert(res->get_header_value("Content-Type") == "text/html");
}

Test(DevServer, directory_serves_index_without_redirect) {
    Site site;
    auto cli = site.Client();

    auto res = cli.Get("/docs");
    cr_assert(res, "request failed");
    cr_assert_eq(res->status, 200);
    cr_assert(res->body == "DOCS", "got '%s'", res->body.c_str());

    res = cli.Get("/docs/");
    cr_assert(res, "request failed");
    cr_assert_eq(res->status, 200);
    cr_assert(res->body == "DOCS", "got '%s'", res->body.c_str());

    res = cli.Get("/");
    cr_assert(res, "request failed");
    cr_assert_eq(res->status, 200);
    cr_assert(res->body == "HOME", "got '%s'", res->body.c_str());
}

Test(DevServer, head_matches_get_without_body) {
    Site site;
    auto cli = site.Client();

    const char *paths[] = {"/app.js", "/docs", "/dashboard/settings"};
    for (const char *path : paths) {
        auto get = cli.Get(path);
        auto head = cli.Head(path);
        cr_assert(get && head, "request failed for %s", path);
        cr_assert_eq(head->status, get->status, "status differs for %s", path);
        cr_assert(head->body.empty(), "HEAD %s returned a body", path);
        cr_assert(head->get_header_value("Content-Type") == get->get_header_value("Content-Type"),
                  "Content-Type differs for %s", path);
        cr_assert(head->get_header_value("Content-Length") ==
                      std::to_string(get->body.size()),
                  "Content-Length differs for %s", path);
    }
}

Test(DevServer, query_string_is_ignored) {
    Site site;
    auto cli = site.Client();

    auto res = cli.Get("/app.js?v=42");
    cr_assert(res, "request failed");
    cr_assert_eq(res->status, 200);
    cr_assert(res->body == "console.log(1)");
}

Test(DevServer, missing_fallback_is_404) {
    Site site(false);
    auto cli = site.Client();

    auto res = cli.Get("/unknown");
    cr_assert(res, "request failed");
    cr_assert_eq(res->status, 404);

    res = cli.Get("/app.js");
    cr_assert(res, "request failed");
    cr_assert_eq(res->status, 200);
}

Test(DevServer, traversal_stays_inside_root) {
    Site site;
    auto cli = site.Client();

    const char *paths[] = {"/../secret.txt", "/docs/../../secret.txt", "/%2e%2e/secret.txt",
                           "/..%2fsecret.txt"};
    for (const char *path : paths) {
        auto res = cli.Get(path);
        cr_assert(res, "request failed for %s", path);
        cr_assert(res->body.find("SECRET") == std::string::npos, "%s leaked content", path);
    }
}

Test(DevServer, filesystem_error_is_500) {
    Site site;
    fs::create_symlink("loop", site.root / "loop");
    auto cli = site.Client();

    auto res = cli.Get("/loop");
    cr_assert(res, "request failed");
    cr_assert_eq(res->status, 500);
    cr_assert(res->body.find("HOME") == std::string::npos, "fallback served on an I/O error");

    auto head = cli.Head("/loop");
    cr_assert(head, "request failed");
    cr_assert_eq(head->status, 500);
    cr_assert(head->body.empty());

    // the server keeps serving after the error
    res = cli.Get("/app.js");
    cr_assert(res, "request failed");
    cr_assert_eq(res->status, 200);
}

Test(DevServer, other_methods_are_not_implemented) {
    Site site;
    auto cli = site.Client();

    auto res = cli.Post("/app.js", "x=1", "application/x-www-form-urlencoded");
    cr_assert(res, "request failed");
    cr_assert_eq(res->status, 501);

    res = cli.Delete("/app.js");
    cr_assert(res, "request failed");
    cr_assert_eq(res->status, 501);
}

Test(DevServer, bind_failure_is_reported) {
    TempDir tmp;
    ServerConfig config;
    config.host = "192.0.2.1"; // TEST-NET-1, never a local address
    config.port = 0;
    config.root = tmp.Path();
    config.log_level = LOG_OFF;

    DevServer server(config);
    cr_assert_not(server.Start());
}

Test(DevServer, stop_releases_socket) {
    Site site;
    auto cli = site.Client();
    auto res = cli.Get("/app.js");
    cr_assert(res, "request failed");

    site.server->Stop();

    auto after = cli.Get("/app.js");
    cr_assert_not(after, "server still answering after Stop()");
}
