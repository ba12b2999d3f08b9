#include <chmesh/core/log.h>
#include <chmesh/http/http_server.h>
#include <chmesh/http/router.h>
#include <chmesh/registry/registry_client.h>
#include <chmesh/runtime/app.h>

#include <chjson/chjson.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

// Sample backend instance. Echoes what it received and keeps itself registered.
//
//   echo_service --service catalog --listen 127.0.0.1:8081 --registry 127.0.0.1:8761
int main(int argc, char** argv) {
    chmesh::AppOptions opt;
    opt.io_threads = 2;

    chmesh::http::ListenAddress listen{"127.0.0.1", 8081};
    chmesh::http::ListenAddress registry{"127.0.0.1", 8761};
    chmesh::registry::RegistryClientOptions client;
    client.service = "echo";

    for (int i = 1; i < argc; ++i) {
        std::string_view a(argv[i]);
        if (a == "--listen" && i + 1 < argc) {
            if (!chmesh::http::ParseListenAddress(argv[++i], listen)) {
                std::cerr << "Invalid --listen, expected host:port\n";
                return 2;
            }
        } else if (a == "--registry" && i + 1 < argc) {
            if (!chmesh::http::ParseListenAddress(argv[++i], registry)) {
                std::cerr << "Invalid --registry, expected host:port\n";
                return 2;
            }
        } else if (a == "--service" && i + 1 < argc) {
            client.service = argv[++i];
        } else if (a == "--id" && i + 1 < argc) {
            client.instance_id = argv[++i];
        } else if (a == "--renew-ms" && i + 1 < argc) {
            client.renew_interval = std::chrono::milliseconds(std::atoi(argv[++i]));
        } else if (a == "--log" && i + 1 < argc) {
            opt.log_level = argv[++i];
        }
    }

    client.registry_host = registry.host;
    client.registry_port = registry.port;
    client.host = listen.host;
    client.port = listen.port;

    chmesh::App app(opt);

    chmesh::http::Router r;
    auto who = client.service + "@" + listen.host + ":" + std::to_string(listen.port);
    r.Fallback([who](const chmesh::http::Request& req, chmesh::http::Response& resp) {
        chjson::value j(chjson::value::object{
            {"instance", chjson::value(who)},
            {"method", chjson::value(std::string(req.raw.method_string().data(), req.raw.method_string().size()))},
            {"path", chjson::value(req.path)},
            {"query", chjson::value(req.query_string)},
            {"body", chjson::value(req.raw.body())},
        });
        resp.SetJson(200, chjson::dump(j));
    });

    app.AddService(std::make_shared<chmesh::http::HttpServer>(app.Io(), "echo", listen, std::move(r)));
    app.AddService(std::make_shared<chmesh::registry::RegistryClient>(app.Io().Next(), client));

    chmesh::log::info("Echo service {} (registry {}:{})", who, registry.host, registry.port);
    return app.Run();
}
