#include <chmesh/registry/registry_client.h>

#include <chmesh/core/log.h>
#include <chmesh/http/http_client.h>

#include <chjson/chjson.hpp>

namespace chmesh::registry {

RegistryClient::RegistryClient(boost::asio::io_context& ioc, RegistryClientOptions opts)
    : opts_(std::move(opts)), instance_id_(opts_.instance_id), timer_(ioc) {}

std::string RegistryClient::instance_id() const {
    std::lock_guard<std::mutex> lk(mu_);
    return instance_id_;
}

chmesh::Result<std::string> RegistryClient::Post(const std::string& target, std::string body) {
    chmesh::http::HttpClientRequest req;
    req.method = boost::beast::http::verb::post;
    req.host = opts_.registry_host;
    req.port = std::to_string(opts_.registry_port);
    req.target = target;
    req.content_type = "application/json";
    req.body = std::move(body);

    auto r = chmesh::http::HttpClient::Send(req, opts_.request_timeout);
    if (!r.ok()) {
        return r.status();
    }
    const auto& resp = r.value();
    if (resp.status == 404) {
        return chmesh::Status(chmesh::StatusCode::not_found, resp.body);
    }
    if (resp.status == 400) {
        return chmesh::Status(chmesh::StatusCode::invalid_argument, resp.body);
    }
    if (resp.status != 200) {
        return chmesh::Status(chmesh::StatusCode::unavailable, "registry answered " + std::to_string(resp.status));
    }
    return resp.body;
}

std::string RegistryClient::KeyJson() const {
    chjson::value j(chjson::value::object{
        {"service", chjson::value(opts_.service)},
        {"instance_id", chjson::value(instance_id())},
    });
    return chjson::dump(j);
}

chmesh::Status RegistryClient::Register() {
    chjson::value j(chjson::value::object{
        {"service", chjson::value(opts_.service)},
        {"instance_id", chjson::value(opts_.instance_id)},
        {"host", chjson::value(opts_.host)},
        {"port", chjson::value::integer(static_cast<std::int64_t>(opts_.port))},
    });

    auto r = Post("/registry/register", chjson::dump(j));
    if (!r.ok()) {
        registered_.store(false, std::memory_order_release);
        return r.status();
    }

    auto parsed = chjson::parse(r.value());
    if (!parsed.err && parsed.doc.root().is_object()) {
        const auto* id = parsed.doc.root().find("instance_id");
        if (id != nullptr && id->is_string()) {
            std::lock_guard<std::mutex> lk(mu_);
            instance_id_ = std::string(id->as_string_view());
        }
    }
    registered_.store(true, std::memory_order_release);
    chmesh::log::info("Registered {} as {} with {}:{}", opts_.service, instance_id(), opts_.registry_host, opts_.registry_port);
    return chmesh::Status::Ok();
}

chmesh::Status RegistryClient::Renew() {
    auto r = Post("/registry/renew", KeyJson());
    if (!r.ok()) {
        if (r.status().code() == chmesh::StatusCode::not_found) {
            registered_.store(false, std::memory_order_release);
        }
        return r.status();
    }
    return chmesh::Status::Ok();
}

chmesh::Status RegistryClient::Deregister() {
    registered_.store(false, std::memory_order_release);
    auto r = Post("/registry/deregister", KeyJson());
    if (!r.ok()) {
        return r.status();
    }
    chmesh::log::info("Deregistered {}/{}", opts_.service, instance_id());
    return chmesh::Status::Ok();
}

void RegistryClient::Heartbeat() {
    if (!registered()) {
        auto st = Register();
        if (!st.ok()) {
            chmesh::log::warn("Register {} failed, retrying next heartbeat: {}", opts_.service, st.ToString());
        }
        return;
    }

    auto st = Renew();
    if (st.ok()) {
        return;
    }
    if (st.code() == chmesh::StatusCode::not_found) {
        chmesh::log::warn("Registry forgot {}/{}, registering again", opts_.service, instance_id());
        st = Register();
        if (!st.ok()) {
            chmesh::log::warn("Register {} failed, retrying next heartbeat: {}", opts_.service, st.ToString());
        }
        return;
    }
    chmesh::log::warn("Renew {}/{} failed: {}", opts_.service, instance_id(), st.ToString());
}

void RegistryClient::Start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }
    Heartbeat();
    Schedule();
}

void RegistryClient::Stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lk(timer_mu_);
        timer_.cancel();
    }
    if (registered()) {
        auto st = Deregister();
        if (!st.ok()) {
            chmesh::log::warn("Deregister {}/{} failed: {}", opts_.service, instance_id(), st.ToString());
        }
    }
}

void RegistryClient::Schedule() {
    std::lock_guard<std::mutex> lk(timer_mu_);
    if (!running_.load(std::memory_order_acquire)) {
        return;
    }
    timer_.expires_after(opts_.renew_interval);
    timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        if (ec || !self->running_.load(std::memory_order_acquire)) {
            return;
        }
        self->Heartbeat();
        self->Schedule();
    });
}

} // namespace chmesh::registry
