#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "gateway_services.hpp"
#include "http_session.hpp"
#include "jwt_validator.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"
#include "server_config.hpp"
#include "session_registry.hpp"
#include "telemetry.hpp"
#include "upstream_client.hpp"


namespace beast = boost::beast;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace edgegate {

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(
        net::io_context& ioc,
        ssl::context& ssl_ctx,
        tcp::endpoint endpoint,
        GatewayServices& services
    )
        : ioc_(ioc)
        , ssl_ctx_(ssl_ctx)
        , acceptor_(net::make_strand(ioc))
        , services_(services)
    {
        beast::error_code ec;
        
        acceptor_.open(endpoint.protocol(), ec);
        if (ec) {
            throw std::runtime_error("Failed to open acceptor: " + ec.message());
        }
        
        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) {
            throw std::runtime_error("Failed to set SO_REUSEADDR: " + ec.message());
        }
        
        acceptor_.bind(endpoint, ec);
        if (ec) {
            throw std::runtime_error("Failed to bind: " + ec.message());
        }
        
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            throw std::runtime_error("Failed to listen: " + ec.message());
        }
    }
    
    void run() {
        do_accept();
    }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);
    }

private:
    net::io_context& ioc_;
    ssl::context& ssl_ctx_;
    tcp::acceptor acceptor_;
    GatewayServices& services_;
    
    void do_accept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
                self->on_accept(ec, std::move(socket));
            });
    }
    
    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec == net::error::operation_aborted) return;
            SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::CONNECTION_REJECTED, "internal", "Accept error: " + ec.message());
        } else {
            // Tracks open sockets until the session tree (HTTP or upgraded WebSocket) is destroyed
            MetricsRegistry::instance().increment_gauge("tcp_connections_open");
            auto guard = std::shared_ptr<void>(nullptr, [](void*) {
                MetricsRegistry::instance().decrement_gauge("tcp_connections_open");
            });

            if (services_.config.enable_tls) {
                auto stream = beast::ssl_stream<beast::tcp_stream>(
                    beast::tcp_stream(std::move(socket)),
                    ssl_ctx_
                );
                std::make_shared<HttpSession>(std::move(stream), services_, guard)->run();
            } else {
                std::make_shared<HttpSession>(beast::tcp_stream(std::move(socket)), services_, guard)->run();
            }
        }
        
        do_accept();
    }
};

// Wires the optional business-layer collaborators from configuration.
// Anything left unset is reported by /health and handled as "unavailable".
GatewayDependencies build_dependencies(const ServerConfig& config, std::shared_ptr<MetricsTelemetry> telemetry) {
    using Level = SecurityLogger::Level;
    using Event = SecurityLogger::EventType;

    GatewayDependencies deps;
    deps.telemetry = std::move(telemetry);

    if (!config.jwt_secret.empty()) {
        deps.token_validator = std::make_shared<JwtTokenValidator>(
            config.jwt_secret, config.jwt_issuer, config.jwt_audience,
            std::chrono::seconds(config.jwt_leeway_sec));
    } else {
        SecurityLogger::log(Level::WARNING, Event::LIFECYCLE, "internal",
                            "No JWT secret configured; token authentication unavailable");
    }

    if (!config.upstream_url.empty()) {
        auto upstream = std::make_shared<UpstreamClient>(
            config.upstream_url, std::chrono::seconds(config.upstream_timeout_sec));
        deps.request_router = upstream;
        deps.agent_message_handler = upstream;
    } else {
        SecurityLogger::log(Level::WARNING, Event::LIFECYCLE, "internal",
                            "No upstream configured; routing and agent messages unavailable");
    }

    if (!config.redis_url.empty()) {
        try {
            auto registry = std::make_shared<RedisSessionRegistry>(config.redis_url);
            if (registry->ping()) {
                deps.session_registry = registry;
            } else {
                SecurityLogger::log(Level::WARNING, Event::DEPENDENCY_FAILURE, "internal",
                                    "Redis did not answer PING; session registry disabled");
            }
        } catch (const std::exception& e) {
            SecurityLogger::log(Level::WARNING, Event::DEPENDENCY_FAILURE, "internal",
                                std::string("Redis unavailable; session registry disabled: ") + e.what());
        }
    }

    return deps;
}

} 

// Configures the SSL context (TLS 1.2+).
void load_server_certificate(ssl::context& ctx, const std::string& cert_path, const std::string& key_path) {
    ctx.set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 |
        ssl::context::no_sslv3 |
        ssl::context::no_tlsv1 |
        ssl::context::no_tlsv1_1 |
        ssl::context::single_dh_use
    );
    
    SSL_CTX_set_options(ctx.native_handle(), SSL_OP_CIPHER_SERVER_PREFERENCE);
    SSL_CTX_set_min_proto_version(ctx.native_handle(), TLS1_2_VERSION);
    
    SSL_CTX_set_cipher_list(ctx.native_handle(),
        "ECDHE-ECDSA-AES256-GCM-SHA384:"
        "ECDHE-RSA-AES256-GCM-SHA384:"
        "ECDHE-ECDSA-CHACHA20-POLY1305:"
        "ECDHE-RSA-CHACHA20-POLY1305:"
        "ECDHE-ECDSA-AES128-GCM-SHA256:"
        "ECDHE-RSA-AES128-GCM-SHA256"
    );
    
    ctx.use_certificate_chain_file(cert_path);
    ctx.use_private_key_file(key_path, ssl::context::pem);
}

int main(int argc, char* argv[]) {
    using edgegate::SecurityLogger;
    try {
        edgegate::ServerConfig config;

        // --- Environment Variable Overrides ---
        edgegate::apply_env_overrides(config);
        
        // --- CLI Argument Parsing (wins over the environment) ---
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--no-tls" || arg == "-n") {
                config.enable_tls = false;
            } else if (arg == "--tls" || arg == "-t") {
                config.enable_tls = true;
            } else if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: " << argv[0] << " [port] [options]\n"
                          << "Options:\n"
                          << "  --tls, -t      Serve HTTPS/WSS using certs/server.crt and certs/server.key\n"
                          << "  --no-tls, -n   Plain HTTP/WS (behind a terminating proxy or for development)\n"
                          << "  --help, -h     Show this help\n"
                          << "Settings are read from EDGEGATE_* environment variables.\n";
                return 0;
            } else {
                try {
                    config.port = static_cast<uint16_t>(std::stoi(arg));
                } catch (const std::exception&) {
                    std::cerr << "[!] Invalid argument: " << arg << "\n";
                    return 1;
                }
            }
        }
        
        if (config.allowed_origins.empty()) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::LIFECYCLE, "internal",
                                "No allowed origins configured; every origin is accepted");
        }
        
        if (config.thread_count == 0) {
            config.thread_count = static_cast<int>(std::thread::hardware_concurrency());
            if (config.thread_count == 0) config.thread_count = 4;
        }
        
        if (config.enable_tls) {
            std::filesystem::path exe_path;
            try {
                exe_path = std::filesystem::canonical("/proc/self/exe").parent_path();
            } catch (const std::exception& e) {
                std::cerr << "[!] Warning: Could not detect executable path via /proc/self/exe: " << e.what() << std::endl;
                exe_path = std::filesystem::current_path();
            }

            if (config.cert_path.rfind("certs/", 0) == 0) {
                config.cert_path = (exe_path / config.cert_path).string();
                config.key_path = (exe_path / config.key_path).string();
            }
            
            if (!std::filesystem::exists(config.cert_path) || 
                !std::filesystem::exists(config.key_path)) {
                std::cerr << "[!] TLS certificates not found at:\n"
                          << "    " << config.cert_path << "\n"
                          << "    " << config.key_path << "\n"
                          << "[*] Set EDGEGATE_CERT_PATH / EDGEGATE_KEY_PATH or use --no-tls.\n";
                return 1;
            }
        }
        
        ssl::context ssl_ctx{ssl::context::tlsv12};
        if (config.enable_tls) {
            load_server_certificate(ssl_ctx, config.cert_path, config.key_path);
        }

        // Sessions left in the io_context reference services on destruction,
        // so services must be declared before (and outlive) ioc.
        auto telemetry = std::make_shared<edgegate::MetricsTelemetry>();
        edgegate::GatewayServices services(config, edgegate::build_dependencies(config, telemetry));

        net::io_context ioc{config.thread_count};

        // Evicts idle rate-limit windows so the key space stays bounded
        const auto sweep_interval = std::chrono::seconds(config.rate_limit_sweep_interval_sec);
        net::steady_timer sweep_timer(ioc, sweep_interval);
        std::function<void(beast::error_code)> on_sweep;
        on_sweep = [&](beast::error_code ec) {
            if (!ec) {
                size_t removed = services.ws_rate_limiter.sweep() + services.http_rate_limiter.sweep();
                if (removed > 0) {
                    edgegate::MetricsRegistry::instance().increment_counter("rate_limit_keys_evicted_total", static_cast<double>(removed));
                }
                sweep_timer.expires_after(sweep_interval);
                sweep_timer.async_wait(on_sweep);
            }
        };
        sweep_timer.async_wait(on_sweep);
        
        auto listener = std::make_shared<edgegate::Listener>(
            ioc,
            ssl_ctx,
            tcp::endpoint{net::ip::make_address(config.address), config.port},
            services
        );
        listener->run();

        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE, "internal",
                            "Edge gateway listening on " + config.address + ":" + std::to_string(config.port) +
                            (config.enable_tls ? " (TLS)" : " (plaintext)") + ", " +
                            std::to_string(config.thread_count) + " io threads, " +
                            std::to_string(config.dependency_threads) + " dependency threads");
        
        // Captured SIGINT and SIGTERM to perform a clean shutdown
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&ioc, listener, &sweep_timer](beast::error_code const&, int) {
                SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE, "internal", "Initiating graceful shutdown");
                beast::error_code ec;
                sweep_timer.cancel(ec);
                listener->stop();
                ioc.stop();
            });
        
        std::vector<std::thread> threads;
        threads.reserve(config.thread_count - 1);
        
        for (int i = 0; i < config.thread_count - 1; ++i) {
            threads.emplace_back([&ioc] {
                ioc.run();
            });
        }
        
        ioc.run();
        
        for (auto& t : threads) {
            t.join();
        }

        // Router and agent calls still running post their replies into the
        // stopped ioc; they must finish before ioc is destroyed.
        services.dependency_pool.shutdown();
        telemetry->shutdown();
        
        return 0;
        
    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
