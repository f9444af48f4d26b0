//
// Created by Andrea on 16/10/2025.
//

#include "connector/server/HttpServer.hpp"
#include "logger/Logger.hpp"
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <algorithm>
#include <stdexcept>

namespace connector::server {
    namespace beast = boost::beast;
    namespace http = boost::beast::http;
    namespace net = boost::asio;
    using tcp = boost::asio::ip::tcp;

    class HttpServer::Session : public std::enable_shared_from_this<Session> {
    public:
        Session(tcp::socket socket, std::shared_ptr<const Handler> handler, net::thread_pool &handlerPool,
                std::chrono::seconds idleTimeout)
                : stream_(std::move(socket)), handler_(std::move(handler)), handlerPool_(handlerPool),
                  idleTimeout_(idleTimeout) {
        }

        void start() {
            // Run on the connection's strand from the first operation on
            net::dispatch(stream_.get_executor(), beast::bind_front_handler(&Session::doRead, shared_from_this()));
        }

    private:
        beast::tcp_stream stream_;
        beast::flat_buffer buffer_;
        Request request_;
        std::shared_ptr<Response> response_;
        std::shared_ptr<const Handler> handler_;
        net::thread_pool &handlerPool_;
        std::chrono::seconds idleTimeout_;

        void doRead() {
            request_ = {};
            stream_.expires_after(idleTimeout_);
            http::async_read(stream_, buffer_, request_,
                             beast::bind_front_handler(&Session::onRead, shared_from_this()));
        }

        void onRead(beast::error_code ec, std::size_t) {
            if (ec == http::error::end_of_stream) {
                doClose();
                return;
            }
            if (ec) {
                if (ec != beast::error::timeout && ec != net::error::operation_aborted) {
                    Logger::logWarning("[HttpServer] Read failed: " + ec.message());
                }
                return;
            }

            auto self = shared_from_this();
            net::post(handlerPool_, [self, request = std::move(request_)]() {
                Response response = self->invokeHandler(request);
                net::post(self->stream_.get_executor(), [self, response = std::move(response)]() mutable {
                    self->doWrite(std::move(response));
                });
            });
        }

        Response invokeHandler(const Request &request) const {
            try {
                return (*handler_)(request);
            } catch (const std::exception &e) {
                Logger::logError("[HttpServer] Handler threw: " + std::string(e.what()));
            }

            Response response{http::status::internal_server_error, request.version()};
            response.set(http::field::content_type, "application/json");
            response.keep_alive(request.keep_alive());
            response.body() = R"({"error":"Internal server error"})";
            response.prepare_payload();
            return response;
        }

        void doWrite(Response response) {
            response_ = std::make_shared<Response>(std::move(response));
            stream_.expires_after(idleTimeout_);
            http::async_write(stream_, *response_,
                              beast::bind_front_handler(&Session::onWrite, shared_from_this(),
                                                        response_->need_eof()));
        }

        void onWrite(bool close, beast::error_code ec, std::size_t) {
            if (ec) {
                Logger::logWarning("[HttpServer] Write failed: " + ec.message());
                return;
            }
            response_.reset();
            if (close) {
                doClose();
                return;
            }
            doRead();
        }

        void doClose() {
            beast::error_code ignored;
            stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
        }
    };

    HttpServer::HttpServer(Options options, Handler handler)
            : options_(std::move(options)), handler_(std::make_shared<const Handler>(std::move(handler))) {
        if (!*handler_) {
            throw std::invalid_argument("HttpServer handler cannot be empty");
        }
    }

    HttpServer::~HttpServer() {
        stop();
    }

    void HttpServer::start() {
        if (running_) {
            Logger::logWarning("[HttpServer] Already running");
            return;
        }

        beast::error_code ec;
        auto address = net::ip::make_address(options_.bindAddress, ec);
        if (ec) {
            throw std::runtime_error("Invalid bind address " + options_.bindAddress + ": " + ec.message());
        }
        tcp::endpoint endpoint(address, options_.port);
        const std::string where = options_.bindAddress + ":" + std::to_string(options_.port);

        acceptor_ = std::make_unique<tcp::acceptor>(net::make_strand(ioContext_));
        acceptor_->open(endpoint.protocol(), ec);
        if (!ec) acceptor_->set_option(net::socket_base::reuse_address(true), ec);
        if (!ec) acceptor_->bind(endpoint, ec);
        if (!ec) acceptor_->listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            acceptor_.reset();
            throw std::runtime_error("Cannot listen on " + where + ": " + ec.message());
        }
        boundPort_ = acceptor_->local_endpoint().port();

        handlerPool_ = std::make_unique<net::thread_pool>(std::max(1, options_.handlerThreads));
        ioContext_.restart();
        workGuard_.emplace(net::make_work_guard(ioContext_));
        doAccept();

        running_ = true;
        const int ioThreads = std::max(1, options_.ioThreads);
        for (int i = 0; i < ioThreads; ++i) {
            ioThreads_.emplace_back([this]() {
                try {
                    ioContext_.run();
                } catch (const std::exception &e) {
                    Logger::logError("[HttpServer] I/O thread crashed: " + std::string(e.what()));
                }
            });
        }

        Logger::logInfo("[HttpServer] Listening on http://" + options_.bindAddress + ":" +
                        std::to_string(boundPort_.load()) + " (" + std::to_string(ioThreads) + " I/O, " +
                        std::to_string(std::max(1, options_.handlerThreads)) + " handler threads)");
    }

    void HttpServer::stop() {
        if (!running_.exchange(false)) return;

        Logger::logInfo("[HttpServer] Stopping...");
        net::post(acceptor_->get_executor(), [this]() {
            beast::error_code ignored;
            acceptor_->close(ignored);
        });
        workGuard_.reset();
        ioContext_.stop();

        for (auto &thread: ioThreads_) {
            if (thread.joinable()) thread.join();
        }
        ioThreads_.clear();

        // In-flight handlers finish; their responses are dropped with the stopped context
        if (handlerPool_) {
            handlerPool_->join();
            handlerPool_.reset();
        }
        acceptor_.reset();
        Logger::logInfo("[HttpServer] Stopped");
    }

    void HttpServer::doAccept() {
        acceptor_->async_accept(net::make_strand(ioContext_), [this](beast::error_code ec, tcp::socket socket) {
            if (ec) {
                if (ec != net::error::operation_aborted) {
                    Logger::logError("[HttpServer] Accept failed: " + ec.message());
                }
                return;
            }
            std::make_shared<Session>(std::move(socket), handler_, *handlerPool_, options_.idleTimeout)->start();
            doAccept();
        });
    }

} // namespace connector::server
