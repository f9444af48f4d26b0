//
// Created by Andrea on 16/10/2025.
//

#pragma once

#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/http.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace connector::server {

    /**
     * @brief Asynchronous HTTP/1.1 server.
     *
     * Connections are read and written on a pool of I/O threads. Each parsed
     * request is handed to a separate handler pool, so a handler blocked on a
     * printer never stalls accepting or reading other requests.
     */
    class HttpServer {
    public:
        using Request = boost::beast::http::request<boost::beast::http::string_body>;
        using Response = boost::beast::http::response<boost::beast::http::string_body>;
        using Handler = std::function<Response(const Request &)>;

        struct Options {
            std::string bindAddress = "127.0.0.1";
            unsigned short port = 8105;
            int ioThreads = 2;
            int handlerThreads = 4;
            std::chrono::seconds idleTimeout{30};
        };

        HttpServer(Options options, Handler handler);

        ~HttpServer();

        HttpServer(const HttpServer &) = delete;

        HttpServer &operator=(const HttpServer &) = delete;

        /**
         * @throws std::runtime_error when the address cannot be bound (port in use)
         */
        void start();

        void stop();

        bool isRunning() const { return running_.load(); }

        /**
         * @brief Bound port; resolves port 0 after start().
         */
        unsigned short getPort() const { return boundPort_.load(); }

    private:
        class Session;

        Options options_;
        std::shared_ptr<const Handler> handler_;

        boost::asio::io_context ioContext_;
        std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> workGuard_;
        std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
        std::unique_ptr<boost::asio::thread_pool> handlerPool_;
        std::vector<std::thread> ioThreads_;

        std::atomic<bool> running_{false};
        std::atomic<unsigned short> boundPort_{0};

        void doAccept();
    };

} // namespace connector::server
