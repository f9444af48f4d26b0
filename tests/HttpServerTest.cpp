#include "application/config/impl/InMemoryPrinterConfigStore.hpp"
#include "connector/controllers/PrinterController.hpp"
#include "connector/server/HttpServer.hpp"
#include "core/escpos/EscPosDecoder.hpp"
#include "core/network/PrinterEmulator.hpp"
#include "core/network/impl/TcpDeliveryChannel.hpp"
#include "support/TestSupport.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <future>

using connector::server::HttpServer;
using namespace std::chrono_literals;

namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {
    HttpServer::Options loopbackOptions() {
        HttpServer::Options options;
        options.bindAddress = "127.0.0.1";
        options.port = 0;
        options.ioThreads = 1;
        options.handlerThreads = 2;
        return options;
    }

    HttpServer::Response textResponse(const HttpServer::Request &request, const std::string &body) {
        HttpServer::Response response{http::status::ok, request.version()};
        response.set(http::field::content_type, "application/json");
        response.keep_alive(request.keep_alive());
        response.body() = body;
        response.prepare_payload();
        return response;
    }

    /**
     * @brief Minimal blocking client; one connection, any number of requests.
     */
    class Client {
    public:
        explicit Client(unsigned short port) : stream_(io_) {
            stream_.connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port));
        }

        ~Client() {
            beast::error_code ignored;
            stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);
        }

        http::response<http::string_body> send(http::verb method, const std::string &target,
                                               const std::string &body = "") {
            http::request<http::string_body> request{method, target, 11};
            request.set(http::field::host, "127.0.0.1");
            request.set(http::field::content_type, "application/json");
            request.body() = body;
            request.prepare_payload();
            http::write(stream_, request);

            http::response<http::string_body> response;
            http::read(stream_, buffer_, response);
            return response;
        }

    private:
        boost::asio::io_context io_;
        beast::tcp_stream stream_;
        beast::flat_buffer buffer_;
    };
}

TEST(HttpServerTest, ServesHandlerResponses) {
    HttpServer server(loopbackOptions(), [](const HttpServer::Request &request) {
        return textResponse(request, std::string(R"({"target":")") + std::string(request.target()) + "\"}");
    });
    server.start();
    ASSERT_NE(server.getPort(), 0);

    Client client(server.getPort());
    auto first = client.send(http::verb::get, "/health");
    EXPECT_EQ(first.result(), http::status::ok);
    EXPECT_EQ(first.body(), R"({"target":"/health"})");

    auto second = client.send(http::verb::post, "/print/booking", "{}");
    EXPECT_EQ(second.body(), R"({"target":"/print/booking"})");
    server.stop();
    EXPECT_FALSE(server.isRunning());
}

TEST(HttpServerTest, HandlerExceptionBecomesServerError) {
    HttpServer server(loopbackOptions(), [](const HttpServer::Request &) -> HttpServer::Response {
        throw std::runtime_error("boom");
    });
    server.start();

    Client client(server.getPort());
    auto response = client.send(http::verb::get, "/health");
    EXPECT_EQ(response.result(), http::status::internal_server_error);
    EXPECT_EQ(nlohmann::json::parse(response.body())["error"], "Internal server error");
    server.stop();
}

TEST(HttpServerTest, SlowHandlerDoesNotBlockOtherConnections) {
    testsupport::Gate gate;
    HttpServer server(loopbackOptions(), [&](const HttpServer::Request &request) {
        if (request.target() == "/slow") gate.wait(5s);
        return textResponse(request, "{}");
    });
    server.start();
    const unsigned short port = server.getPort();

    auto slow = std::async(std::launch::async, [port]() {
        Client client(port);
        return client.send(http::verb::get, "/slow").result();
    });

    Client fast(port);
    EXPECT_EQ(fast.send(http::verb::get, "/fast").result(), http::status::ok);
    EXPECT_EQ(slow.wait_for(0ms), std::future_status::timeout);

    gate.open();
    EXPECT_EQ(slow.get(), http::status::ok);
    server.stop();
}

TEST(HttpServerTest, PortInUseFailsToStart) {
    HttpServer first(loopbackOptions(), [](const HttpServer::Request &request) { return textResponse(request, ""); });
    first.start();

    auto options = loopbackOptions();
    options.port = first.getPort();
    HttpServer second(options, [](const HttpServer::Request &request) { return textResponse(request, ""); });
    EXPECT_THROW(second.start(), std::runtime_error);
    EXPECT_FALSE(second.isRunning());
    first.stop();
}

TEST(HttpServerTest, InvalidBindAddressFailsToStart) {
    auto options = loopbackOptions();
    options.bindAddress = "not-an-address";
    HttpServer server(options, [](const HttpServer::Request &request) { return textResponse(request, ""); });
    EXPECT_THROW(server.start(), std::runtime_error);
}

TEST(HttpServerTest, EmptyHandlerIsRejected) {
    EXPECT_THROW(HttpServer(loopbackOptions(), HttpServer::Handler{}), std::invalid_argument);
}

TEST(HttpServerTest, BookingReachesEmulatedPrinter) {
    core::PrinterEmulator printer("127.0.0.1", 0);
    printer.start();

    core::config::EndpointDefaults defaults;
    defaults.current = {"127.0.0.1", printer.getPort()};
    auto store = std::make_shared<core::config::InMemoryPrinterConfigStore>(defaults);
    auto channel = std::make_shared<core::TcpDeliveryChannel>(2000ms, 100ms);
    auto queue = std::make_shared<core::PrintDispatchQueue>(channel);
    queue->start();
    auto controller = std::make_shared<connector::controllers::PrinterController>(
        store, queue, channel, connector::controllers::PrinterController::Settings{});

    HttpServer server(loopbackOptions(), [controller](const HttpServer::Request &request) {
        return controller->handle(request);
    });
    server.start();

    Client client(server.getPort());
    auto response = client.send(http::verb::post, "/api/printer/print/booking", R"({
        "licensePlate": "123 TU 456",
        "destinationName": "Monastir",
        "seatNumber": 3,
        "totalAmount": 15.45,
        "basePrice": 5,
        "createdAt": "2025-10-15T08:30:00Z"
    })");

    EXPECT_EQ(response.result(), http::status::ok) << response.body();
    EXPECT_EQ(nlohmann::json::parse(response.body())["message"], "booking ticket printed successfully");

    ASSERT_TRUE(printer.waitForJobs(1, 2000ms));
    auto lines = core::escpos::EscPosDecoder::decode(printer.getJobs()[0].data);
    EXPECT_NE(std::find(lines.begin(), lines.end(), "Montant TTC: 15.450 TND"), lines.end());
    EXPECT_NE(std::find(lines.begin(), lines.end(), "Vehicule: 123 TU 456"), lines.end());

    auto probe = client.send(http::verb::post, "/test");
    EXPECT_EQ(nlohmann::json::parse(probe.body())["connected"], true);

    server.stop();
    queue->stop();
    printer.stop();
}

TEST(HttpServerTest, UnreachablePrinterIsBadGateway) {
    core::config::EndpointDefaults defaults;
    defaults.current = {"127.0.0.1", testsupport::closedLoopbackPort()};
    auto store = std::make_shared<core::config::InMemoryPrinterConfigStore>(defaults);
    auto channel = std::make_shared<core::TcpDeliveryChannel>(1000ms, 100ms);
    auto queue = std::make_shared<core::PrintDispatchQueue>(channel);
    queue->start();
    auto controller = std::make_shared<connector::controllers::PrinterController>(
        store, queue, channel, connector::controllers::PrinterController::Settings{});

    HttpServer server(loopbackOptions(), [controller](const HttpServer::Request &request) {
        return controller->handle(request);
    });
    server.start();

    Client client(server.getPort());
    auto response = client.send(http::verb::post, "/print/daypass", R"({"totalAmount": 2})");
    EXPECT_EQ(response.result(), http::status::bad_gateway);

    auto probe = nlohmann::json::parse(client.send(http::verb::post, "/test").body());
    EXPECT_EQ(probe["connected"], false);
    EXPECT_NE(probe["error"].get<std::string>().find("printer unreachable"), std::string::npos);

    server.stop();
    queue->stop();
}
