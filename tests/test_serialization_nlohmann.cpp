#include <gtest/gtest.h>

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "fake_connection.hpp"
#include "poolhttp/client.hpp"
#include "poolhttp/serialize_nlohmann.hpp"

// Define a DTO
struct Product {
    int id{};
    std::string name;
    double price{};
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Product, id, name, price)

using namespace poolhttp;
using namespace poolhttp_test;

namespace {

    std::unique_ptr<HttpClient> json_client(std::shared_ptr<FakeState> state) {
        ClientConfiguration cfg;
        cfg.base_url = "http://shop.example";
        cfg.backend = ConnectionBackend::Custom;
        cfg.connection_factory = make_fake_factory(std::move(state));
        return std::make_unique<HttpClient>(std::move(cfg));
    }

}  // namespace

TEST(SerializationNlohmannTest, GetDeserializesObject) {
    auto state = std::make_shared<FakeState>();
    state->handler = [](const PreparedRequest&) {
        return Result<Response>::ok(make_response(
            200, R"({"id": 7, "name": "Widget", "price": 9.5})",
            {{"Content-Type", "application/json"}}));
    };
    auto client = json_client(state);

    auto res = client->get<Product>("/products/7");
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(res.value().id, 7);
    EXPECT_EQ(res.value().name, "Widget");
    EXPECT_DOUBLE_EQ(res.value().price, 9.5);

    auto sent = state->requests();
    ASSERT_EQ(sent.size(), 1U);
    EXPECT_EQ(sent[0].beast_req.target(), "/products/7");
}

TEST(SerializationNlohmannTest, PostDeserializesArray) {
    auto state = std::make_shared<FakeState>();
    state->handler = [](const PreparedRequest& preq) {
        // Echo the posted product back inside a list
        return Result<Response>::ok(
            make_response(201, "[" + preq.beast_req.body() + "]"));
    };
    auto client = json_client(state);

    const nlohmann::json body = Product{1, "Gadget", 2.25};
    auto res = client->post<std::vector<Product>>("/products", body.dump());
    ASSERT_TRUE(res.has_value()) << res.error().message;
    ASSERT_EQ(res.value().size(), 1U);
    EXPECT_EQ(res.value()[0].name, "Gadget");
    EXPECT_DOUBLE_EQ(res.value()[0].price, 2.25);
}

TEST(SerializationNlohmannTest, InvalidJsonBecomesError) {
    auto state = std::make_shared<FakeState>();
    state->handler = [](const PreparedRequest&) {
        return Result<Response>::ok(make_response(200, "not json"));
    };
    auto client = json_client(state);

    auto res = client->get<Product>("/products/1");
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error().code, ErrorCode::Unknown);
    EXPECT_NE(res.error().message.find("Failed to deserialize response"),
              std::string::npos);
}

TEST(SerializationNlohmannTest, MissingFieldBecomesError) {
    auto state = std::make_shared<FakeState>();
    state->handler = [](const PreparedRequest&) {
        return Result<Response>::ok(make_response(200, R"({"id": 1})"));
    };
    auto client = json_client(state);

    auto res = client->get<Product>("/products/1");
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error().code, ErrorCode::Unknown);
}

TEST(SerializationNlohmannTest, TransportErrorIsPassedThrough) {
    auto state = std::make_shared<FakeState>();
    state->connect_error = Error{ErrorCode::ConnectionFailed, "refused"};
    ClientConfiguration cfg;
    cfg.backend = ConnectionBackend::Custom;
    cfg.connection_factory = make_fake_factory(state);
    cfg.retry = Retry::disabled().config();
    HttpClient client(cfg);

    auto res = client.del<Product>("http://shop.example/products/1");
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error().code, ErrorCode::ConnectionFailed);
}
