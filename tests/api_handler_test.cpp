/**
 * @file api_handler_test.cpp
 * @brief ParkingApiHandler的单元测试
 */
#include "api_handler.h"
#include "logger.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <limits>

using json = nlohmann::json;

namespace {

HttpRequest withBody(const json& body) {
    HttpRequest request;
    request.body = body.dump();
    return request;
}

HttpRequest withParams(std::map<std::string, std::string> params) {
    HttpRequest request;
    request.params = std::move(params);
    return request;
}

class ParkingApiHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setLogLevel(LogLevel::ERROR);
        lot.addLevel(1, 3, 2);
    }

    void TearDown() override {
        Logger::setLogLevel(LogLevel::INFO);
    }

    json park(const json& body, int expectedStatus = 200) {
        HttpResponse response = handler.handleParkVehicle(withBody(body));
        EXPECT_EQ(response.status, expectedStatus) << response.body;
        return json::parse(response.body);
    }

    ParkingLot lot;
    ParkingApiHandler handler{lot};
};

}  // namespace

TEST(ParkingApiHandlerStaticTest, CreatesJsonEnvelope) {
    json plain = json::parse(ParkingApiHandler::createJsonResponse(true, "ok"));
    EXPECT_TRUE(plain["success"].get<bool>());
    EXPECT_EQ(plain["message"], "ok");
    EXPECT_FALSE(plain.contains("data"));

    json withData = json::parse(ParkingApiHandler::createJsonResponse(false, "bad \"quote\"", "[1,2]"));
    EXPECT_FALSE(withData["success"].get<bool>());
    EXPECT_EQ(withData["message"], "bad \"quote\"");
    EXPECT_EQ(withData["data"], json::array({1, 2}));
}

TEST(ParkingApiHandlerStaticTest, MapsErrorCodesToStatus) {
    EXPECT_EQ(httpStatusFor(ParkingErrorCode::InvalidInput), 400);
    EXPECT_EQ(httpStatusFor(ParkingErrorCode::UnknownCriterion), 400);
    EXPECT_EQ(httpStatusFor(ParkingErrorCode::LevelNotFound), 404);
    EXPECT_EQ(httpStatusFor(ParkingErrorCode::NotFound), 404);
    EXPECT_EQ(httpStatusFor(ParkingErrorCode::Full), 409);
}

TEST_F(ParkingApiHandlerTest, AddLevel) {
    HttpResponse response = handler.handleAddLevel(withBody({{"regularCapacity", 4}, {"evCapacity", 1}}));
    ASSERT_EQ(response.status, 200) << response.body;
    EXPECT_EQ(json::parse(response.body)["data"]["levelNumber"], 2);

    response = handler.handleAddLevel(withBody({{"levelNumber", 2}, {"regularCapacity", 1}, {"evCapacity", 1}}));
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(response.headers["X-Error-Code"], "InvalidInput");

    response = handler.handleAddLevel(withBody({{"levelNumber", 5}, {"regularCapacity", -1}, {"evCapacity", 1}}));
    EXPECT_EQ(response.status, 400);
}

TEST_F(ParkingApiHandlerTest, ParkAndQuery) {
    json result = park({{"registration", "ABC123"}, {"make", "Audi"}, {"model", "A4"},
                        {"color", "Red"}, {"electric", false}, {"motorcycle", false}});
    EXPECT_TRUE(result["success"].get<bool>());
    EXPECT_EQ(result["data"]["levelNumber"], 1);
    EXPECT_EQ(result["data"]["slotId"], 1);
    EXPECT_EQ(result["data"]["electric"], false);

    HttpResponse response = handler.handleQueryVehicle(withParams({{"registration", "ABC123"}}));
    ASSERT_EQ(response.status, 200) << response.body;
    json data = json::parse(response.body)["data"];
    EXPECT_EQ(data["vehicle"]["make"], "Audi");
    EXPECT_EQ(data["vehicle"]["kind"], "car");
    EXPECT_FALSE(data["vehicle"].contains("charge"));
    EXPECT_EQ(data["location"]["slotId"], 1);

    response = handler.handleQueryVehicle(withParams({{"registration", "NOPE"}}));
    EXPECT_EQ(response.status, 404);
}

TEST_F(ParkingApiHandlerTest, ParkExplicitKind) {
    json result = park({{"registration", "EB1"}, {"kind", "electric_bike"}, {"charge", 30}});
    EXPECT_EQ(result["data"]["electric"], true);

    HttpResponse response = handler.handleQueryVehicle(withParams({{"registration", "EB1"}}));
    json vehicle = json::parse(response.body)["data"]["vehicle"];
    EXPECT_EQ(vehicle["kind"], "electric_bike");
    EXPECT_DOUBLE_EQ(vehicle["charge"].get<double>(), 30.0);

    park({{"registration", "X1"}, {"kind", "spaceship"}}, 400);
}

TEST_F(ParkingApiHandlerTest, ParkErrors) {
    park({{"make", "Audi"}}, 400);
    park({{"registration", ""}}, 400);
    park({{"registration", "A1"}, {"level", 9}}, 404);

    HttpRequest malformed;
    malformed.body = "{not json";
    EXPECT_EQ(handler.handleParkVehicle(malformed).status, 400);

    park({{"registration", "E1"}, {"electric", true}});
    park({{"registration", "E2"}, {"electric", true}});
    json full = park({{"registration", "E3"}, {"electric", true}}, 409);
    EXPECT_FALSE(full["success"].get<bool>());
}

TEST_F(ParkingApiHandlerTest, RemoveFromSlot) {
    park({{"registration", "E1"}, {"electric", true}, {"color", "Blue"}});

    HttpResponse response = handler.handleRemoveFromSlot(
        withParams({{"level", "1"}, {"slot", "1"}, {"electric", "false"}}));
    EXPECT_EQ(response.status, 404);

    response = handler.handleRemoveFromSlot(
        withParams({{"level", "1"}, {"slot", "1"}, {"electric", "true"}}));
    ASSERT_EQ(response.status, 200) << response.body;
    EXPECT_EQ(json::parse(response.body)["data"]["registration"], "E1");

    response = handler.handleRemoveFromSlot(withParams({{"level", "x"}, {"slot", "1"}}));
    EXPECT_EQ(response.status, 400);
    response = handler.handleRemoveFromSlot(withParams({{"level", "1"}, {"slot", "1"}, {"electric", "maybe"}}));
    EXPECT_EQ(response.status, 400);
}

TEST_F(ParkingApiHandlerTest, RemoveByRegistration) {
    park({{"registration", "A1"}});

    HttpResponse response = handler.handleRemoveVehicle(withParams({{"registration", "A1"}}));
    ASSERT_EQ(response.status, 200) << response.body;
    response = handler.handleRemoveVehicle(withParams({{"registration", "A1"}}));
    EXPECT_EQ(response.status, 404);
}

TEST_F(ParkingApiHandlerTest, Search) {
    park({{"registration", "A1"}, {"color", "Red"}});
    park({{"registration", "A2"}, {"color", "Blue"}});
    park({{"registration", "A3"}, {"color", "red"}});

    HttpResponse response = handler.handleSearch(
        withParams({{"criterion", "color"}, {"value", "RED"}, {"electric", "false"}}));
    ASSERT_EQ(response.status, 200) << response.body;
    json data = json::parse(response.body)["data"];
    ASSERT_EQ(data.size(), 2u);
    EXPECT_EQ(data[0]["slotId"], 1);
    EXPECT_EQ(data[1]["slotId"], 3);

    response = handler.handleSearch(withParams({{"criterion", "color"}, {"value", "RED"}, {"electric", "true"}}));
    EXPECT_TRUE(json::parse(response.body)["data"].empty());

    response = handler.handleSearch(withParams({{"criterion", "owner"}, {"value", "x"}}));
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(response.headers["X-Error-Code"], "UnknownCriterion");

    response = handler.handleSearch(withParams({{"criterion", "color"}}));
    EXPECT_EQ(response.status, 400);
}

TEST_F(ParkingApiHandlerTest, SetCharge) {
    park({{"registration", "E1"}, {"electric", true}});

    HttpRequest request = withParams({{"level", "1"}, {"slot", "1"}});
    request.body = json{{"charge", 140}}.dump();
    HttpResponse response = handler.handleSetCharge(request);
    ASSERT_EQ(response.status, 200) << response.body;
    EXPECT_DOUBLE_EQ(json::parse(response.body)["data"]["charge"].get<double>(), 100.0);

    request.params["slot"] = "2";
    EXPECT_EQ(handler.handleSetCharge(request).status, 404);
}

TEST_F(ParkingApiHandlerTest, StatusAndCurrentVehicles) {
    park({{"registration", "A1"}});
    park({{"registration", "E1"}, {"electric", true}});

    HttpResponse response = handler.handleGetParkingStatus(HttpRequest());
    ASSERT_EQ(response.status, 200);
    json status = json::parse(response.body)["data"];
    EXPECT_EQ(status["totalRegularOccupied"], 1);
    EXPECT_EQ(status["totalRegularCapacity"], 3);
    EXPECT_EQ(status["totalEvOccupied"], 1);
    EXPECT_EQ(status["totalEvCapacity"], 2);
    ASSERT_EQ(status["levels"].size(), 1u);
    EXPECT_EQ(status["levels"][0]["regularFree"], 2);
    EXPECT_EQ(status["levels"][0]["evFree"], 1);

    response = handler.handleGetCurrentVehicles(HttpRequest());
    json vehicles = json::parse(response.body)["data"];
    ASSERT_EQ(vehicles.size(), 2u);
    EXPECT_EQ(vehicles[0]["vehicle"]["registration"], "A1");
    EXPECT_EQ(vehicles[1]["location"]["electric"], true);
}

TEST_F(ParkingApiHandlerTest, ResponsesCarryCorsHeaders) {
    HttpResponse response = handler.handleGetParkingStatus(HttpRequest());
    EXPECT_EQ(response.headers["Access-Control-Allow-Origin"], "*");
    EXPECT_EQ(response.headers["Content-Type"], "application/json");
}

TEST_F(ParkingApiHandlerTest, QueryReportsLocationAndVehicleTogether) {
    park({{"registration", "A1"}, {"color", "Red"}});
    park({{"registration", "A2"}, {"color", "Blue"}});

    HttpResponse response = handler.handleQueryVehicle(withParams({{"registration", "A2"}}));
    ASSERT_EQ(response.status, 200) << response.body;
    json data = json::parse(response.body)["data"];
    EXPECT_EQ(data["location"]["levelNumber"], 1);
    EXPECT_EQ(data["location"]["slotId"], 2);
    EXPECT_EQ(data["location"]["electric"], false);
    EXPECT_EQ(data["vehicle"]["registration"], "A2");
    EXPECT_EQ(data["vehicle"]["color"], "Blue");
}

TEST_F(ParkingApiHandlerTest, RejectsOversizedIntegers) {
    // 4294967297 截断为int时等于1
    json parked = park({{"registration", "A1"}, {"level", 4294967297ULL}}, 400);
    EXPECT_FALSE(parked["success"].get<bool>());
    EXPECT_FALSE(lot.locate("A1").has_value());

    park({{"registration", "A1"}, {"level", -4294967295LL}}, 400);
    park({{"registration", "A1"}, {"level", 1.5}}, 400);

    HttpResponse response = handler.handleAddLevel(
        withBody({{"levelNumber", 4}, {"regularCapacity", 4294967297ULL}, {"evCapacity", 1}}));
    EXPECT_EQ(response.status, 400) << response.body;
    response = handler.handleAddLevel(
        withBody({{"levelNumber", 4294967298ULL}, {"regularCapacity", 1}, {"evCapacity", 1}}));
    EXPECT_EQ(response.status, 400) << response.body;
    EXPECT_EQ(lot.getLevelCount(), 1u);
}

TEST_F(ParkingApiHandlerTest, AutoLevelNumberAfterIntMax) {
    HttpResponse response = handler.handleAddLevel(withBody(
        {{"levelNumber", std::numeric_limits<int>::max()}, {"regularCapacity", 1}, {"evCapacity", 1}}));
    ASSERT_EQ(response.status, 200) << response.body;

    response = handler.handleAddLevel(withBody({{"regularCapacity", 1}, {"evCapacity", 1}}));
    EXPECT_EQ(response.status, 400) << response.body;
    EXPECT_EQ(response.headers["X-Error-Code"], "InvalidInput");
    EXPECT_EQ(lot.getLevelCount(), 2u);
}
