#include "source/rpc_account_source.hpp"
#include "node_connection/rpc_client.hpp"
#include "net/http_client.hpp"
#include "encoding/base64.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <functional>

using json = nlohmann::json;

/* answers getMultipleAccounts from an in-memory account map */
class FakeHttpClient : public HttpClient {
public:
	HttpResponse Post(const std::string &url, const std::string &body,
			  const std::unordered_map<std::string, std::string> &headers,
			  int timeout_ms) override {
		last_url = url;
		last_headers = headers;
		last_timeout_ms = timeout_ms;
		requests.push_back(json::parse(body));
		if (override_response)
			return override_response(requests.back());

		json values = json::array();
		for (const auto &k : requests.back()["params"][0]) {
			auto it = accounts.find(AccountKey::FromBase58(k.get<std::string>()));
			if (it == accounts.end()) {
				values.push_back(nullptr);
			} else {
				values.push_back({
					{"data", {Base64::Encode(it->second), "base64"}},
					{"executable", false},
					{"lamports", 1000},
					{"owner", "AddressLookupTab1e1111111111111111111111111"},
					{"rentEpoch", 0},
				});
			}
		}
		json reply = {
			{"jsonrpc", "2.0"},
			{"id", requests.back()["id"]},
			{"result", {{"context", {{"slot", 1}}}, {"value", values}}},
		};
		return {200, reply.dump(), ""};
	}

	AccountMap accounts;
	std::vector<json> requests;
	std::string last_url;
	std::unordered_map<std::string, std::string> last_headers;
	int last_timeout_ms = 0;
	std::function<HttpResponse(const json &)> override_response;
};

class RpcAccountSourceTest : public ::testing::Test {
protected:
	RpcAccountSourceTest()
		:rpc_(http_, "http://node.invalid:8899", std::string("Bearer secret")) {
		config_.rpc_url = "http://node.invalid:8899";
		config_.commitment = "confirmed";
		config_.timeout_ms = 1234;
	}

	static AltErrorKind FailureOf(RpcAccountSource &source,
				      const std::vector<AccountKey> &keys) {
		try {
			source.Fetch(keys);
		} catch (const AltError &e) {
			return e.Kind();
		}
		ADD_FAILURE() << "fetch unexpectedly succeeded";
		return AltErrorKind::StoreCorrupt;
	}

	FakeHttpClient http_;
	RpcClient rpc_;
	RpcSourceConfig config_;
};

TEST_F(RpcAccountSourceTest, RequestShape)
{
	http_.accounts[MakeKey(1)] = {1, 2, 3};
	RpcAccountSource source(rpc_, config_);
	source.Fetch({MakeKey(1), MakeKey(2)});

	ASSERT_EQ(http_.requests.size(), 1u);
	const auto &req = http_.requests[0];
	EXPECT_EQ(req["jsonrpc"].get<std::string>(), "2.0");
	EXPECT_EQ(req["method"].get<std::string>(), "getMultipleAccounts");
	EXPECT_EQ(req["params"][0][0].get<std::string>(), MakeKey(1).ToBase58());
	EXPECT_EQ(req["params"][0][1].get<std::string>(), MakeKey(2).ToBase58());
	EXPECT_EQ(req["params"][1]["encoding"].get<std::string>(), "base64");
	EXPECT_EQ(req["params"][1]["commitment"].get<std::string>(), "confirmed");

	EXPECT_EQ(rpc_.Endpoint(), "http://node.invalid:8899");
	EXPECT_EQ(http_.last_url, "http://node.invalid:8899");
	EXPECT_EQ(http_.last_timeout_ms, 1234);
	EXPECT_EQ(http_.last_headers["Content-Type"], "application/json");
	EXPECT_EQ(http_.last_headers["Authorization"], "Bearer secret");
}

TEST_F(RpcAccountSourceTest, OmitsMissingAccounts)
{
	http_.accounts[MakeKey(1)] = {1, 2, 3};
	http_.accounts[MakeKey(3)] = {};
	RpcAccountSource source(rpc_, config_);

	const auto result = source.Fetch({MakeKey(1), MakeKey(2), MakeKey(3)});
	ASSERT_EQ(result.size(), 2u);
	EXPECT_EQ(result[0].key, MakeKey(1));
	EXPECT_EQ(result[0].data, (AccountData{1, 2, 3}));
	EXPECT_EQ(result[1].key, MakeKey(3));
	EXPECT_TRUE(result[1].data.empty());
}

TEST_F(RpcAccountSourceTest, EmptyInputSkipsNetwork)
{
	RpcAccountSource source(rpc_, config_);
	EXPECT_TRUE(source.Fetch({}).empty());
	EXPECT_TRUE(http_.requests.empty());
}

TEST_F(RpcAccountSourceTest, RejectsOversizedBatch)
{
	config_.max_batch_size = 2;
	RpcAccountSource source(rpc_, config_);
	EXPECT_EQ(source.MaxBatchSize(), 2u);
	EXPECT_EQ(FailureOf(source, {MakeKey(1), MakeKey(2), MakeKey(3)}), AltErrorKind::FetchFailed);
	EXPECT_TRUE(http_.requests.empty());
}

TEST_F(RpcAccountSourceTest, HttpErrorStatus)
{
	http_.override_response = [](const json &) { return HttpResponse{503, "busy", ""}; };
	RpcAccountSource source(rpc_, config_);
	EXPECT_EQ(FailureOf(source, {MakeKey(1)}), AltErrorKind::FetchFailed);
}

TEST_F(RpcAccountSourceTest, TransportError)
{
	http_.override_response = [](const json &) {
		return HttpResponse{0, "", "Couldn't connect to server"};
	};
	RpcAccountSource source(rpc_, config_);
	EXPECT_EQ(FailureOf(source, {MakeKey(1)}), AltErrorKind::FetchFailed);
}

TEST_F(RpcAccountSourceTest, JsonRpcError)
{
	http_.override_response = [](const json &req) {
		json reply = {{"jsonrpc", "2.0"}, {"id", req["id"]},
			      {"error", {{"code", -32005}, {"message", "Node is behind"}}}};
		return HttpResponse{200, reply.dump(), ""};
	};
	RpcAccountSource source(rpc_, config_);
	EXPECT_EQ(FailureOf(source, {MakeKey(1)}), AltErrorKind::FetchFailed);
}

TEST_F(RpcAccountSourceTest, MalformedResponses)
{
	RpcAccountSource source(rpc_, config_);

	http_.override_response = [](const json &) { return HttpResponse{200, "{not json", ""}; };
	EXPECT_EQ(FailureOf(source, {MakeKey(1)}), AltErrorKind::FetchFailed);

	/* value array shorter than the request */
	http_.override_response = [](const json &req) {
		json reply = {{"jsonrpc", "2.0"}, {"id", req["id"]},
			      {"result", {{"context", {{"slot", 1}}}, {"value", json::array()}}}};
		return HttpResponse{200, reply.dump(), ""};
	};
	EXPECT_EQ(FailureOf(source, {MakeKey(1)}), AltErrorKind::FetchFailed);

	/* unexpected data encoding */
	http_.override_response = [](const json &req) {
		json account = {{"data", {"AQID", "base58"}}};
		json reply = {{"jsonrpc", "2.0"}, {"id", req["id"]},
			      {"result", {{"context", {{"slot", 1}}}, {"value", {account}}}}};
		return HttpResponse{200, reply.dump(), ""};
	};
	EXPECT_EQ(FailureOf(source, {MakeKey(1)}), AltErrorKind::FetchFailed);

	/* broken base64 payload */
	http_.override_response = [](const json &req) {
		json account = {{"data", {"A*ID", "base64"}}};
		json reply = {{"jsonrpc", "2.0"}, {"id", req["id"]},
			      {"result", {{"context", {{"slot", 1}}}, {"value", {account}}}}};
		return HttpResponse{200, reply.dump(), ""};
	};
	EXPECT_EQ(FailureOf(source, {MakeKey(1)}), AltErrorKind::FetchFailed);
}

TEST_F(RpcAccountSourceTest, InvalidConfig)
{
	config_.commitment = "recent";
	EXPECT_THROW({ RpcAccountSource source(rpc_, config_); }, std::invalid_argument);
	config_.commitment = "finalized";
	config_.max_batch_size = 0;
	EXPECT_THROW({ RpcAccountSource source(rpc_, config_); }, std::invalid_argument);
}

TEST(Base64, DecodeAndReject)
{
	std::vector<uint8_t> out;
	ASSERT_TRUE(Base64::Decode("AQID", out));
	EXPECT_EQ(out, (std::vector<uint8_t>{1, 2, 3}));
	ASSERT_TRUE(Base64::Decode("", out));
	EXPECT_TRUE(out.empty());
	EXPECT_EQ(Base64::Encode({1, 2, 3, 4}), "AQIDBA==");
	EXPECT_FALSE(Base64::Decode("AQI", out));
	EXPECT_FALSE(Base64::Decode("A=ID", out));
	EXPECT_FALSE(Base64::Decode("AQ\nID", out));
}

TEST(CurlHttpClient, ConnectionRefused)
{
	/* nothing listens on the discard port of the loopback interface */
	auto http = CreateCurlHttpClient();
	ASSERT_NE(http, nullptr);
	const auto resp = http->Post("http://127.0.0.1:9/", "{}",
				     {{"Content-Type", "application/json"}}, 2000);
	EXPECT_EQ(resp.status, 0);
	EXPECT_FALSE(resp.error.empty());

	RpcClient rpc(*http, "http://127.0.0.1:9/");
	RpcSourceConfig config;
	config.timeout_ms = 2000;
	RpcAccountSource source(rpc, config);
	EXPECT_THROW(source.Fetch({MakeKey(1)}), AltError);
}
