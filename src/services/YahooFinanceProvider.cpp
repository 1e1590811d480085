#include "services/YahooFinanceProvider.hpp"
#include "utils/HttpClient.hpp"
#include <json-glib/json-glib.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <memory>
#include <utility>

namespace ShareMonitor {

namespace {

const long kRequestTimeoutSeconds = 15;

struct GObjectDeleter {
    void operator()(gpointer object) const { g_object_unref(object); }
};

using ParserPtr = std::unique_ptr<JsonParser, GObjectDeleter>;

ParserPtr parseDocument(const std::string& body, const std::string& symbol) {
    ParserPtr parser(json_parser_new());
    GError* error = nullptr;
    if (!json_parser_load_from_data(parser.get(), body.c_str(), static_cast<gssize>(body.size()), &error)) {
        std::string message = error ? error->message : "unknown error";
        if (error) g_error_free(error);
        throw ProviderError("Malformed response for " + symbol + ": " + message);
    }
    JsonNode* root = json_parser_get_root(parser.get());
    if (!root || !JSON_NODE_HOLDS_OBJECT(root)) {
        throw ProviderError("Unexpected response shape for " + symbol);
    }
    return parser;
}

JsonObject* requireObjectMember(JsonObject* obj, const char* name, const std::string& symbol) {
    JsonNode* node = json_object_get_member(obj, name);
    if (!node || !JSON_NODE_HOLDS_OBJECT(node)) {
        throw ProviderError(std::string("Missing '") + name + "' in response for " + symbol);
    }
    return json_node_get_object(node);
}

JsonArray* optionalArrayMember(JsonObject* obj, const char* name) {
    JsonNode* node = json_object_get_member(obj, name);
    if (!node || !JSON_NODE_HOLDS_ARRAY(node)) return nullptr;
    return json_node_get_array(node);
}

std::optional<double> optionalNumber(JsonObject* obj, const char* name) {
    JsonNode* node = json_object_get_member(obj, name);
    if (!node || !JSON_NODE_HOLDS_VALUE(node)) return std::nullopt;
    GType type = json_node_get_value_type(node);
    if (type != G_TYPE_DOUBLE && type != G_TYPE_INT64) return std::nullopt;
    return json_node_get_double(node);
}

// Provider errors arrive as {"code": "...", "description": "..."}
void throwIfErrorMember(JsonObject* container, const std::string& symbol) {
    JsonNode* node = json_object_get_member(container, "error");
    if (!node || JSON_NODE_HOLDS_NULL(node)) return;
    std::string description = "provider error";
    if (JSON_NODE_HOLDS_OBJECT(node)) {
        JsonObject* err = json_node_get_object(node);
        if (json_object_has_member(err, "description")) {
            const char* text = json_object_get_string_member(err, "description");
            if (text) description = text;
        }
    }
    throw ProviderError(symbol + ": " + description);
}

}

YahooFinanceProvider::YahooFinanceProvider(std::string baseUrl) : baseUrl_(std::move(baseUrl)) {}

int YahooFinanceProvider::intervalSeconds(const std::string& interval) {
    static const std::pair<const char*, int> table[] = {
        {"1m", 60}, {"2m", 120}, {"5m", 300}, {"15m", 900}, {"30m", 1800},
        {"60m", 3600}, {"90m", 5400}, {"1h", 3600}, {"1d", 86400},
        {"5d", 432000}, {"1wk", 604800}, {"1mo", 2592000}, {"3mo", 7776000},
    };
    for (const auto& entry : table) {
        if (interval == entry.first) return entry.second;
    }
    return 0;
}

PriceHistory YahooFinanceProvider::parseChart(const std::string& body, const std::string& symbol) {
    ParserPtr parser = parseDocument(body, symbol);
    JsonObject* root = json_node_get_object(json_parser_get_root(parser.get()));
    JsonObject* chart = requireObjectMember(root, "chart", symbol);
    throwIfErrorMember(chart, symbol);

    JsonArray* results = optionalArrayMember(chart, "result");
    if (!results || json_array_get_length(results) == 0) {
        throw ProviderError("No chart data returned for " + symbol);
    }
    JsonObject* result = json_array_get_object_element(results, 0);
    if (!result) throw ProviderError("No chart data returned for " + symbol);

    PriceHistory history;
    if (json_object_has_member(result, "meta")) {
        JsonObject* meta = json_object_get_object_member(result, "meta");
        if (meta && json_object_has_member(meta, "dataGranularity")) {
            const char* granularity = json_object_get_string_member(meta, "dataGranularity");
            if (granularity) history.granularitySeconds = intervalSeconds(granularity);
        }
    }

    // A symbol with no trades in the period has meta but no timestamps
    JsonArray* timestamps = optionalArrayMember(result, "timestamp");
    if (!timestamps) return history;

    JsonObject* indicators = requireObjectMember(result, "indicators", symbol);
    JsonArray* quotes = optionalArrayMember(indicators, "quote");
    if (!quotes || json_array_get_length(quotes) == 0) return history;
    JsonObject* quote = json_array_get_object_element(quotes, 0);
    JsonArray* closes = quote ? optionalArrayMember(quote, "close") : nullptr;
    if (!closes) return history;

    guint count = std::min(json_array_get_length(timestamps), json_array_get_length(closes));
    history.points.reserve(count);
    for (guint i = 0; i < count; ++i) {
        JsonNode* ts = json_array_get_element(timestamps, i);
        JsonNode* close = json_array_get_element(closes, i);
        if (!ts || !close || JSON_NODE_HOLDS_NULL(ts) || JSON_NODE_HOLDS_NULL(close)) continue;
        history.points.push_back({json_node_get_int(ts), json_node_get_double(close)});
    }
    return history;
}

QuoteInfo YahooFinanceProvider::parseQuote(const std::string& body, const std::string& symbol) {
    ParserPtr parser = parseDocument(body, symbol);
    JsonObject* root = json_node_get_object(json_parser_get_root(parser.get()));
    JsonObject* response = requireObjectMember(root, "quoteResponse", symbol);
    throwIfErrorMember(response, symbol);

    QuoteInfo info;
    JsonArray* results = optionalArrayMember(response, "result");
    if (!results || json_array_get_length(results) == 0) return info;
    JsonObject* quote = json_array_get_object_element(results, 0);
    if (!quote) return info;

    info.price = optionalNumber(quote, "regularMarketPrice");
    info.openPrice = optionalNumber(quote, "regularMarketOpen");
    return info;
}

PriceHistory YahooFinanceProvider::fetchHistory(const std::string& symbol,
                                                const std::string& period,
                                                const std::string& interval) {
    std::string url = baseUrl_ + "/v8/finance/chart/" + HttpClient::urlEncode(symbol) +
                      "?range=" + HttpClient::urlEncode(period) +
                      "&interval=" + HttpClient::urlEncode(interval);
    HttpClient client;
    client.setTimeout(kRequestTimeoutSeconds);
    auto response = client.get(url);
    spdlog::debug("FETCH: {} history {}/{} -> {}", symbol, period, interval, response.statusCode);

    if (!response.success) {
        // Unknown symbols come back as 404 with a chart.error body
        if (!response.body.empty()) parseChart(response.body, symbol);
        throw ProviderError("History request for " + symbol + " failed: " + response.error);
    }
    return parseChart(response.body, symbol);
}

QuoteInfo YahooFinanceProvider::fetchInfo(const std::string& symbol) {
    std::string url = baseUrl_ + "/v7/finance/quote?symbols=" + HttpClient::urlEncode(symbol);
    HttpClient client;
    client.setTimeout(kRequestTimeoutSeconds);
    auto response = client.get(url);
    if (!response.success) {
        throw ProviderError("Quote request for " + symbol + " failed: " + response.error);
    }
    return parseQuote(response.body, symbol);
}

}
