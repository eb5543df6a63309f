// src/data/hyperliquid_snapshot_source.cpp

#include "signal_ngin/data/hyperliquid_snapshot_source.hpp"
#include <curl/curl.h>
#include <algorithm>
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/core/time_utils.hpp"

namespace signal_ngin {

namespace {

std::once_flag curl_global_once;

size_t write_callback(char* data, size_t size, size_t nmemb, void* userp) {
    auto* buffer = static_cast<std::string*>(userp);
    buffer->append(data, size * nmemb);
    return size * nmemb;
}

// Hyperliquid encodes prices and sizes as decimal strings
double read_decimal(const nlohmann::json& value) {
    if (value.is_string()) {
        return std::stod(value.get<std::string>());
    }
    return value.get<double>();
}

}  // namespace

HyperliquidSnapshotSource::HyperliquidSnapshotSource(HyperliquidConfig config,
                                                     std::shared_ptr<Clock> clock)
    : config_(std::move(config)), clock_(std::move(clock)) {
    if (!clock_) {
        throw std::invalid_argument("HyperliquidSnapshotSource requires a clock");
    }
    if (config_.book_levels <= 0) {
        throw std::invalid_argument("book_levels must be positive");
    }
    std::call_once(curl_global_once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
    curl_ = curl_easy_init();
    if (!curl_) {
        throw std::runtime_error("Failed to initialise libcurl handle");
    }
}

HyperliquidSnapshotSource::~HyperliquidSnapshotSource() {
    if (curl_) {
        curl_easy_cleanup(static_cast<CURL*>(curl_));
    }
}

Result<nlohmann::json> HyperliquidSnapshotSource::post_info(const nlohmann::json& request,
                                                            std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        return make_error<nlohmann::json>(ErrorCode::TIMEOUT_ERROR,
                                          "No time left for request", "HyperliquidSource");
    }

    CURL* curl = static_cast<CURL*>(curl_);
    curl_easy_reset(curl);

    std::string body = request.dump();
    std::string response;
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, config_.api_url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, config_.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, config_.verify_tls ? 2L : 0L);

    CURLcode res = curl_easy_perform(curl);
    long http_status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);
    curl_slist_free_all(headers);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        return make_error<nlohmann::json>(ErrorCode::TIMEOUT_ERROR,
                                          "Request timed out after " +
                                              std::to_string(timeout.count()) + "ms",
                                          "HyperliquidSource");
    }
    if (res != CURLE_OK) {
        return make_error<nlohmann::json>(ErrorCode::CONNECTION_ERROR,
                                          std::string("Request failed: ") +
                                              curl_easy_strerror(res),
                                          "HyperliquidSource");
    }
    if (http_status != 200) {
        return make_error<nlohmann::json>(ErrorCode::API_ERROR,
                                          "HTTP status " + std::to_string(http_status),
                                          "HyperliquidSource");
    }

    try {
        return nlohmann::json::parse(response);
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<nlohmann::json>(ErrorCode::JSON_PARSE_ERROR,
                                          std::string("Malformed response: ") + e.what(),
                                          "HyperliquidSource");
    }
}

Result<MarketSnapshot> HyperliquidSnapshotSource::parse_l2_book(const nlohmann::json& response,
                                                                int levels) {
    try {
        if (!response.is_object() || !response.contains("levels") ||
            !response.contains("time")) {
            return make_error<MarketSnapshot>(ErrorCode::INVALID_DATA,
                                              "l2Book response missing levels or time",
                                              "HyperliquidSource");
        }
        const auto& sides = response.at("levels");
        if (!sides.is_array() || sides.size() != 2 || sides[0].empty() || sides[1].empty()) {
            return make_error<MarketSnapshot>(ErrorCode::INVALID_DATA,
                                              "l2Book has an empty side", "HyperliquidSource");
        }

        MarketSnapshot snapshot;
        snapshot.timestamp = core::from_epoch_ms(response.at("time").get<int64_t>());
        if (response.contains("coin")) {
            snapshot.coin = response.at("coin").get<std::string>();
        }

        const auto& bids = sides[0];
        const auto& asks = sides[1];
        snapshot.best_bid = read_decimal(bids[0].at("px"));
        snapshot.bid_size = read_decimal(bids[0].at("sz"));
        snapshot.best_ask = read_decimal(asks[0].at("px"));
        snapshot.ask_size = read_decimal(asks[0].at("sz"));

        size_t depth = static_cast<size_t>(levels);
        for (size_t i = 0; i < std::min(depth, bids.size()); ++i) {
            snapshot.bid_depth += read_decimal(bids[i].at("sz"));
        }
        for (size_t i = 0; i < std::min(depth, asks.size()); ++i) {
            snapshot.ask_depth += read_decimal(asks[i].at("sz"));
        }

        auto valid = validate_snapshot(snapshot);
        if (valid.is_error()) {
            return forward_error<MarketSnapshot>(valid, "HyperliquidSource");
        }
        return snapshot;

    } catch (const nlohmann::json::exception& e) {
        return make_error<MarketSnapshot>(ErrorCode::INVALID_DATA,
                                          std::string("Unexpected l2Book layout: ") + e.what(),
                                          "HyperliquidSource");
    } catch (const std::exception& e) {
        return make_error<MarketSnapshot>(ErrorCode::CONVERSION_ERROR,
                                          std::string("Bad numeric field in l2Book: ") + e.what(),
                                          "HyperliquidSource");
    }
}

Result<TradeFlow> HyperliquidSnapshotSource::summarize_trades(const nlohmann::json& response,
                                                              Timestamp window_end,
                                                              std::chrono::milliseconds window) {
    if (!response.is_array()) {
        return make_error<TradeFlow>(ErrorCode::INVALID_DATA,
                                     "recentTrades response is not an array",
                                     "HyperliquidSource");
    }

    int64_t end_ms = core::to_epoch_ms(window_end);
    int64_t start_ms = end_ms - window.count();

    TradeFlow flow;
    try {
        for (const auto& trade : response) {
            int64_t t = trade.at("time").get<int64_t>();
            if (t <= start_ms || t > end_ms) {
                continue;
            }
            double size = read_decimal(trade.at("sz"));
            std::string side = trade.at("side").get<std::string>();
            if (side == "B") {
                flow.buy_volume += size;
            } else if (side == "A") {
                flow.sell_volume += size;
            } else {
                continue;
            }
            ++flow.trade_count;
        }
    } catch (const std::exception& e) {
        return make_error<TradeFlow>(ErrorCode::INVALID_DATA,
                                     std::string("Unexpected recentTrades entry: ") + e.what(),
                                     "HyperliquidSource");
    }
    return flow;
}

Result<SnapshotPtr> HyperliquidSnapshotSource::fetch(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto deadline = std::chrono::steady_clock::now() + timeout;
    auto remaining = [&deadline, this]() {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        return std::min(left, std::chrono::milliseconds(config_.request_timeout_ms));
    };

    auto unavailable = [](const std::string& why) {
        return make_error<SnapshotPtr>(ErrorCode::DATA_UNAVAILABLE, why, "HyperliquidSource");
    };

    auto book_json = post_info({{"type", "l2Book"}, {"coin", config_.coin}}, remaining());
    if (book_json.is_error()) {
        return unavailable(std::string("l2Book: ") + book_json.error()->to_string());
    }

    auto book = parse_l2_book(book_json.value(), config_.book_levels);
    if (book.is_error()) {
        return unavailable(std::string("l2Book: ") + book.error()->to_string());
    }
    MarketSnapshot snapshot = book.take();
    snapshot.coin = config_.coin;

    Timestamp now = clock_->now();
    auto age = std::chrono::duration_cast<std::chrono::milliseconds>(now - snapshot.timestamp);
    if (age.count() > config_.max_staleness_ms) {
        return unavailable("Book is stale by " + std::to_string(age.count()) + "ms");
    }
    if (snapshot.timestamp <= last_book_time_) {
        return unavailable("Book timestamp did not advance");
    }

    auto trades_json = post_info({{"type", "recentTrades"}, {"coin", config_.coin}}, remaining());
    if (trades_json.is_error()) {
        return unavailable(std::string("recentTrades: ") + trades_json.error()->to_string());
    }
    auto flow = summarize_trades(trades_json.value(), snapshot.timestamp,
                                 std::chrono::milliseconds(config_.trade_window_ms));
    if (flow.is_error()) {
        return unavailable(std::string("recentTrades: ") + flow.error()->to_string());
    }

    snapshot.buy_volume = flow.value().buy_volume;
    snapshot.sell_volume = flow.value().sell_volume;
    snapshot.trade_count = flow.value().trade_count;
    snapshot.received_at = clock_->now();
    last_book_time_ = snapshot.timestamp;

    TRACE("Fetched " << config_.coin << " mid=" << snapshot.mid()
                     << " spread=" << snapshot.spread() << " trades=" << snapshot.trade_count);
    return SnapshotPtr(std::make_shared<const MarketSnapshot>(std::move(snapshot)));
}

}  // namespace signal_ngin
